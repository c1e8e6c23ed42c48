#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace widepath {
namespace logging {

constexpr const char* LOGGER_NAME = "widepath";
constexpr const char* LEVEL_ENV = "WIDEPATH_LOG_LEVEL";

// spdlog level names (trace, debug, info, warn/warning, err/error, critical, off).
// Anything else is rejected rather than silently meaning "off".
inline std::optional<spdlog::level::level_enum> parse_level(std::string_view name) {
    if (name == "off") {
        return spdlog::level::off;
    }
    auto level = spdlog::level::from_str(std::string(name));
    if (level == spdlog::level::off) {
        return std::nullopt;
    }
    return level;
}

// Console logger on stderr; stdout stays free for command output such as report summaries.
inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::stderr_color_mt(LOGGER_NAME);
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        log->set_level(spdlog::level::info);

        if (const char* env = std::getenv(LEVEL_ENV)) {
            if (auto level = parse_level(env)) {
                log->set_level(*level);
            } else {
                log->warn("Ignoring {}='{}': unknown log level", LEVEL_ENV, env);
            }
        }
        return log;
    }();
    return logger;
}

// -v: lower the threshold to debug unless the environment already asked for more
inline void enable_verbose() {
    auto log = get_logger();
    if (log->level() > spdlog::level::debug) {
        log->set_level(spdlog::level::debug);
    }
}

}  // namespace logging
}  // namespace widepath
