#ifndef WIDEPATH_CLI_COMMON_HPP
#define WIDEPATH_CLI_COMMON_HPP

#include <cstddef>
#include <charconv>
#include <cstdint>
#include <string>
#include <optional>
#include <iostream>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace widepath::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    bool verbose = false;
    bool help = false;

    // convert options; unset means "use config file or default"
    std::optional<std::string> dataset;
    std::optional<std::string> projection;
    std::optional<double> base_width;
    std::optional<double> rush_width;
    std::optional<double> clearway_width;
    std::optional<int> clearway_pct;
    std::optional<int> density;
    std::optional<double> speed;
    std::optional<uint32_t> cost_seed;
    bool unseeded_costs = false;
    bool keep_legacy = false;

    // check options
    std::optional<size_t> node_count;
};

inline double parse_double_arg(const std::string& flag, const std::string& value) {
    double result = 0.0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size() || value.empty()) {
        throw std::runtime_error(flag + " expects a number, got '" + value + "'");
    }
    return result;
}

template <typename T>
T parse_integer_arg(const std::string& flag, const std::string& value) {
    T result{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size() || value.empty()) {
        throw std::runtime_error(flag + " expects an integer, got '" + value + "'");
    }
    return result;
}

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    auto value_of = [&](const std::string& flag) -> std::string {
        if (i + 1 < argc) {
            std::string value = argv[i + 1];
            i += 2;
            return value;
        }
        throw std::runtime_error(flag + " requires an argument");
    };

    // Parse flags and positional arguments
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = value_of(arg);
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = value_of(arg);
        } else if (arg == "-d" || arg == "--dataset") {
            ctx.dataset = value_of(arg);
        } else if (arg == "--projection") {
            ctx.projection = value_of(arg);
        } else if (arg == "--base-width") {
            ctx.base_width = parse_double_arg(arg, value_of(arg));
        } else if (arg == "--rush-width") {
            ctx.rush_width = parse_double_arg(arg, value_of(arg));
        } else if (arg == "--clearway-width") {
            ctx.clearway_width = parse_double_arg(arg, value_of(arg));
        } else if (arg == "--clearway-pct") {
            ctx.clearway_pct = parse_integer_arg<int>(arg, value_of(arg));
        } else if (arg == "--density") {
            ctx.density = parse_integer_arg<int>(arg, value_of(arg));
        } else if (arg == "--speed") {
            ctx.speed = parse_double_arg(arg, value_of(arg));
        } else if (arg == "--cost-seed") {
            ctx.cost_seed = parse_integer_arg<uint32_t>(arg, value_of(arg));
        } else if (arg == "--unseeded-costs") {
            ctx.unseeded_costs = true;
            ++i;
        } else if (arg == "--keep-legacy") {
            ctx.keep_legacy = true;
            ++i;
        } else if (arg == "-n" || arg == "--nodes") {
            ctx.node_count = parse_integer_arg<size_t>(arg, value_of(arg));
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            ++i;
        } else if (arg[0] != '-') {
            // Positional argument (input path)
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
                ++i;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    return {ctx, i};
}

// Read entire file to string
inline std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// Command function declarations
int command_convert(int argc, char** argv);
int command_check(int argc, char** argv);
int command_report(int argc, char** argv);

}  // namespace widepath::cli

#endif // WIDEPATH_CLI_COMMON_HPP
