#include "cli_common.hpp"
#include <report/pareto_report.hpp>
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <filesystem>

namespace widepath::cli {

int command_report(int argc, char** argv) {
    auto log = widepath::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: widepath report <pareto_output.txt>\n";
            std::cerr << "Summarizes the Pareto paths listed in a routing engine report.\n";
            return ctx.help ? 0 : 1;
        }

        if (!std::filesystem::exists(ctx.input_path)) {
            throw InputNotFoundError(ctx.input_path);
        }

        log->debug("Parsing report: {}", ctx.input_path);
        std::string content = read_file(ctx.input_path);
        report::ParetoReport parsed = report::parse_pareto_report(content);

        if (parsed.paths.size() != parsed.path_headers) {
            log->warn("{} Pareto path header(s) without a complete block",
                      parsed.path_headers - parsed.paths.size());
        }

        std::cout << report::format_pareto_summary(parsed);
        return parsed.has_pair() ? 0 : 1;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace widepath::cli
