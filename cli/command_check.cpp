#include "cli_common.hpp"
#include <format/wide_path_checker.hpp>
#include <format/wide_path_reader.hpp>
#include <common/logging.hpp>
#include <filesystem>
#include <vector>

namespace widepath::cli {

namespace {

// Node count of the only nodes_<N>.txt in the directory
size_t discover_node_count(const std::filesystem::path& dir) {
    std::vector<size_t> counts;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        std::string name = entry.path().filename().string();
        if (name.rfind("nodes_", 0) != 0 || entry.path().extension() != ".txt") {
            continue;
        }
        std::string digits = name.substr(6, name.size() - 6 - 4);
        counts.push_back(parse_integer_arg<size_t>(name, digits));
    }
    if (counts.size() != 1) {
        throw std::runtime_error("Expected exactly one nodes_<N>.txt in " + dir.string() +
                                 ", found " + std::to_string(counts.size()) + " (use -n)");
    }
    return counts.front();
}

}  // namespace

int command_check(int argc, char** argv) {
    auto log = widepath::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: widepath check <dataset_dir> [-n <node_count>]\n";
            std::cerr << "Validates nodes_<N>.txt and edges_<N>.txt against the solver's format.\n";
            return ctx.help ? 0 : 1;
        }
        if (ctx.verbose) {
            widepath::logging::enable_verbose();
        }

        std::filesystem::path dir(ctx.input_path);
        size_t n = ctx.node_count ? *ctx.node_count : discover_node_count(dir);
        std::filesystem::path nodes_path = dir / ("nodes_" + std::to_string(n) + ".txt");
        std::filesystem::path edges_path = dir / ("edges_" + std::to_string(n) + ".txt");

        log->info("Checking {} and {}", nodes_path.string(), edges_path.string());
        std::vector<NodeLine> nodes = read_node_file(nodes_path);
        EdgeFile edges = read_edge_file(edges_path);

        CheckReport report = check_wide_path(nodes, edges);
        if (report.node_count != n) {
            report.problems.push_back("file name says " + std::to_string(n) + " nodes, found " +
                                      std::to_string(report.node_count));
        }

        for (const auto& problem : report.problems) {
            log->error("{}", problem);
        }

        std::cerr << (report.ok() ? "OK" : "INVALID") << ": "
                  << report.node_count << " nodes, " << report.edge_count << " edges, "
                  << report.time_points << " time points, "
                  << report.widened_edges << " edges widen during rush hour\n";

        return report.ok() ? 0 : 1;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace widepath::cli
