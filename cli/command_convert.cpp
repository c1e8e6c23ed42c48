#include "cli_common.hpp"
#include <pipeline/pipeline.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <common/logging.hpp>

namespace widepath::cli {

namespace {

void print_convert_usage() {
    std::cerr << "Usage: widepath convert <input_dir> -o <output_dir> [options]\n";
    std::cerr << "Options:\n";
    std::cerr << "  -d, --dataset NAME      california | london (default: california)\n";
    std::cerr << "  -c, --config <file>     JSON configuration, overridden by flags below\n";
    std::cerr << "  --projection MODE       precise | approximate (default: precise)\n";
    std::cerr << "  --base-width M          Base lane width in meters (default: 3.5)\n";
    std::cerr << "  --rush-width M          Rush-hour width of regular roads (default: 2.5)\n";
    std::cerr << "  --clearway-width M      Rush-hour width of clearway roads (default: 4.5)\n";
    std::cerr << "  --clearway-pct N        Percentage of clearway roads (default: 5)\n";
    std::cerr << "  --density N             Percentage of edges with positive scores (default: 20)\n";
    std::cerr << "  --speed S               Base speed in distance units per minute\n";
    std::cerr << "                          (default: 20-25 mph for california, 100 m/min for london)\n";
    std::cerr << "  --cost-seed N           Seed for per-edge speed and rush multipliers\n";
    std::cerr << "  --unseeded-costs        Draw the cost seed from the system entropy source\n";
    std::cerr << "  --keep-legacy           Do not remove node_<N>.txt / edge_<N>.txt\n";
    std::cerr << "  -v, --verbose           Debug logging\n";
}

PipelineConfig build_config(const CommandContext& ctx) {
    auto log = widepath::logging::get_logger();
    PipelineConfig config;

    // Load or use default configuration
    if (ctx.config_path.has_value()) {
        nlohmann::json j = json::read_json_file(ctx.config_path.value());
        from_json(j, config);
        log->info("Loaded configuration from: {}", ctx.config_path.value());
    }

    // Override with command-line arguments
    if (!ctx.input_path.empty()) config.input_dir = ctx.input_path;
    if (!ctx.output_path.empty()) config.output_dir = ctx.output_path;
    if (ctx.dataset) config.dataset = dataset_kind_from_string(*ctx.dataset);
    if (ctx.projection) config.projection = projection_mode_from_string(*ctx.projection);
    if (ctx.base_width) config.widths.base_width = *ctx.base_width;
    if (ctx.rush_width) config.widths.rush_width = *ctx.rush_width;
    if (ctx.clearway_width) config.widths.clearway_width = *ctx.clearway_width;
    if (ctx.clearway_pct) config.widths.clearway_percentage = *ctx.clearway_pct;
    if (ctx.density) config.density_percentage = *ctx.density;
    if (ctx.speed) config.base_speed = *ctx.speed;
    if (ctx.cost_seed) config.seeds.cost = *ctx.cost_seed;
    if (ctx.unseeded_costs) config.seeds.seeded_costs = false;
    if (ctx.keep_legacy) config.remove_legacy_files = false;

    return config;
}

}  // namespace

int command_convert(int argc, char** argv) {
    auto log = widepath::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help) {
            print_convert_usage();
            return 0;
        }
        if (ctx.verbose) {
            widepath::logging::enable_verbose();
        }

        PipelineConfig config = build_config(ctx);
        if (config.input_dir.empty() || config.output_dir.empty()) {
            print_convert_usage();
            return 1;
        }

        log->debug("Effective configuration: {}", nlohmann::json(config).dump());

        PipelineResult result = run_pipeline(config);

        std::cerr << "Conversion complete\n";
        std::cerr << "  nodes -> " << result.nodes_path.string() << " (" << result.node_count << ")\n";
        std::cerr << "  edges -> " << result.edges_path.string() << " (" << result.edge_count << ")\n";
        std::cerr << "  Distances in " << result.distance_unit << ", costs in minutes\n";
        std::cerr << "  Time series: " << result.time_points << " points\n";
        std::cerr << "  Clearway: " << result.clearway_edges << " roads widen to "
                  << config.widths.clearway_width << "m during rush hour\n";
        std::cerr << "  Remaining roads: constant width (" << config.widths.base_width << "m)\n";
        std::cerr << "  Positive-score edges: " << result.scored_edges << " ("
                  << config.density_percentage << "%)\n";
        std::cerr << "  Cost seed: " << result.cost_seed
                  << (config.seeds.seeded_costs ? "" : " (unseeded run)") << "\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace widepath::cli
