#include "pipeline.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <format/wide_path_writer.hpp>
#include <graph/canonical_graph.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <system_error>

namespace widepath {

SynthesisConfig PipelineConfig::synthesis_config(const DatasetProfile& profile) const {
    SynthesisConfig synthesis;
    synthesis.widths = widths;
    synthesis.speed = base_speed ? SpeedModel::around(*base_speed) : profile.speed;
    synthesis.density_percentage = density_percentage;
    synthesis.seeds = seeds;
    synthesis.rush_windows = rush_windows;
    return synthesis;
}

PipelineResult run_pipeline(const PipelineConfig& config) {
    auto log = logging::get_logger();
    PipelineResult result;

    DatasetProfile profile = DatasetProfile::for_kind(config.dataset);

    // Reject bad options before reading anything
    AttributeSynthesizer synthesizer(config.synthesis_config(profile));
    TimeGrid grid = TimeGrid::from_rush_windows(config.rush_windows);
    result.time_points = grid.size();
    result.cost_seed = synthesizer.cost_seed();

    // 1. Load
    std::unique_ptr<RawLoader> loader = make_loader(config.dataset, config.projection);
    log->info("Loading {} dataset from {} ({} loader)", to_string(config.dataset),
              config.input_dir, loader->name());
    RawGraph raw = loader->load(config.input_dir);
    result.raw_node_count = raw.nodes.size();
    result.raw_edge_count = raw.edges.size();
    result.distance_unit = profile.distance_unit;
    log->info("Loaded {} nodes, {} edges (distances in {})", raw.nodes.size(), raw.edges.size(),
              profile.distance_unit);

    // 2. Canonicalize
    CanonicalGraph graph = CanonicalGraph::from_raw(raw, profile.id_policy);
    result.node_count = graph.node_count();
    result.edge_count = graph.edge_count();
    log->info("Canonical graph: {} nodes, {} edges ({} duplicates dropped, {} unreferenced nodes dropped)",
              graph.node_count(), graph.edge_count(), graph.duplicate_edges_dropped(),
              graph.unreferenced_nodes_dropped());

    // 3. Synthesize
    log->info("Synthesizing attributes over {} time points", grid.size());
    std::vector<EdgeAttributes> attributes = synthesizer.synthesize(graph, grid);
    result.clearway_edges = static_cast<size_t>(std::count_if(
        attributes.begin(), attributes.end(), [](const EdgeAttributes& a) { return a.clearway; }));
    result.scored_edges = static_cast<size_t>(std::count_if(
        attributes.begin(), attributes.end(), [](const EdgeAttributes& a) { return a.scored; }));

    // 4. Write
    std::filesystem::path output_dir(config.output_dir);
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        throw std::runtime_error("Cannot create output directory " + output_dir.string() +
                                 ": " + ec.message());
    }

    WidePathWriter writer(output_dir);
    WrittenFiles files = writer.write(graph, attributes, grid);
    result.nodes_path = files.nodes_path;
    result.edges_path = files.edges_path;
    log->info("Wrote {} and {}", files.nodes_path.string(), files.edges_path.string());

    if (config.remove_legacy_files) {
        for (const char* prefix : {"node_", "edge_"}) {
            std::filesystem::path legacy =
                output_dir / fmt::format("{}{}.txt", prefix, graph.node_count());
            if (std::filesystem::remove(legacy, ec)) {
                result.removed_legacy_files.push_back(legacy);
                log->info("Removed legacy file {}", legacy.string());
            } else if (ec) {
                log->warn("Could not remove legacy file {}: {}", legacy.string(), ec.message());
            }
        }
    }

    return result;
}

}  // namespace widepath
