#ifndef WIDEPATH_PIPELINE_PIPELINE_HPP
#define WIDEPATH_PIPELINE_PIPELINE_HPP

#include "dataset_profile.hpp"
#include <synth/attribute_synthesizer.hpp>
#include <timegrid/time_grid.hpp>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace widepath {

struct PipelineConfig {
    std::string input_dir;
    std::string output_dir;
    DatasetKind dataset = DatasetKind::California;
    ProjectionMode projection = ProjectionMode::Precise;

    WidthPolicy widths;
    int density_percentage = 20;
    std::optional<double> base_speed;  // Overrides the dataset's speed model with base * [0.8, 1.2]
    SynthesisSeeds seeds;
    std::vector<RushWindow> rush_windows = default_rush_windows();

    bool remove_legacy_files = true;   // node_<N>.txt / edge_<N>.txt from the split format

    // Synthesis parameters for the given dataset profile
    SynthesisConfig synthesis_config(const DatasetProfile& profile) const;
};

struct PipelineResult {
    std::filesystem::path nodes_path;
    std::filesystem::path edges_path;
    size_t raw_node_count = 0;
    size_t raw_edge_count = 0;
    std::string distance_unit;         // Unit of the distance column, as read
    size_t node_count = 0;
    size_t edge_count = 0;
    size_t time_points = 0;
    size_t clearway_edges = 0;
    size_t scored_edges = 0;
    uint32_t cost_seed = 0;
    std::vector<std::filesystem::path> removed_legacy_files;
};

// Load -> canonicalize -> time grid -> synthesize -> write.
// Inputs are validated before the output directory is touched.
PipelineResult run_pipeline(const PipelineConfig& config);

}  // namespace widepath

#endif // WIDEPATH_PIPELINE_PIPELINE_HPP
