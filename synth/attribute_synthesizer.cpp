#include "attribute_synthesizer.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <string>
#include <utility>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace widepath {

void SynthesisConfig::validate() const {
    widths.validate();
    if (density_percentage < 0 || density_percentage > 100) {
        throw ConfigError("Density percentage must be within [0, 100], got " +
                          std::to_string(density_percentage));
    }
    if (speed.base_speed <= 0.0 || speed.min_factor <= 0.0 || speed.max_factor < speed.min_factor) {
        throw ConfigError("Speed model must be positive with min_factor <= max_factor");
    }
    validate_rush_windows(rush_windows);
}

AttributeSynthesizer::AttributeSynthesizer(SynthesisConfig config)
    : config_(std::move(config)), cost_seed_(config_.seeds.cost) {
    config_.validate();
    if (!config_.seeds.seeded_costs) {
        std::random_device device;
        cost_seed_ = device();
    }
}

EdgeAttributes AttributeSynthesizer::synthesize_edge(const EdgeRecord& edge, size_t index,
                                                     const TimeGrid& grid) const {
    std::seed_seq seq{cost_seed_,
                      static_cast<uint32_t>(index & 0xffffffffu),
                      static_cast<uint32_t>(static_cast<uint64_t>(index) >> 32)};
    EdgeRng rng(seq);

    EdgeAttributes attrs;
    attrs.distance = edge.distance;
    attrs.base_cost = edge.distance / config_.speed.draw(rng);
    attrs.costs = synthesize_costs(attrs.base_cost, grid, config_.rush_windows, rng);
    return attrs;
}

std::vector<EdgeAttributes> AttributeSynthesizer::synthesize(const CanonicalGraph& graph,
                                                             const TimeGrid& grid) const {
    auto log = logging::get_logger();
    const auto& edges = graph.edges();

    // Group assignments follow canonical edge order and run before the fan-out
    std::vector<uint8_t> scored = assign_shuffled_flags(
        edges.size(), config_.density_percentage, config_.seeds.score);
    std::vector<uint8_t> clearway = assign_shuffled_flags(
        edges.size(), config_.widths.clearway_percentage, config_.seeds.clearway);

    log->debug("Synthesizing attributes for {} edges over {} time points (cost seed {}, {})",
               edges.size(), grid.size(), cost_seed_,
               config_.seeds.seeded_costs ? "seeded" : "from random_device");

    std::vector<EdgeAttributes> result(edges.size());

    #pragma omp parallel for schedule(static) if(edges.size() > 1000)
    for (size_t i = 0; i < edges.size(); ++i) {
        EdgeAttributes attrs = synthesize_edge(edges[i], i, grid);
        EdgeWidths widths = widths_for(clearway[i] != 0, config_.widths);
        attrs.base_width = widths.base_width;
        attrs.rush_width = widths.rush_width;
        attrs.clearway = clearway[i] != 0;
        attrs.scored = scored[i] != 0;
        result[i] = std::move(attrs);
    }

    log->debug("Assigned {} clearway edges, {} positive-score edges",
               std::count(clearway.begin(), clearway.end(), 1),
               std::count(scored.begin(), scored.end(), 1));

    return result;
}

}  // namespace widepath
