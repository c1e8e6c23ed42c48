#ifndef WIDEPATH_SYNTH_ATTRIBUTE_SYNTHESIZER_HPP
#define WIDEPATH_SYNTH_ATTRIBUTE_SYNTHESIZER_HPP

#include "cost_model.hpp"
#include "width_model.hpp"
#include <graph/canonical_graph.hpp>
#include <timegrid/time_grid.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace widepath {

// Each reproducible random group draws from its own seed, so changing how one
// group is assigned never perturbs another.
struct SynthesisSeeds {
    uint32_t score = 42;
    uint32_t clearway = 123;
    uint32_t cost = 20240601;
    bool seeded_costs = true;  // false: cost seed comes from std::random_device
};

struct SynthesisConfig {
    WidthPolicy widths;
    SpeedModel speed;
    int density_percentage = 20;  // Share of edges in the positive-score group
    SynthesisSeeds seeds;
    std::vector<RushWindow> rush_windows = default_rush_windows();

    void validate() const;
};

// Synthesized, immutable per-edge output. costs[i] belongs to grid.arrival_points[i].
struct EdgeAttributes {
    std::vector<double> costs;
    double base_cost = 0.0;     // Free-flow minutes, the floor of every cost
    double base_width = 0.0;
    double rush_width = 0.0;
    double distance = 0.0;
    bool clearway = false;
    bool scored = false;
};

class AttributeSynthesizer {
public:
    explicit AttributeSynthesizer(SynthesisConfig config);

    // One EdgeAttributes per canonical edge, in canonical edge order.
    // Edges are processed in parallel; each edge owns a generator derived from
    // (cost seed, edge index), so the result does not depend on scheduling.
    std::vector<EdgeAttributes> synthesize(const CanonicalGraph& graph, const TimeGrid& grid) const;

    const SynthesisConfig& config() const { return config_; }
    uint32_t cost_seed() const { return cost_seed_; }

private:
    SynthesisConfig config_;
    uint32_t cost_seed_;

    EdgeAttributes synthesize_edge(const EdgeRecord& edge, size_t index,
                                   const TimeGrid& grid) const;
};

}  // namespace widepath

#endif // WIDEPATH_SYNTH_ATTRIBUTE_SYNTHESIZER_HPP
