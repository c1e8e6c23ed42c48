#ifndef WIDEPATH_SYNTH_COST_MODEL_HPP
#define WIDEPATH_SYNTH_COST_MODEL_HPP

#include <timegrid/time_grid.hpp>
#include <cstddef>
#include <optional>
#include <random>
#include <vector>

namespace widepath {

using EdgeRng = std::mt19937_64;

constexpr double KM_PER_MILE = 1.60934;

// Free-flow speed drawn per edge, uniformly in [base * min_factor, base * max_factor].
// Units are distance units per minute, so distance / speed is a cost in minutes.
struct SpeedModel {
    double base_speed = 100.0;  // e.g. meters per minute
    double min_factor = 0.8;
    double max_factor = 1.2;

    double draw(EdgeRng& rng) const;

    // base_speed * [min_factor, max_factor]
    static SpeedModel around(double base_speed, double min_factor = 0.8, double max_factor = 1.2) {
        return SpeedModel{.base_speed = base_speed, .min_factor = min_factor, .max_factor = max_factor};
    }

    // Uniform in [min_mph, max_mph], expressed in kilometers per minute
    static SpeedModel mph_range_km_per_min(double min_mph, double max_mph) {
        return SpeedModel{.base_speed = KM_PER_MILE / 60.0, .min_factor = min_mph, .max_factor = max_mph};
    }
};

// Two-state automaton over the rush windows. Feed it the grid's sample times in
// increasing order; each window is entered once at its start and left once the
// samples reach its end, after which the next window becomes current.
class RushTracker {
public:
    explicit RushTracker(const std::vector<RushWindow>& windows);

    // Returns the window the sample falls in, or nullptr outside rush
    const RushWindow* advance(int minute);

    bool inside_rush() const { return inside_; }
    size_t rush_index() const { return index_; }

private:
    const std::vector<RushWindow>& windows_;
    size_t index_ = 0;
    bool inside_ = false;
};

struct MultiplierRange {
    double low = 0.0;
    double high = 0.0;
};

// Congestion surcharge by 30-minute position inside a window: light at the edges
// (0 and 4), heavier next (1 and 3), peak in the middle (2). Other positions
// carry no surcharge.
std::optional<MultiplierRange> rush_multiplier_range(int position);

// One cost per grid point: base_cost outside rush, base_cost * (1 + m) inside,
// with m drawn independently per point. Every entry is >= base_cost.
std::vector<double> synthesize_costs(double base_cost,
                                     const TimeGrid& grid,
                                     const std::vector<RushWindow>& windows,
                                     EdgeRng& rng);

}  // namespace widepath

#endif // WIDEPATH_SYNTH_COST_MODEL_HPP
