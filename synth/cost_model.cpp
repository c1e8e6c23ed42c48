#include "cost_model.hpp"

namespace widepath {

double SpeedModel::draw(EdgeRng& rng) const {
    std::uniform_real_distribution<double> factor(min_factor, max_factor);
    return base_speed * factor(rng);
}

RushTracker::RushTracker(const std::vector<RushWindow>& windows)
    : windows_(windows) {}

const RushWindow* RushTracker::advance(int minute) {
    while (index_ < windows_.size()) {
        const RushWindow& window = windows_[index_];
        if (inside_) {
            if (minute >= window.end_minute) {
                inside_ = false;
                ++index_;
                continue;
            }
            return &window;
        }
        if (minute > window.end_minute) {
            // The grid never sampled this window
            ++index_;
            continue;
        }
        if (minute >= window.start_minute && minute < window.end_minute) {
            inside_ = true;
            return &window;
        }
        return nullptr;
    }
    return nullptr;
}

std::optional<MultiplierRange> rush_multiplier_range(int position) {
    switch (position) {
        case 0:
        case 4:
            return MultiplierRange{.low = 0.10, .high = 0.15};
        case 1:
        case 3:
            return MultiplierRange{.low = 0.20, .high = 0.25};
        case 2:
            return MultiplierRange{.low = 0.30, .high = 0.40};
        default:
            return std::nullopt;
    }
}

std::vector<double> synthesize_costs(double base_cost,
                                     const TimeGrid& grid,
                                     const std::vector<RushWindow>& windows,
                                     EdgeRng& rng) {
    std::vector<double> costs;
    costs.reserve(grid.arrival_points.size());

    RushTracker tracker(windows);
    for (int minute : grid.arrival_points) {
        double cost = base_cost;

        if (const RushWindow* window = tracker.advance(minute)) {
            int position = (minute - window->start_minute) / RUSH_SAMPLE_STEP;
            if (auto range = rush_multiplier_range(position)) {
                std::uniform_real_distribution<double> multiplier(range->low, range->high);
                cost += base_cost * multiplier(rng);
            }
        }

        costs.push_back(cost);
    }

    return costs;
}

}  // namespace widepath
