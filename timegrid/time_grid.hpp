#ifndef WIDEPATH_TIMEGRID_TIME_GRID_HPP
#define WIDEPATH_TIMEGRID_TIME_GRID_HPP

#include <cstddef>
#include <vector>

namespace widepath {

constexpr int MINUTES_PER_DAY = 24 * 60;
constexpr int RUSH_SAMPLE_STEP = 30;  // minutes between samples inside a window

// Time-of-day interval with elevated travel cost, in minutes from midnight.
// Both bounds are sampled; the end sample is already outside rush.
struct RushWindow {
    int start_minute = 0;
    int end_minute = 0;

    bool operator==(const RushWindow&) const = default;

    static RushWindow morning() { return RushWindow{.start_minute = 7 * 60 + 30, .end_minute = 9 * 60 + 30}; }
    static RushWindow evening() { return RushWindow{.start_minute = 16 * 60, .end_minute = 18 * 60 + 30}; }
};

std::vector<RushWindow> default_rush_windows();

// Throws ConfigError unless windows are well-formed, within the day, disjoint,
// ordered, and all start after midnight.
void validate_rush_windows(const std::vector<RushWindow>& windows);

// Sample points shared by every edge's cost vector. The consumer relies on
// the length and positional meaning of arrival_points matching each cost vector.
struct TimeGrid {
    std::vector<int> arrival_points;
    std::vector<int> width_points;  // Reserved; always {0}

    size_t size() const { return arrival_points.size(); }

    // [0] followed by start, start+30, ... <= end for each window in order.
    static TimeGrid from_rush_windows(const std::vector<RushWindow>& windows);
};

}  // namespace widepath

#endif // WIDEPATH_TIMEGRID_TIME_GRID_HPP
