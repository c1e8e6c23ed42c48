#include "time_grid.hpp"
#include <common/errors.hpp>
#include <string>

namespace widepath {

std::vector<RushWindow> default_rush_windows() {
    return {RushWindow::morning(), RushWindow::evening()};
}

void validate_rush_windows(const std::vector<RushWindow>& windows) {
    int previous_end = 0;
    for (size_t i = 0; i < windows.size(); ++i) {
        const auto& w = windows[i];
        std::string label = "Rush window #" + std::to_string(i + 1) + " [" +
                            std::to_string(w.start_minute) + ", " +
                            std::to_string(w.end_minute) + "]";
        if (w.end_minute < w.start_minute) {
            throw ConfigError(label + " ends before it starts");
        }
        if (w.start_minute <= 0 || w.end_minute > MINUTES_PER_DAY) {
            throw ConfigError(label + " must lie within (0, " +
                              std::to_string(MINUTES_PER_DAY) + "]");
        }
        if (w.start_minute <= previous_end) {
            throw ConfigError(label + " overlaps or precedes the previous window");
        }
        previous_end = w.end_minute;
    }
}

TimeGrid TimeGrid::from_rush_windows(const std::vector<RushWindow>& windows) {
    validate_rush_windows(windows);

    TimeGrid grid;
    grid.arrival_points.push_back(0);
    for (const auto& window : windows) {
        for (int t = window.start_minute; t <= window.end_minute; t += RUSH_SAMPLE_STEP) {
            grid.arrival_points.push_back(t);
        }
    }
    grid.width_points.push_back(0);
    return grid;
}

}  // namespace widepath
