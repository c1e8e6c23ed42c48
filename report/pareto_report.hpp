#ifndef WIDEPATH_REPORT_PARETO_REPORT_HPP
#define WIDEPATH_REPORT_PARETO_REPORT_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace widepath {
namespace report {

struct ParetoPath {
    int number = 0;
    double wideness_percent = 0.0;
    int right_turns = 0;
    int sharp_turns = 0;
    double travel_minutes = 0.0;
};

// What the routing engine's text report says about one query
struct ParetoReport {
    std::optional<int64_t> source;
    std::optional<int64_t> destination;
    std::optional<double> departure_minutes;
    std::optional<std::string> departure_clock;   // "HH:MM"
    std::optional<double> budget_minutes;
    size_t path_headers = 0;                      // "--- Pareto Path #n ---" lines seen
    std::vector<ParetoPath> paths;                // Headers followed by a complete block

    bool has_pair() const { return source.has_value() && destination.has_value(); }
};

// Recognized lines:
//   Source: <id>
//   Destination: <id>
//   Departure Time: <minutes> minutes (<HH:MM>)
//   Budget: <minutes> minutes
//   --- Pareto Path #<n> ---
// each header followed, in order, by the lines
//   Wideness Score: <pct>%
//   Right Turns: <n>
//   Sharp Turns: <n>
//   Travel Time: <minutes> minutes
// The first occurrence of each scalar field wins. Unrecognized lines are ignored.
ParetoReport parse_pareto_report(std::string_view text);

// Human-readable summary table
std::string format_pareto_summary(const ParetoReport& report);

}  // namespace report
}  // namespace widepath

#endif // WIDEPATH_REPORT_PARETO_REPORT_HPP
