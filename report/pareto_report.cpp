#include "pareto_report.hpp"
#include <spdlog/fmt/fmt.h>
#include <charconv>
#include <sstream>

namespace widepath {
namespace report {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

// Value after `label` when the line starts with it
std::optional<std::string_view> field_after(std::string_view line, std::string_view label) {
    if (line.substr(0, label.size()) != label) {
        return std::nullopt;
    }
    return trim(line.substr(label.size()));
}

template <typename T>
std::optional<T> leading_number(std::string_view s, std::string_view* rest = nullptr) {
    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr == s.data()) {
        return std::nullopt;
    }
    if (rest) {
        *rest = trim(std::string_view(ptr, static_cast<size_t>(s.data() + s.size() - ptr)));
    }
    return value;
}

// "<n> ---"
std::optional<int> path_header_number(std::string_view line) {
    auto body = field_after(line, "--- Pareto Path #");
    if (!body) return std::nullopt;
    std::string_view rest;
    auto number = leading_number<int>(*body, &rest);
    if (!number || rest != "---") return std::nullopt;
    return number;
}

// "<minutes> minutes (<HH:MM>)"
void parse_departure(std::string_view value, ParetoReport& report) {
    std::string_view rest;
    auto minutes = leading_number<double>(value, &rest);
    if (!minutes) return;
    auto unit = field_after(rest, "minutes");
    if (!unit || unit->size() < 2 || unit->front() != '(' || unit->back() != ')') return;
    report.departure_minutes = minutes;
    report.departure_clock = std::string(unit->substr(1, unit->size() - 2));
}

class PathBlockParser {
public:
    explicit PathBlockParser(int number) { path_.number = number; }

    // Feed the next non-blank line; returns false if the block is broken
    bool feed(std::string_view line) {
        std::string_view rest;
        switch (step_) {
            case 0: {
                auto v = field_after(line, "Wideness Score:");
                auto pct = v ? leading_number<double>(*v, &rest) : std::nullopt;
                if (!pct || rest != "%") return false;
                path_.wideness_percent = *pct;
                break;
            }
            case 1: {
                auto v = field_after(line, "Right Turns:");
                auto n = v ? leading_number<int>(*v, &rest) : std::nullopt;
                if (!n || !rest.empty()) return false;
                path_.right_turns = *n;
                break;
            }
            case 2: {
                auto v = field_after(line, "Sharp Turns:");
                auto n = v ? leading_number<int>(*v, &rest) : std::nullopt;
                if (!n || !rest.empty()) return false;
                path_.sharp_turns = *n;
                break;
            }
            case 3: {
                auto v = field_after(line, "Travel Time:");
                auto minutes = v ? leading_number<double>(*v, &rest) : std::nullopt;
                if (!minutes || rest != "minutes") return false;
                path_.travel_minutes = *minutes;
                break;
            }
            default:
                return false;
        }
        ++step_;
        return true;
    }

    bool complete() const { return step_ == 4; }
    const ParetoPath& path() const { return path_; }

private:
    ParetoPath path_;
    int step_ = 0;
};

}  // namespace

ParetoReport parse_pareto_report(std::string_view text) {
    ParetoReport report;
    std::optional<PathBlockParser> block;

    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = trim(text.substr(start, end - start));
        start = end + 1;

        if (line.empty()) continue;

        if (auto number = path_header_number(line)) {
            ++report.path_headers;
            block.emplace(*number);
            continue;
        }

        if (block) {
            if (block->feed(line)) {
                if (block->complete()) {
                    report.paths.push_back(block->path());
                    block.reset();
                }
                continue;
            }
            block.reset();
        }

        if (auto source = field_after(line, "Source:")) {
            if (!report.source) report.source = leading_number<int64_t>(*source);
        } else if (auto destination = field_after(line, "Destination:")) {
            if (!report.destination) report.destination = leading_number<int64_t>(*destination);
        } else if (auto departure = field_after(line, "Departure Time:")) {
            if (!report.departure_minutes) parse_departure(*departure, report);
        } else if (auto budget = field_after(line, "Budget:")) {
            std::string_view rest;
            auto minutes = leading_number<double>(*budget, &rest);
            if (!report.budget_minutes && minutes && rest == "minutes") report.budget_minutes = minutes;
        }
    }

    return report;
}

std::string format_pareto_summary(const ParetoReport& report) {
    std::ostringstream out;
    const std::string rule(70, '=');
    const std::string thin(70, '-');

    if (!report.has_pair()) {
        out << "No valid pair found in report.\n";
        return out.str();
    }

    out << rule << "\n";
    out << "Source-destination pair with " << report.path_headers << " Pareto optimal route(s)\n";
    out << rule << "\n\n";
    out << fmt::format("  Source node:       {}\n", *report.source);
    out << fmt::format("  Destination node:  {}\n", *report.destination);
    out << fmt::format("  Departure time:    {}\n", report.departure_clock.value_or("N/A"));
    if (report.budget_minutes) {
        out << fmt::format("  Budget:            {} minutes\n", *report.budget_minutes);
    } else {
        out << "  Budget:            N/A\n";
    }
    out << fmt::format("  Pareto routes:     {}\n\n", report.path_headers);

    out << thin << "\n";
    out << "PARETO OPTIMAL PATHS SUMMARY\n";
    out << thin << "\n";
    out << fmt::format("{:^6} {:>10} {:>8} {:>8} {:>12}\n", "Path", "Wideness", "R-Turns", "S-Turns", "Travel");
    out << std::string(50, '-') << "\n";
    for (const auto& path : report.paths) {
        out << fmt::format("  #{:>2}   {:>8.2f}%   {:>6}   {:>6}   {:>7.2f} min\n",
                           path.number, path.wideness_percent, path.right_turns,
                           path.sharp_turns, path.travel_minutes);
    }
    return out.str();
}

}  // namespace report
}  // namespace widepath
