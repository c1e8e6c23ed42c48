#include "wide_path_checker.hpp"
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace widepath {

namespace {

// Costs are written with six decimals
constexpr double COST_TOLERANCE = 1e-6;

}  // namespace

CheckReport check_wide_path(const std::vector<NodeLine>& nodes,
                            const EdgeFile& edges,
                            size_t max_problems) {
    CheckReport report;
    report.node_count = nodes.size();
    report.edge_count = edges.edges.size();
    report.time_points = edges.arrival_points.size();

    auto problem = [&](std::string message) {
        if (report.problems.size() < max_problems) {
            report.problems.push_back(std::move(message));
        }
    };

    for (size_t i = 0; i < nodes.size(); ++i) {
        if (nodes[i].id != static_cast<NodeId>(i)) {
            problem(fmt::format("node line {} has id {}, expected {}", i + 1, nodes[i].id, i));
        }
    }

    const auto& points = edges.arrival_points;
    if (points.empty() || points.front() != 0) {
        problem("arrival time points must start at 0");
    }
    for (size_t i = 1; i < points.size(); ++i) {
        if (points[i] <= points[i - 1]) {
            problem(fmt::format("arrival time points not strictly increasing at position {} ({} after {})",
                                i, points[i], points[i - 1]));
        }
    }
    if (edges.width_points.empty()) {
        problem("width time points line is empty");
    }

    const NodeId n = static_cast<NodeId>(nodes.size());
    for (size_t i = 0; i < edges.edges.size(); ++i) {
        const EdgeLine& edge = edges.edges[i];
        std::string label = fmt::format("edge ({}, {})", edge.src, edge.dst);

        if (edge.src < 0 || edge.src >= n || edge.dst < 0 || edge.dst >= n) {
            problem(label + " references an unknown node");
        }
        if (i > 0) {
            const EdgeLine& prev = edges.edges[i - 1];
            if (std::make_pair(prev.src, prev.dst) >= std::make_pair(edge.src, edge.dst)) {
                problem(label + " is duplicated or out of (src, dst) order");
            }
        }
        if (edge.costs.size() != points.size()) {
            problem(fmt::format("{} has {} costs for {} arrival points",
                                label, edge.costs.size(), points.size()));
        } else if (!edge.costs.empty()) {
            for (double cost : edge.costs) {
                if (cost + COST_TOLERANCE < edge.costs.front()) {
                    problem(fmt::format("{} has cost {} below its free-flow cost {}",
                                        label, cost, edge.costs.front()));
                    break;
                }
            }
        }
        if (edge.base_width <= 0.0 || edge.rush_width < edge.base_width) {
            problem(fmt::format("{} has invalid widths base={} rush={}",
                                label, edge.base_width, edge.rush_width));
        }
        if (edge.rush_width > edge.base_width) {
            ++report.widened_edges;
        }
        if (edge.distance < 0.0) {
            problem(label + " has a negative distance");
        }
    }

    return report;
}

}  // namespace widepath
