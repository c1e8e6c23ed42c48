#include "wide_path_writer.hpp"
#include <common/logging.hpp>
#include <spdlog/fmt/fmt.h>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace widepath {

namespace {

template <typename T>
std::string join_points(const std::vector<T>& points, char separator) {
    std::string out;
    for (size_t i = 0; i < points.size(); ++i) {
        if (i > 0) out += separator;
        out += fmt::format("{}", points[i]);
    }
    return out;
}

std::ofstream open_for_writing(const std::filesystem::path& path) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path.string());
    }
    return file;
}

void finish(std::ofstream& file, const std::filesystem::path& path) {
    file.flush();
    if (!file) {
        throw std::runtime_error("Failed while writing file: " + path.string());
    }
}

}  // namespace

std::string format_decimal(double value) {
    std::string text = fmt::format("{}", value);
    bool integral = text.find_first_not_of("-0123456789") == std::string::npos;
    if (integral) {
        text += ".0";
    }
    return text;
}

std::string format_cost(double value) {
    return fmt::format("{:.6f}", value);
}

std::string format_node_line(const NodeRecord& node, int cluster_id) {
    return fmt::format("{} {} {} {}", node.id, format_decimal(node.lat),
                       format_decimal(node.lon), cluster_id);
}

std::string format_edge_line(const EdgeRecord& edge, const EdgeAttributes& attrs) {
    std::string costs;
    for (size_t i = 0; i < attrs.costs.size(); ++i) {
        if (i > 0) costs += ',';
        costs += format_cost(attrs.costs[i]);
    }
    return fmt::format("{} {} {} {} {} {}", edge.src, edge.dst, costs,
                       format_decimal(attrs.base_width), format_decimal(attrs.rush_width),
                       format_decimal(attrs.distance));
}

void write_nodes(std::ostream& out, const CanonicalGraph& graph) {
    for (const auto& node : graph.nodes()) {
        out << format_node_line(node) << '\n';
    }
}

void write_edges(std::ostream& out,
                 const CanonicalGraph& graph,
                 const std::vector<EdgeAttributes>& attributes,
                 const TimeGrid& grid) {
    const auto& edges = graph.edges();
    if (attributes.size() != edges.size()) {
        throw std::invalid_argument(fmt::format(
            "write_edges: {} attribute sets for {} edges", attributes.size(), edges.size()));
    }

    out << join_points(grid.arrival_points, ' ') << '\n';
    out << join_points(grid.width_points, ' ') << '\n';

    for (size_t i = 0; i < edges.size(); ++i) {
        if (attributes[i].costs.size() != grid.size()) {
            throw std::invalid_argument(fmt::format(
                "write_edges: edge ({}, {}) has {} costs for {} arrival points",
                edges[i].src, edges[i].dst, attributes[i].costs.size(), grid.size()));
        }
        out << format_edge_line(edges[i], attributes[i]) << '\n';
    }
}

WidePathWriter::WidePathWriter(std::filesystem::path output_dir)
    : output_dir_(std::move(output_dir)) {}

std::filesystem::path WidePathWriter::nodes_path(size_t node_count) const {
    return output_dir_ / fmt::format("nodes_{}.txt", node_count);
}

std::filesystem::path WidePathWriter::edges_path(size_t node_count) const {
    return output_dir_ / fmt::format("edges_{}.txt", node_count);
}

WrittenFiles WidePathWriter::write(const CanonicalGraph& graph,
                                   const std::vector<EdgeAttributes>& attributes,
                                   const TimeGrid& grid) const {
    auto log = logging::get_logger();

    WrittenFiles files{
        .nodes_path = nodes_path(graph.node_count()),
        .edges_path = edges_path(graph.node_count())
    };

    {
        std::ofstream file = open_for_writing(files.nodes_path);
        write_nodes(file, graph);
        finish(file, files.nodes_path);
    }
    log->debug("Wrote {} nodes to {}", graph.node_count(), files.nodes_path.string());

    {
        std::ofstream file = open_for_writing(files.edges_path);
        write_edges(file, graph, attributes, grid);
        finish(file, files.edges_path);
    }
    log->debug("Wrote {} edges to {}", graph.edge_count(), files.edges_path.string());

    return files;
}

}  // namespace widepath
