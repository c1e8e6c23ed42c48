#include "wide_path_reader.hpp"
#include <common/errors.hpp>
#include <parser/line_scanner.hpp>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace widepath {

namespace {

std::vector<int> read_points(parser::LineScanner& scanner, const char* what) {
    if (!scanner.next()) {
        throw ParseError(scanner.source(), scanner.line_number(), "",
                         std::string("missing ") + what + " line");
    }
    std::vector<int> points;
    for (auto field : scanner.split_whitespace()) {
        points.push_back(static_cast<int>(scanner.parse_int(field, what)));
    }
    return points;
}

std::ifstream open_existing(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw InputNotFoundError(path.string());
    }
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path.string());
    }
    return file;
}

}  // namespace

std::vector<NodeLine> read_node_file(std::istream& input, const std::string& source) {
    std::vector<NodeLine> nodes;
    parser::LineScanner scanner(input, source);
    while (scanner.next()) {
        auto fields = scanner.split_whitespace();
        if (fields.size() != 4) {
            scanner.fail("expected 4 fields (id lat lon cluster), got " +
                         std::to_string(fields.size()));
        }
        nodes.push_back(NodeLine{
            .id = scanner.parse_int(fields[0], "node id"),
            .lat = scanner.parse_double(fields[1], "latitude"),
            .lon = scanner.parse_double(fields[2], "longitude"),
            .cluster_id = static_cast<int>(scanner.parse_int(fields[3], "cluster id"))
        });
    }
    return nodes;
}

EdgeFile read_edge_file(std::istream& input, const std::string& source) {
    EdgeFile file;
    parser::LineScanner scanner(input, source);
    file.arrival_points = read_points(scanner, "arrival time");
    file.width_points = read_points(scanner, "width time");

    while (scanner.next()) {
        auto fields = scanner.split_whitespace();
        if (fields.size() != 6) {
            scanner.fail("expected 6 fields (src dst costs baseWidth rushWidth distance), got " +
                         std::to_string(fields.size()));
        }

        EdgeLine edge;
        edge.src = scanner.parse_int(fields[0], "source node");
        edge.dst = scanner.parse_int(fields[1], "destination node");

        std::string_view costs = fields[2];
        size_t start = 0;
        while (start <= costs.size()) {
            size_t end = costs.find(',', start);
            if (end == std::string_view::npos) end = costs.size();
            edge.costs.push_back(scanner.parse_double(costs.substr(start, end - start), "cost"));
            start = end + 1;
        }

        edge.base_width = scanner.parse_double(fields[3], "base width");
        edge.rush_width = scanner.parse_double(fields[4], "rush width");
        edge.distance = scanner.parse_double(fields[5], "distance");
        file.edges.push_back(std::move(edge));
    }
    return file;
}

std::vector<NodeLine> read_node_file(const std::filesystem::path& path) {
    std::ifstream file = open_existing(path);
    return read_node_file(file, path.string());
}

EdgeFile read_edge_file(const std::filesystem::path& path) {
    std::ifstream file = open_existing(path);
    return read_edge_file(file, path.string());
}

}  // namespace widepath
