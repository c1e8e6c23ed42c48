#include "coordinate_table_loader.hpp"
#include <common/logging.hpp>
#include <parser/line_scanner.hpp>
#include <fstream>
#include <stdexcept>

namespace widepath {

std::vector<NodeRecord> CoordinateTableLoader::read_nodes(std::istream& input,
                                                          const std::string& source) {
    std::vector<NodeRecord> nodes;
    parser::LineScanner scanner(input, source);
    while (scanner.next()) {
        auto fields = scanner.split_whitespace();
        scanner.require_fields(fields, 3);

        NodeRecord node;
        node.id = scanner.parse_int(fields[0], "node id");
        node.lon = scanner.parse_double(fields[1], "longitude");
        node.lat = scanner.parse_double(fields[2], "latitude");
        if (node.id < 0) {
            scanner.fail("negative node id");
        }
        nodes.push_back(node);
    }
    return nodes;
}

std::vector<EdgeRecord> CoordinateTableLoader::read_edges(std::istream& input,
                                                          const std::string& source) {
    std::vector<EdgeRecord> edges;
    parser::LineScanner scanner(input, source);
    while (scanner.next()) {
        auto fields = scanner.split_whitespace();
        scanner.require_fields(fields, 4);

        // fields[0] is the dataset's own edge id, not needed downstream
        EdgeRecord edge;
        edge.src = scanner.parse_int(fields[1], "source node");
        edge.dst = scanner.parse_int(fields[2], "destination node");
        edge.distance = scanner.parse_double(fields[3], "distance");
        if (edge.distance < 0.0) {
            scanner.fail("negative distance");
        }
        edges.push_back(edge);
    }
    return edges;
}

RawGraph CoordinateTableLoader::load(const std::filesystem::path& input_dir) const {
    auto log = logging::get_logger();
    require_files(input_dir);

    RawGraph raw;

    std::filesystem::path node_path = input_dir / NODE_FILE;
    std::ifstream node_file(node_path);
    if (!node_file) {
        throw std::runtime_error("Cannot open file: " + node_path.string());
    }
    raw.nodes = read_nodes(node_file, node_path.string());
    log->debug("Read {} nodes from {}", raw.nodes.size(), node_path.string());

    std::filesystem::path edge_path = input_dir / EDGE_FILE;
    std::ifstream edge_file(edge_path);
    if (!edge_file) {
        throw std::runtime_error("Cannot open file: " + edge_path.string());
    }
    raw.edges = read_edges(edge_file, edge_path.string());
    log->debug("Read {} edges from {}", raw.edges.size(), edge_path.string());

    return raw;
}

}  // namespace widepath
