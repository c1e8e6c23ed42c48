#ifndef WIDEPATH_FORMAT_WIDE_PATH_READER_HPP
#define WIDEPATH_FORMAT_WIDE_PATH_READER_HPP

#include <graph/graph_records.hpp>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace widepath {

struct NodeLine {
    NodeId id = 0;
    double lat = 0.0;
    double lon = 0.0;
    int cluster_id = 0;
};

struct EdgeLine {
    NodeId src = 0;
    NodeId dst = 0;
    std::vector<double> costs;
    double base_width = 0.0;
    double rush_width = 0.0;
    double distance = 0.0;
};

struct EdgeFile {
    std::vector<int> arrival_points;
    std::vector<int> width_points;
    std::vector<EdgeLine> edges;
};

// Readers for the files the solver consumes. Lines are parsed as written;
// semantic checks live in check_wide_path().
std::vector<NodeLine> read_node_file(std::istream& input, const std::string& source);
EdgeFile read_edge_file(std::istream& input, const std::string& source);

// Throw InputNotFoundError if the file does not exist
std::vector<NodeLine> read_node_file(const std::filesystem::path& path);
EdgeFile read_edge_file(const std::filesystem::path& path);

}  // namespace widepath

#endif // WIDEPATH_FORMAT_WIDE_PATH_READER_HPP
