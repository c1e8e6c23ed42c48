#ifndef WIDEPATH_FORMAT_WIDE_PATH_WRITER_HPP
#define WIDEPATH_FORMAT_WIDE_PATH_WRITER_HPP

#include <graph/canonical_graph.hpp>
#include <synth/attribute_synthesizer.hpp>
#include <timegrid/time_grid.hpp>
#include <cstddef>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace widepath {

constexpr int DEFAULT_CLUSTER_ID = 1;

// Shortest decimal that reads back to the same double, always with a
// fractional part: 3.5 -> "3.5", 5.0 -> "5.0", 1e-07 -> "1e-07".
std::string format_decimal(double value);

// Fixed six decimals, as used for travel costs
std::string format_cost(double value);

// "<id> <lat> <lon> <cluster>"
std::string format_node_line(const NodeRecord& node, int cluster_id = DEFAULT_CLUSTER_ID);

// "<src> <dst> <c1,...,cK> <baseWidth> <rushWidth> <distance>"
std::string format_edge_line(const EdgeRecord& edge, const EdgeAttributes& attrs);

// Nodes ascending by id
void write_nodes(std::ostream& out, const CanonicalGraph& graph);

// Two header lines (arrival points, width points), then one line per canonical edge.
// Throws std::invalid_argument if attributes are not aligned with the graph and grid.
void write_edges(std::ostream& out,
                 const CanonicalGraph& graph,
                 const std::vector<EdgeAttributes>& attributes,
                 const TimeGrid& grid);

struct WrittenFiles {
    std::filesystem::path nodes_path;
    std::filesystem::path edges_path;
};

// Writes nodes_<N>.txt and edges_<N>.txt, N being the canonical node count
class WidePathWriter {
public:
    explicit WidePathWriter(std::filesystem::path output_dir);

    std::filesystem::path nodes_path(size_t node_count) const;
    std::filesystem::path edges_path(size_t node_count) const;

    WrittenFiles write(const CanonicalGraph& graph,
                       const std::vector<EdgeAttributes>& attributes,
                       const TimeGrid& grid) const;

private:
    std::filesystem::path output_dir_;
};

}  // namespace widepath

#endif // WIDEPATH_FORMAT_WIDE_PATH_WRITER_HPP
