#ifndef WIDEPATH_GRAPH_GRAPH_RECORDS_HPP
#define WIDEPATH_GRAPH_GRAPH_RECORDS_HPP

#include <cstdint>
#include <vector>

namespace widepath {

using NodeId = int64_t;

struct NodeRecord {
    NodeId id = 0;
    double lat = 0.0;
    double lon = 0.0;
};

// Directed road segment. (src, dst) is the natural key before deduplication.
struct EdgeRecord {
    NodeId src = 0;
    NodeId dst = 0;
    double distance = 0.0;  // Same unit throughout a dataset (km or m)

    bool operator==(const EdgeRecord&) const = default;
};

// Records exactly as a loader produced them: ids may be sparse, edges may repeat.
struct RawGraph {
    std::vector<NodeRecord> nodes;
    std::vector<EdgeRecord> edges;
};

}  // namespace widepath

#endif // WIDEPATH_GRAPH_GRAPH_RECORDS_HPP
