#ifndef WIDEPATH_GRAPH_CANONICAL_GRAPH_HPP
#define WIDEPATH_GRAPH_CANONICAL_GRAPH_HPP

#include "graph_records.hpp"
#include <cstddef>
#include <string_view>
#include <vector>

namespace widepath {

// How a dataset's raw ids are turned into the contiguous 0..N-1 space.
enum class IdPolicy {
    ValidateOnly,  // Raw ids must already be exactly {0..N-1}
    Renumber       // Keep referenced nodes only, renumbered by ascending raw id
};

IdPolicy id_policy_from_string(std::string_view name);
const char* to_string(IdPolicy policy);

// Graph handed to the attribute synthesizer and the serializer.
// nodes()[i].id == i for every i; edges() are unique and sorted by (src, dst),
// and every endpoint is a valid index into nodes().
class CanonicalGraph {
public:
    CanonicalGraph() = default;

    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const { return edges_.size(); }
    const std::vector<NodeRecord>& nodes() const { return nodes_; }
    const std::vector<EdgeRecord>& edges() const { return edges_; }

    // Canonicalization counters, for reporting
    size_t duplicate_edges_dropped() const { return raw_edge_count_ - edges_.size(); }
    size_t unreferenced_nodes_dropped() const { return unreferenced_nodes_dropped_; }

    // Deduplicate, apply the id policy and verify referential integrity.
    // Throws GraphIntegrityError when the result cannot satisfy the invariants.
    static CanonicalGraph from_raw(const RawGraph& raw, IdPolicy policy);

private:
    std::vector<NodeRecord> nodes_;
    std::vector<EdgeRecord> edges_;
    size_t raw_edge_count_ = 0;
    size_t unreferenced_nodes_dropped_ = 0;
};

// Collapse parallel edges to the shortest one (first encountered wins a tie)
// and sort by (src, dst). Idempotent.
std::vector<EdgeRecord> dedupe_edges(const std::vector<EdgeRecord>& edges);

// Throws GraphIntegrityError unless node ids are exactly {0..N-1} and every
// edge endpoint is one of them.
void ensure_ids_contiguous(const std::vector<NodeRecord>& nodes,
                           const std::vector<EdgeRecord>& edges);

struct RenumberResult {
    std::vector<NodeRecord> nodes;     // Indexed by new id
    std::vector<EdgeRecord> edges;     // Endpoints remapped, order preserved
    std::vector<NodeId> new_to_old;    // new id -> raw id
};

// Assign new ids 0..M-1 to the raw ids referenced by edges, in ascending raw-id order.
// Nodes never referenced are dropped. Throws GraphIntegrityError if a referenced id
// has no node record.
RenumberResult renumber_contiguous(const std::vector<NodeRecord>& nodes,
                                   const std::vector<EdgeRecord>& edges);

}  // namespace widepath

#endif // WIDEPATH_GRAPH_CANONICAL_GRAPH_HPP
