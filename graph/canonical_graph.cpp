#include "canonical_graph.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <map>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>

namespace widepath {

namespace {

constexpr size_t MAX_REPORTED_IDS = 20;

std::string join_ids(const std::vector<NodeId>& ids) {
    std::ostringstream oss;
    for (size_t i = 0; i < ids.size() && i < MAX_REPORTED_IDS; ++i) {
        if (i > 0) oss << ",";
        oss << ids[i];
    }
    if (ids.size() > MAX_REPORTED_IDS) {
        oss << ",... (" << ids.size() << " total)";
    }
    return oss.str();
}

}  // namespace

IdPolicy id_policy_from_string(std::string_view name) {
    if (name == "validate") return IdPolicy::ValidateOnly;
    if (name == "renumber") return IdPolicy::Renumber;
    throw ConfigError("Unknown id policy: " + std::string(name));
}

const char* to_string(IdPolicy policy) {
    switch (policy) {
        case IdPolicy::ValidateOnly: return "validate";
        case IdPolicy::Renumber: return "renumber";
    }
    return "unknown";
}

std::vector<EdgeRecord> dedupe_edges(const std::vector<EdgeRecord>& edges) {
    std::map<std::pair<NodeId, NodeId>, EdgeRecord> shortest;
    for (const auto& edge : edges) {
        auto key = std::make_pair(edge.src, edge.dst);
        auto it = shortest.find(key);
        if (it == shortest.end()) {
            shortest.emplace(key, edge);
        } else if (edge.distance < it->second.distance) {
            it->second = edge;
        }
    }

    std::vector<EdgeRecord> result;
    result.reserve(shortest.size());
    for (const auto& [key, edge] : shortest) {
        result.push_back(edge);
    }
    return result;
}

void ensure_ids_contiguous(const std::vector<NodeRecord>& nodes,
                           const std::vector<EdgeRecord>& edges) {
    if (nodes.empty()) {
        throw GraphIntegrityError("Node set is empty");
    }

    const NodeId n = static_cast<NodeId>(nodes.size());
    std::vector<bool> seen(nodes.size(), false);
    std::vector<NodeId> out_of_range;
    std::vector<NodeId> duplicated;
    for (const auto& node : nodes) {
        if (node.id < 0 || node.id >= n) {
            out_of_range.push_back(node.id);
        } else if (seen[static_cast<size_t>(node.id)]) {
            duplicated.push_back(node.id);
        } else {
            seen[static_cast<size_t>(node.id)] = true;
        }
    }

    std::vector<NodeId> missing;
    for (NodeId id = 0; id < n; ++id) {
        if (!seen[static_cast<size_t>(id)]) {
            missing.push_back(id);
        }
    }

    if (!missing.empty() || !out_of_range.empty() || !duplicated.empty()) {
        std::ostringstream oss;
        oss << "Node ids are not contiguous from 0.." << (n - 1) << ".";
        if (!missing.empty()) oss << " Missing: " << join_ids(missing) << ".";
        if (!out_of_range.empty()) oss << " Out of range: " << join_ids(out_of_range) << ".";
        if (!duplicated.empty()) oss << " Duplicated: " << join_ids(duplicated) << ".";
        throw GraphIntegrityError(oss.str());
    }

    std::vector<NodeId> unknown;
    for (const auto& edge : edges) {
        for (NodeId endpoint : {edge.src, edge.dst}) {
            if (endpoint < 0 || endpoint >= n) {
                unknown.push_back(endpoint);
            }
        }
    }
    if (!unknown.empty()) {
        std::sort(unknown.begin(), unknown.end());
        unknown.erase(std::unique(unknown.begin(), unknown.end()), unknown.end());
        throw GraphIntegrityError("Edges reference unknown nodes: " + join_ids(unknown));
    }
}

RenumberResult renumber_contiguous(const std::vector<NodeRecord>& nodes,
                                   const std::vector<EdgeRecord>& edges) {
    RenumberResult result;

    result.new_to_old.reserve(edges.size() * 2);
    for (const auto& edge : edges) {
        result.new_to_old.push_back(edge.src);
        result.new_to_old.push_back(edge.dst);
    }
    std::sort(result.new_to_old.begin(), result.new_to_old.end());
    result.new_to_old.erase(std::unique(result.new_to_old.begin(), result.new_to_old.end()),
                            result.new_to_old.end());

    std::unordered_map<NodeId, NodeId> old_to_new;
    old_to_new.reserve(result.new_to_old.size());
    for (size_t i = 0; i < result.new_to_old.size(); ++i) {
        old_to_new.emplace(result.new_to_old[i], static_cast<NodeId>(i));
    }

    // First record wins if a loader reported the same raw id twice
    std::unordered_map<NodeId, const NodeRecord*> by_raw_id;
    by_raw_id.reserve(nodes.size());
    for (const auto& node : nodes) {
        by_raw_id.emplace(node.id, &node);
    }

    std::vector<NodeId> unknown;
    result.nodes.reserve(result.new_to_old.size());
    for (size_t i = 0; i < result.new_to_old.size(); ++i) {
        NodeId old_id = result.new_to_old[i];
        auto it = by_raw_id.find(old_id);
        if (it == by_raw_id.end()) {
            unknown.push_back(old_id);
            continue;
        }
        NodeRecord renumbered = *it->second;
        renumbered.id = static_cast<NodeId>(i);
        result.nodes.push_back(renumbered);
    }
    if (!unknown.empty()) {
        throw GraphIntegrityError("Edges reference nodes without coordinates: " +
                                  join_ids(unknown));
    }

    result.edges.reserve(edges.size());
    for (const auto& edge : edges) {
        result.edges.push_back(EdgeRecord{
            .src = old_to_new.at(edge.src),
            .dst = old_to_new.at(edge.dst),
            .distance = edge.distance
        });
    }

    return result;
}

CanonicalGraph CanonicalGraph::from_raw(const RawGraph& raw, IdPolicy policy) {
    auto log = logging::get_logger();

    if (raw.nodes.empty()) {
        throw GraphIntegrityError("Node set is empty");
    }

    CanonicalGraph graph;
    graph.raw_edge_count_ = raw.edges.size();

    if (policy == IdPolicy::ValidateOnly) {
        ensure_ids_contiguous(raw.nodes, raw.edges);
        graph.edges_ = dedupe_edges(raw.edges);
        graph.nodes_ = raw.nodes;
        std::sort(graph.nodes_.begin(), graph.nodes_.end(),
                  [](const NodeRecord& a, const NodeRecord& b) { return a.id < b.id; });
    } else {
        RenumberResult renumbered = renumber_contiguous(raw.nodes, dedupe_edges(raw.edges));
        graph.unreferenced_nodes_dropped_ = raw.nodes.size() - renumbered.nodes.size();
        graph.nodes_ = std::move(renumbered.nodes);
        graph.edges_ = std::move(renumbered.edges);
    }

    const NodeId n = static_cast<NodeId>(graph.nodes_.size());
    for (const auto& edge : graph.edges_) {
        if (edge.src < 0 || edge.src >= n || edge.dst < 0 || edge.dst >= n) {
            std::ostringstream oss;
            oss << "Edge (" << edge.src << ", " << edge.dst
                << ") references a node outside 0.." << (n - 1);
            throw GraphIntegrityError(oss.str());
        }
    }

    log->debug("Canonicalized graph ({} policy): {} nodes, {} edges, "
               "{} duplicate edges dropped, {} unreferenced nodes dropped",
               to_string(policy), graph.node_count(), graph.edge_count(),
               graph.duplicate_edges_dropped(), graph.unreferenced_nodes_dropped());

    return graph;
}

}  // namespace widepath
