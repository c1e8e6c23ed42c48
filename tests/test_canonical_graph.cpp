#include <gtest/gtest.h>
#include <graph/canonical_graph.hpp>
#include <common/errors.hpp>
#include "test_helpers.hpp"

using namespace widepath;
using widepath::test::edge;
using widepath::test::node;

// ============== Deduplication ==============

TEST(Dedupe, KeepsShortestParallelEdge) {
    auto result = dedupe_edges({edge(0, 1, 5.0), edge(0, 1, 3.2)});
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], edge(0, 1, 3.2));
}

TEST(Dedupe, EqualDistanceDuplicatesCollapse) {
    auto result = dedupe_edges({edge(2, 3, 4.0), edge(2, 3, 4.0), edge(2, 3, 7.0)});
    ASSERT_EQ(result.size(), 1u);
    EXPECT_DOUBLE_EQ(result[0].distance, 4.0);
}

TEST(Dedupe, SortsBySourceThenDestination) {
    auto result = dedupe_edges({edge(2, 0, 1.0), edge(0, 5, 1.0), edge(0, 1, 1.0), edge(1, 9, 1.0)});
    ASSERT_EQ(result.size(), 4u);
    EXPECT_EQ(result[0], edge(0, 1, 1.0));
    EXPECT_EQ(result[1], edge(0, 5, 1.0));
    EXPECT_EQ(result[2], edge(1, 9, 1.0));
    EXPECT_EQ(result[3], edge(2, 0, 1.0));
}

TEST(Dedupe, DirectionMatters) {
    auto result = dedupe_edges({edge(0, 1, 1.0), edge(1, 0, 2.0)});
    EXPECT_EQ(result.size(), 2u);
}

TEST(Dedupe, Idempotent) {
    std::vector<EdgeRecord> raw = {
        edge(3, 1, 2.0), edge(0, 1, 5.0), edge(3, 1, 1.5), edge(0, 1, 3.2),
        edge(1, 2, 0.0), edge(2, 2, 4.0), edge(1, 2, 0.5)
    };
    auto once = dedupe_edges(raw);
    auto twice = dedupe_edges(once);
    EXPECT_EQ(once, twice);
}

// ============== Validate-only policy ==============

TEST(EnsureIdsContiguous, AcceptsPermutedContiguousIds) {
    std::vector<NodeRecord> nodes = {node(2, 0, 0), node(0, 0, 0), node(1, 0, 0)};
    EXPECT_NO_THROW(ensure_ids_contiguous(nodes, {edge(0, 2, 1.0)}));
}

TEST(EnsureIdsContiguous, RejectsGap) {
    std::vector<NodeRecord> nodes = {node(0, 0, 0), node(2, 0, 0)};
    EXPECT_THROW(ensure_ids_contiguous(nodes, {}), GraphIntegrityError);
}

TEST(EnsureIdsContiguous, RejectsDuplicateId) {
    std::vector<NodeRecord> nodes = {node(0, 0, 0), node(0, 1, 1)};
    EXPECT_THROW(ensure_ids_contiguous(nodes, {}), GraphIntegrityError);
}

TEST(EnsureIdsContiguous, RejectsUnknownEndpoint) {
    std::vector<NodeRecord> nodes = {node(0, 0, 0), node(1, 0, 0)};
    try {
        ensure_ids_contiguous(nodes, {edge(0, 7, 1.0)});
        FAIL() << "expected GraphIntegrityError";
    } catch (const GraphIntegrityError& e) {
        EXPECT_NE(std::string(e.what()).find("7"), std::string::npos);
    }
}

TEST(EnsureIdsContiguous, RejectsEmptyNodeSet) {
    EXPECT_THROW(ensure_ids_contiguous({}, {}), GraphIntegrityError);
}

// ============== Renumber policy ==============

TEST(Renumber, MapsSortedReferencedIdsToSequentialIds) {
    std::vector<NodeRecord> nodes = {node(900, 1, 1), node(17, 2, 2), node(42, 3, 3), node(5, 4, 4)};
    std::vector<EdgeRecord> edges = {edge(900, 17, 1.0), edge(17, 42, 2.0)};

    RenumberResult result = renumber_contiguous(nodes, edges);

    // 17 -> 0, 42 -> 1, 900 -> 2; node 5 is never referenced
    ASSERT_EQ(result.new_to_old, (std::vector<NodeId>{17, 42, 900}));
    ASSERT_EQ(result.nodes.size(), 3u);
    EXPECT_EQ(result.nodes[0].id, 0);
    EXPECT_DOUBLE_EQ(result.nodes[0].lat, 2.0);
    EXPECT_EQ(result.nodes[1].id, 1);
    EXPECT_DOUBLE_EQ(result.nodes[1].lat, 3.0);
    EXPECT_EQ(result.nodes[2].id, 2);
    EXPECT_DOUBLE_EQ(result.nodes[2].lat, 1.0);

    ASSERT_EQ(result.edges.size(), 2u);
    EXPECT_EQ(result.edges[0], edge(2, 0, 1.0));
    EXPECT_EQ(result.edges[1], edge(0, 1, 2.0));
}

TEST(Renumber, BijectionWithinNewNodeCount) {
    std::vector<NodeRecord> nodes;
    std::vector<EdgeRecord> edges;
    for (NodeId i = 0; i < 50; ++i) {
        nodes.push_back(node(i * 37 + 11, 0, 0));
    }
    for (NodeId i = 0; i < 50; i += 3) {
        edges.push_back(edge(i * 37 + 11, ((i + 7) % 50) * 37 + 11, 1.0));
    }

    RenumberResult result = renumber_contiguous(nodes, edges);
    const NodeId m = static_cast<NodeId>(result.nodes.size());
    for (const auto& e : result.edges) {
        EXPECT_GE(e.src, 0);
        EXPECT_LT(e.src, m);
        EXPECT_GE(e.dst, 0);
        EXPECT_LT(e.dst, m);
    }
    for (size_t i = 1; i < result.new_to_old.size(); ++i) {
        EXPECT_LT(result.new_to_old[i - 1], result.new_to_old[i]);
    }
}

TEST(Renumber, MissingCoordinatesIsIntegrityError) {
    std::vector<NodeRecord> nodes = {node(1, 0, 0)};
    EXPECT_THROW(renumber_contiguous(nodes, {edge(1, 2, 1.0)}), GraphIntegrityError);
}

// ============== CanonicalGraph ==============

TEST(CanonicalGraph, EndToEndExampleKeepsIds) {
    RawGraph raw;
    raw.nodes = {node(0, 37.0, -122.0), node(1, 37.1, -122.1)};
    raw.edges = {edge(0, 1, 5.0)};

    CanonicalGraph graph = CanonicalGraph::from_raw(raw, IdPolicy::ValidateOnly);
    ASSERT_EQ(graph.node_count(), 2u);
    EXPECT_EQ(graph.nodes()[0].id, 0);
    EXPECT_EQ(graph.nodes()[1].id, 1);
    ASSERT_EQ(graph.edge_count(), 1u);
    EXPECT_EQ(graph.edges()[0], edge(0, 1, 5.0));
}

TEST(CanonicalGraph, ValidateOnlySortsNodesAndDropsDuplicates) {
    RawGraph raw;
    raw.nodes = {node(1, 1, 1), node(0, 0, 0)};
    raw.edges = {edge(1, 0, 2.0), edge(0, 1, 5.0), edge(0, 1, 3.2)};

    CanonicalGraph graph = CanonicalGraph::from_raw(raw, IdPolicy::ValidateOnly);
    EXPECT_EQ(graph.nodes()[0].id, 0);
    EXPECT_EQ(graph.nodes()[1].id, 1);
    ASSERT_EQ(graph.edge_count(), 2u);
    EXPECT_EQ(graph.edges()[0], edge(0, 1, 3.2));
    EXPECT_EQ(graph.duplicate_edges_dropped(), 1u);
}

TEST(CanonicalGraph, RenumberDropsUnreferencedNodes) {
    RawGraph raw;
    raw.nodes = {node(10, 0, 0), node(20, 0, 0), node(30, 0, 0)};
    raw.edges = {edge(30, 10, 1.0), edge(30, 10, 0.5)};

    CanonicalGraph graph = CanonicalGraph::from_raw(raw, IdPolicy::Renumber);
    EXPECT_EQ(graph.node_count(), 2u);
    EXPECT_EQ(graph.unreferenced_nodes_dropped(), 1u);
    ASSERT_EQ(graph.edge_count(), 1u);
    EXPECT_EQ(graph.edges()[0], edge(1, 0, 0.5));
}

TEST(CanonicalGraph, EmptyNodeSetFails) {
    RawGraph raw;
    raw.edges = {edge(0, 1, 1.0)};
    EXPECT_THROW(CanonicalGraph::from_raw(raw, IdPolicy::Renumber), GraphIntegrityError);
    EXPECT_THROW(CanonicalGraph::from_raw(raw, IdPolicy::ValidateOnly), GraphIntegrityError);
}

TEST(IdPolicy, ParsesNames) {
    EXPECT_EQ(id_policy_from_string("validate"), IdPolicy::ValidateOnly);
    EXPECT_EQ(id_policy_from_string("renumber"), IdPolicy::Renumber);
    EXPECT_THROW(id_policy_from_string("shuffle"), ConfigError);
}
