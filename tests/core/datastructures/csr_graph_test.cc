#include <vector>

#include <gmock/gmock.h>

#include "tests/core/graph_factories.h"
#include "tests/core/graph_helpers.h"

#include "klpart-core/datastructures/csr_graph.h"

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::UnorderedElementsAre;

namespace klpart::testing {
TEST(CSRGraphTest, triangle_has_expected_structure) {
  const CSRGraph graph = load_graph(3, {1, 2, 0, 2, 0, 1}, {0, 2, 4, 6});

  EXPECT_EQ(graph.n(), 3);
  EXPECT_EQ(graph.m(), 6);
  EXPECT_EQ(graph.max_degree(), 2);
  EXPECT_THAT(degrees(graph), ElementsAre(2, 2, 2));

  std::vector<NodeID> neighbors;
  graph.adjacent_nodes(1, [&](const NodeID v) { neighbors.push_back(v); });
  EXPECT_THAT(neighbors, UnorderedElementsAre(0, 2));
  EXPECT_THAT(view_to_vector(graph.neighbors(2)), UnorderedElementsAre(0, 1));
}

TEST(CSRGraphTest, adjacent_nodes_can_stop_early) {
  const CSRGraph graph = make_complete_graph(5);

  int visited = 0;
  graph.adjacent_nodes(0, [&](const NodeID) {
    ++visited;
    return visited == 2;
  });
  EXPECT_EQ(visited, 2);
}

TEST(CSRGraphTest, edgeless_graph_is_valid) {
  const CSRGraph graph = load_graph(4, {}, {0, 0, 0, 0, 0});
  EXPECT_EQ(graph.n(), 4);
  EXPECT_EQ(graph.m(), 0);
  EXPECT_EQ(graph.max_degree(), 0);
}

TEST(CSRGraphTest, isolated_vertices_are_allowed) {
  // 0 -- 1, 2 isolated
  const CSRGraph graph = load_graph(3, {1, 0}, {0, 1, 2, 2});
  EXPECT_EQ(graph.degree(2), 0);
  EXPECT_TRUE(debug::validate_graph(graph));
}

TEST(CSRGraphTest, rejects_empty_graph) {
  EXPECT_THROW(load_graph(0, {}, {0}), StructuralError);
}

TEST(CSRGraphTest, rejects_offset_array_of_wrong_length) {
  EXPECT_THROW(load_graph(3, {1, 0}, {0, 1, 2}), StructuralError);
  EXPECT_THROW(load_graph(2, {1, 0}, {0, 1, 2, 2}), StructuralError);
}

TEST(CSRGraphTest, rejects_offsets_not_starting_at_zero) {
  EXPECT_THROW(load_graph(2, {1, 0}, {1, 1, 2}), StructuralError);
}

TEST(CSRGraphTest, rejects_decreasing_offsets) {
  EXPECT_THROW(load_graph(3, {1, 0}, {0, 2, 1, 2}), StructuralError);
}

TEST(CSRGraphTest, rejects_last_offset_not_matching_neighbors) {
  EXPECT_THROW(load_graph(2, {1, 0, 1}, {0, 1, 2}), StructuralError);
  EXPECT_THROW(load_graph(2, {1}, {0, 1, 2}), StructuralError);
}

TEST(CSRGraphTest, rejects_neighbor_out_of_range) {
  try {
    (void)load_graph(2, {1, 2}, {0, 1, 2});
    FAIL() << "expected StructuralError";
  } catch (const StructuralError &e) {
    EXPECT_THAT(e.what(), HasSubstr("refers to vertex 2"));
  }
}

TEST(CSRGraphTest, validate_graph_detects_self_loops) {
  const CSRGraph graph = make_graph({0, 2, 3}, {0, 1, 0});
  EXPECT_FALSE(debug::validate_graph(graph));
}

TEST(CSRGraphTest, validate_graph_detects_multi_edges) {
  const CSRGraph graph = make_graph({0, 2, 4}, {1, 1, 0, 0});
  EXPECT_FALSE(debug::validate_graph(graph));
}

TEST(CSRGraphTest, validate_graph_detects_missing_reverse_edges) {
  const CSRGraph graph = make_graph({0, 1, 1}, {1});
  EXPECT_FALSE(debug::validate_graph(graph));
}

TEST(CSRGraphTest, validate_graph_accepts_factory_graphs) {
  EXPECT_TRUE(debug::validate_graph(make_grid_graph(4, 5)));
  EXPECT_TRUE(debug::validate_graph(make_complete_graph(6)));
  EXPECT_TRUE(debug::validate_graph(make_complete_bipartite_graph(3, 4)));
  EXPECT_TRUE(debug::validate_graph(make_clique_chain_graph(3, 4)));
  EXPECT_TRUE(debug::validate_graph(make_cycle_graph(7)));
}
} // namespace klpart::testing
