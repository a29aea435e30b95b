#include <vector>

#include <gmock/gmock.h>

#include "tests/core/graph_factories.h"
#include "tests/core/graph_helpers.h"

#include "klpart-core/datastructures/partitioned_graph.h"
#include "klpart-core/metrics.h"

#include "klpart-common/random.h"

namespace klpart::testing {
class MetricsTestFixture : public ::testing::Test {
public:
  // Star with center 0 and leaves 1, 2, 3, 4
  MetricsTestFixture() : graph(make_graph({0, 4, 5, 6, 7, 8}, {1, 2, 3, 4, 0, 0, 0, 0})) {}

  CSRGraph graph;
};

TEST_F(MetricsTestFixture, parallel_bipartition_edge_cut) {
  PartitionedGraph p_graph = make_p_graph(graph, 2, {0, 1, 1, 1, 1});
  EXPECT_EQ(metrics::edge_cut(p_graph), 4);

  // star center and one leaf swap blocks, should reduce the edge cut to 1
  p_graph.swap_blocks(0, 1);
  EXPECT_EQ(metrics::edge_cut(p_graph), 1);
}

TEST_F(MetricsTestFixture, sequential_bipartition_edge_cut) {
  PartitionedGraph p_graph = make_p_graph(graph, 2, {0, 1, 1, 1, 1});
  EXPECT_EQ(metrics::edge_cut_seq(p_graph), 4);

  p_graph.swap_blocks(0, 1);
  EXPECT_EQ(metrics::edge_cut_seq(p_graph), 1);
}

TEST_F(MetricsTestFixture, singleton_blocks_cut_every_edge) {
  const PartitionedGraph p_graph = make_p_graph(graph, 5, {0, 1, 2, 3, 4});
  EXPECT_EQ(metrics::edge_cut(p_graph), 4);
  EXPECT_EQ(metrics::edge_cut_seq(p_graph), 4);
}

TEST_F(MetricsTestFixture, single_block_cuts_nothing) {
  const std::vector<BlockID> partition(5, 0);
  EXPECT_EQ(metrics::edge_cut(graph, partition), 0);
}

TEST_F(MetricsTestFixture, perfectly_balanced_partition_has_no_imbalance) {
  const PartitionedGraph p_graph = make_p_graph(graph, 5, {0, 1, 2, 3, 4});
  EXPECT_DOUBLE_EQ(metrics::imbalance(p_graph), 0.0);
}

TEST_F(MetricsTestFixture, imbalanced_bipartition_balance) {
  const PartitionedGraph p_graph = make_p_graph(graph, 2, {0, 0, 0, 0, 1});
  // perfectly balanced block size: 2.5, largest block: 4 --> imbalance 60%
  EXPECT_DOUBLE_EQ(metrics::imbalance(p_graph), 0.6);
}

TEST_F(MetricsTestFixture, count_cut_edges_does_not_modify_assignment) {
  const std::vector<BlockID> assignment = {1, 0, 1, 0, 1};
  const std::vector<BlockID> copy = assignment;

  EXPECT_EQ(count_cut_edges(graph, assignment), 2);
  EXPECT_EQ(count_cut_edges(graph, assignment), 2);
  EXPECT_EQ(assignment, copy);
}

TEST_F(MetricsTestFixture, count_cut_edges_rejects_assignment_of_wrong_length) {
  const std::vector<BlockID> assignment = {0, 1, 0};
  EXPECT_THROW((void)count_cut_edges(graph, assignment), ParameterError);
}

TEST(MetricsTest, parallel_and_sequential_edge_cut_agree) {
  const CSRGraph graph = make_grid_graph(20, 30);
  Random rand(5);

  for (int repetition = 0; repetition < 10; ++repetition) {
    std::vector<BlockID> partition(graph.n());
    for (BlockID &block : partition) {
      block = static_cast<BlockID>(rand.random_index(0, 4));
    }

    EXPECT_EQ(metrics::edge_cut(graph, partition), metrics::edge_cut_seq(graph, partition));
  }
}

TEST(MetricsTest, edge_counted_iff_endpoints_in_different_blocks) {
  const CSRGraph graph = make_path_graph(4); // 0 - 1 - 2 - 3
  EXPECT_EQ(metrics::edge_cut(graph, std::vector<BlockID>{0, 0, 0, 0}), 0);
  EXPECT_EQ(metrics::edge_cut(graph, std::vector<BlockID>{0, 0, 1, 1}), 1);
  EXPECT_EQ(metrics::edge_cut(graph, std::vector<BlockID>{0, 1, 0, 1}), 3);
  EXPECT_EQ(metrics::edge_cut(graph, std::vector<BlockID>{0, 1, 1, 0}), 2);
}

TEST(MetricsTest, each_undirected_edge_is_counted_once_from_its_smaller_endpoint) {
  // The edge 0 -- 1 is only stored as 0 -> 1
  const CSRGraph graph = load_graph(2, {1}, {0, 1, 1});

  EXPECT_EQ(count_cut_edges(graph, std::vector<BlockID>{0, 1}), 1);
  EXPECT_EQ(metrics::edge_cut_seq(graph, std::vector<BlockID>{0, 1}), 1);
  EXPECT_EQ(count_cut_edges(graph, std::vector<BlockID>{0, 0}), 0);
}

TEST(MetricsTest, balance_predicates) {
  const CSRGraph graph = make_path_graph(6);
  Context ctx = create_default_context();
  ctx.partition.enforce_min_block_size = true;
  ctx.partition.setup(graph, 3, 0.0); // min 2, max 2

  EXPECT_TRUE(metrics::is_feasible(make_p_graph(graph, 3, {0, 0, 1, 1, 2, 2}), ctx.partition));

  const PartitionedGraph skewed = make_p_graph(graph, 3, {0, 0, 0, 1, 1, 2});
  EXPECT_FALSE(metrics::is_balanced(skewed, ctx.partition));
  EXPECT_FALSE(metrics::is_min_balanced(skewed, ctx.partition));
  EXPECT_FALSE(metrics::is_feasible(skewed, ctx.partition));
}
} // namespace klpart::testing
