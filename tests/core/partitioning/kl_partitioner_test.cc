#include <algorithm>
#include <cmath>
#include <vector>

#include <gmock/gmock.h>
#include <tbb/global_control.h>

#include "tests/core/graph_factories.h"
#include "tests/core/graph_helpers.h"

#include "klpart-core/metrics.h"
#include "klpart-core/partitioning/kl_partitioner.h"

using ::testing::Each;
using ::testing::ElementsAre;
using ::testing::Le;
using ::testing::SizeIs;
using ::testing::UnorderedElementsAre;

namespace klpart::testing {
namespace {
// Two triangles {0, 1, 2} and {3, 4, 5} joined by the edge 2 -- 3
CSRGraph make_two_triangles_graph() {
  EdgeBasedGraphBuilder builder(6);
  builder.add_edge(0, 1);
  builder.add_edge(1, 2);
  builder.add_edge(0, 2);
  builder.add_edge(3, 4);
  builder.add_edge(4, 5);
  builder.add_edge(3, 5);
  builder.add_edge(2, 3);
  return builder.build();
}

void expect_valid_result(const CSRGraph &graph, const BlockID k, const PartitionResult &result) {
  ASSERT_THAT(result.partition, SizeIs(graph.n()));
  ASSERT_THAT(result.blocks, SizeIs(k));

  // Every vertex is listed exactly once, in the block it is assigned to
  std::vector<int> seen(graph.n(), 0);
  for (BlockID b = 0; b < k; ++b) {
    EXPECT_TRUE(std::is_sorted(result.blocks[b].begin(), result.blocks[b].end()));
    for (const NodeID u : result.blocks[b]) {
      ++seen[u];
      EXPECT_EQ(result.partition[u], b);
    }
  }
  EXPECT_THAT(seen, Each(1));

  EXPECT_EQ(result.cut, metrics::edge_cut(graph, result.partition));
}
} // namespace

TEST(KLPartitionerTest, triangle_is_split_into_blocks_of_size_one_and_two) {
  const CSRGraph graph = make_complete_graph(3);

  for (int seed = 0; seed < 5; ++seed) {
    Context ctx = make_context(2, 50.0);
    ctx.seed = seed;
    const PartitionResult result = partition(graph, ctx);

    expect_valid_result(graph, 2, result);
    EXPECT_THAT(
        (std::vector<std::size_t>{result.blocks[0].size(), result.blocks[1].size()}),
        UnorderedElementsAre(1, 2)
    );
    // Any split of a triangle cuts two of its three edges
    EXPECT_EQ(result.cut, 2);
  }
}

TEST(KLPartitionerTest, two_triangles_are_separated_for_every_seed) {
  const CSRGraph graph = make_two_triangles_graph();

  for (int seed = 0; seed < 20; ++seed) {
    Context ctx = make_context(2, 0.0);
    ctx.seed = seed;
    const PartitionResult result = partition(graph, ctx);

    expect_valid_result(graph, 2, result);
    EXPECT_EQ(result.cut, 1);
    EXPECT_THAT(
        result.blocks,
        UnorderedElementsAre(ElementsAre(0, 1, 2), ElementsAre(3, 4, 5))
    );
  }
}

TEST(KLPartitionerTest, two_triangles_are_separated_from_contiguous_start) {
  const CSRGraph graph = make_two_triangles_graph();

  Context ctx = create_contiguous_context();
  ctx.partition.k = 2;
  ctx.partition.margin = 0.0;
  const PartitionResult result = partition(graph, ctx);

  EXPECT_EQ(result.cut, 1);
  EXPECT_EQ(result.num_passes, 1);
}

TEST(KLPartitionerTest, singleton_blocks_cut_every_edge) {
  const CSRGraph graph = make_grid_graph(3, 4);
  const PartitionResult result = partition(graph, graph.n(), 0.0);

  expect_valid_result(graph, graph.n(), result);
  EXPECT_EQ(result.cut, graph.m() / 2);
  for (const auto &block : result.blocks) {
    EXPECT_THAT(block, SizeIs(1));
  }
}

TEST(KLPartitionerTest, rejects_single_block) {
  const CSRGraph graph = make_path_graph(4);

  KLPartitioner partitioner(graph, make_context(1, 0.0));
  EXPECT_THROW(partitioner.partition(), ParameterError);
  EXPECT_EQ(partitioner.state(), PartitionerState::FAILED);
}

TEST(KLPartitionerTest, rejects_invalid_parameters) {
  const CSRGraph graph = make_path_graph(4);
  EXPECT_THROW(partition(graph, 0, 0.0), ParameterError);
  EXPECT_THROW(partition(graph, 5, 0.0), ParameterError);
  EXPECT_THROW(partition(graph, 2, -5.0), ParameterError);
}

TEST(KLPartitionerTest, accepts_huge_margin) {
  const CSRGraph graph = make_empty_graph(10);

  const PartitionResult result = partition(graph, 2, 85899345840.0);
  expect_valid_result(graph, 2, result);
  EXPECT_EQ(result.cut, 0);
}

TEST(KLPartitionerTest, state_is_done_after_success) {
  const CSRGraph graph = make_path_graph(4);

  KLPartitioner partitioner(graph, make_context(2, 0.0));
  EXPECT_EQ(partitioner.state(), PartitionerState::UNINITIALIZED);
  partitioner.partition();
  EXPECT_EQ(partitioner.state(), PartitionerState::DONE);
}

TEST(KLPartitionerTest, partition_is_balanced) {
  const CSRGraph graph = make_grid_graph(10, 10);

  for (const BlockID k : {2u, 3u, 4u, 7u}) {
    for (const double margin : {0.0, 3.0, 20.0}) {
      const PartitionResult result = partition(graph, k, margin);
      expect_valid_result(graph, k, result);

      const BlockSize max_block_size =
          static_cast<BlockSize>(std::ceil(graph.n() * (100.0 + margin) / (100.0 * k)));
      for (const auto &block : result.blocks) {
        EXPECT_LE(block.size(), max_block_size);
      }
    }
  }
}

TEST(KLPartitionerTest, partition_does_not_change_block_sizes_of_initial_partition) {
  const CSRGraph graph = make_grid_graph(5, 7);
  const PartitionResult result = partition(graph, 3, 100.0);

  // Swaps never change block sizes, thus the sizes stay those of the round-robin deal
  std::vector<std::size_t> sizes;
  for (const auto &block : result.blocks) {
    sizes.push_back(block.size());
  }
  EXPECT_THAT(sizes, ElementsAre(12, 12, 11));
}

TEST(KLPartitionerTest, strict_preset_enforces_lower_bound) {
  const CSRGraph graph = make_grid_graph(6, 6);

  Context ctx = create_strict_context();
  ctx.partition.k = 5;
  ctx.partition.margin = 10.0;

  KLPartitioner partitioner(graph, ctx);
  const PartitionResult result = partitioner.partition();
  EXPECT_EQ(partitioner.context().partition.min_block_size(), 7);
  for (const auto &block : result.blocks) {
    EXPECT_GE(block.size(), 7);
  }
}

TEST(KLPartitionerTest, same_seed_yields_same_result) {
  const CSRGraph graph = make_grid_graph(12, 9);

  Context ctx = make_context(4, 5.0);
  ctx.seed = 123;
  const PartitionResult first = partition(graph, ctx);
  const PartitionResult second = partition(graph, ctx);

  EXPECT_EQ(first.partition, second.partition);
  EXPECT_EQ(first.cut, second.cut);
  EXPECT_EQ(first.num_passes, second.num_passes);
}

TEST(KLPartitionerTest, result_does_not_depend_on_number_of_threads) {
  const CSRGraph graph = make_grid_graph(16, 16);
  Context ctx = make_context(4, 0.0);
  ctx.seed = 7;

  const auto partition_with = [&](const int num_threads) {
    tbb::global_control gc(tbb::global_control::max_allowed_parallelism, num_threads);
    return partition(graph, ctx).partition;
  };

  const std::vector<BlockID> sequential = partition_with(1);
  EXPECT_EQ(partition_with(2), sequential);
  EXPECT_EQ(partition_with(6), sequential);
}

TEST(KLPartitionerTest, refinement_improves_clique_chain) {
  const CSRGraph graph = make_clique_chain_graph(4, 5);

  for (int seed = 0; seed < 5; ++seed) {
    Context ctx = make_context(4, 0.0);
    ctx.seed = seed;
    ctx.refinement.record_swaps = true;
    const PartitionResult result = partition(graph, ctx);

    ASSERT_FALSE(result.history.empty());
    EXPECT_LE(result.cut, result.history.front().initial_cut);
  }
}

TEST(KLPartitionerTest, history_is_empty_unless_requested) {
  const CSRGraph graph = make_grid_graph(4, 4);
  EXPECT_TRUE(partition(graph, 2, 0.0).history.empty());
}

TEST(KLPartitionerTest, history_records_every_refinement_step) {
  const CSRGraph graph = make_grid_graph(8, 8);

  Context ctx = make_context(3, 5.0);
  ctx.seed = 2;
  ctx.refinement.record_swaps = true;
  const PartitionResult result = partition(graph, ctx);

  // One step per pair of blocks and pass
  ASSERT_EQ(result.history.size(), 3 * result.num_passes);

  EdgeWeight cut = result.history.front().initial_cut;
  for (std::size_t i = 0; i < result.history.size(); ++i) {
    const RefinementStep &step = result.history[i];
    EXPECT_EQ(step.pass, static_cast<int>(i / 3));
    EXPECT_LT(step.block_a, step.block_b);
    EXPECT_EQ(step.initial_cut, cut);
    EXPECT_LE(step.num_committed_swaps, step.swaps.size());

    // Each swap exchanges a vertex of block A with a vertex of block B and the cuts are
    // consistent with the gains
    EdgeWeight swap_cut = step.initial_cut;
    for (const SwapRecord &swap : step.swaps) {
      EXPECT_EQ(swap.cut, swap_cut - swap.gain);
      swap_cut = swap.cut;
    }

    if (step.num_committed_swaps > 0) {
      const EdgeWeight committed_cut = step.swaps[step.num_committed_swaps - 1].cut;
      EXPECT_LT(committed_cut, cut);
      cut = committed_cut;
    }
  }

  EXPECT_EQ(cut, result.cut);
}

TEST(KLPartitionerTest, cut_never_increases_between_passes) {
  const CSRGraph graph = make_grid_graph(10, 10);

  Context ctx = make_context(4, 0.0);
  ctx.refinement.record_swaps = true;
  const PartitionResult result = partition(graph, ctx);

  std::vector<EdgeWeight> initial_cuts;
  for (const RefinementStep &step : result.history) {
    initial_cuts.push_back(step.initial_cut);
  }
  EXPECT_TRUE(std::is_sorted(initial_cuts.rbegin(), initial_cuts.rend()));
  EXPECT_THAT(initial_cuts, Each(Le(initial_cuts.front())));
}

TEST(KLPartitionerTest, pass_limit_is_respected) {
  const CSRGraph graph = make_grid_graph(10, 10);

  Context ctx = create_fast_context();
  ctx.partition.k = 4;
  ctx.partition.margin = 0.0;
  EXPECT_EQ(partition(graph, ctx).num_passes, 1);
}
} // namespace klpart::testing
