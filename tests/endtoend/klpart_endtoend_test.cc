/*******************************************************************************
 * End-to-end test for the library interface.
 *
 * @file:   klpart_endtoend_test.cc
 * @author: Daniel Seemaier
 * @date:   03.02.2026
 ******************************************************************************/
#include <stdexcept>
#include <vector>

#include <gmock/gmock.h>

#include "klpart/klpart.h"

#include "klpart-core/datastructures/csr_graph.h"

using ::testing::Each;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::SizeIs;

namespace klpart {
namespace data {
// Two triangles {0, 1, 2} and {3, 4, 5} joined by the edge 2 -- 3
static std::vector<EdgeID> xadj = {0, 2, 4, 7, 10, 12, 14};
static std::vector<NodeID> adjncy = {1, 2, 0, 2, 0, 1, 3, 2, 4, 5, 3, 5, 3, 4};
} // namespace data

TEST(KLPartEndToEndTest, separates_two_triangles_from_copied_graph) {
  for (const int seed : {0, 1, 2, 3, 4, 5, 6, 7, 8, 9}) {
    KLPart partitioner(2, create_default_context());
    partitioner.set_output_level(OutputLevel::QUIET);
    partitioner.reseed(seed);
    partitioner.copy_graph(data::xadj, data::adjncy);

    const PartitionResult result = partitioner.compute_partition(2, 0.0);
    EXPECT_EQ(result.cut, 1);
    ASSERT_THAT(result.blocks, SizeIs(2));
    EXPECT_THAT(result.blocks[result.partition[0]], ElementsAre(0, 1, 2));
    EXPECT_THAT(result.blocks[result.partition[5]], ElementsAre(3, 4, 5));
  }
}

TEST(KLPartEndToEndTest, stores_partition_in_output_span) {
  std::vector<BlockID> partition(6, kInvalidBlockID);

  KLPart partitioner(1, create_default_context());
  partitioner.set_output_level(OutputLevel::QUIET);
  partitioner.copy_graph(data::xadj, data::adjncy);

  EXPECT_EQ(partitioner.compute_partition(2, 0.0, partition), 1);
  EXPECT_EQ(partition[0], partition[1]);
  EXPECT_EQ(partition[1], partition[2]);
  EXPECT_EQ(partition[3], partition[4]);
  EXPECT_EQ(partition[4], partition[5]);
  EXPECT_NE(partition[0], partition[5]);
}

TEST(KLPartEndToEndTest, rejects_too_short_output_span) {
  std::vector<BlockID> partition(5);

  KLPart partitioner(1, create_default_context());
  partitioner.set_output_level(OutputLevel::QUIET);
  partitioner.copy_graph(data::xadj, data::adjncy);

  EXPECT_THROW(partitioner.compute_partition(2, 0.0, partition), std::invalid_argument);
}

TEST(KLPartEndToEndTest, checks_output_span_before_partitioning) {
  std::vector<BlockID> partition(5, kInvalidBlockID);

  KLPart partitioner(1, create_default_context());
  partitioner.set_output_level(OutputLevel::QUIET);
  partitioner.copy_graph(data::xadj, data::adjncy);

  // k = 1 would be rejected with a ParameterError if partitioning started
  try {
    partitioner.compute_partition(1, 0.0, partition);
    FAIL() << "expected std::invalid_argument";
  } catch (const ParameterError &) {
    FAIL() << "output span was checked after partitioning";
  } catch (const std::invalid_argument &e) {
    EXPECT_THAT(e.what(), HasSubstr("output span has length 5"));
  }
  EXPECT_THAT(partition, Each(kInvalidBlockID));
}

TEST(KLPartEndToEndTest, partitions_owned_graph) {
  KLPart partitioner(1, create_default_context());
  partitioner.set_output_level(OutputLevel::QUIET);
  partitioner.set_graph(load_graph(6, data::adjncy, data::xadj));
  ASSERT_NE(partitioner.graph(), nullptr);
  EXPECT_EQ(partitioner.graph()->n(), 6);

  const PartitionResult result = partitioner.compute_partition(3, 0.0);
  ASSERT_THAT(result.blocks, SizeIs(3));
  for (const auto &block : result.blocks) {
    EXPECT_THAT(block, SizeIs(2));
  }
}

TEST(KLPartEndToEndTest, same_seed_yields_same_partition) {
  std::vector<PartitionResult> results;
  for (int rep = 0; rep < 2; ++rep) {
    KLPart partitioner(1, create_default_context());
    partitioner.set_output_level(OutputLevel::QUIET);
    partitioner.reseed(42);
    partitioner.copy_graph(data::xadj, data::adjncy);
    results.push_back(partitioner.compute_partition(3, 10.0));
  }

  EXPECT_EQ(results[0].partition, results[1].partition);
  EXPECT_EQ(results[0].cut, results[1].cut);
}

TEST(KLPartEndToEndTest, records_history_when_requested) {
  KLPart partitioner(1, create_default_context());
  partitioner.set_output_level(OutputLevel::QUIET);
  partitioner.context().refinement.record_swaps = true;
  partitioner.copy_graph(data::xadj, data::adjncy);

  const PartitionResult result = partitioner.compute_partition(2, 0.0);
  EXPECT_FALSE(result.history.empty());

  partitioner.context().refinement.record_swaps = false;
  EXPECT_TRUE(partitioner.compute_partition(2, 0.0).history.empty());
}

TEST(KLPartEndToEndTest, rejects_partitioning_without_graph) {
  KLPart partitioner(1, create_default_context());
  partitioner.set_output_level(OutputLevel::QUIET);
  EXPECT_THROW(partitioner.compute_partition(2, 0.0), std::invalid_argument);
}

TEST(KLPartEndToEndTest, rejects_malformed_csr_arrays) {
  KLPart partitioner(1, create_default_context());
  partitioner.set_output_level(OutputLevel::QUIET);

  // Offsets must start at 0
  const std::vector<EdgeID> bad_xadj = {1, 2, 2};
  const std::vector<NodeID> bad_adjncy = {1, 0};
  EXPECT_THROW(partitioner.copy_graph(bad_xadj, bad_adjncy), StructuralError);

  // Neighbor out of range
  const std::vector<EdgeID> xadj = {0, 1, 2};
  const std::vector<NodeID> adjncy = {1, 2};
  EXPECT_THROW(partitioner.copy_graph(xadj, adjncy), StructuralError);

  EXPECT_THROW(partitioner.copy_graph(std::vector<EdgeID>{}, adjncy), StructuralError);
  EXPECT_EQ(partitioner.graph(), nullptr);
}

TEST(KLPartEndToEndTest, rejects_invalid_parameters) {
  KLPart partitioner(1, create_default_context());
  partitioner.set_output_level(OutputLevel::QUIET);
  partitioner.copy_graph(data::xadj, data::adjncy);

  EXPECT_THROW(partitioner.compute_partition(1, 0.0), ParameterError);
  EXPECT_THROW(partitioner.compute_partition(7, 0.0), ParameterError);
  EXPECT_THROW(partitioner.compute_partition(2, -1.0), ParameterError);
}
} // namespace klpart
