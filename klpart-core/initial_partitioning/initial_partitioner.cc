/*******************************************************************************
 * Interface for algorithms computing the initial k-way partition that is
 * subsequently improved by pairwise refinement.
 *
 * @file:   initial_partitioner.cc
 * @author: Daniel Seemaier
 * @date:   03.02.2026
 ******************************************************************************/
#include "klpart-core/initial_partitioning/initial_partitioner.h"

#include <algorithm>

#include "klpart-common/assert.h"

namespace klpart {
PartitionedGraph
InitialPartitioner::partition(const CSRGraph &graph, const PartitionContext &p_ctx) {
  KASSERT(p_ctx.k >= 2u && p_ctx.k <= graph.n(), "invalid number of blocks", assert::always);

  _partition.assign(graph.n(), kInvalidBlockID);
  fill_partition(graph, p_ctx.k);

  KASSERT(
      std::none_of(
          _partition.begin(),
          _partition.end(),
          [&](const BlockID b) { return b >= p_ctx.k; }
      ),
      "not all vertices were assigned to a valid block",
      assert::normal
  );

  return {graph, p_ctx.k, std::move(_partition)};
}
} // namespace klpart
