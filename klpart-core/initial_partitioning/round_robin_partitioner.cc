/*******************************************************************************
 * Initial partitioner that deals a random permutation of the vertices to the
 * blocks in round-robin fashion.
 *
 * @file:   round_robin_partitioner.cc
 * @author: Daniel Seemaier
 * @date:   03.02.2026
 ******************************************************************************/
#include "klpart-core/initial_partitioning/round_robin_partitioner.h"

#include "klpart-common/logger.h"

namespace klpart {
namespace {
SET_DEBUG(false);
}

void RoundRobinPartitioner::fill_partition(const CSRGraph &graph, const BlockID k) {
  const std::vector<NodeID> permutation = _rand.random_permutation(graph.n());

  // Position i of the permutation goes to block i mod k, hence the first
  // n mod k blocks receive ceil(n / k) vertices and the others floor(n / k)
  for (NodeID i = 0; i < graph.n(); ++i) {
    _partition[permutation[i]] = static_cast<BlockID>(i % k);
  }

  DBG << "Dealt " << graph.n() << " vertices to " << k << " blocks, seed " << _rand.seed();
}
} // namespace klpart
