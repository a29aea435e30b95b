/*******************************************************************************
 * Utility functions for partitioning.
 *
 * @file:   partition_utils.cc
 * @author: Daniel Seemaier
 * @date:   13.03.2023
 ******************************************************************************/
#include "klpart-core/partition_utils.h"

#include <algorithm>
#include <cmath>

#include "klpart-core/datastructures/partitioned_graph.h"
#include "klpart-core/metrics.h"

#include "klpart-common/logger.h"

namespace klpart {
namespace {
SET_DEBUG(false);
}

BlockSize compute_max_block_size(const NodeID n, const BlockID k, const double margin) {
  // Exact for integral margins: n * (100 + margin) has no rounding error; no block can hold more
  // than n vertices, which also keeps the cast in range for huge margins
  const double bound = std::ceil(n * (100.0 + margin) / (100.0 * k));
  return static_cast<BlockSize>(std::min<double>(bound, n));
}

BlockSize compute_min_block_size(const NodeID n, const BlockID k) {
  return n / k;
}

void validate_balance(const PartitionedGraph &p_graph, const PartitionContext &p_ctx) {
  if (metrics::is_feasible(p_graph, p_ctx)) {
    return;
  }

  DBG << "Infeasible block sizes: " << p_graph.block_sizes();

  const auto sizes = p_graph.block_sizes();
  throw BalanceViolationError(
      {sizes.begin(), sizes.end()}, p_ctx.min_block_size(), p_ctx.max_block_size()
  );
}

std::vector<std::vector<NodeID>> extract_blocks(const PartitionedGraph &p_graph) {
  std::vector<std::vector<NodeID>> blocks(p_graph.k());
  for (const BlockID b : p_graph.blocks()) {
    blocks[b].reserve(p_graph.block_size(b));
  }

  for (const NodeID u : p_graph.graph().nodes()) {
    blocks[p_graph.block(u)].push_back(u);
  }

  return blocks;
}
} // namespace klpart
