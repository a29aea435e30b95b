/*******************************************************************************
 * Initial partitioner that splits the vertex IDs into k consecutive ranges.
 *
 * @file:   contiguous_partitioner.cc
 * @author: Daniel Seemaier
 * @date:   03.02.2026
 ******************************************************************************/
#include "klpart-core/initial_partitioning/contiguous_partitioner.h"

#include <cstdint>

namespace klpart {
void ContiguousPartitioner::fill_partition(const CSRGraph &graph, const BlockID k) {
  const std::uint64_t n = graph.n();

  // Vertex u goes to block floor(u * k / n): the ranges have sizes floor(n / k)
  // or ceil(n / k), with the larger ones spread evenly
  for (const NodeID u : graph.nodes()) {
    _partition[u] = static_cast<BlockID>(static_cast<std::uint64_t>(u) * k / n);
  }
}
} // namespace klpart
