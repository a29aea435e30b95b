/**
 * @file partitioned_graph.cc
 * @brief A mutable k-way partition on top of a static graph.
 */
#include "klpart-core/datastructures/partitioned_graph.h"

namespace klpart {
PartitionedGraph::PartitionedGraph(
    const CSRGraph &graph, const BlockID k, std::vector<BlockID> partition
)
    : _graph(&graph),
      _k(k),
      _partition(std::move(partition)),
      _block_sizes(k, 0) {
  KASSERT(_partition.size() == graph.n(), "partition has the wrong length", assert::always);
  init_block_sizes();
}

void PartitionedGraph::init_block_sizes() {
  for (const BlockID b : _partition) {
    KASSERT(b < _k, "invalid block id " << b, assert::always);
    ++_block_sizes[b];
  }
}
} // namespace klpart
