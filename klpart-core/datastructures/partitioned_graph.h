/**
 * @file partitioned_graph.h
 * @brief A mutable k-way partition on top of a static graph.
 */
#pragma once

#include <span>
#include <utility>
#include <vector>

#include "klpart-core/datastructures/csr_graph.h"
#include "klpart/klpart.h"

#include "klpart-common/assert.h"
#include "klpart-common/ranges.h"

namespace klpart {

/*!
 * Extends a static graph with a k-way partition.
 *
 * Stores the block of each vertex together with the size of each block. Every vertex is assigned
 * to exactly one block in `[0, k)` at all times. The partition is not thread-safe: all changes
 * happen sequentially.
 */
class PartitionedGraph {
public:
  /*!
   * @param graph The graph, must outlive this object.
   * @param k Number of blocks.
   * @param partition Block of each vertex, each in `[0, k)`.
   */
  PartitionedGraph(const CSRGraph &graph, BlockID k, std::vector<BlockID> partition);

  PartitionedGraph(const PartitionedGraph &) = delete;
  PartitionedGraph &operator=(const PartitionedGraph &) = delete;

  PartitionedGraph(PartitionedGraph &&) noexcept = default;
  PartitionedGraph &operator=(PartitionedGraph &&) noexcept = delete;

  [[nodiscard]] inline const CSRGraph &graph() const {
    return *_graph;
  }

  [[nodiscard]] inline NodeID n() const {
    return _graph->n();
  }

  [[nodiscard]] inline BlockID k() const {
    return _k;
  }

  [[nodiscard]] inline IotaRange<BlockID> blocks() const {
    return {static_cast<BlockID>(0), k()};
  }

  [[nodiscard]] inline BlockID block(const NodeID u) const {
    KASSERT(u < _partition.size(), "node out of range", assert::light);
    return _partition[u];
  }

  /*!
   * Exchanges the blocks of `u` and `v`. Block sizes do not change.
   */
  inline void swap_blocks(const NodeID u, const NodeID v) {
    KASSERT(u < n() && v < n(), "node out of range", assert::light);
    std::swap(_partition[u], _partition[v]);
  }

  [[nodiscard]] inline BlockSize block_size(const BlockID b) const {
    KASSERT(b < k(), "block out of range", assert::light);
    return _block_sizes[b];
  }

  [[nodiscard]] inline std::span<const BlockSize> block_sizes() const {
    return _block_sizes;
  }

  [[nodiscard]] inline std::span<const BlockID> partition() const {
    return _partition;
  }

  [[nodiscard]] inline std::vector<BlockID> &&take_partition() {
    return std::move(_partition);
  }

private:
  void init_block_sizes();

  const CSRGraph *_graph;
  BlockID _k;
  std::vector<BlockID> _partition;
  std::vector<BlockSize> _block_sizes;
};

} // namespace klpart
