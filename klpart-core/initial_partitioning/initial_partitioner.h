/*******************************************************************************
 * Interface for algorithms computing the initial k-way partition that is
 * subsequently improved by pairwise refinement.
 *
 * @file:   initial_partitioner.h
 * @author: Daniel Seemaier
 * @date:   03.02.2026
 ******************************************************************************/
#pragma once

#include <string>
#include <vector>

#include "klpart-core/datastructures/csr_graph.h"
#include "klpart-core/datastructures/partitioned_graph.h"
#include "klpart/klpart.h"

namespace klpart {
class InitialPartitioner {
public:
  InitialPartitioner(const InitialPartitioner &) = delete;
  InitialPartitioner &operator=(const InitialPartitioner &) = delete;

  InitialPartitioner(InitialPartitioner &&) noexcept = default;
  InitialPartitioner &operator=(InitialPartitioner &&) = delete;

  virtual ~InitialPartitioner() = default;

  [[nodiscard]] virtual std::string name() const = 0;

  /*!
   * Assigns every vertex of the graph to one of `p_ctx.k` blocks such that block sizes differ by
   * at most one.
   */
  [[nodiscard]] PartitionedGraph partition(const CSRGraph &graph, const PartitionContext &p_ctx);

protected:
  InitialPartitioner() = default;

  // Fills _partition, which has length n
  virtual void fill_partition(const CSRGraph &graph, BlockID k) = 0;

  std::vector<BlockID> _partition;
};
} // namespace klpart
