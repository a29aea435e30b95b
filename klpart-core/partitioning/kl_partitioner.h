/*******************************************************************************
 * Multi-pass Kernighan-Lin k-way partitioner: computes an initial partition and
 * refines all pairs of blocks until a pass brings no improvement.
 *
 * @file:   kl_partitioner.h
 * @author: Daniel Seemaier
 * @date:   03.02.2026
 ******************************************************************************/
#pragma once

#include <cstdint>
#include <ostream>
#include <vector>

#include "klpart-core/datastructures/csr_graph.h"
#include "klpart-core/datastructures/partitioned_graph.h"
#include "klpart-core/refinement/refiner.h"
#include "klpart/klpart.h"

namespace klpart {

enum class PartitionerState : std::uint8_t {
  UNINITIALIZED,
  INITIALIZING,
  REFINING,
  VALIDATING,
  DONE,
  FAILED,
};

std::ostream &operator<<(std::ostream &out, PartitionerState state);

class KLPartitioner {
public:
  /*!
   * @param graph The graph to be partitioned, must outlive this object.
   * @param ctx Context; `ctx.partition.k` and `ctx.partition.margin` must be set, the remaining
   * fields of the partition context are computed by partition().
   */
  KLPartitioner(const CSRGraph &graph, Context ctx);

  KLPartitioner(const KLPartitioner &) = delete;
  KLPartitioner &operator=(const KLPartitioner &) = delete;

  KLPartitioner(KLPartitioner &&) = delete;
  KLPartitioner &operator=(KLPartitioner &&) = delete;

  /*!
   * Runs the partitioner. Can only be called once per object.
   *
   * @throws ParameterError if `k < 2`, `k > n` or the margin is negative.
   * @throws BalanceViolationError if the final partition violates the balance constraint.
   */
  PartitionResult partition();

  [[nodiscard]] PartitionerState state() const {
    return _state;
  }

  [[nodiscard]] const Context &context() const {
    return _ctx;
  }

  void set_output_level(const OutputLevel output_level) {
    _output_level = output_level;
  }

private:
  PartitionResult run();

  // Returns whether any pair of blocks was improved
  bool refine_all_pairs(PartitionedGraph &p_graph, PairwiseRefiner &refiner, int pass);

  void record_step(const PairwiseRefiner &refiner, int pass, BlockID a, BlockID b);

  [[nodiscard]] bool output_at_least(OutputLevel level) const {
    return _output_level >= level;
  }

  const CSRGraph &_graph;
  Context _ctx;

  PartitionerState _state = PartitionerState::UNINITIALIZED;
  OutputLevel _output_level = OutputLevel::QUIET;

  std::vector<RefinementStep> _history;
};

/*!
 * Partitions the graph into `k` blocks such that no block contains more than
 * `ceil(n / k * (1 + margin / 100))` vertices, using the default configuration.
 *
 * @throws ParameterError if `k < 2`, `k > n` or the margin is negative.
 * @throws BalanceViolationError if the final partition violates the balance constraint.
 */
PartitionResult partition(const CSRGraph &graph, BlockID k, double margin);

/*!
 * Same as above, but uses the given context; `ctx.partition.k` and `ctx.partition.margin`
 * must be set.
 */
PartitionResult partition(const CSRGraph &graph, const Context &ctx);

} // namespace klpart
