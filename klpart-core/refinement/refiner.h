/*******************************************************************************
 * Interface for refinement algorithms that improve the cut between a pair of
 * blocks.
 *
 * @file:   refiner.h
 * @author: Daniel Seemaier
 * @date:   21.09.2021
 ******************************************************************************/
#pragma once

#include <span>
#include <string>

#include "klpart-core/datastructures/partitioned_graph.h"
#include "klpart/klpart.h"

namespace klpart {

class PairwiseRefiner {
public:
  PairwiseRefiner(const PairwiseRefiner &) = delete;
  PairwiseRefiner &operator=(const PairwiseRefiner &) = delete;

  PairwiseRefiner(PairwiseRefiner &&) noexcept = default;
  PairwiseRefiner &operator=(PairwiseRefiner &&) = delete;

  virtual ~PairwiseRefiner() = default;

  [[nodiscard]] virtual std::string name() const = 0;

  /*!
   * Prepares the refiner for the given partition and computes its edge cut. Afterwards, the
   * partition may only be changed through refine().
   */
  virtual void initialize(const PartitionedGraph &p_graph) = 0;

  /*!
   * Exchanges vertices between blocks `a` and `b` to reduce the edge cut. Vertices of other
   * blocks are not touched and block sizes do not change.
   *
   * @return Whether the edge cut was reduced.
   */
  virtual bool refine(PartitionedGraph &p_graph, BlockID a, BlockID b) = 0;

  //! Edge cut of the partition after the last call to initialize() or refine().
  [[nodiscard]] virtual EdgeWeight cut() const = 0;

  //! Edge cut before the last call to refine().
  [[nodiscard]] virtual EdgeWeight initial_cut() const = 0;

  //! All swaps tentatively performed during the last call to refine().
  [[nodiscard]] virtual std::span<const SwapRecord> swaps() const = 0;

  //! Number of swaps of the last call to refine() that were kept.
  [[nodiscard]] virtual std::size_t num_committed_swaps() const = 0;

protected:
  PairwiseRefiner() = default;
};

} // namespace klpart
