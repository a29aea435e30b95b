/*******************************************************************************
 * Kernighan-Lin refinement of a pair of blocks.
 *
 * @file:   kl_refiner.h
 * @author: Daniel Seemaier
 * @date:   03.02.2026
 ******************************************************************************/
#pragma once

#include <limits>
#include <vector>

#include <tbb/enumerable_thread_specific.h>

#include "klpart-core/refinement/refiner.h"
#include "klpart/klpart.h"

#include "klpart-common/datastructures/marker.h"

namespace klpart {

/*!
 * Performs one Kernighan-Lin pass on blocks A and B: repeatedly exchanges the unlocked pair of
 * vertices (one from each block) whose exchange reduces the cut the most, locks both and
 * continues until one side runs out of unlocked vertices. Afterwards, the shortest prefix of the
 * swap sequence that reaches the smallest cut is kept; the remaining swaps are undone. If no
 * prefix reduces the cut below its initial value, the partition is restored completely.
 *
 * Gains are recomputed from scratch before each exchange. The search for the best pair runs in
 * parallel, but ties are always broken in favor of the pair that comes first in the ascending
 * member lists of A and B, i.e., the result does not depend on the number of threads.
 */
class KLRefiner : public PairwiseRefiner {
public:
  explicit KLRefiner(const Context &ctx);

  KLRefiner(const KLRefiner &) = delete;
  KLRefiner &operator=(const KLRefiner &) = delete;

  KLRefiner(KLRefiner &&) noexcept = delete;
  KLRefiner &operator=(KLRefiner &&) = delete;

  ~KLRefiner() override;

  [[nodiscard]] std::string name() const final {
    return "Kernighan-Lin";
  }

  void initialize(const PartitionedGraph &p_graph) final;

  bool refine(PartitionedGraph &p_graph, BlockID a, BlockID b) final;

  [[nodiscard]] EdgeWeight cut() const final {
    return _cut;
  }

  [[nodiscard]] EdgeWeight initial_cut() const final {
    return _initial_cut;
  }

  [[nodiscard]] std::span<const SwapRecord> swaps() const final {
    return _swaps;
  }

  [[nodiscard]] std::size_t num_committed_swaps() const final {
    return _num_committed_swaps;
  }

private:
  struct Candidate {
    static constexpr std::size_t kInvalidIndex = std::numeric_limits<std::size_t>::max();

    EdgeWeight gain = std::numeric_limits<EdgeWeight>::min();
    std::size_t index_a = kInvalidIndex;
    std::size_t index_b = kInvalidIndex;

    [[nodiscard]] bool valid() const {
      return index_a != kInvalidIndex;
    }

    // Higher gain first, then lexicographically smaller position
    [[nodiscard]] bool better_than(const Candidate &other) const {
      if (!other.valid()) {
        return valid();
      }
      if (!valid()) {
        return false;
      }
      if (gain != other.gain) {
        return gain > other.gain;
      }
      if (index_a != other.index_a) {
        return index_a < other.index_a;
      }
      return index_b < other.index_b;
    }
  };

  void collect_members(const PartitionedGraph &p_graph, BlockID a, BlockID b);

  [[nodiscard]] Candidate find_best_pair(const PartitionedGraph &p_graph);

  void rollback(PartitionedGraph &p_graph, std::size_t num_kept_swaps);

  const RefinementContext &_r_ctx;

  NodeID _n = 0;
  EdgeWeight _cut = 0;
  EdgeWeight _initial_cut = 0;

  std::vector<NodeID> _members_a;
  std::vector<NodeID> _members_b;
  std::vector<EdgeWeight> _gains_a;
  std::vector<EdgeWeight> _gains_b;

  Marker<> _locked;
  tbb::enumerable_thread_specific<Marker<>> _adjacency_markers;

  std::vector<SwapRecord> _swaps;
  std::size_t _num_committed_swaps = 0;
};

} // namespace klpart
