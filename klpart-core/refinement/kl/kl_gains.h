/*******************************************************************************
 * Gains of the vertices of two blocks w.r.t. exchanging them between the two
 * blocks.
 *
 * @file:   kl_gains.h
 * @author: Daniel Seemaier
 * @date:   03.02.2026
 ******************************************************************************/
#pragma once

#include <span>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include "klpart-core/datastructures/partitioned_graph.h"
#include "klpart/klpart.h"

#include "klpart-common/assert.h"
#include "klpart-common/datastructures/marker.h"

namespace klpart::kl {

/*!
 * Computes the gain of moving `u` to block `other`, i.e., the number of neighbors of `u` in
 * `other` minus the number of neighbors of `u` in its own block. Neighbors in any third block do
 * not contribute.
 */
[[nodiscard]] inline EdgeWeight
compute_gain(const PartitionedGraph &p_graph, const NodeID u, const BlockID other) {
  const BlockID own = p_graph.block(u);
  KASSERT(own != other, "vertex " << u << " already is in block " << other, assert::light);

  EdgeWeight external = 0;
  EdgeWeight internal = 0;
  p_graph.graph().adjacent_nodes(u, [&](const NodeID v) {
    const BlockID v_block = p_graph.block(v);
    if (v_block == other) {
      ++external;
    } else if (v_block == own) {
      ++internal;
    }
  });

  return external - internal;
}

/*!
 * Computes the gains of all unlocked `candidates`, which must all be in the same block, w.r.t.
 * moving them to block `other`. The gains of locked candidates are left untouched.
 */
inline void compute_gains(
    const PartitionedGraph &p_graph,
    const std::span<const NodeID> candidates,
    const Marker<> &locked,
    const BlockID other,
    const std::span<EdgeWeight> gains
) {
  KASSERT(candidates.size() == gains.size(), "gain array has the wrong size", assert::light);

  tbb::parallel_for(tbb::blocked_range<std::size_t>(0, candidates.size()), [&](const auto &r) {
    for (std::size_t i = r.begin(); i != r.end(); ++i) {
      const NodeID u = candidates[i];
      if (!locked.get(u)) {
        gains[i] = compute_gain(p_graph, u, other);
      }
    }
  });
}

} // namespace klpart::kl
