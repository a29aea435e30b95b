/*******************************************************************************
 * Utility functions for computing partition metrics.
 *
 * @file:   metrics.h
 * @author: Daniel Seemaier
 * @date:   21.09.2021
 ******************************************************************************/
#pragma once

#include <algorithm>
#include <span>

#include "klpart-core/datastructures/csr_graph.h"
#include "klpart-core/datastructures/partitioned_graph.h"
#include "klpart/klpart.h"

namespace klpart {
/*!
 * Counts the undirected edges whose endpoints are assigned to different blocks. Each edge is
 * counted once. Does not modify its arguments.
 *
 * @throws ParameterError if the assignment does not contain exactly one block per vertex.
 */
[[nodiscard]] EdgeWeight
count_cut_edges(const CSRGraph &graph, std::span<const BlockID> assignment);
} // namespace klpart

namespace klpart::metrics {

[[nodiscard]] EdgeWeight edge_cut_seq(const PartitionedGraph &p_graph);
[[nodiscard]] EdgeWeight edge_cut(const PartitionedGraph &p_graph);

[[nodiscard]] EdgeWeight edge_cut_seq(const CSRGraph &graph, std::span<const BlockID> partition);
[[nodiscard]] EdgeWeight edge_cut(const CSRGraph &graph, std::span<const BlockID> partition);

// Relative excess of the largest block over the perfectly balanced block size
[[nodiscard]] double imbalance(const PartitionedGraph &p_graph);

[[nodiscard]] inline bool
is_balanced(const PartitionedGraph &p_graph, const PartitionContext &p_ctx) {
  return std::all_of(p_graph.blocks().begin(), p_graph.blocks().end(), [&](const BlockID b) {
    return p_graph.block_size(b) <= p_ctx.max_block_size();
  });
}

[[nodiscard]] inline bool
is_min_balanced(const PartitionedGraph &p_graph, const PartitionContext &p_ctx) {
  return std::all_of(p_graph.blocks().begin(), p_graph.blocks().end(), [&](const BlockID b) {
    return p_graph.block_size(b) >= p_ctx.min_block_size();
  });
}

[[nodiscard]] inline bool
is_feasible(const PartitionedGraph &p_graph, const PartitionContext &p_ctx) {
  return is_balanced(p_graph, p_ctx) && is_min_balanced(p_graph, p_ctx);
}

} // namespace klpart::metrics
