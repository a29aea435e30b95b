/*******************************************************************************
 * Utility functions for partitioning.
 *
 * @file:   partition_utils.h
 * @author: Daniel Seemaier
 * @date:   13.03.2023
 ******************************************************************************/
#pragma once

#include <vector>

#include "klpart/klpart.h"

namespace klpart {
class PartitionedGraph;

/*!
 * Largest allowed block size, i.e., `ceil(n / k * (1 + margin / 100))`.
 */
[[nodiscard]] BlockSize compute_max_block_size(NodeID n, BlockID k, double margin);

/*!
 * Smallest allowed block size if the lower bound is enforced, i.e., `floor(n / k)`.
 */
[[nodiscard]] BlockSize compute_min_block_size(NodeID n, BlockID k);

/*!
 * Checks the block sizes of the partition against the bounds of the partition context.
 *
 * @throws BalanceViolationError if a block is larger than the maximum block size, or smaller
 * than the minimum block size.
 */
void validate_balance(const PartitionedGraph &p_graph, const PartitionContext &p_ctx);

/*!
 * Returns the members of each block in ascending order.
 */
[[nodiscard]] std::vector<std::vector<NodeID>> extract_blocks(const PartitionedGraph &p_graph);
} // namespace klpart
