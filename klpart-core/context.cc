/*******************************************************************************
 * Context struct for KLPart.
 *
 * @file:   context.cc
 * @author: Daniel Seemaier
 * @date:   21.09.2021
 ******************************************************************************/
#include <cmath>
#include <sstream>
#include <string>

#include "klpart-core/datastructures/csr_graph.h"
#include "klpart-core/partition_utils.h"
#include "klpart/klpart.h"

#include "klpart-common/assert.h"
#include "klpart-common/strutils.h"

namespace klpart {

//
// PartitionContext
//

void PartitionContext::setup(const CSRGraph &graph, const BlockID k, const double margin) {
  if (k < 2) {
    throw ParameterError(
        "number of blocks must be at least 2, but is " + std::to_string(k) +
        ": a single block has no pairs to refine"
    );
  }
  if (k > graph.n()) {
    throw ParameterError(
        "number of blocks (" + std::to_string(k) + ") exceeds the number of vertices (" +
        std::to_string(graph.n()) + ")"
    );
  }
  if (!std::isfinite(margin) || margin < 0.0) {
    std::stringstream ss;
    ss << "balance margin must be a non-negative percentage, but is " << margin;
    throw ParameterError(ss.str());
  }

  this->n = graph.n();
  this->m = graph.m();
  this->k = k;
  this->margin = margin;

  _max_block_size = compute_max_block_size(n, k, margin);
  _min_block_size = enforce_min_block_size ? compute_min_block_size(n, k) : 0;

  KASSERT(_min_block_size <= _max_block_size, "inconsistent balance constraint", assert::always);
}

//
// BalanceViolationError
//

namespace {
std::string describe_balance_violation(
    const std::vector<BlockSize> &block_sizes, const BlockSize min, const BlockSize max
) {
  std::stringstream ss;
  ss << "partition violates the balance constraint [" << min << ", " << max
     << "]: block sizes are " << str::implode(block_sizes, ", ");
  return ss.str();
}
} // namespace

BalanceViolationError::BalanceViolationError(
    std::vector<BlockSize> block_sizes, const BlockSize min_block_size, const BlockSize max_block_size
)
    : std::runtime_error(describe_balance_violation(block_sizes, min_block_size, max_block_size)),
      _block_sizes(std::move(block_sizes)),
      _min_block_size(min_block_size),
      _max_block_size(max_block_size) {}

} // namespace klpart
