#pragma once

#include <span>
#include <vector>

#include <gmock/gmock.h>

#include "klpart-core/datastructures/csr_graph.h"
#include "klpart-core/datastructures/partitioned_graph.h"
#include "klpart/klpart.h"

namespace klpart::testing {
//
// Convenience functions to create CSRGraph / PartitionedGraph from initializer
// lists
//

inline CSRGraph make_graph(const std::vector<EdgeID> &nodes, const std::vector<NodeID> &edges) {
  return {nodes, edges};
}

inline PartitionedGraph
make_p_graph(const CSRGraph &graph, const BlockID k, const std::vector<BlockID> &partition) {
  return {graph, k, partition};
}

inline Context make_context(const BlockID k, const double margin) {
  Context ctx = create_default_context();
  ctx.partition.k = k;
  ctx.partition.margin = margin;
  return ctx;
}

// gmock container matchers require const_iterator, which std::span lacks before C++23
template <typename View> auto view_to_vector(const View &view) {
  return std::vector(view.begin(), view.end());
}

inline std::vector<NodeID> degrees(const CSRGraph &graph) {
  std::vector<NodeID> degrees(graph.n());
  for (const NodeID u : graph.nodes()) {
    degrees[u] = graph.degree(u);
  }
  return degrees;
}

inline std::vector<BlockSize> block_sizes(const BlockID k, const std::span<const BlockID> partition) {
  std::vector<BlockSize> sizes(k);
  for (const BlockID b : partition) {
    ++sizes[b];
  }
  return sizes;
}
} // namespace klpart::testing
