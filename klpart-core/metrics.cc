/*******************************************************************************
 * Utility functions for computing partition metrics.
 *
 * @file:   metrics.cc
 * @author: Daniel Seemaier
 * @date:   21.09.2021
 ******************************************************************************/
#include "klpart-core/metrics.h"

#include <cstdint>
#include <functional>
#include <string>

#include <tbb/blocked_range.h>
#include <tbb/enumerable_thread_specific.h>
#include <tbb/parallel_for.h>

#include "klpart-common/assert.h"
#include "klpart-common/asserting_cast.h"

namespace klpart {
EdgeWeight count_cut_edges(const CSRGraph &graph, const std::span<const BlockID> assignment) {
  if (assignment.size() != graph.n()) {
    throw ParameterError(
        "assignment has length " + std::to_string(assignment.size()) + ", but the graph has " +
        std::to_string(graph.n()) + " vertices"
    );
  }

  return metrics::edge_cut(graph, assignment);
}
} // namespace klpart

namespace klpart::metrics {
EdgeWeight edge_cut_seq(const PartitionedGraph &p_graph) {
  return edge_cut_seq(p_graph.graph(), p_graph.partition());
}

EdgeWeight edge_cut(const PartitionedGraph &p_graph) {
  return edge_cut(p_graph.graph(), p_graph.partition());
}

EdgeWeight edge_cut_seq(const CSRGraph &graph, const std::span<const BlockID> partition) {
  std::int64_t cut = 0;

  for (const NodeID u : graph.nodes()) {
    graph.adjacent_nodes(u, [&](const NodeID v) {
      cut += (u < v && partition[u] != partition[v]) ? 1 : 0;
    });
  }

  return asserting_cast<assert::always, EdgeWeight>(cut);
}

EdgeWeight edge_cut(const CSRGraph &graph, const std::span<const BlockID> partition) {
  tbb::enumerable_thread_specific<std::int64_t> cut_ets(0);

  tbb::parallel_for(tbb::blocked_range<NodeID>(0, graph.n()), [&](const auto &r) {
    auto &cut = cut_ets.local();
    for (NodeID u = r.begin(); u < r.end(); ++u) {
      graph.adjacent_nodes(u, [&](const NodeID v) {
        cut += (u < v && partition[u] != partition[v]) ? 1 : 0;
      });
    }
  });

  return asserting_cast<assert::always, EdgeWeight>(cut_ets.combine(std::plus<>{}));
}

double imbalance(const PartitionedGraph &p_graph) {
  const double perfect_block_size = 1.0 * p_graph.n() / p_graph.k();

  double max_imbalance = 0.0;
  for (const BlockID b : p_graph.blocks()) {
    max_imbalance = std::max(max_imbalance, p_graph.block_size(b) / perfect_block_size - 1.0);
  }

  return max_imbalance;
}
} // namespace klpart::metrics
