/*******************************************************************************
 * Validator for undirected input graphs.
 *
 * @file:   input_validator.cc
 * @author: Daniel Seemaier
 * @date:   26.10.2022
 ******************************************************************************/
#include "apps/io/input_validator.h"

#include <algorithm>
#include <atomic>
#include <sstream>
#include <vector>

#include <tbb/parallel_for.h>

namespace klpart {

namespace {

template <typename ForwardIterator, typename T>
bool binary_contains(ForwardIterator begin, ForwardIterator end, const T &val) {
  const auto i = std::lower_bound(begin, end, val);
  return i != end && *i == val;
}

// Only the violation at the smallest vertex is reported, independent of the schedule
void report(std::atomic<NodeID> &first_violation, const NodeID u) {
  NodeID expected = first_violation.load(std::memory_order_relaxed);
  while (u < expected && !first_violation.compare_exchange_weak(expected, u)) {
  }
}

} // namespace

void validate_undirected_graph(const CSRGraph &graph) {
  const NodeID n = graph.n();
  const auto &nodes = graph.raw_nodes();

  // Create a copy of the edges for sorting
  std::vector<NodeID> edges = graph.raw_edges();

  // Sort outgoing edges of each node, then check for self-loops and multi edges
  std::atomic<NodeID> first_bad_node = kInvalidNodeID;
  tbb::parallel_for<NodeID>(0, n, [&](const NodeID u) {
    std::sort(edges.begin() + nodes[u], edges.begin() + nodes[u + 1]);

    for (EdgeID e = nodes[u]; e < nodes[u + 1]; ++e) {
      if (edges[e] == u || (e > nodes[u] && edges[e - 1] == edges[e])) {
        report(first_bad_node, u);
        return;
      }
    }
  });

  if (const NodeID u = first_bad_node; u != kInvalidNodeID) {
    std::stringstream ss;
    const auto begin = edges.begin() + nodes[u];
    const auto end = edges.begin() + nodes[u + 1];

    if (std::binary_search(begin, end, u)) {
      ss << "vertex " << u << " has a self-loop";
    } else {
      const auto dup = std::adjacent_find(begin, end);
      ss << "vertex " << u << " has multiple edges to neighbor " << *dup;
    }
    throw StructuralError(ss.str());
  }

  // Check for reverse edges
  std::atomic<NodeID> first_bad_edge_source = kInvalidNodeID;
  tbb::parallel_for<NodeID>(0, n, [&](const NodeID u) {
    for (EdgeID e = nodes[u]; e < nodes[u + 1]; ++e) {
      const NodeID v = edges[e];
      if (!binary_contains(edges.begin() + nodes[v], edges.begin() + nodes[v + 1], u)) {
        report(first_bad_edge_source, u);
        return;
      }
    }
  });

  if (const NodeID u = first_bad_edge_source; u != kInvalidNodeID) {
    for (EdgeID e = nodes[u]; e < nodes[u + 1]; ++e) {
      const NodeID v = edges[e];
      if (!binary_contains(edges.begin() + nodes[v], edges.begin() + nodes[v + 1], u)) {
        std::stringstream ss;
        ss << "missing reverse edge of edge " << u << " --> " << v;
        throw StructuralError(ss.str());
      }
    }
  }
}

} // namespace klpart
