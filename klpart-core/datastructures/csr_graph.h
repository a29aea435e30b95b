/*******************************************************************************
 * Static CSR graph data structure for undirected, unweighted graphs.
 *
 * @file:   csr_graph.h
 * @author: Daniel Seemaier
 * @date:   21.09.2021
 ******************************************************************************/
#pragma once

#include <span>
#include <type_traits>
#include <utility>
#include <vector>

#include "klpart/klpart.h"

#include "klpart-common/assert.h"
#include "klpart-common/ranges.h"

namespace klpart {
class CSRGraph {
public:
  // Does not validate its arguments: use load_graph() for untrusted input
  CSRGraph(std::vector<EdgeID> nodes, std::vector<NodeID> edges);

  CSRGraph(const CSRGraph &) = delete;
  CSRGraph &operator=(const CSRGraph &) = delete;

  CSRGraph(CSRGraph &&) noexcept = default;
  CSRGraph &operator=(CSRGraph &&) noexcept = default;

  //
  // Size of the graph
  //

  [[nodiscard]] inline NodeID n() const {
    return static_cast<NodeID>(_nodes.size() - 1);
  }

  // Number of directed edges, i.e., twice the number of undirected edges
  [[nodiscard]] inline EdgeID m() const {
    return static_cast<EdgeID>(_edges.size());
  }

  //
  // Iterators for nodes
  //

  [[nodiscard]] inline IotaRange<NodeID> nodes() const {
    return {static_cast<NodeID>(0), n()};
  }

  //
  // Node degree
  //

  [[nodiscard]] inline NodeID max_degree() const {
    return _max_degree;
  }

  [[nodiscard]] inline NodeID degree(const NodeID u) const {
    KASSERT(u < n(), "node out of range", assert::light);
    return static_cast<NodeID>(_nodes[u + 1] - _nodes[u]);
  }

  //
  // Graph operations
  //

  // Invokes l(v) for each neighbor v of u; stops early if l returns true
  template <typename Lambda> inline void adjacent_nodes(const NodeID u, Lambda &&l) const {
    KASSERT(u < n(), "node out of range", assert::light);
    static_assert(std::is_invocable_v<Lambda, NodeID>);
    constexpr bool kNonStoppable = std::is_void_v<std::invoke_result_t<Lambda, NodeID>>;

    for (EdgeID e = _nodes[u]; e < _nodes[u + 1]; ++e) {
      if constexpr (kNonStoppable) {
        l(_edges[e]);
      } else {
        if (l(_edges[e])) {
          return;
        }
      }
    }
  }

  [[nodiscard]] inline std::span<const NodeID> neighbors(const NodeID u) const {
    KASSERT(u < n(), "node out of range", assert::light);
    return {_edges.data() + _nodes[u], _edges.data() + _nodes[u + 1]};
  }

  //
  // Access to the raw CSR arrays
  //

  [[nodiscard]] inline const std::vector<EdgeID> &raw_nodes() const {
    return _nodes;
  }

  [[nodiscard]] inline const std::vector<NodeID> &raw_edges() const {
    return _edges;
  }

private:
  std::vector<EdgeID> _nodes;
  std::vector<NodeID> _edges;

  NodeID _max_degree = 0;
};

/*!
 * Builds a graph from its CSR representation: the neighbors of vertex `u` are
 * `neighbors[offsets[u]..offsets[u+1]-1]`.
 *
 * Only the structure of the arrays is validated. Symmetry (each edge stored in both directions)
 * and the absence of self-loops are assumed.
 *
 * @throws StructuralError if `n == 0`, `offsets` does not have length `n + 1`, does not start at
 * 0, decreases, does not end at `neighbors.size()`, or if a neighbor is `>= n`.
 */
CSRGraph load_graph(NodeID n, std::vector<NodeID> neighbors, std::vector<EdgeID> offsets);

namespace debug {
/*!
 * Checks that every edge has its reverse edge and that there are no self-loops or parallel
 * edges. Prints the first violation as a warning.
 */
bool validate_graph(const CSRGraph &graph);
} // namespace debug
} // namespace klpart
