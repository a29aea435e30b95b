/*******************************************************************************
 * Static CSR graph data structure for undirected, unweighted graphs.
 *
 * @file:   csr_graph.cc
 * @author: Daniel Seemaier
 * @date:   21.09.2021
 ******************************************************************************/
#include "klpart-core/datastructures/csr_graph.h"

#include <algorithm>
#include <sstream>

#include <tbb/blocked_range.h>
#include <tbb/parallel_reduce.h>

#include "klpart-common/datastructures/marker.h"
#include "klpart-common/logger.h"

namespace klpart {
CSRGraph::CSRGraph(std::vector<EdgeID> nodes, std::vector<NodeID> edges)
    : _nodes(std::move(nodes)),
      _edges(std::move(edges)) {
  KASSERT(!_nodes.empty(), "node array must contain at least one entry", assert::always);
  KASSERT(_nodes.back() == _edges.size(), "node array does not match edge array", assert::light);

  _max_degree = tbb::parallel_reduce(
      tbb::blocked_range<NodeID>(0, n()),
      static_cast<NodeID>(0),
      [&](const auto &r, NodeID max_degree) {
        for (NodeID u = r.begin(); u != r.end(); ++u) {
          max_degree = std::max(max_degree, degree(u));
        }
        return max_degree;
      },
      [](const NodeID lhs, const NodeID rhs) { return std::max(lhs, rhs); }
  );
}

CSRGraph load_graph(const NodeID n, std::vector<NodeID> neighbors, std::vector<EdgeID> offsets) {
  const auto fail = [](const auto &...what) {
    std::stringstream ss;
    (ss << ... << what);
    throw StructuralError(ss.str());
  };

  if (n == 0) {
    fail("graph must contain at least one vertex");
  }
  if (offsets.size() != static_cast<std::size_t>(n) + 1) {
    fail("offset array has length ", offsets.size(), ", expected n + 1 = ", n + 1ull);
  }
  if (offsets.front() != 0) {
    fail("offset array must start at 0, but starts at ", offsets.front());
  }
  for (NodeID u = 0; u < n; ++u) {
    if (offsets[u] > offsets[u + 1]) {
      fail("offset array decreases at position ", u, ": ", offsets[u], " > ", offsets[u + 1]);
    }
  }
  if (offsets.back() != neighbors.size()) {
    fail("last offset is ", offsets.back(), ", but there are ", neighbors.size(), " neighbors");
  }

  const auto out_of_range = std::find_if(neighbors.begin(), neighbors.end(), [n](const NodeID v) {
    return v >= n;
  });
  if (out_of_range != neighbors.end()) {
    fail(
        "neighbor entry ",
        std::distance(neighbors.begin(), out_of_range),
        " refers to vertex ",
        *out_of_range,
        ", but the graph only has ",
        n,
        " vertices"
    );
  }

  return {std::move(offsets), std::move(neighbors)};
}

namespace debug {
bool validate_graph(const CSRGraph &graph) {
  Marker<> seen(graph.n());

  for (const NodeID u : graph.nodes()) {
    seen.reset();

    for (const NodeID v : graph.neighbors(u)) {
      if (u == v) {
        LOG_WARNING << "Self-loop at vertex " << u;
        return false;
      }

      if (seen.get(v)) {
        LOG_WARNING << "Edge " << u << " --> " << v << " is stored multiple times";
        return false;
      }
      seen.set(v);

      const auto reverse = graph.neighbors(v);
      if (std::find(reverse.begin(), reverse.end(), u) == reverse.end()) {
        LOG_WARNING << "Edge " << u << " --> " << v << " exists, but the reverse edge does not";
        return false;
      }
    }
  }

  return true;
}
} // namespace debug
} // namespace klpart
