#pragma once

#include <map>
#include <utility>
#include <vector>

#include "klpart-core/datastructures/csr_graph.h"
#include "klpart/klpart.h"

#include "klpart-common/assert.h"

namespace klpart::testing {

class GraphBuilder {
public:
  GraphBuilder() = default;

  GraphBuilder(const NodeID n, const EdgeID m) {
    _nodes.reserve(n + 1);
    _edges.reserve(m);
  }

  GraphBuilder(const GraphBuilder &) = delete;
  GraphBuilder &operator=(const GraphBuilder &) = delete;

  GraphBuilder(GraphBuilder &&) noexcept = default;
  GraphBuilder &operator=(GraphBuilder &&) noexcept = default;

  NodeID new_node() {
    _nodes.push_back(_edges.size());
    return _nodes.size() - 1;
  }

  EdgeID new_edge(const NodeID v) {
    _edges.push_back(v);
    return _edges.size() - 1;
  }

  CSRGraph build() {
    _nodes.push_back(_edges.size());
    return {std::move(_nodes), std::move(_edges)};
  }

private:
  std::vector<EdgeID> _nodes;
  std::vector<NodeID> _edges;
};

class EdgeBasedGraphBuilder {
public:
  explicit EdgeBasedGraphBuilder(const NodeID n) : _neighborhoods(n) {}

  void add_edge(const NodeID u, const NodeID v) {
    KASSERT(u != v, "self-loops are not supported", assert::always);
    _neighborhoods[u].push_back(v);
    _neighborhoods[v].push_back(u);
  }

  [[nodiscard]] CSRGraph build() const {
    GraphBuilder builder;
    for (const auto &neighborhood : _neighborhoods) {
      builder.new_node();
      for (const NodeID v : neighborhood) {
        builder.new_edge(v);
      }
    }
    return builder.build();
  }

private:
  std::vector<std::vector<NodeID>> _neighborhoods;
};

} // namespace klpart::testing
