/*******************************************************************************
 * Random graph generator producing inputs for the partitioner.
 *
 * @file:   graph_generator.cc
 * @author: Daniel Seemaier
 * @date:   03.02.2026
 ******************************************************************************/
#include "apps/tools/graph_generator.h"

#include <algorithm>
#include <cmath>
#include <stack>

#include "klpart-common/logger.h"
#include "klpart-common/random.h"

namespace klpart::tools {

namespace {
SET_DEBUG(false);

CSRGraph build_graph(std::vector<std::vector<NodeID>> adjacency) {
  std::vector<EdgeID> nodes;
  nodes.reserve(adjacency.size() + 1);
  std::vector<NodeID> edges;

  nodes.push_back(0);
  for (auto &neighbors : adjacency) {
    std::sort(neighbors.begin(), neighbors.end());
    edges.insert(edges.end(), neighbors.begin(), neighbors.end());
    nodes.push_back(static_cast<EdgeID>(edges.size()));
  }

  return {std::move(nodes), std::move(edges)};
}

} // namespace

CSRGraph generate_gnp(const GnpContext &ctx) {
  if (ctx.n == 0) {
    throw ParameterError("number of vertices must be positive");
  }
  if (!std::isfinite(ctx.p) || ctx.p < 0.0 || ctx.p > 1.0) {
    throw ParameterError("edge probability must be in [0, 1]");
  }

  Random rand(ctx.seed);

  std::vector<std::vector<NodeID>> adjacency(ctx.n);
  for (NodeID u = 0; u < ctx.n; ++u) {
    for (NodeID v = u + 1; v < ctx.n; ++v) {
      if (rand.random_bool(ctx.p)) {
        adjacency[u].push_back(v);
        adjacency[v].push_back(u);
      }
    }
  }

  if (!ctx.connected) {
    return build_graph(std::move(adjacency));
  }

  CSRGraph graph = build_graph(adjacency);
  NodeID num_components = 0;
  const std::vector<NodeID> components = compute_connected_components(graph, num_components);
  DBG << "G(" << ctx.n << ", " << ctx.p << ") has " << num_components << " components";

  if (num_components == 1) {
    return graph;
  }

  // Link the smallest vertex of each component to the smallest vertex of the next one
  std::vector<NodeID> representatives;
  representatives.reserve(num_components);
  for (NodeID u = 0; u < ctx.n; ++u) {
    if (components[u] == representatives.size()) {
      representatives.push_back(u);
    }
  }

  for (NodeID c = 0; c + 1 < num_components; ++c) {
    const NodeID u = representatives[c];
    const NodeID v = representatives[c + 1];
    adjacency[u].push_back(v);
    adjacency[v].push_back(u);
  }

  return build_graph(std::move(adjacency));
}

std::vector<NodeID> compute_connected_components(const CSRGraph &graph, NodeID &num_components) {
  std::vector<NodeID> components(graph.n(), kInvalidNodeID);
  std::stack<NodeID> todo;
  num_components = 0;

  for (const NodeID start : graph.nodes()) {
    if (components[start] != kInvalidNodeID) {
      continue;
    }

    components[start] = num_components;
    todo.push(start);
    do {
      const NodeID u = todo.top();
      todo.pop();

      graph.adjacent_nodes(u, [&](const NodeID v) {
        if (components[v] == kInvalidNodeID) {
          components[v] = num_components;
          todo.push(v);
        }
      });
    } while (!todo.empty());

    ++num_components;
  }

  return components;
}

} // namespace klpart::tools
