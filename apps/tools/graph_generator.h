/*******************************************************************************
 * Random graph generator producing inputs for the partitioner.
 *
 * @file:   graph_generator.h
 * @author: Daniel Seemaier
 * @date:   03.02.2026
 ******************************************************************************/
#pragma once

#include <vector>

#include "klpart-core/datastructures/csr_graph.h"
#include "klpart/klpart.h"

namespace klpart::tools {

struct GnpContext {
  NodeID n = 0;

  //! Probability of each of the `n * (n - 1) / 2` possible edges.
  double p = 0.0;

  int seed = 0;

  //! If set, components are linked by additional edges until the graph is connected.
  bool connected = false;
};

/*!
 * Generates a simple undirected Erdos-Renyi graph G(n, p). The neighbors of each vertex are
 * sorted in ascending order. The same context always yields the same graph.
 *
 * @throws ParameterError if `n == 0` or `p` is not in `[0, 1]`.
 */
CSRGraph generate_gnp(const GnpContext &ctx);

/*!
 * Computes the connected components of a graph.
 *
 * @param[out] num_components Number of connected components.
 * @return Component ID of each vertex; components are numbered in order of their smallest vertex.
 */
std::vector<NodeID> compute_connected_components(const CSRGraph &graph, NodeID &num_components);

} // namespace klpart::tools
