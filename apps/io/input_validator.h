/*******************************************************************************
 * Validator for undirected input graphs.
 *
 * @file:   input_validator.h
 * @author: Daniel Seemaier
 * @date:   26.10.2022
 ******************************************************************************/
#pragma once

#include "klpart-core/datastructures/csr_graph.h"

namespace klpart {
/*!
 * Checks that the graph is simple and undirected, i.e., that it contains no self-loops, no
 * multi-edges and that every edge is stored in both directions.
 *
 * @throws StructuralError describing the first violation found.
 */
void validate_undirected_graph(const CSRGraph &graph);
} // namespace klpart
