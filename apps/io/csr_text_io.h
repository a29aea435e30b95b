/*******************************************************************************
 * IO utilities for graphs in CSR text format and for partitioning results.
 *
 * @file:   csr_text_io.h
 * @author: Daniel Seemaier
 * @date:   03.02.2026
 ******************************************************************************/
#pragma once

#include <span>
#include <string>
#include <vector>

#include "klpart-core/datastructures/csr_graph.h"
#include "klpart/klpart.h"

namespace klpart::io {

namespace csr_text {

/*!
 * Reads a graph stored in CSR text format:
 *
 * - line 1: number of vertices `n`,
 * - line 2: neighbors of all vertices, separated by `;`,
 * - line 3: `n + 1` offsets into line 2, separated by `;`.
 *
 * Blanks around the separators are allowed, further lines are ignored.
 *
 * @param filename The name of the file to read.
 * @return The graph that is stored in the file.
 *
 * @throws TokerException if the file cannot be read.
 * @throws ParserException if the file is not in CSR text format.
 * @throws StructuralError if the arrays do not describe a valid graph.
 */
CSRGraph read(const std::string &filename);

/*!
 * Writes a graph in CSR text format.
 */
void write(const std::string &filename, const CSRGraph &graph);

} // namespace csr_text

namespace results {

/*!
 * Writes a partitioning result in the format of the original GUI tool: number of blocks, edge
 * cut, then one line per block with its size followed by the IDs of its vertices.
 */
void write(const std::string &filename, const PartitionResult &result);

} // namespace results

namespace partition {

void write(const std::string &filename, std::span<const BlockID> partition);

std::vector<BlockID> read(const std::string &filename);

} // namespace partition

namespace history {

/*!
 * Writes one line per recorded swap:
 * `pass block_a block_b index first second gain cut committed`.
 */
void write(const std::string &filename, std::span<const RefinementStep> history);

} // namespace history

} // namespace klpart::io
