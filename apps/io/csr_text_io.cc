/*******************************************************************************
 * IO utilities for graphs in CSR text format and for partitioning results.
 *
 * @file:   csr_text_io.cc
 * @author: Daniel Seemaier
 * @date:   03.02.2026
 ******************************************************************************/
#include "apps/io/csr_text_io.h"

#include <fstream>
#include <limits>

#include "klpart-common/logger.h"

#include "apps/io/file_toker.h"

namespace klpart::io {

namespace {
SET_DEBUG(false);

std::ofstream open_output(const std::string &filename) {
  std::ofstream out(filename);
  if (!out) {
    throw TokerException("Cannot open output file " + filename);
  }
  return out;
}

void check_written(std::ofstream &out, const std::string &filename) {
  out.flush();
  if (!out) {
    throw TokerException("Cannot write output file " + filename);
  }
}

template <typename T> T scan_value(MappedFileToker &toker) {
  const std::size_t line = toker.line();
  const std::uint64_t value = toker.scan_uint();
  if (value > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
    throw ParserException(line, "value " + std::to_string(value) + " exceeds the ID type");
  }
  return static_cast<T>(value);
}

// Parses a `;`-separated list that ends with the current line; a trailing separator is allowed
template <typename T> std::vector<T> scan_list(MappedFileToker &toker) {
  std::vector<T> values;

  toker.skip_spaces();
  while (!toker.at_line_end()) {
    values.push_back(scan_value<T>(toker));

    if (toker.at_line_end()) {
      break;
    }
    toker.consume_char(';');
    toker.skip_spaces();
  }

  toker.consume_line_end();
  return values;
}

} // namespace

namespace csr_text {

CSRGraph read(const std::string &filename) {
  MappedFileToker toker(filename);

  toker.skip_spaces();
  const NodeID n = scan_value<NodeID>(toker);
  toker.consume_line_end();

  if (!toker.valid_position()) {
    toker.throw_unexpected("the neighbor list");
  }
  std::vector<NodeID> neighbors = scan_list<NodeID>(toker);

  if (!toker.valid_position()) {
    toker.throw_unexpected("the offset list");
  }
  std::vector<EdgeID> offsets = scan_list<EdgeID>(toker);

  DBG << "Read " << filename << ": n=" << n << ", " << neighbors.size() << " neighbors, "
      << offsets.size() << " offsets";

  // Remaining lines hold vertex groups, which are not used for partitioning
  return load_graph(n, std::move(neighbors), std::move(offsets));
}

void write(const std::string &filename, const CSRGraph &graph) {
  std::ofstream out = open_output(filename);

  out << graph.n() << "\n";

  bool first = true;
  for (const NodeID v : graph.raw_edges()) {
    out << (first ? "" : ";") << v;
    first = false;
  }
  out << "\n";

  first = true;
  for (const EdgeID e : graph.raw_nodes()) {
    out << (first ? "" : ";") << e;
    first = false;
  }
  out << "\n";

  check_written(out, filename);
}

} // namespace csr_text

namespace results {

void write(const std::string &filename, const PartitionResult &result) {
  std::ofstream out = open_output(filename);

  out << result.blocks.size() << "\n";
  out << result.cut << "\n";
  for (const auto &block : result.blocks) {
    out << block.size();
    for (const NodeID u : block) {
      out << " " << u;
    }
    out << "\n";
  }

  check_written(out, filename);
}

} // namespace results

namespace partition {

void write(const std::string &filename, const std::span<const BlockID> partition) {
  std::ofstream out = open_output(filename);
  for (const BlockID block : partition) {
    out << block << "\n";
  }
  check_written(out, filename);
}

std::vector<BlockID> read(const std::string &filename) {
  MappedFileToker toker(filename);

  std::vector<BlockID> partition;
  while (toker.valid_position()) {
    partition.push_back(scan_value<BlockID>(toker));
    toker.consume_line_end();
  }

  return partition;
}

} // namespace partition

namespace history {

void write(const std::string &filename, const std::span<const RefinementStep> history) {
  std::ofstream out = open_output(filename);

  for (const RefinementStep &step : history) {
    for (std::size_t i = 0; i < step.swaps.size(); ++i) {
      const SwapRecord &swap = step.swaps[i];
      out << step.pass << " " << step.block_a << " " << step.block_b << " " << i << " "
          << swap.first << " " << swap.second << " " << swap.gain << " " << swap.cut << " "
          << (i < step.num_committed_swaps ? 1 : 0) << "\n";
    }
  }

  check_written(out, filename);
}

} // namespace history

} // namespace klpart::io
