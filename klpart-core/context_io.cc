/*******************************************************************************
 * IO functions for the context structs.
 *
 * @file:   context_io.cc
 * @author: Daniel Seemaier
 * @date:   13.03.2023
 ******************************************************************************/
#include "klpart-core/context_io.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>

#include "klpart-common/console_io.h"

namespace klpart {
std::unordered_map<std::string, InitialPartitioningAlgorithm> get_initial_partitioning_algorithms() {
  return {
      {"random-round-robin", InitialPartitioningAlgorithm::RANDOM_ROUND_ROBIN},
      {"round-robin", InitialPartitioningAlgorithm::RANDOM_ROUND_ROBIN},
      {"contiguous", InitialPartitioningAlgorithm::CONTIGUOUS},
  };
}

std::ostream &operator<<(std::ostream &out, const InitialPartitioningAlgorithm algorithm) {
  switch (algorithm) {
  case InitialPartitioningAlgorithm::RANDOM_ROUND_ROBIN:
    return out << "random-round-robin";
  case InitialPartitioningAlgorithm::CONTIGUOUS:
    return out << "contiguous";
  }

  return out << "<invalid>";
}

std::unordered_map<std::string, OutputLevel> get_output_levels() {
  return {
      {"quiet", OutputLevel::QUIET},
      {"progress", OutputLevel::PROGRESS},
      {"application", OutputLevel::APPLICATION},
      {"experiment", OutputLevel::EXPERIMENT},
      {"debug", OutputLevel::DEBUG},
  };
}

std::ostream &operator<<(std::ostream &out, const OutputLevel level) {
  switch (level) {
  case OutputLevel::QUIET:
    return out << "quiet";
  case OutputLevel::PROGRESS:
    return out << "progress";
  case OutputLevel::APPLICATION:
    return out << "application";
  case OutputLevel::EXPERIMENT:
    return out << "experiment";
  case OutputLevel::DEBUG:
    return out << "debug";
  }

  return out << "<invalid>";
}

void print(const Context &ctx, std::ostream &out) {
  out << "Number of threads:            " << ctx.parallel.num_threads << "\n";
  out << "Seed:                         " << ctx.seed << "\n";
  print(ctx.partition, out);
  cio::print_delimiter("Initial Partitioning", '-');
  print(ctx.initial_partitioning, out);
  cio::print_delimiter("Refinement", '-');
  print(ctx.refinement, out);
}

void print(const PartitionContext &p_ctx, std::ostream &out) {
  const auto size = std::max<std::uint64_t>({p_ctx.n, p_ctx.m, 1});
  const std::size_t width = std::ceil(std::log10(size + 1));

  out << "  Number of vertices:         " << std::setw(width) << p_ctx.n << "\n";
  out << "  Number of edges:            " << std::setw(width) << p_ctx.m / 2 << "\n";
  out << "Number of blocks:             " << p_ctx.k << "\n";
  out << "Maximum block size:           " << p_ctx.max_block_size() << " ("
      << p_ctx.perfectly_balanced_block_size() << " + " << p_ctx.margin << "%)\n";
  if (p_ctx.enforce_min_block_size) {
    out << "Minimum block size:           " << p_ctx.min_block_size() << "\n";
  } else {
    out << "Minimum block size:           <not enforced>\n";
  }
}

void print(const InitialPartitioningContext &i_ctx, std::ostream &out) {
  out << "Algorithm:                    " << i_ctx.algorithm << "\n";
}

void print(const RefinementContext &r_ctx, std::ostream &out) {
  out << "Algorithm:                    kernighan-lin\n";
  out << "  Max. number of passes:      " << r_ctx.max_num_passes << "\n";
  out << "  Max. rounds per pair:       ";
  if (r_ctx.max_num_rounds == 0) {
    out << "<unlimited>\n";
  } else {
    out << r_ctx.max_num_rounds << "\n";
  }
  out << "  Record swaps:               " << (r_ctx.record_swaps ? "yes" : "no") << "\n";
}
} // namespace klpart
