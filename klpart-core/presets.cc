/*******************************************************************************
 * Configuration presets for KLPart.
 *
 * @file:   presets.cc
 * @author: Daniel Seemaier
 * @date:   13.03.2023
 ******************************************************************************/
#include <stdexcept>
#include <string>
#include <unordered_set>

#include "klpart/klpart.h"

#include "klpart-common/strutils.h"

namespace klpart {

Context create_context_by_preset_name(const std::string &name) {
  const std::string preset = str::to_lower(name);

  if (preset == "default") {
    return create_default_context();
  } else if (preset == "strict") {
    return create_strict_context();
  } else if (preset == "fast") {
    return create_fast_context();
  } else if (preset == "contiguous") {
    return create_contiguous_context();
  }

  throw std::runtime_error("invalid preset name: " + name);
}

std::unordered_set<std::string> get_preset_names() {
  return {
      "default",
      "strict",
      "fast",
      "contiguous",
  };
}

Context create_default_context() {
  return {
      .partition = {},
      .initial_partitioning =
          {
              .algorithm = InitialPartitioningAlgorithm::RANDOM_ROUND_ROBIN,
          },
      .refinement =
          {
              .max_num_passes = 10,
              .max_num_rounds = 0,
              .record_swaps = false,
          },
      .parallel =
          {
              .num_threads = 1,
          },
      .seed = 0,
  };
}

Context create_strict_context() {
  Context ctx = create_default_context();
  ctx.partition.enforce_min_block_size = true;
  return ctx;
}

Context create_fast_context() {
  Context ctx = create_default_context();
  ctx.refinement.max_num_passes = 1;
  return ctx;
}

Context create_contiguous_context() {
  Context ctx = create_default_context();
  ctx.initial_partitioning.algorithm = InitialPartitioningAlgorithm::CONTIGUOUS;
  return ctx;
}

} // namespace klpart
