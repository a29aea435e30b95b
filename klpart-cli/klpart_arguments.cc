/*******************************************************************************
 * Command line arguments for the Kernighan-Lin partitioner.
 *
 * @file:   klpart_arguments.cc
 * @author: Daniel Seemaier
 * @date:   03.02.2026
 ******************************************************************************/
#include "klpart-cli/klpart_arguments.h"

#include "klpart-core/context_io.h"

namespace klpart {

void create_all_options(CLI::App *app, Context &ctx) {
  create_partitioning_options(app, ctx);
  create_initial_partitioning_options(app, ctx);
  create_refinement_options(app, ctx);
}

CLI::Option_group *create_partitioning_options(CLI::App *app, Context &ctx) {
  auto *partitioning = app->add_option_group("Partitioning");

  partitioning
      ->add_flag(
          "--enforce-min-block-size",
          ctx.partition.enforce_min_block_size,
          "Also require every block to contain at least floor(n / k) vertices."
      )
      ->capture_default_str();

  return partitioning;
}

CLI::Option_group *create_initial_partitioning_options(CLI::App *app, Context &ctx) {
  auto *ip = app->add_option_group("Initial Partitioning");

  ip->add_option("--i-algorithm", ctx.initial_partitioning.algorithm)
      ->transform(CLI::CheckedTransformer(get_initial_partitioning_algorithms()).description(""))
      ->description(R"(Algorithm used to compute the initial partition:
  - random-round-robin: shuffle the vertices, then assign them to the blocks in turn
  - contiguous:         assign consecutive ranges of vertex IDs to the blocks)")
      ->capture_default_str();

  return ip;
}

CLI::Option_group *create_refinement_options(CLI::App *app, Context &ctx) {
  auto *refinement = app->add_option_group("Refinement");

  refinement
      ->add_option(
          "--r-max-passes",
          ctx.refinement.max_num_passes,
          "Maximum number of passes over all pairs of blocks; refinement stops earlier if a pass "
          "does not improve the cut."
      )
      ->check(CLI::PositiveNumber)
      ->capture_default_str();
  refinement
      ->add_option(
          "--r-max-rounds",
          ctx.refinement.max_num_rounds,
          "Maximum number of swaps per pair of blocks (set to '0' for no limit)."
      )
      ->capture_default_str();
  refinement
      ->add_flag(
          "--r-record-swaps",
          ctx.refinement.record_swaps,
          "Record all tentative swaps; required for --output-history."
      )
      ->capture_default_str();

  return refinement;
}

} // namespace klpart
