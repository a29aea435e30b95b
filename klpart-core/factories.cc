/*******************************************************************************
 * Factory functions to instantiate partitioning components based on their
 * respective enum constant.
 *
 * @file:   factories.cc
 * @author: Daniel Seemaier
 * @date:   21.09.2021
 ******************************************************************************/
#include "klpart-core/factories.h"

// Initial partitioning
#include "klpart-core/initial_partitioning/contiguous_partitioner.h"
#include "klpart-core/initial_partitioning/round_robin_partitioner.h"

// Refinement
#include "klpart-core/refinement/kl/kl_refiner.h"

namespace klpart::factory {
std::unique_ptr<InitialPartitioner> create_initial_partitioner(const Context &ctx, Random &rand) {
  switch (ctx.initial_partitioning.algorithm) {
  case InitialPartitioningAlgorithm::RANDOM_ROUND_ROBIN:
    return std::make_unique<RoundRobinPartitioner>(rand);

  case InitialPartitioningAlgorithm::CONTIGUOUS:
    return std::make_unique<ContiguousPartitioner>();
  }

  __builtin_unreachable();
}

std::unique_ptr<PairwiseRefiner> create_refiner(const Context &ctx) {
  return std::make_unique<KLRefiner>(ctx);
}
} // namespace klpart::factory
