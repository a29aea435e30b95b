/*******************************************************************************
 * Factory functions to instantiate partitioning components based on their
 * respective enum constant.
 *
 * @file:   factories.h
 * @author: Daniel Seemaier
 * @date:   21.09.2021
 ******************************************************************************/
#pragma once

#include <memory>

#include "klpart-core/initial_partitioning/initial_partitioner.h"
#include "klpart-core/refinement/refiner.h"
#include "klpart/klpart.h"

#include "klpart-common/random.h"

namespace klpart::factory {
// The generator must outlive the returned object
std::unique_ptr<InitialPartitioner> create_initial_partitioner(const Context &ctx, Random &rand);

std::unique_ptr<PairwiseRefiner> create_refiner(const Context &ctx);
} // namespace klpart::factory
