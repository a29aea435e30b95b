/*******************************************************************************
 * Seeded PRNG.
 *
 * @file:   random.cc
 * @author: Daniel Seemaier
 * @date:   21.09.2021
 ******************************************************************************/
#include "klpart-common/random.h"

#include <cstdint>

namespace klpart {
Random::Random(const int seed) : _seed(seed), _generator(static_cast<std::uint32_t>(seed)) {}

void Random::reinit(const int seed) {
  _seed = seed;
  _generator.seed(static_cast<std::uint32_t>(seed));
  _real_dist.reset();
}
} // namespace klpart
