/*******************************************************************************
 * Seeded PRNG. Instances are owned by the caller and passed to the components
 * that need randomness; there is no process-global generator.
 *
 * @file:   random.h
 * @author: Daniel Seemaier
 * @date:   21.09.2021
 ******************************************************************************/
#pragma once

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <random>
#include <vector>

namespace klpart {
class Random {
public:
  using generator_type = std::mt19937;

  explicit Random(int seed);

  Random(const Random &) = delete;
  Random &operator=(const Random &) = delete;

  Random(Random &&) noexcept = default;
  Random &operator=(Random &&) noexcept = default;

  void reinit(int seed);

  [[nodiscard]] int seed() const {
    return _seed;
  }

  std::size_t
  random_index(const std::size_t inclusive_lower_bound, const std::size_t exclusive_upper_bound) {
    return std::uniform_int_distribution<std::size_t>(
        inclusive_lower_bound, exclusive_upper_bound - 1
    )(_generator);
  }

  bool random_bool(const double prob) {
    return _real_dist(_generator) < prob;
  }

  template <typename Container> void shuffle(Container &&vec) {
    std::shuffle(vec.begin(), vec.end(), _generator);
  }

  // Uniformly random permutation of 0, ..., size - 1
  template <typename Value> [[nodiscard]] std::vector<Value> random_permutation(const Value size) {
    std::vector<Value> permutation(size);
    std::iota(permutation.begin(), permutation.end(), static_cast<Value>(0));
    shuffle(permutation);
    return permutation;
  }

private:
  int _seed;
  generator_type _generator;
  std::uniform_real_distribution<> _real_dist{0.0, 1.0};
};
} // namespace klpart
