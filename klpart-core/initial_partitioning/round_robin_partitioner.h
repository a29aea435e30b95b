/*******************************************************************************
 * Initial partitioner that deals a random permutation of the vertices to the
 * blocks in round-robin fashion.
 *
 * @file:   round_robin_partitioner.h
 * @author: Daniel Seemaier
 * @date:   03.02.2026
 ******************************************************************************/
#pragma once

#include "klpart-core/initial_partitioning/initial_partitioner.h"

#include "klpart-common/random.h"

namespace klpart {
class RoundRobinPartitioner : public InitialPartitioner {
public:
  // The generator must outlive this object; each call to partition() draws a
  // fresh permutation from it
  explicit RoundRobinPartitioner(Random &rand) : _rand(rand) {}

  [[nodiscard]] std::string name() const final {
    return "Random Round-Robin";
  }

protected:
  void fill_partition(const CSRGraph &graph, BlockID k) final;

private:
  Random &_rand;
};
} // namespace klpart
