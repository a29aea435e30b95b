/*******************************************************************************
 * Initial partitioner that splits the vertex IDs into k consecutive ranges.
 *
 * @file:   contiguous_partitioner.h
 * @author: Daniel Seemaier
 * @date:   03.02.2026
 ******************************************************************************/
#pragma once

#include "klpart-core/initial_partitioning/initial_partitioner.h"

namespace klpart {
class ContiguousPartitioner : public InitialPartitioner {
public:
  [[nodiscard]] std::string name() const final {
    return "Contiguous";
  }

protected:
  void fill_partition(const CSRGraph &graph, BlockID k) final;
};
} // namespace klpart
