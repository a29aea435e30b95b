/*******************************************************************************
 * Multi-pass Kernighan-Lin k-way partitioner: computes an initial partition and
 * refines all pairs of blocks until a pass brings no improvement.
 *
 * @file:   kl_partitioner.cc
 * @author: Daniel Seemaier
 * @date:   03.02.2026
 ******************************************************************************/
#include "klpart-core/partitioning/kl_partitioner.h"

#include <exception>

#include "klpart-core/factories.h"
#include "klpart-core/metrics.h"
#include "klpart-core/partition_utils.h"

#include "klpart-common/assert.h"
#include "klpart-common/logger.h"
#include "klpart-common/random.h"

namespace klpart {
namespace {
SET_DEBUG(false);
}

std::ostream &operator<<(std::ostream &out, const PartitionerState state) {
  switch (state) {
  case PartitionerState::UNINITIALIZED:
    return out << "uninitialized";
  case PartitionerState::INITIALIZING:
    return out << "initializing";
  case PartitionerState::REFINING:
    return out << "refining";
  case PartitionerState::VALIDATING:
    return out << "validating";
  case PartitionerState::DONE:
    return out << "done";
  case PartitionerState::FAILED:
    return out << "failed";
  }

  return out << "<invalid>";
}

KLPartitioner::KLPartitioner(const CSRGraph &graph, Context ctx)
    : _graph(graph),
      _ctx(std::move(ctx)) {}

PartitionResult KLPartitioner::partition() {
  KASSERT(
      _state == PartitionerState::UNINITIALIZED,
      "partition() can only be called once, but the partitioner is " << _state,
      assert::always
  );

  try {
    return run();
  } catch (const std::exception &) {
    _state = PartitionerState::FAILED;
    throw;
  }
}

PartitionResult KLPartitioner::run() {
  _ctx.partition.setup(_graph, _ctx.partition.k, _ctx.partition.margin);

  _state = PartitionerState::INITIALIZING;
  Random rand(_ctx.seed);
  auto initial_partitioner = factory::create_initial_partitioner(_ctx, rand);
  PartitionedGraph p_graph = initial_partitioner->partition(_graph, _ctx.partition);

  _state = PartitionerState::REFINING;
  auto refiner = factory::create_refiner(_ctx);
  refiner->initialize(p_graph);

  if (output_at_least(OutputLevel::PROGRESS)) {
    LOG << "Initial partition (" << initial_partitioner->name() << "): cut=" << refiner->cut();
  }

  int num_passes = 0;
  while (num_passes < _ctx.refinement.max_num_passes) {
    const bool improved = refine_all_pairs(p_graph, *refiner, num_passes);
    ++num_passes;

    if (output_at_least(OutputLevel::PROGRESS)) {
      LOG << "Pass " << num_passes << ": cut=" << refiner->cut()
          << (improved ? "" : " (no improvement)");
    }
    if (!improved) {
      break;
    }
  }

  _state = PartitionerState::VALIDATING;
  KASSERT(refiner->cut() == metrics::edge_cut(p_graph), "inconsistent cut", assert::normal);
  validate_balance(p_graph, _ctx.partition);

  PartitionResult result;
  result.blocks = extract_blocks(p_graph);
  result.cut = refiner->cut();
  result.num_passes = num_passes;
  result.history = std::move(_history);
  result.partition = p_graph.take_partition();

  _state = PartitionerState::DONE;
  return result;
}

bool KLPartitioner::refine_all_pairs(
    PartitionedGraph &p_graph, PairwiseRefiner &refiner, const int pass
) {
  bool improved = false;

  for (BlockID a = 0; a < p_graph.k(); ++a) {
    for (BlockID b = a + 1; b < p_graph.k(); ++b) {
      const bool pair_improved = refiner.refine(p_graph, a, b);
      improved |= pair_improved;

      DBG << "Pass " << pass << ", blocks " << a << "/" << b << ": " << refiner.initial_cut()
          << " -> " << refiner.cut();
      if (output_at_least(OutputLevel::DEBUG) && pair_improved) {
        LOG << "  Blocks " << a << " and " << b << ": kept " << refiner.num_committed_swaps()
            << " of " << refiner.swaps().size() << " swaps, cut " << refiner.initial_cut()
            << " -> " << refiner.cut();
      }

      if (_ctx.refinement.record_swaps) {
        record_step(refiner, pass, a, b);
      }
    }
  }

  return improved;
}

void KLPartitioner::record_step(
    const PairwiseRefiner &refiner, const int pass, const BlockID a, const BlockID b
) {
  const auto swaps = refiner.swaps();
  _history.push_back(
      {.pass = pass,
       .block_a = a,
       .block_b = b,
       .initial_cut = refiner.initial_cut(),
       .swaps = {swaps.begin(), swaps.end()},
       .num_committed_swaps = refiner.num_committed_swaps()}
  );
}

PartitionResult partition(const CSRGraph &graph, const BlockID k, const double margin) {
  Context ctx = create_default_context();
  ctx.partition.k = k;
  ctx.partition.margin = margin;
  return partition(graph, ctx);
}

PartitionResult partition(const CSRGraph &graph, const Context &ctx) {
  KLPartitioner partitioner(graph, ctx);
  return partitioner.partition();
}

} // namespace klpart
