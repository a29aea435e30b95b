/*******************************************************************************
 * Public library interface of KLPart.
 *
 * @file:   klpart.cc
 * @author: Daniel Seemaier
 * @date:   03.02.2026
 ******************************************************************************/
#include "klpart/klpart.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include "klpart-core/context_io.h"
#include "klpart-core/datastructures/csr_graph.h"
#include "klpart-core/partitioning/kl_partitioner.h"

#include "klpart-common/console_io.h"
#include "klpart-common/logger.h"

namespace klpart {

namespace {

void print_statistics(const Context &ctx, const PartitionResult &result, const bool parseable) {
  const BlockID k = static_cast<BlockID>(result.blocks.size());

  BlockSize max_block_size = 0;
  for (const auto &block : result.blocks) {
    max_block_size = std::max<BlockSize>(max_block_size, block.size());
  }
  const double imbalance = max_block_size / ctx.partition.perfectly_balanced_block_size() - 1.0;

  cio::print_delimiter("Result Summary");

  // Statistics output that is easy to parse
  if (parseable) {
    LOG << "RESULT cut=" << result.cut << " imbalance=" << imbalance << " k=" << k
        << " passes=" << result.num_passes << " seed=" << ctx.seed;
    LOG;
  }

  LOG << "Partition summary:";
  LOG << "  Number of blocks: " << k;
  LOG << "  Edge cut:         " << result.cut;
  LOG << "  Imbalance:        " << imbalance;
  LOG << "  Passes:           " << result.num_passes;

  LOG;
  LOG << "Block sizes:";

  constexpr BlockID max_displayed_sizes = 128;

  const int block_id_width = std::log10(std::min(max_displayed_sizes, k)) + 1;
  const int block_size_width = std::log10(std::max<BlockSize>(max_block_size, 1)) + 1;

  for (BlockID b = 0; b < std::min(k, max_displayed_sizes); ++b) {
    std::stringstream ss;
    ss << "  |V" << std::left << std::setw(block_id_width) << b
       << "| = " << std::setw(block_size_width) << result.blocks[b].size();
    LLOG << ss.str() << " ";
    if ((b % 4) == 3) {
      LOG;
    }
  }
  if (std::min(k, max_displayed_sizes) % 4 != 0) {
    LOG;
  }
  if (k > max_displayed_sizes) {
    LOG << "(only showing the first " << max_displayed_sizes << " of " << k << " blocks)";
  }
}

} // namespace

KLPart::KLPart() : KLPart(tbb::this_task_arena::max_concurrency(), create_default_context()) {}

KLPart::KLPart(const int num_threads, Context ctx)
    : _num_threads(num_threads),
      _ctx(std::move(ctx)),
      _gc(std::make_unique<tbb::global_control>(
          tbb::global_control::max_allowed_parallelism, num_threads
      )) {
  _ctx.parallel.num_threads = num_threads;
}

KLPart::~KLPart() = default;

void KLPart::reseed(const int seed) {
  _ctx.seed = seed;
}

void KLPart::set_output_level(const OutputLevel output_level) {
  _output_level = output_level;
}

Context &KLPart::context() {
  return _ctx;
}

void KLPart::copy_graph(const std::span<const EdgeID> xadj, const std::span<const NodeID> adjncy) {
  if (xadj.empty()) {
    throw StructuralError("offset array must contain at least one entry");
  }

  std::vector<EdgeID> offsets(xadj.size());
  std::vector<NodeID> neighbors(adjncy.size());

  tbb::parallel_for<std::size_t>(0, xadj.size(), [&](const std::size_t i) {
    offsets[i] = xadj[i];
  });
  tbb::parallel_for<std::size_t>(0, adjncy.size(), [&](const std::size_t i) {
    neighbors[i] = adjncy[i];
  });

  const auto n = static_cast<NodeID>(xadj.size() - 1);
  set_graph(load_graph(n, std::move(neighbors), std::move(offsets)));
}

void KLPart::set_graph(CSRGraph graph) {
  _graph_ptr = std::make_unique<CSRGraph>(std::move(graph));
}

const CSRGraph *KLPart::graph() const {
  return _graph_ptr.get();
}

PartitionResult KLPart::compute_partition(const BlockID k, const double margin) {
  if (_graph_ptr == nullptr) {
    throw std::invalid_argument(
        "Call KLPart::copy_graph() or KLPart::set_graph() before calling "
        "KLPart::compute_partition()."
    );
  }

  Logger::set_quiet_mode(_output_level == OutputLevel::QUIET);

  // Validates k and margin before anything is printed
  _ctx.partition.setup(*_graph_ptr, k, margin);
  _ctx.parallel.num_threads = _num_threads;

  if (_output_level >= OutputLevel::APPLICATION) {
    cio::print_klpart_banner();
    cio::print_build_identifier();
    cio::print_build_datatypes<NodeID, EdgeID, BlockID, EdgeWeight>();
    cio::print_delimiter("Input Summary", '#');
    print(_ctx, std::cout);
    cio::print_delimiter("Partitioning");
  }

  KLPartitioner partitioner(*_graph_ptr, _ctx);
  partitioner.set_output_level(_output_level);
  PartitionResult result = partitioner.partition();

  if (_output_level >= OutputLevel::APPLICATION) {
    print_statistics(_ctx, result, _output_level >= OutputLevel::EXPERIMENT);
  }

  return result;
}

EdgeWeight
KLPart::compute_partition(const BlockID k, const double margin, std::span<BlockID> partition) {
  if (_graph_ptr != nullptr && partition.size() < _graph_ptr->n()) {
    throw std::invalid_argument(
        "output span has length " + std::to_string(partition.size()) + ", but the graph has " +
        std::to_string(_graph_ptr->n()) + " vertices"
    );
  }

  const PartitionResult result = compute_partition(k, margin);
  std::copy(result.partition.begin(), result.partition.end(), partition.begin());

  return result.cut;
}

} // namespace klpart
