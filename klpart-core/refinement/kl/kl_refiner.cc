/*******************************************************************************
 * Kernighan-Lin refinement of a pair of blocks.
 *
 * @file:   kl_refiner.cc
 * @author: Daniel Seemaier
 * @date:   03.02.2026
 ******************************************************************************/
#include "klpart-core/refinement/kl/kl_refiner.h"

#include <algorithm>

#include <tbb/blocked_range.h>
#include <tbb/parallel_reduce.h>

#include "klpart-core/metrics.h"
#include "klpart-core/refinement/kl/kl_gains.h"

#include "klpart-common/assert.h"
#include "klpart-common/logger.h"

namespace klpart {
namespace {
SET_DEBUG(false);
}

KLRefiner::KLRefiner(const Context &ctx)
    : _r_ctx(ctx.refinement),
      _adjacency_markers([this] { return Marker<>(_n); }) {}

KLRefiner::~KLRefiner() = default;

void KLRefiner::initialize(const PartitionedGraph &p_graph) {
  if (_n != p_graph.n()) {
    _n = p_graph.n();
    _locked.resize(_n);
    _adjacency_markers.clear();
  }

  _cut = metrics::edge_cut(p_graph);
  _initial_cut = _cut;
  _swaps.clear();
  _num_committed_swaps = 0;
}

bool KLRefiner::refine(PartitionedGraph &p_graph, const BlockID a, const BlockID b) {
  KASSERT(p_graph.n() == _n, "refiner was initialized for another graph", assert::always);
  KASSERT(a != b && a < p_graph.k() && b < p_graph.k(), "invalid pair of blocks", assert::light);
  KASSERT(metrics::edge_cut(p_graph) == _cut, "partition changed since the last call", assert::heavy);

  collect_members(p_graph, a, b);

  _initial_cut = _cut;
  _swaps.clear();
  _num_committed_swaps = 0;
  _locked.reset();

  NodeID max_num_rounds = static_cast<NodeID>(std::min(_members_a.size(), _members_b.size()));
  if (_r_ctx.max_num_rounds > 0) {
    max_num_rounds = std::min(max_num_rounds, _r_ctx.max_num_rounds);
  }

  DBG << "Refining blocks " << a << " and " << b << ": |A|=" << _members_a.size()
      << " |B|=" << _members_b.size() << " cut=" << _cut << " rounds<=" << max_num_rounds;

  EdgeWeight current_cut = _cut;
  EdgeWeight best_cut = _cut;
  std::size_t best_prefix = 0;

  for (NodeID round = 0; round < max_num_rounds; ++round) {
    kl::compute_gains(p_graph, _members_a, _locked, b, _gains_a);
    kl::compute_gains(p_graph, _members_b, _locked, a, _gains_b);

    const Candidate best = find_best_pair(p_graph);
    if (!best.valid()) {
      break;
    }

    const NodeID first = _members_a[best.index_a];
    const NodeID second = _members_b[best.index_b];
    KASSERT(p_graph.block(first) == a && p_graph.block(second) == b, "", assert::light);

    p_graph.swap_blocks(first, second);
    _locked.set(first);
    _locked.set(second);

    // The gains are exact w.r.t. the two blocks and edges to third blocks stay
    // cut, thus the global cut decreases by exactly the combined gain
    current_cut -= best.gain;
    _swaps.push_back({first, second, best.gain, current_cut});
    KASSERT(current_cut == metrics::edge_cut(p_graph), "inconsistent cut", assert::heavy);

    if (current_cut < best_cut) {
      best_cut = current_cut;
      best_prefix = _swaps.size();
    }
  }

  rollback(p_graph, best_prefix);
  _num_committed_swaps = best_prefix;
  _cut = best_cut;

  DBG << "Performed " << _swaps.size() << " swaps, kept " << best_prefix
      << ", cut: " << _initial_cut << " -> " << _cut;
  KASSERT(_cut == metrics::edge_cut(p_graph), "inconsistent cut after rollback", assert::heavy);
  KASSERT(_cut <= _initial_cut, "refinement increased the cut", assert::always);

  return best_prefix > 0;
}

void KLRefiner::collect_members(const PartitionedGraph &p_graph, const BlockID a, const BlockID b) {
  _members_a.clear();
  _members_b.clear();
  _members_a.reserve(p_graph.block_size(a));
  _members_b.reserve(p_graph.block_size(b));

  for (const NodeID u : p_graph.graph().nodes()) {
    const BlockID u_block = p_graph.block(u);
    if (u_block == a) {
      _members_a.push_back(u);
    } else if (u_block == b) {
      _members_b.push_back(u);
    }
  }

  _gains_a.resize(_members_a.size());
  _gains_b.resize(_members_b.size());
}

KLRefiner::Candidate KLRefiner::find_best_pair(const PartitionedGraph &p_graph) {
  const CSRGraph &graph = p_graph.graph();

  return tbb::parallel_reduce(
      tbb::blocked_range<std::size_t>(0, _members_a.size()),
      Candidate{},
      [&](const auto &r, Candidate best) {
        Marker<> &adjacent = _adjacency_markers.local();

        for (std::size_t i = r.begin(); i != r.end(); ++i) {
          const NodeID first = _members_a[i];
          if (_locked.get(first)) {
            continue;
          }

          adjacent.reset();
          graph.adjacent_nodes(first, [&](const NodeID v) { adjacent.set(v); });

          for (std::size_t j = 0; j < _members_b.size(); ++j) {
            const NodeID second = _members_b[j];
            if (_locked.get(second)) {
              continue;
            }

            // Exchanging adjacent vertices keeps their common edge cut
            const EdgeWeight gain = _gains_a[i] + _gains_b[j] - (adjacent.get(second) ? 2 : 0);
            const Candidate candidate{gain, i, j};
            if (candidate.better_than(best)) {
              best = candidate;
            }
          }
        }

        return best;
      },
      [](const Candidate &lhs, const Candidate &rhs) { return rhs.better_than(lhs) ? rhs : lhs; }
  );
}

void KLRefiner::rollback(PartitionedGraph &p_graph, const std::size_t num_kept_swaps) {
  for (std::size_t i = _swaps.size(); i > num_kept_swaps; --i) {
    const SwapRecord &swap = _swaps[i - 1];
    p_graph.swap_blocks(swap.first, swap.second);
  }
}
} // namespace klpart
