/*******************************************************************************
 * Public library interface of KLPart.
 *
 * @file:   klpart.h
 * @author: Daniel Seemaier
 * @date:   03.02.2026
 ******************************************************************************/
#ifndef KLPART_H
#define KLPART_H

#include <cstdint>
#include <limits>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include <tbb/global_control.h>

#define KLPART_VERSION_MAJOR 1
#define KLPART_VERSION_MINOR 0
#define KLPART_VERSION_PATCH 0

namespace klpart {

#ifdef KLPART_64BIT_NODE_IDS
using NodeID = std::uint64_t;
#else  // KLPART_64BIT_NODE_IDS
using NodeID = std::uint32_t;
#endif // KLPART_64BIT_NODE_IDS

#ifdef KLPART_64BIT_EDGE_IDS
using EdgeID = std::uint64_t;
#else  // KLPART_64BIT_EDGE_IDS
using EdgeID = std::uint32_t;
#endif // KLPART_64BIT_EDGE_IDS

// Signed: also used for gains, which can be negative
#ifdef KLPART_64BIT_WEIGHTS
using EdgeWeight = std::int64_t;
#else  // KLPART_64BIT_WEIGHTS
using EdgeWeight = std::int32_t;
#endif // KLPART_64BIT_WEIGHTS

using BlockID = std::uint32_t;

// Graphs are unweighted: the weight of a block is its number of vertices
using BlockSize = NodeID;

constexpr BlockID kInvalidBlockID = std::numeric_limits<BlockID>::max();
constexpr NodeID kInvalidNodeID = std::numeric_limits<NodeID>::max();
constexpr EdgeID kInvalidEdgeID = std::numeric_limits<EdgeID>::max();
constexpr EdgeWeight kInvalidEdgeWeight = std::numeric_limits<EdgeWeight>::max();

class CSRGraph;

//
// Errors
//

/*!
 * Thrown if the CSR arrays describing a graph are malformed.
 */
class StructuralError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

/*!
 * Thrown if the partitioning parameters are out of range, e.g., `k < 2`, `k > n` or a negative
 * balance margin.
 */
class ParameterError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

/*!
 * Thrown if the computed partition violates the balance constraint. Carries the offending
 * block sizes and the bounds they were checked against.
 */
class BalanceViolationError : public std::runtime_error {
public:
  BalanceViolationError(
      std::vector<BlockSize> block_sizes, BlockSize min_block_size, BlockSize max_block_size
  );

  [[nodiscard]] const std::vector<BlockSize> &block_sizes() const {
    return _block_sizes;
  }

  [[nodiscard]] BlockSize min_block_size() const {
    return _min_block_size;
  }

  [[nodiscard]] BlockSize max_block_size() const {
    return _max_block_size;
  }

private:
  std::vector<BlockSize> _block_sizes;
  BlockSize _min_block_size;
  BlockSize _max_block_size;
};

//
// Configuration
//

enum class InitialPartitioningAlgorithm {
  RANDOM_ROUND_ROBIN,
  CONTIGUOUS,
};

struct PartitionContext {
  NodeID n = kInvalidNodeID;
  EdgeID m = kInvalidEdgeID;

  BlockID k = 0;

  //! Allowed excess over the perfectly balanced block size, in percent.
  double margin = 0.0;

  //! If set, blocks must also contain at least `floor(n / k)` vertices.
  bool enforce_min_block_size = false;

  [[nodiscard]] double perfectly_balanced_block_size() const {
    return 1.0 * n / k;
  }

  [[nodiscard]] BlockSize max_block_size() const {
    return _max_block_size;
  }

  [[nodiscard]] BlockSize min_block_size() const {
    return _min_block_size;
  }

  void setup(const CSRGraph &graph, BlockID k, double margin);

private:
  BlockSize _max_block_size = 0;
  BlockSize _min_block_size = 0;
};

struct InitialPartitioningContext {
  InitialPartitioningAlgorithm algorithm;
};

struct RefinementContext {
  //! Upper bound on the number of passes over all block pairs.
  int max_num_passes;

  //! Upper bound on the number of swap rounds per block pair, 0 for no limit.
  NodeID max_num_rounds;

  //! If set, each refinement step is recorded in `PartitionResult::history`.
  bool record_swaps;
};

struct ParallelContext {
  int num_threads;
};

struct Context {
  PartitionContext partition;
  InitialPartitioningContext initial_partitioning;
  RefinementContext refinement;
  ParallelContext parallel;

  int seed;
};

//
// Configuration presets
//

std::unordered_set<std::string> get_preset_names();

Context create_context_by_preset_name(const std::string &name);

Context create_default_context();
Context create_strict_context();
Context create_fast_context();
Context create_contiguous_context();

//
// Partitioning results
//

/*!
 * One swap of a pairwise refinement step: `first` moved from block A to block B, `second` the
 * other way round. `cut` is the global edge cut after applying the swap.
 */
struct SwapRecord {
  NodeID first;
  NodeID second;
  EdgeWeight gain;
  EdgeWeight cut;
};

/*!
 * All swaps tentatively performed while refining the blocks `block_a` and `block_b` during pass
 * `pass`. The first `num_committed_swaps` swaps were kept, the rest was rolled back.
 */
struct RefinementStep {
  int pass;
  BlockID block_a;
  BlockID block_b;
  EdgeWeight initial_cut;
  std::vector<SwapRecord> swaps;
  std::size_t num_committed_swaps;
};

struct PartitionResult {
  //! Block ID of each vertex.
  std::vector<BlockID> partition;

  //! Vertices of each block, in ascending order.
  std::vector<std::vector<NodeID>> blocks;

  EdgeWeight cut;
  int num_passes;

  //! Only filled if `RefinementContext::record_swaps` is set.
  std::vector<RefinementStep> history;
};

} // namespace klpart

//
// Partitioner interface
//

namespace klpart {

enum class OutputLevel : std::uint8_t {
  QUIET,       //! Disable all output to stdout.
  PROGRESS,    //! Output a summary of each refinement pass.
  APPLICATION, //! Also output the application banner, context and result summary.
  EXPERIMENT,  //! Also output a machine-readable result line.
  DEBUG,       //! Also output the result of every refinement step.
};

class KLPart {
public:
  KLPart();
  KLPart(int num_threads, Context ctx);

  KLPart(const KLPart &) = delete;
  KLPart &operator=(const KLPart &) = delete;

  KLPart(KLPart &&) noexcept = default;
  KLPart &operator=(KLPart &&) noexcept = default;

  ~KLPart();

  /*!
   * Sets the seed used to generate the initial partition.
   *
   * @param seed Seed for the random number generator.
   */
  void reseed(int seed);

  /*!
   * Sets the verbosity of the partitioner.
   *
   * @param output_level Verbosity level, higher values mean more output.
   */
  void set_output_level(OutputLevel output_level);

  /*!
   * Returns a non-const reference to the context object, which can be used to configure the
   * partitioning process.
   *
   * @return Reference to the context object.
   */
  Context &context();

  /*!
   * Sets the graph to be partitioned by copying the given CSR arrays.
   *
   * @param xadj Array of length `n + 1`, where `xadj[u]` points to the first neighbor of node `u`
   * in `adjncy`. In other words, the neighbors of `u` are `adjncy[xadj[u]..xadj[u+1]-1]`.
   * @param adjncy Array of length `xadj[n]` storing the neighbors of all nodes. Each undirected
   * edge must be stored in both directions.
   *
   * @throws StructuralError if the arrays do not describe a valid CSR graph.
   */
  void copy_graph(std::span<const EdgeID> xadj, std::span<const NodeID> adjncy);

  /*!
   * Sets the graph to be partitioned.
   *
   * @param graph The graph to be partitioned.
   */
  void set_graph(CSRGraph graph);

  /*!
   * Partitions the graph set by `copy_graph()` or `set_graph()` into `k` blocks such that no
   * block contains more than `ceil(n / k * (1 + margin / 100))` vertices.
   *
   * @param k Number of blocks.
   * @param margin Balance margin in percent (e.g., 3 for at most 3% above the average size).
   *
   * @return The partition, its blocks, its edge cut and (optionally) the refinement history.
   *
   * @throws ParameterError if `k` or `margin` is out of range.
   * @throws BalanceViolationError if the computed partition violates the balance constraint.
   */
  PartitionResult compute_partition(BlockID k, double margin);

  /*!
   * Same as above, but only stores the block ID of each node in `partition`.
   *
   * @param[out] partition Span of length `n` to store the partition.
   *
   * @return Edge cut of the partition.
   */
  EdgeWeight compute_partition(BlockID k, double margin, std::span<BlockID> partition);

  [[nodiscard]] const CSRGraph *graph() const;

private:
  int _num_threads;

  OutputLevel _output_level = OutputLevel::APPLICATION;
  Context _ctx;

  std::unique_ptr<CSRGraph> _graph_ptr;
  std::unique_ptr<tbb::global_control> _gc;
};

} // namespace klpart

#endif // KLPART_H
