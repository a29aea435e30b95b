/*******************************************************************************
 * Standalone binary for the Kernighan-Lin partitioner.
 *
 * @file:   KLPart.cc
 * @author: Daniel Seemaier
 * @date:   03.02.2026
 ******************************************************************************/
// clang-format off
#include "klpart-cli/klpart_arguments.h"
#include "klpart/klpart.h"
// clang-format on

#include <cstdlib>
#include <iostream>
#include <limits>

#include "klpart-core/datastructures/csr_graph.h"

#include "klpart-common/logger.h"
#include "klpart-common/strutils.h"

#include "apps/io/csr_text_io.h"
#include "apps/io/file_toker.h"
#include "apps/io/input_validator.h"
#include "apps/version.h"

using namespace klpart;

namespace {

struct ApplicationContext {
  bool dump_config = false;
  bool show_version = false;

  int seed = 0;
  int num_threads = 1;

  BlockID k = 0;
  double margin = 0.0;

  int repetitions = 1;

  bool quiet = false;
  bool progress = false;
  bool experiment = false;
  bool validate = false;
  bool debug = false;

  std::string graph_filename = "";

  std::string result_filename = "";
  std::string partition_filename = "";
  std::string history_filename = "";
};

void setup_context(CLI::App &cli, ApplicationContext &app, Context &ctx) {
  cli.set_config("-C,--config", "", "Read parameters from a TOML configuration file.", false);
  cli.add_option_function<std::string>(
         "-P,--preset",
         [&](const std::string preset) { ctx = create_context_by_preset_name(preset); }
  )
      ->check(CLI::IsMember(get_preset_names(), CLI::ignore_case))
      ->description(R"(Use configuration preset:
  - default:    random round-robin initial partition, up to 10 refinement passes
  - strict:     same as default, but blocks must also contain at least floor(n / k) vertices
  - fast:       only one refinement pass
  - contiguous: blocks are initialized with consecutive ranges of vertex IDs)");

  // Mandatory
  auto *mandatory = cli.add_option_group("Application")->require_option(1);

  // Mandatory -> either dump config ...
  mandatory->add_flag("--dump-config", app.dump_config)
      ->configurable(false)
      ->description(R"(Print the current configuration and exit.
The output should be stored in a file and can be used by the -C,--config option.)");
  mandatory->add_flag("-v,--version", app.show_version, "Show version and exit.");

  // Mandatory -> ... or partition a graph
  auto *gp_group = mandatory->add_option_group("Partitioning")->silent();
  gp_group->add_option("-k,--k", app.k, "Number of blocks in the partition.")
      ->configurable(false)
      ->check(CLI::Range(static_cast<BlockID>(2), std::numeric_limits<BlockID>::max()))
      ->required();
  gp_group->add_option("-G,--graph", app.graph_filename, "Input graph in CSR text format.")
      ->check(CLI::ExistingFile)
      ->configurable(false)
      ->required();

  // Application options
  cli.add_option(
         "-e,--margin",
         app.margin,
         "Balance margin in percent: no block may contain more than ceil(n / k * (1 + e / 100)) "
         "vertices."
  )
      ->check(CLI::NonNegativeNumber)
      ->default_val(app.margin);
  cli.add_option("-s,--seed", app.seed, "Seed for random number generation.")
      ->default_val(app.seed);
  cli.add_option("-t,--threads", app.num_threads, "Number of threads to be used.")
      ->check(CLI::PositiveNumber)
      ->default_val(app.num_threads);
  cli.add_option(
         "--repetitions",
         app.repetitions,
         "Number of attempts with seeds seed, seed + 1, ... if a partition violates the balance "
         "constraint."
  )
      ->check(CLI::PositiveNumber)
      ->default_val(app.repetitions);
  cli.add_flag("-q,--quiet", app.quiet, "Suppress all console output.");
  cli.add_flag("--progress", app.progress, "Only print a summary of each refinement pass.");
  cli.add_flag("-E,--experiment", app.experiment, "Use an output format that is easier to parse.");
  cli.add_flag(
      "-D,--debug", app.debug, "Same as -E, but print the result of every refinement step."
  );

  cli.add_option(
         "-o,--output",
         app.result_filename,
         "Output filename for the partitioning result: number of blocks, edge cut and one line "
         "per block listing its size and vertices."
  )
      ->capture_default_str();
  cli.add_option(
         "--output-partition",
         app.partition_filename,
         "Output filename for the graph partition (one block ID per line)."
  )
      ->capture_default_str();
  cli.add_option(
         "--output-history",
         app.history_filename,
         "Output filename for all tentative swaps (implies --r-record-swaps)."
  )
      ->capture_default_str();

  cli.add_flag(
      "--validate",
      app.validate,
      "Check that the input graph is undirected and contains neither self-loops nor multi-edges "
      "before partitioning."
  );

  // Algorithmic options
  create_all_options(&cli, ctx);
}

OutputLevel output_level(const ApplicationContext &app) {
  if (app.quiet) {
    return OutputLevel::QUIET;
  } else if (app.debug) {
    return OutputLevel::DEBUG;
  } else if (app.experiment) {
    return OutputLevel::EXPERIMENT;
  } else if (app.progress) {
    return OutputLevel::PROGRESS;
  }
  return OutputLevel::APPLICATION;
}

void write_outputs(const ApplicationContext &app, const PartitionResult &result) {
  if (!app.result_filename.empty()) {
    io::results::write(app.result_filename, result);
  }
  if (!app.partition_filename.empty()) {
    io::partition::write(app.partition_filename, result.partition);
  }
  if (!app.history_filename.empty()) {
    io::history::write(app.history_filename, result.history);
  }
}

int run(const ApplicationContext &app, const Context &ctx) {
  Logger::set_quiet_mode(app.quiet);

  LOG << "Reading input graph " << str::extract_basename(app.graph_filename) << " ...";
  CSRGraph graph = io::csr_text::read(app.graph_filename);

  if (app.validate) {
    validate_undirected_graph(graph);
  } else if (!debug::validate_graph(graph)) {
    LOG_WARNING << "The input graph is not simple and undirected, results might be meaningless; "
                   "rerun with --validate for details.";
  }

  KLPart partitioner(app.num_threads, ctx);
  partitioner.set_output_level(output_level(app));
  partitioner.set_graph(std::move(graph));

  for (int attempt = 0;; ++attempt) {
    partitioner.reseed(app.seed + attempt);

    try {
      const PartitionResult result = partitioner.compute_partition(app.k, app.margin);
      write_outputs(app, result);

      LOG_SUCCESS << "Found a partition with edge cut " << result.cut << " (seed "
                  << app.seed + attempt << ")";
      return EXIT_SUCCESS;
    } catch (const BalanceViolationError &e) {
      if (attempt + 1 >= app.repetitions) {
        throw;
      }
      LOG_WARNING << e.what() << "; retrying with seed " << app.seed + attempt + 1;
    }
  }
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App cli("KLPart: Kernighan-Lin k-way Graph Partitioner");
  ApplicationContext app;
  Context ctx = create_default_context();
  setup_context(cli, app, ctx);
  CLI11_PARSE(cli, argc, argv);

  if (app.dump_config) {
    CLI::App dump;
    create_all_options(&dump, ctx);
    std::cout << dump.config_to_str(true, true);
    std::exit(1);
  }

  if (app.show_version) {
    print_version();
    std::exit(0);
  }

  if (!app.history_filename.empty()) {
    ctx.refinement.record_swaps = true;
  }

  try {
    return run(app, ctx);
  } catch (const io::TokerException &e) {
    LOG_ERROR << e.what();
  } catch (const StructuralError &e) {
    LOG_ERROR << "Invalid input graph: " << e.what();
  } catch (const ParameterError &e) {
    LOG_ERROR << "Invalid parameters: " << e.what();
  } catch (const BalanceViolationError &e) {
    LOG_ERROR << e.what() << " (after " << app.repetitions << " attempt(s))";
  }

  return EXIT_FAILURE;
}
