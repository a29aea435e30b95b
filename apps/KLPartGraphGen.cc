/*******************************************************************************
 * Generates random G(n, p) graphs in CSR text format.
 *
 * @file:   KLPartGraphGen.cc
 * @author: Daniel Seemaier
 * @date:   03.02.2026
 ******************************************************************************/
#include <cstdlib>

#include <CLI/CLI.hpp>

#include "klpart/klpart.h"

#include "klpart-common/logger.h"

#include "apps/io/csr_text_io.h"
#include "apps/io/file_toker.h"
#include "apps/tools/graph_generator.h"

using namespace klpart;

int main(int argc, char *argv[]) {
  tools::GnpContext ctx;
  std::string out_filename;

  CLI::App app("KLPart graph generator: random G(n, p) graphs in CSR text format");
  app.add_option("-n,--nodes", ctx.n, "Number of vertices.")
      ->check(CLI::PositiveNumber)
      ->required();
  app.add_option("-p,--probability", ctx.p, "Probability of each possible edge.")
      ->check(CLI::Range(0.0, 1.0))
      ->required();
  app.add_option("-s,--seed", ctx.seed, "Seed for random number generation.")
      ->capture_default_str();
  app.add_flag(
         "-c,--connected",
         ctx.connected,
         "Link the connected components of the random graph by additional edges."
  )
      ->capture_default_str();
  app.add_option("-O,--out", out_filename, "Output file for the generated graph.")->required();
  CLI11_PARSE(app, argc, argv);

  try {
    LOG << "Generating G(" << ctx.n << ", " << ctx.p << ") with seed " << ctx.seed << " ...";
    const CSRGraph graph = tools::generate_gnp(ctx);

    LOG << "Writing graph with " << graph.n() << " vertices and " << graph.m() / 2
        << " edges to " << out_filename << " ...";
    io::csr_text::write(out_filename, graph);
  } catch (const ParameterError &e) {
    LOG_ERROR << e.what();
    return EXIT_FAILURE;
  } catch (const io::TokerException &e) {
    LOG_ERROR << e.what();
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
