/*******************************************************************************
 * Command line arguments for the Kernighan-Lin partitioner.
 *
 * @file:   klpart_arguments.h
 * @author: Daniel Seemaier
 * @date:   03.02.2026
 ******************************************************************************/
#pragma once

#include <CLI/CLI.hpp>

#include "klpart/klpart.h"

namespace klpart {
void create_all_options(CLI::App *app, Context &ctx);

CLI::Option_group *create_partitioning_options(CLI::App *app, Context &ctx);

CLI::Option_group *create_initial_partitioning_options(CLI::App *app, Context &ctx);

CLI::Option_group *create_refinement_options(CLI::App *app, Context &ctx);
} // namespace klpart
