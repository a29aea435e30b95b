/*******************************************************************************
 * IO functions for the context structs.
 *
 * @file:   context_io.h
 * @author: Daniel Seemaier
 * @date:   13.03.2023
 ******************************************************************************/
#pragma once

#include <iostream>
#include <string>
#include <unordered_map>

#include "klpart/klpart.h"

namespace klpart {
std::ostream &operator<<(std::ostream &out, InitialPartitioningAlgorithm algorithm);

std::unordered_map<std::string, InitialPartitioningAlgorithm> get_initial_partitioning_algorithms();

std::ostream &operator<<(std::ostream &out, OutputLevel level);

std::unordered_map<std::string, OutputLevel> get_output_levels();

void print(const Context &ctx, std::ostream &out);
void print(const PartitionContext &p_ctx, std::ostream &out);
void print(const InitialPartitioningContext &i_ctx, std::ostream &out);
void print(const RefinementContext &r_ctx, std::ostream &out);
} // namespace klpart
