/*******************************************************************************
 * Prints a detailed version message including the build configuration.
 *
 * @file:   version.h
 * @author: Daniel Seemaier
 * @date:   18.09.2024
 ******************************************************************************/
#pragma once

namespace klpart {

void print_version();

} // namespace klpart
