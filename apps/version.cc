/*******************************************************************************
 * Prints a detailed version message including the build configuration.
 *
 * @file:   version.cc
 * @author: Daniel Seemaier
 * @date:   18.09.2024
 ******************************************************************************/
#include "apps/version.h"

#include <iostream>

#include <klpart-common/assert.h>
#include <klpart/klpart.h>
#include <tbb/version.h>

namespace klpart {

void print_version() {
  std::cout << "KLPart v" << KLPART_VERSION_MAJOR << "." << KLPART_VERSION_MINOR << "."
            << KLPART_VERSION_PATCH << "\n";
  std::cout << "Build configuration:\n";
  std::cout << "  Data types:\n";
#ifdef KLPART_64BIT_NODE_IDS
  std::cout << "    64-bit node IDs: enabled\n";
#else
  std::cout << "    64-bit node IDs: disabled\n";
#endif
#ifdef KLPART_64BIT_EDGE_IDS
  std::cout << "    64-bit edge IDs: enabled\n";
#else
  std::cout << "    64-bit edge IDs: disabled\n";
#endif
#ifdef KLPART_64BIT_WEIGHTS
  std::cout << "    64-bit weights: enabled\n";
#else
  std::cout << "    64-bit weights: disabled\n";
#endif
  std::cout << "  Dependencies:\n";
#ifdef KLPART_KASSERT_FOUND
  std::cout << "    kassert: found and enabled\n";
#else
  std::cout << "    kassert: not found or disabled\n";
#endif
  std::cout << "    TBB: " << TBB_VERSION_STRING << "\n";
  std::cout << "  Assertion levels: always";
#if KASSERT_ENABLED(ASSERTION_LEVEL_LIGHT)
  std::cout << "+light";
#endif
#if KASSERT_ENABLED(ASSERTION_LEVEL_NORMAL)
  std::cout << "+normal";
#endif
#if KASSERT_ENABLED(ASSERTION_LEVEL_HEAVY)
  std::cout << "+heavy";
#endif
  std::cout << "\n";
  std::cout << std::flush;
}

} // namespace klpart
