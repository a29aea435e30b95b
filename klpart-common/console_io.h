/*******************************************************************************
 * Helper functions for console IO.
 *
 * @file:   console_io.h
 * @author: Daniel Seemaier
 * @date:   21.09.2021
 ******************************************************************************/
#pragma once

#include <string>

#include "klpart-common/logger.h"

namespace klpart::cio {

void print_delimiter(const std::string &caption = "", char ch = '#');
void print_klpart_banner();
void print_build_identifier();

template <typename NodeID, typename EdgeID, typename BlockID, typename EdgeWeight>
void print_build_datatypes() {
  LOG << "Types:                        NID: " << sizeof(NodeID) << ", EID: " << sizeof(EdgeID)
      << ", BID: " << sizeof(BlockID) << ", EW: " << sizeof(EdgeWeight);
}

} // namespace klpart::cio
