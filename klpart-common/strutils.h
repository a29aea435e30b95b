/*******************************************************************************
 * Utility functions for common string operations.
 *
 * @file:   strutils.h
 * @author: Daniel Seemaier
 * @date:   21.09.2021
 ******************************************************************************/
#pragma once

#include <sstream>
#include <string>

namespace klpart::str {
std::string extract_basename(const std::string &path, bool keep_extension = false);
std::string to_lower(std::string arg);

template <typename Elements>
std::string implode(const Elements &elements, const std::string &separator) {
  std::stringstream ss;
  bool first = true;
  for (const auto &element : elements) {
    if (!first) {
      ss << separator;
    }
    ss << element;
    first = false;
  }
  return ss.str();
}
} // namespace klpart::str
