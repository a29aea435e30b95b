/*******************************************************************************
 * Utility functions for common string operations.
 *
 * @file:   strutils.cc
 * @author: Daniel Seemaier
 * @date:   21.09.2021
 ******************************************************************************/
#include "klpart-common/strutils.h"

#include <algorithm>
#include <cctype>

namespace klpart::str {
std::string extract_basename(const std::string &path, const bool keep_extension) {
  const std::size_t slash = path.find_last_of('/');
  const std::string name = path.substr(slash == std::string::npos ? 0 : slash + 1);
  return keep_extension ? name : name.substr(0, name.find_last_of('.'));
}

std::string to_lower(std::string arg) {
  std::transform(arg.begin(), arg.end(), arg.begin(), [](const unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return arg;
}
} // namespace klpart::str
