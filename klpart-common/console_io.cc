/*******************************************************************************
 * Helper functions for console IO.
 *
 * @file:   console_io.cc
 * @author: Daniel Seemaier
 * @date:   21.09.2021
 ******************************************************************************/
#include "klpart-common/console_io.h"

#include <array>
#include <string_view>

#include "klpart-common/assert.h"
#include "klpart-common/logger.h"

namespace klpart::cio {
namespace {
constexpr std::size_t kLineWidth = 80;

void print_banner_line(const std::string_view text, const std::string_view tag = "") {
  const std::size_t left = 16;
  const std::size_t used = 1 + left + text.size() + tag.size() + 1;
  const std::size_t right = used < kLineWidth ? kLineWidth - used : 0;
  LOG << "#" << std::string(left, ' ') << text << std::string(right, ' ') << tag << "#";
}
} // namespace

void print_delimiter(const std::string &caption, const char ch) {
  if (caption.empty()) {
    LOG << std::string(kLineWidth, ch);
  } else {
    LOG << std::string(kLineWidth - caption.size() - 5, ch) << " " << caption << " "
        << std::string(3, ch);
  }
}

void print_klpart_banner() {
  constexpr std::array<std::string_view, 5> kLines = {
      R"( _  __ _      ____              _   )",
      R"(| |/ /| |    |  _ \  __ _  _ __ | |_ )",
      R"(| ' / | |    | |_) |/ _` || '__|| __|)",
      R"(| . \ | |___ |  __/| (_| || |   | |_ )",
      R"(|_|\_\|_____||_|    \__,_||_|    \__|)",
  };

  print_delimiter();
  for (std::size_t i = 0; i < kLines.size(); ++i) {
#if KASSERT_ENABLED(ASSERTION_LEVEL_NORMAL)
    print_banner_line(kLines[i], i == 0 ? "#ASSERTIONS" : "");
#else
    print_banner_line(kLines[i]);
#endif
  }
  print_banner_line("");
  print_delimiter();
}

void print_build_identifier() {
  std::string assertion_level_name = "always";
  if (KASSERT_ASSERTION_LEVEL >= ASSERTION_LEVEL_LIGHT) {
    assertion_level_name += "+light";
  }
  if (KASSERT_ASSERTION_LEVEL >= ASSERTION_LEVEL_NORMAL) {
    assertion_level_name += "+normal";
  }
  if (KASSERT_ASSERTION_LEVEL >= ASSERTION_LEVEL_HEAVY) {
    assertion_level_name += "+heavy";
  }
  LOG << "Assertion level:              " << assertion_level_name;
#ifdef KLPART_KASSERT_FOUND
  LOG << "Assertion library:            kassert";
#else
  LOG << "Assertion library:            <cassert>";
#endif
}
} // namespace klpart::cio
