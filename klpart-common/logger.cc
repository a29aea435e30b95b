/*******************************************************************************
 * Helper class for console logging.
 *
 * @file:   logger.cc
 * @author: Daniel Seemaier
 * @date:   21.09.2021
 ******************************************************************************/
#include "klpart-common/logger.h"

namespace klpart {
namespace logger {
void CompactContainerFormatter::print(const std::vector<std::string> &container, std::ostream &out)
    const {
  bool first{true};
  for (const auto &element : container) {
    if (!first) {
      out << _sep;
    }
    out << element;
    first = false;
  }
}

void DefaultTextFormatter::print(const std::string &text, std::ostream &out) const {
  out << text;
}

void Colorized::print(const std::string &text, std::ostream &out) const {
  switch (_color) {
  case Color::RED:
    out << "\u001b[31m";
    break;
  case Color::GREEN:
    out << "\u001b[32m";
    break;
  case Color::ORANGE:
    out << "\u001b[33m";
    break;
  case Color::MAGENTA:
    out << "\u001b[35m";
    break;
  case Color::RESET:
    break;
  }
  out << text << "\u001b[0m";
}

using namespace std::literals::string_view_literals;
DefaultTextFormatter DEFAULT_TEXT{};
Colorized RED{Colorized::Color::RED};
Colorized GREEN{Colorized::Color::GREEN};
Colorized MAGENTA{Colorized::Color::MAGENTA};
Colorized ORANGE{Colorized::Color::ORANGE};
Colorized RESET{Colorized::Color::RESET};
CompactContainerFormatter DEFAULT_CONTAINER{", "sv};
} // namespace logger

std::atomic<std::uint8_t> Logger::_quiet = 0;

Logger::Logger() : Logger(std::cout) {}

Logger::Logger(std::ostream &out, std::string append)
    : _buffer(),
      _out(out),
      _append(std::move(append)) {}

void Logger::flush() {
  if (_quiet || _flushed) {
    return;
  }

  {
    tbb::spin_mutex::scoped_lock lock(flush_mutex());
    _out << _buffer.str() << _append << std::flush;
  }
  _flushed = true;
}

tbb::spin_mutex &Logger::flush_mutex() {
  static tbb::spin_mutex mutex;
  return mutex;
}

void Logger::set_quiet_mode(const bool quiet) {
  _quiet = quiet;
}
} // namespace klpart
