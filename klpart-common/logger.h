/*******************************************************************************
 * Helper class for console logging.
 *
 * @file:   logger.h
 * @author: Daniel Seemaier
 * @date:   21.09.2021
 ******************************************************************************/
#pragma once

#include <atomic>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <memory>
#include <sstream>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <tbb/spin_mutex.h>

// Debug output
//
// Each translation unit that uses these macros declares SET_DEBUG(true|false).
// DBG behaves like LOG, DBGC(cond) only prints if cond holds.
#define FILENAME (std::strrchr(__FILE__, '/') ? std::strrchr(__FILE__, '/') + 1 : __FILE__)
#define POSITION FILENAME << ":" << __LINE__ << "(" << __func__ << ")"

#define SET_DEBUG(value) [[maybe_unused]] static constexpr bool kDebug = value
#define DBGC(cond)                                                                                 \
  (kDebug && (cond)) && klpart::DebugLogger(std::cout)                                             \
                            << klpart::logger::MAGENTA << POSITION << " "                          \
                            << klpart::logger::DEFAULT_TEXT
#define DBG DBGC(true)

// Console output
//
// LOG prints one line to stdout, LLOG prints without the trailing newline.
// LOG_SUCCESS prefixes the line and colors it green; LOG_WARNING and LOG_ERROR
// go to stderr, colored orange and red. Quiet mode silences all of them.
#define LOG (klpart::Logger())
#define LLOG (klpart::Logger(std::cout, ""))

#define LOG_SUCCESS (klpart::Logger(std::cout) << klpart::logger::GREEN << "[Success] ")
#define LOG_WARNING (klpart::Logger(std::cerr) << klpart::logger::ORANGE << "[Warning] ")
#define LOG_ERROR (klpart::Logger(std::cerr) << klpart::logger::RED << "[Error] ")

// LOG << V(a) << V(b) prints "a=<a> b=<b> "
#define V(x) std::string(#x "=") << (x) << " "

namespace klpart {
namespace logger {
template <typename T, typename = void> struct is_iterable : std::false_type {};

template <typename T>
struct is_iterable<
    T,
    std::void_t<decltype(std::begin(std::declval<T>())), decltype(std::end(std::declval<T>()))>>
    : std::true_type {};

template <typename T>
constexpr bool is_container_v = !std::is_same_v<std::decay_t<T>, std::string> &&      //
                                !std::is_same_v<std::decay_t<T>, std::string_view> && //
                                !std::is_same_v<std::decay_t<T>, char *> &&           //
                                !std::is_same_v<std::decay_t<T>, const char *> &&     //
                                is_iterable<T>::value;

class ContainerFormatter {
public:
  virtual ~ContainerFormatter() = default;
  virtual void print(const std::vector<std::string> &container, std::ostream &out) const = 0;
};

class CompactContainerFormatter : public ContainerFormatter {
public:
  constexpr explicit CompactContainerFormatter(std::string_view sep) noexcept : _sep{sep} {}
  void print(const std::vector<std::string> &container, std::ostream &out) const final;

private:
  std::string_view _sep;
};

class TextFormatter {
public:
  virtual ~TextFormatter() = default;
  virtual void print(const std::string &text, std::ostream &out) const = 0;
};

class DefaultTextFormatter final : public TextFormatter {
public:
  void print(const std::string &text, std::ostream &out) const final;
};

class Colorized : public TextFormatter {
public:
  enum class Color {
    RED,
    GREEN,
    MAGENTA,
    ORANGE,
    RESET
  };

  constexpr explicit Colorized(Color color) noexcept : _color{color} {}
  void print(const std::string &text, std::ostream &out) const final;

private:
  Color _color;
};

template <typename T>
constexpr bool is_text_formatter_v = std::is_base_of_v<TextFormatter, std::decay_t<T>>;

template <typename T>
constexpr bool is_container_formatter_v = std::is_base_of_v<ContainerFormatter, std::decay_t<T>>;

template <typename T>
constexpr bool is_default_log_arg_v =
    !is_container_v<T> && !is_text_formatter_v<T> && !is_container_formatter_v<T>;

extern DefaultTextFormatter DEFAULT_TEXT;
extern Colorized RED;
extern Colorized GREEN;
extern Colorized MAGENTA;
extern Colorized ORANGE;
extern Colorized RESET;
extern CompactContainerFormatter DEFAULT_CONTAINER;
} // namespace logger

class Logger {
public:
  Logger();
  explicit Logger(std::ostream &out, std::string append = "\n");

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;
  Logger(Logger &&) noexcept = default;
  Logger &operator=(Logger &&) = delete;
  virtual ~Logger() {
    flush();
  };

  template <typename Arg, std::enable_if_t<logger::is_default_log_arg_v<Arg>, bool> = true>
  Logger &operator<<(Arg &&arg) {
    std::stringstream ss;
    ss << arg;
    _text_formatter->print(ss.str(), _buffer);
    return *this;
  }

  template <
      typename Formatter,
      std::enable_if_t<logger::is_text_formatter_v<Formatter>, bool> = true>
  Logger &operator<<(Formatter &&formatter) {
    _text_formatter = std::make_unique<std::decay_t<Formatter>>(formatter);
    return *this;
  }

  template <
      typename Formatter,
      std::enable_if_t<logger::is_container_formatter_v<Formatter>, bool> = true>
  Logger &operator<<(Formatter &&formatter) {
    _container_formatter = std::make_unique<std::decay_t<Formatter>>(formatter);
    return *this;
  }

  template <typename T, std::enable_if_t<logger::is_container_v<T>, bool> = true>
  Logger &operator<<(T &&container) {
    std::vector<std::string> str;
    for (const auto &element : container) {
      std::stringstream ss;
      ss << element;
      str.push_back(ss.str());
    }
    _container_formatter->print(str, _buffer);
    return *this;
  }

  void flush();

  static void set_quiet_mode(bool quiet);

private:
  static std::atomic<std::uint8_t> _quiet;

  static tbb::spin_mutex &flush_mutex();

  std::unique_ptr<logger::TextFormatter> _text_formatter{
      std::make_unique<logger::DefaultTextFormatter>(logger::DEFAULT_TEXT)
  };
  std::unique_ptr<logger::ContainerFormatter> _container_formatter{
      std::make_unique<logger::CompactContainerFormatter>(logger::DEFAULT_CONTAINER)
  };

  std::ostringstream _buffer;
  std::ostream &_out;
  std::string _append;
  bool _flushed{false};
};

// Backs DBG: evaluates to false so that disabled debug output short-circuits
class DebugLogger {
public:
  explicit DebugLogger(std::ostream &out) : _logger(out) {}

  ~DebugLogger() {
    _logger << logger::RESET;
    _logger.flush();
  }

  template <typename Arg> DebugLogger &operator<<(Arg &&arg) {
    _logger << std::forward<Arg>(arg);
    return *this;
  }

  operator bool() { // NOLINT
    return false;
  }

private:
  Logger _logger;
};
} // namespace klpart
