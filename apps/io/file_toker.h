/*******************************************************************************
 * Tokener that transforms a text file into tokens.
 *
 * @file:   file_toker.h
 * @author: Daniel Seemaier
 * @date:   26.10.2022
 ******************************************************************************/
#pragma once

#include <cctype>
#include <cstdint>
#include <exception>
#include <limits>
#include <string>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace klpart::io {

class TokerException : public std::exception {
public:
  TokerException(std::string msg) : _msg(std::move(msg)) {}

  [[nodiscard]] const char *what() const noexcept override {
    return _msg.c_str();
  }

private:
  std::string _msg;
};

/*!
 * Thrown if the contents of an input file do not match the expected format.
 */
class ParserException : public TokerException {
public:
  ParserException(const std::size_t line, const std::string &msg)
      : TokerException("line " + std::to_string(line) + ": " + msg),
        _line(line) {}

  [[nodiscard]] std::size_t line() const {
    return _line;
  }

private:
  std::size_t _line;
};

class MappedFileToker {
public:
  explicit MappedFileToker(const std::string &filename) {
    _fd = open(filename.c_str(), O_RDONLY);
    if (_fd == -1) {
      throw TokerException("Cannot open input file " + filename);
    }

    struct stat file_info{};
    if (fstat(_fd, &file_info) == -1) {
      close(_fd);
      throw TokerException("Cannot get input file status");
    }

    _position = 0;
    _length = static_cast<std::size_t>(file_info.st_size);

    // mmap() rejects zero-length mappings
    if (_length == 0) {
      _contents = nullptr;
      return;
    }

    _contents = static_cast<char *>(mmap(nullptr, _length, PROT_READ, MAP_PRIVATE, _fd, 0));
    if (_contents == MAP_FAILED) {
      close(_fd);
      throw TokerException("Cannot map input file into memory");
    }
  }

  MappedFileToker(const MappedFileToker &) = delete;
  MappedFileToker &operator=(const MappedFileToker &) = delete;

  ~MappedFileToker() {
    if (_contents != nullptr) {
      munmap(_contents, _length);
    }
    close(_fd);
  }

  // Skips blanks, but never the end of a line
  inline void skip_spaces() {
    while (valid_position() && (current() == ' ' || current() == '\t' || current() == '\r')) {
      advance();
    }
  }

  inline std::uint64_t scan_uint() {
    if (!valid_position() || !std::isdigit(static_cast<unsigned char>(current()))) {
      throw_unexpected("an unsigned integer");
    }

    std::uint64_t number = 0;
    while (valid_position() && std::isdigit(static_cast<unsigned char>(current()))) {
      const int digit = current() - '0';
      if (number > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
        throw ParserException(_line, "integer is too large");
      }

      number = number * 10 + digit;
      advance();
    }

    skip_spaces();
    return number;
  }

  inline void consume_char(const char ch) {
    if (!valid_position() || current() != ch) {
      throw_unexpected(std::string("'") + ch + "'");
    }

    advance();
  }

  // Consumes the end of the current line; the end of the file counts as well
  inline void consume_line_end() {
    skip_spaces();
    if (valid_position()) {
      consume_char('\n');
    }
  }

  [[nodiscard]] inline bool at_line_end() const {
    return !valid_position() || current() == '\n';
  }

  [[nodiscard]] inline bool valid_position() const {
    return _position < _length;
  }

  [[nodiscard]] inline char current() const {
    return _contents[_position];
  }

  inline void advance() {
    if (_contents[_position] == '\n') {
      ++_line;
    }
    ++_position;
  }

  [[nodiscard]] inline std::size_t line() const {
    return _line;
  }

  [[noreturn]] void throw_unexpected(const std::string &expected) const {
    if (!valid_position()) {
      throw ParserException(_line, "unexpected end of file, expected " + expected);
    } else if (current() == '\n') {
      throw ParserException(_line, "unexpected end of line, expected " + expected);
    }
    throw ParserException(
        _line, std::string("unexpected symbol '") + current() + "', expected " + expected
    );
  }

private:
  int _fd;
  std::size_t _position;
  std::size_t _length;
  std::size_t _line = 1;
  char *_contents;
};

} // namespace klpart::io
