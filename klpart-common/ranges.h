/*******************************************************************************
 * Integer ranges for range-based for loops, e.g., over all nodes of a graph.
 *
 * @file:   ranges.h
 * @author: Daniel Seemaier
 * @date:   21.09.2021
 ******************************************************************************/
#pragma once

#include <iterator>
#include <type_traits>

namespace klpart {
template <typename Int> class IotaRange {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Int;
    using difference_type = std::make_signed_t<Int>;
    using pointer = Int *;
    using reference = Int &;

    explicit iterator(const Int value) : _value(value) {}

    Int operator*() const {
      return _value;
    }

    iterator &operator++() {
      ++_value;
      return *this;
    }

    iterator operator++(int) {
      auto tmp = *this;
      ++*this;
      return tmp;
    }

    bool operator==(const iterator &other) const {
      return _value == other._value;
    }
    bool operator!=(const iterator &other) const {
      return _value != other._value;
    }

  private:
    Int _value;
  };

  IotaRange(const Int begin, const Int end) : _begin(begin), _end(end) {}

  [[nodiscard]] iterator begin() const {
    return _begin;
  }
  [[nodiscard]] iterator end() const {
    return _end;
  }

  [[nodiscard]] Int size() const {
    return *_end - *_begin;
  }

private:
  iterator _begin;
  iterator _end;
};
} // namespace klpart
