/*******************************************************************************
 * Sequential timestamp marker data structure of static size. Markers can be
 * reset in amortized constant time.
 *
 * @file:   marker.h
 * @author: Daniel Seemaier
 * @date:   21.09.2021
 ******************************************************************************/
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

#include "klpart-common/assert.h"

namespace klpart {
template <typename Value = std::uint32_t> class Marker {
public:
  Marker() = default;

  explicit Marker(const std::size_t capacity) : _data(capacity, 0) {}

  Marker(const Marker &) = delete;
  Marker &operator=(const Marker &) = delete;

  Marker(Marker &&) noexcept = default;
  Marker &operator=(Marker &&) noexcept = default;

  void set(const std::size_t element) {
    KASSERT(element < _data.size(), "element out of range", assert::light);
    _data[element] = _timestamp;
  }

  void unset(const std::size_t element) {
    KASSERT(element < _data.size(), "element out of range", assert::light);
    _data[element] = 0;
  }

  [[nodiscard]] bool get(const std::size_t element) const {
    KASSERT(element < _data.size(), "element out of range", assert::light);
    return _data[element] == _timestamp;
  }

  [[nodiscard]] std::size_t size() const {
    return _data.size();
  }

  // Unmarks all elements by advancing the timestamp; only touches the data
  // when the timestamp overflows
  void reset() {
    if (_timestamp == std::numeric_limits<Value>::max()) {
      std::fill(_data.begin(), _data.end(), 0);
      _timestamp = 0;
    }
    ++_timestamp;
  }

  void resize(const std::size_t capacity) {
    _data.resize(capacity, 0);
  }

private:
  std::vector<Value> _data;
  Value _timestamp = 1;
};
} // namespace klpart
