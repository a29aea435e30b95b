/*******************************************************************************
 * Like `static_cast()`, but asserts that no (un)signed overflow occurs.
 *
 * @file:   asserting_cast.h
 * @author: Daniel Seemaier
 * @date:   08.08.2022
 ******************************************************************************/
#pragma once

#include <type_traits>
#include <typeinfo>
#include <utility>

#include "klpart-common/assert.h"

namespace klpart {
template <typename To, typename From> constexpr bool in_range(const From value) noexcept {
  static_assert(std::is_integral_v<From>);
  static_assert(std::is_integral_v<To>);
  return std::in_range<To>(value);
}

template <int assertion_level, typename To, typename From> To asserting_cast(const From value) {
  KASSERT(
      in_range<To>(value),
      value << " of type " << typeid(From).name() << " not in range of type " << typeid(To).name(),
      assertion_level
  );
  return static_cast<To>(value);
}
} // namespace klpart
