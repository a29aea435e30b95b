/*******************************************************************************
 * Assertion levels to be used with KASSERT().
 *
 * @file:   assert.h
 * @author: Daniel Seemaier
 * @date:   14.06.2022
 ******************************************************************************/
#pragma once

#ifdef KLPART_KASSERT_FOUND

#include <kassert/kassert.hpp> // IWYU pragma: export

#else

// Without the kassert library, KASSERT() degrades to assert(): the assertion
// level and the message are dropped
#include <cassert>
#define KASSERT(x, ...) assert((x))
#define KASSERT_ENABLED(x) 0
#define KASSERT_ASSERTION_LEVEL 0

#endif

namespace klpart::assert {

#define ASSERTION_LEVEL_ALWAYS 0
constexpr int always = ASSERTION_LEVEL_ALWAYS;

// O(1) checks, e.g., argument ranges
#define ASSERTION_LEVEL_LIGHT 10
constexpr int light = ASSERTION_LEVEL_LIGHT;

// Checks that are linear in the size of their local scope
#define ASSERTION_LEVEL_NORMAL 30
constexpr int normal = ASSERTION_LEVEL_NORMAL;

// Checks that recompute global quantities, e.g., the edge cut after every swap
#define ASSERTION_LEVEL_HEAVY 40
constexpr int heavy = ASSERTION_LEVEL_HEAVY;

} // namespace klpart::assert
