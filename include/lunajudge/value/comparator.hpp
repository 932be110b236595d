#pragma once

#include <lunajudge/value/value.hpp>

namespace lunajudge {

/// Absolute tolerance for float-vs-float comparison. Test fixtures hold small integers and floats,
/// so a relative tolerance is not used
inline constexpr double FLOAT_TOLERANCE = 1e-9;

/// Whether a returned value matches the expected one, recursively:
///   1. two floats are equal if they differ by less than FLOAT_TOLERANCE
///   2. two sequences are equal if they have the same length and all elements are equivalent, in order
///   3. two mappings are equal if they have the same keys and all values are equivalent
///   4. anything else uses Lua's own equality (see ``native_equal``)
bool equivalent(const Value& actual, const Value& expected);

/// Lua's ``==`` on plain data: numbers compare mathematically across integer / float subtypes,
/// values of different kinds never compare equal. Tables are compared structurally, since
/// values that crossed a process boundary have no identity
bool native_equal(const Value& lhs, const Value& rhs);

} // namespace lunajudge
