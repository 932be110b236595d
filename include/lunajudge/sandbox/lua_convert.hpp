/// \file
/// Conversions between Lua objects and the host Value model
#pragma once

#include <lunajudge/common/expected.hpp>
#include <lunajudge/value/value.hpp>

#include <sol/sol.hpp>

#include <cstddef>
#include <string>

namespace lunajudge::sandbox {

/// Maximum table nesting accepted by ``from_lua``. Cyclic tables are caught by this limit
inline constexpr std::size_t MAX_CONVERSION_DEPTH = 200;

struct ConversionError
{
    std::string message;
};

/// Convert a Lua object into a Value.
///
/// Integers and floats keep their Lua 5.4 subtype. A table with keys exactly 1..n (or no keys)
/// becomes a Sequence, a table with only string keys becomes a Mapping. Any other table,
/// and any function, userdata or thread, is a ConversionError.
Expected<Value, ConversionError> from_lua(const sol::object& obj);

/// Convert a Value into a Lua object owned by ``lua``
sol::object to_lua(sol::state_view lua, const Value& value);

/// The result of Lua's ``tostring`` for ``obj``, honoring ``__tostring``
std::string describe(const sol::object& obj);

/// Whether ``obj`` is a number with the integer subtype
bool is_integer(const sol::object& obj);

/// Primitive (metamethod-free) equality of two Lua references
bool raw_equal(const sol::reference& lhs, const sol::reference& rhs);

} // namespace lunajudge::sandbox
