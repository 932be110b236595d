#include <lunajudge/common/error_types.hpp>
#include <lunajudge/common/overloaded.hpp>
#include <lunajudge/sandbox/lua_convert.hpp>

#include <fmt/format.h>
#include <lua.hpp>
#include <sol/sol.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lunajudge::sandbox {

namespace {

std::string_view type_name_of(const sol::object& obj) {
    return lua_typename(obj.lua_state(), static_cast<int>(obj.get_type()));
}

Expected<Value, ConversionError> from_lua_impl(const sol::object& obj, std::size_t depth);

Expected<Value, ConversionError> table_from_lua(const sol::table& table, std::size_t depth) {
    if (depth >= MAX_CONVERSION_DEPTH) {
        return ConversionError{fmt::format("table nesting exceeds {} levels (or the table is cyclic)",
                                           MAX_CONVERSION_DEPTH)};
    }

    std::vector<std::pair<sol::object, sol::object>> entries;
    bool all_integer_keys = true;
    bool all_string_keys = true;

    for (const auto& [key, elem] : table) {
        all_integer_keys = all_integer_keys && is_integer(key);
        all_string_keys = all_string_keys && key.get_type() == sol::type::string;
        entries.emplace_back(key, elem);
    }

    if (entries.empty()) {
        return Sequence{};
    }

    if (all_integer_keys) {
        Sequence seq(entries.size());
        for (const auto& [key, elem] : entries) {
            auto idx = key.as<std::int64_t>();

            if (idx < 1 || static_cast<std::size_t>(idx) > entries.size()) {
                return ConversionError{
                    fmt::format("table is not a sequence (key {} is outside 1..{})", idx, entries.size())};
            }

            seq[static_cast<std::size_t>(idx - 1)] = TRY(from_lua_impl(elem, depth + 1));
        }

        return seq;
    }

    if (all_string_keys) {
        Mapping map;

        for (const auto& [key, elem] : entries) {
            map.emplace(key.as<std::string>(), TRY(from_lua_impl(elem, depth + 1)));
        }

        return map;
    }

    return ConversionError{"table mixes sequence and non-string keys"};
}

Expected<Value, ConversionError> from_lua_impl(const sol::object& obj, std::size_t depth) {
    switch (obj.get_type()) {
    case sol::type::none:
    case sol::type::lua_nil:
        return Value{};
    case sol::type::boolean:
        return Value{obj.as<bool>()};
    case sol::type::number:
        if (is_integer(obj)) {
            return Value{obj.as<std::int64_t>()};
        }
        return Value{obj.as<double>()};
    case sol::type::string:
        return Value{obj.as<std::string>()};
    case sol::type::table:
        return table_from_lua(obj.as<sol::table>(), depth);
    default:
        break;
    }

    return ConversionError{fmt::format("cannot convert a {} to a value", type_name_of(obj))};
}

} // namespace

Expected<Value, ConversionError> from_lua(const sol::object& obj) {
    return from_lua_impl(obj, 0);
}

sol::object to_lua(sol::state_view lua, const Value& value) {
    return value.visit(Overloaded{
        [&](const Value::Nil& /*unused*/) { return sol::make_object(lua, sol::lua_nil); },
        [&](bool boolean) { return sol::make_object(lua, boolean); },
        [&](std::int64_t integer) { return sol::make_object(lua, integer); },
        [&](double number) { return sol::make_object(lua, number); },
        [&](const std::string& str) { return sol::make_object(lua, str); },
        [&](const Sequence& seq) {
            sol::table table = lua.create_table(static_cast<int>(seq.size()), 0);
            for (std::size_t i = 0; i < seq.size(); ++i) {
                table[i + 1] = to_lua(lua, seq[i]);
            }
            return sol::object{table};
        },
        [&](const Mapping& map) {
            sol::table table = lua.create_table(0, static_cast<int>(map.size()));
            for (const auto& [key, elem] : map) {
                table[key] = to_lua(lua, elem);
            }
            return sol::object{table};
        },
    });
}

std::string describe(const sol::object& obj) {
    lua_State* lua = obj.lua_state();

    obj.push(lua);
    std::size_t len = 0;
    const char* str = luaL_tolstring(lua, -1, &len);
    std::string res{str, len};

    // the object and its string form
    lua_pop(lua, 2);

    return res;
}

bool is_integer(const sol::object& obj) {
    if (obj.get_type() != sol::type::number) {
        return false;
    }

    lua_State* lua = obj.lua_state();

    obj.push(lua);
    bool res = lua_isinteger(lua, -1) != 0;
    lua_pop(lua, 1);

    return res;
}

bool raw_equal(const sol::reference& lhs, const sol::reference& rhs) {
    lua_State* lua = lhs.lua_state();

    lhs.push(lua);
    rhs.push(lua);
    bool res = lua_rawequal(lua, -1, -2) != 0;
    lua_pop(lua, 2);

    return res;
}

} // namespace lunajudge::sandbox
