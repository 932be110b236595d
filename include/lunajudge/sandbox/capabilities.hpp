/// \file
/// The allow-list from which every sandbox scope is built. A binding that is not named
/// here does not exist inside the sandbox.
#pragma once

#include <array>
#include <span>
#include <string_view>
#include <type_traits>

namespace lunajudge::sandbox {

/// A standard library that is exposed with only the listed members
struct LibraryGrant
{
    std::string_view name;
    std::span<const std::string_view> members;
};

/// A global that refers to a member of a granted library, e.g. ``unpack`` -> ``table.unpack``
struct AliasGrant
{
    std::string_view name;
    std::string_view library;
    std::string_view member;
};

/// An exception type constructed by the host. An empty base marks the root type
struct ExceptionGrant
{
    std::string_view name;
    std::string_view base;
};

struct CapabilityTable
{
    std::span<const std::string_view> base_functions;
    std::span<const LibraryGrant> libraries;
    std::span<const AliasGrant> aliases;
    std::span<const std::string_view> host_builtins;

    /// Ordered so that every base precedes the types derived from it
    std::span<const ExceptionGrant> exception_types;

    /// Whether ``name`` is bound at the top level of a sandbox scope
    constexpr bool allows(std::string_view name) const;
};

namespace detail {

inline constexpr std::array<std::string_view, 16> BASE_FUNCTIONS{
    "assert",   "error",    "pcall", "xpcall",   "ipairs", "pairs",  "next",   "select",
    "tonumber", "tostring", "type",  "rawequal", "rawget", "rawlen", "rawset", "setmetatable",
};

// math.random and math.randomseed are left out so that runs are reproducible
inline constexpr std::array<std::string_view, 25> MATH_MEMBERS{
    "abs",  "acos", "asin", "atan", "ceil",       "cos", "deg",        "exp",  "floor",
    "fmod", "huge", "log",  "max",  "maxinteger", "min", "mininteger", "modf", "pi",
    "rad",  "sin",  "sqrt", "tan",  "tointeger",  "type", "ult",
};

// string.dump is left out; it is the only way to obtain bytecode
inline constexpr std::array<std::string_view, 16> STRING_MEMBERS{
    "byte",  "char", "find",     "format", "gmatch",  "gsub", "len",    "lower",
    "match", "pack", "packsize", "rep",    "reverse", "sub",  "unpack", "upper",
};

inline constexpr std::array<std::string_view, 7> TABLE_MEMBERS{
    "concat", "insert", "move", "pack", "remove", "sort", "unpack",
};

inline constexpr std::array<std::string_view, 6> UTF8_MEMBERS{
    "char", "charpattern", "codepoint", "codes", "len", "offset",
};

inline constexpr std::array<LibraryGrant, 4> LIBRARIES{{
    {.name = "math", .members = MATH_MEMBERS},
    {.name = "string", .members = STRING_MEMBERS},
    {.name = "table", .members = TABLE_MEMBERS},
    {.name = "utf8", .members = UTF8_MEMBERS},
}};

inline constexpr std::array<AliasGrant, 1> ALIASES{{
    {.name = "unpack", .library = "table", .member = "unpack"},
}};

inline constexpr std::array<std::string_view, 2> HOST_BUILTINS{"isinstance", "hasattr"};

inline constexpr std::array<ExceptionGrant, 9> EXCEPTION_TYPES{{
    {.name = "Exception", .base = ""},
    {.name = "ValueError", .base = "Exception"},
    {.name = "TypeError", .base = "Exception"},
    {.name = "KeyError", .base = "Exception"},
    {.name = "IndexError", .base = "Exception"},
    {.name = "AttributeError", .base = "Exception"},
    {.name = "ZeroDivisionError", .base = "Exception"},
    {.name = "StopIteration", .base = "Exception"},
    {.name = "RuntimeError", .base = "Exception"},
}};

} // namespace detail

inline constexpr CapabilityTable CAPABILITIES{
    .base_functions = detail::BASE_FUNCTIONS,
    .libraries = detail::LIBRARIES,
    .aliases = detail::ALIASES,
    .host_builtins = detail::HOST_BUILTINS,
    .exception_types = detail::EXCEPTION_TYPES,
};

constexpr bool CapabilityTable::allows(std::string_view name) const {
    auto matches = [name](const auto& entry) {
        if constexpr (std::is_same_v<std::decay_t<decltype(entry)>, std::string_view>) {
            return entry == name;
        } else {
            return entry.name == name;
        }
    };

    auto any_of = [&matches](const auto& range) {
        for (const auto& entry : range) {
            if (matches(entry)) {
                return true;
            }
        }
        return false;
    };

    return any_of(base_functions) || any_of(libraries) || any_of(aliases) || any_of(host_builtins) ||
           any_of(exception_types);
}

static_assert(CAPABILITIES.allows("pcall") && CAPABILITIES.allows("string") && CAPABILITIES.allows("unpack"));
static_assert(!CAPABILITIES.allows("io") && !CAPABILITIES.allows("os") && !CAPABILITIES.allows("require") &&
              !CAPABILITIES.allows("load") && !CAPABILITIES.allows("getmetatable") &&
              !CAPABILITIES.allows("collectgarbage"));

} // namespace lunajudge::sandbox
