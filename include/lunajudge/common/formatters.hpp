#pragma once

#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/preprocessor/variadic/to_seq.hpp>
#include <fmt/format.h>

#include <cstring>
#include <optional>
#include <string_view>
#include <system_error>

namespace lunajudge {

/// Base for formatters that accept an optional '?' (debug) spec
struct DebugFormatter
{
    bool is_debug_format = false;

    constexpr auto parse(fmt::format_parse_context& ctx) {
        const auto* it = ctx.begin();
        const auto* end = ctx.end();

        if (it != end && *it == '?') {
            is_debug_format = true;
            ++it;
        }

        return it;
    }
};

} // namespace lunajudge

/// Output formatter for make_error_code
template <>
struct fmt::formatter<std::error_code> : ::lunajudge::DebugFormatter
{
    template <typename FormatContext>
    auto format(const std::error_code& from, FormatContext& ctx) const {
        const char* name = strerrorname_np(from.value());
        return fmt::format_to(ctx.out(), "{} : {}", name != nullptr ? name : "<unknown>", from.message());
    }
};

template <typename T>
struct fmt::formatter<std::optional<T>> : ::lunajudge::DebugFormatter
{
    template <typename FormatContext>
    auto format(const std::optional<T>& from, FormatContext& ctx) const {
        if (!from) {
            return fmt::format_to(ctx.out(), "nullopt");
        }

        if (is_debug_format) {
            return fmt::format_to(ctx.out(), "Optional({})", from.value());
        }

        return fmt::format_to(ctx.out(), "{}", from.value());
    }
};

#define LUNAJUDGE_FORMAT_ENUM_CASE_IMPL(r, enum_name, ident)                                                           \
    case enum_name::ident:                                                                                             \
        return BOOST_PP_STRINGIZE(ident);

/// Defines a fmt::formatter for `enum_name` that prints the enumerator's identifier.
/// With the '?' spec, the enum's name is included, e.g. `ErrorKind{TimedOut}`
#define LUNAJUDGE_FORMAT_ENUM(enum_name, ... /*enumerators*/)                                                          \
    template <>                                                                                                        \
    struct fmt::formatter<enum_name> : ::lunajudge::DebugFormatter                                                     \
    {                                                                                                                  \
        static constexpr std::string_view to_string(enum_name from) {                                                  \
            switch (from) {                                                                                            \
                BOOST_PP_SEQ_FOR_EACH(LUNAJUDGE_FORMAT_ENUM_CASE_IMPL, enum_name, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__)) \
            }                                                                                                          \
            return "<unknown>";                                                                                        \
        }                                                                                                              \
                                                                                                                       \
        template <typename FormatContext>                                                                              \
        auto format(enum_name from, FormatContext& ctx) const {                                                        \
            if (is_debug_format) {                                                                                     \
                return fmt::format_to(ctx.out(), "{}{{{}}}", #enum_name, to_string(from));                             \
            }                                                                                                          \
            return fmt::format_to(ctx.out(), "{}", to_string(from));                                                   \
        }                                                                                                              \
    }
