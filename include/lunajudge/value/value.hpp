/// \file
/// The dynamically-typed value graph exchanged between test cases, the sandbox and the comparator
#pragma once

#include <lunajudge/common/formatters.hpp>

#include <fmt/format.h>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lunajudge {

class Value;

/// Ordered list of values (a Lua table with keys 1..n)
using Sequence = std::vector<Value>;

/// String-keyed values (a Lua table with string keys). Ordered so that display and encoding are deterministic
using Mapping = std::map<std::string, Value, std::less<>>;

enum class ValueKind { Nil, Boolean, Integer, Float, String, Sequence, Mapping };

/// A value as seen by submitted code: nil, boolean, integer, float, string, or a nested sequence / mapping.
///
/// Copying a Value copies the entire graph; nothing is shared between copies.
class Value
{
public:
    struct Nil
    {
        constexpr bool operator==(const Nil&) const = default;
    };

    using Storage = std::variant<Nil, bool, std::int64_t, double, std::string, Sequence, Mapping>;

    Value() = default;

    // NOLINTBEGIN(google-explicit-constructor)
    Value(std::nullptr_t /*unused*/) {}

    Value(bool boolean)
        : storage_{boolean} {}

    template <std::integral I>
        requires(!std::same_as<I, bool>)
    Value(I integer)
        : storage_{static_cast<std::int64_t>(integer)} {}

    template <std::floating_point F>
    Value(F number)
        : storage_{static_cast<double>(number)} {}

    Value(const char* str)
        : storage_{std::string{str}} {}

    Value(std::string_view str)
        : storage_{std::string{str}} {}

    Value(std::string str)
        : storage_{std::move(str)} {}

    Value(Sequence seq)
        : storage_{std::move(seq)} {}

    Value(Mapping map)
        : storage_{std::move(map)} {}
    // NOLINTEND(google-explicit-constructor)

    ValueKind kind() const { return static_cast<ValueKind>(storage_.index()); }

    /// Lua's name for the value's type (``math.type`` for numbers)
    std::string_view type_name() const;

    bool is_nil() const { return kind() == ValueKind::Nil; }
    bool is_bool() const { return kind() == ValueKind::Boolean; }
    bool is_int() const { return kind() == ValueKind::Integer; }
    bool is_float() const { return kind() == ValueKind::Float; }
    bool is_number() const { return is_int() || is_float(); }
    bool is_string() const { return kind() == ValueKind::String; }
    bool is_sequence() const { return kind() == ValueKind::Sequence; }
    bool is_mapping() const { return kind() == ValueKind::Mapping; }

    bool as_bool() const { return std::get<bool>(storage_); }
    std::int64_t as_int() const { return std::get<std::int64_t>(storage_); }
    double as_float() const { return std::get<double>(storage_); }
    const std::string& as_string() const { return std::get<std::string>(storage_); }
    const Sequence& as_sequence() const { return std::get<Sequence>(storage_); }
    Sequence& as_sequence() { return std::get<Sequence>(storage_); }
    const Mapping& as_mapping() const { return std::get<Mapping>(storage_); }
    Mapping& as_mapping() { return std::get<Mapping>(storage_); }

    template <typename Visitor>
    decltype(auto) visit(Visitor&& visitor) const {
        return std::visit(std::forward<Visitor>(visitor), storage_);
    }

    /// Strict equality: same kind and same contents. An integer never equals a float here;
    /// see ``equivalent`` for the comparison used to grade results
    bool operator==(const Value& rhs) const { return storage_ == rhs.storage_; }

    /// Render for messages, e.g. ``[1, 2.5, "abc", {"k": nil}]``
    std::string to_display_string() const;

private:
    Storage storage_;
};

} // namespace lunajudge

LUNAJUDGE_FORMAT_ENUM(lunajudge::ValueKind, Nil, Boolean, Integer, Float, String, Sequence, Mapping);

template <>
struct fmt::formatter<::lunajudge::Value> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(const ::lunajudge::Value& from, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(from.to_display_string(), ctx);
    }
};
