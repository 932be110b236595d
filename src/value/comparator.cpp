#include <lunajudge/value/comparator.hpp>

#include <lunajudge/value/value.hpp>

#include <range/v3/algorithm/equal.hpp>

#include <cmath>
#include <cstdint>

namespace lunajudge {

namespace {

bool integer_equals_float(std::int64_t integer, double number) {
    // Same rule as Lua: the float must be integral and representable as a 64-bit integer
    constexpr double TWO_POW_63 = 9223372036854775808.0;

    if (!std::isfinite(number) || std::floor(number) != number) {
        return false;
    }
    if (number < -TWO_POW_63 || number >= TWO_POW_63) {
        return false;
    }

    return static_cast<std::int64_t>(number) == integer;
}

bool is_empty_table(const Value& value) {
    return (value.is_sequence() && value.as_sequence().empty()) || (value.is_mapping() && value.as_mapping().empty());
}

} // namespace

bool native_equal(const Value& lhs, const Value& rhs) {
    if (lhs.is_int() && rhs.is_float()) {
        return integer_equals_float(lhs.as_int(), rhs.as_float());
    }
    if (lhs.is_float() && rhs.is_int()) {
        return integer_equals_float(rhs.as_int(), lhs.as_float());
    }

    return lhs == rhs;
}

bool equivalent(const Value& actual, const Value& expected) {
    if (actual.is_float() && expected.is_float()) {
        return std::fabs(actual.as_float() - expected.as_float()) < FLOAT_TOLERANCE;
    }

    if (actual.is_sequence() && expected.is_sequence()) {
        const Sequence& lhs = actual.as_sequence();
        const Sequence& rhs = expected.as_sequence();

        if (lhs.size() != rhs.size()) {
            return false;
        }

        return ranges::equal(lhs, rhs, equivalent);
    }

    if (actual.is_mapping() && expected.is_mapping()) {
        const Mapping& lhs = actual.as_mapping();
        const Mapping& rhs = expected.as_mapping();

        // Mappings are ordered by key, so equal key sets line up pairwise
        if (lhs.size() != rhs.size()) {
            return false;
        }

        return ranges::equal(lhs, rhs, [](const auto& lhs_entry, const auto& rhs_entry) {
            return lhs_entry.first == rhs_entry.first && equivalent(lhs_entry.second, rhs_entry.second);
        });
    }

    // Lua has a single empty table, which converts to an empty Sequence
    if (is_empty_table(actual) && is_empty_table(expected)) {
        return true;
    }

    return native_equal(actual, expected);
}

} // namespace lunajudge
