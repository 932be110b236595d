#include <lunajudge/common/overloaded.hpp>
#include <lunajudge/value/value.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/any_of.hpp>

#include <cmath>
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>

namespace lunajudge {

namespace {

std::string format_float(double number) {
    if (std::isnan(number)) {
        return std::signbit(number) ? "-nan" : "nan";
    }
    if (std::isinf(number)) {
        return number < 0 ? "-inf" : "inf";
    }

    std::string res = fmt::format("{}", number);

    // Keep floats visually distinct from integers, as Lua does (10.0 vs 10)
    if (!ranges::any_of(res, [](char chr) { return chr == '.' || chr == 'e' || chr == 'E'; })) {
        res += ".0";
    }

    return res;
}

void append_display(const Value& value, std::string& out) {
    auto inserter = std::back_inserter(out);

    value.visit(Overloaded{
        [&](const Value::Nil& /*unused*/) { out += "nil"; },
        [&](bool boolean) { out += boolean ? "true" : "false"; },
        [&](std::int64_t integer) { fmt::format_to(inserter, "{}", integer); },
        [&](double number) { out += format_float(number); },
        [&](const std::string& str) { fmt::format_to(inserter, "{:?}", str); },
        [&](const Sequence& seq) {
            out += '[';
            for (std::size_t i = 0; i < seq.size(); ++i) {
                if (i != 0) {
                    out += ", ";
                }
                append_display(seq[i], out);
            }
            out += ']';
        },
        [&](const Mapping& map) {
            out += '{';
            bool first = true;
            for (const auto& [key, elem] : map) {
                if (!first) {
                    out += ", ";
                }
                first = false;
                fmt::format_to(inserter, "{:?}: ", key);
                append_display(elem, out);
            }
            out += '}';
        },
    });
}

} // namespace

std::string_view Value::type_name() const {
    switch (kind()) {
    case ValueKind::Nil:
        return "nil";
    case ValueKind::Boolean:
        return "boolean";
    case ValueKind::Integer:
        return "integer";
    case ValueKind::Float:
        return "float";
    case ValueKind::String:
        return "string";
    case ValueKind::Sequence:
    case ValueKind::Mapping:
        return "table";
    }

    return "<unknown>";
}

std::string Value::to_display_string() const {
    std::string res;
    append_display(*this, res);
    return res;
}

} // namespace lunajudge
