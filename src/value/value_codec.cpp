#include <lunajudge/value/value_codec.hpp>

#include <lunajudge/common/overloaded.hpp>
#include <lunajudge/value/value.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace lunajudge {

nlohmann::json to_json(const Value& value) {
    using nlohmann::json;

    return value.visit(Overloaded{
        [](const Value::Nil& /*unused*/) -> json { return nullptr; },
        [](bool boolean) -> json { return boolean; },
        [](std::int64_t integer) -> json { return integer; },
        [](double number) -> json { return number; },
        [](const std::string& str) -> json { return str; },
        [](const Sequence& seq) -> json {
            json arr = json::array();
            for (const Value& elem : seq) {
                arr.push_back(to_json(elem));
            }
            return arr;
        },
        [](const Mapping& map) -> json {
            json obj = json::object();
            for (const auto& [key, elem] : map) {
                obj[key] = to_json(elem);
            }
            return obj;
        },
    });
}

Value from_json(const nlohmann::json& json) {
    using value_t = nlohmann::json::value_t;

    switch (json.type()) {
    case value_t::null:
        return {};
    case value_t::boolean:
        return json.get<bool>();
    case value_t::number_integer:
        return json.get<std::int64_t>();
    case value_t::number_unsigned: {
        // CBOR stores non-negative integers as unsigned; anything we wrote fits in an int64
        auto number = json.get<std::uint64_t>();
        if (number > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw std::invalid_argument(fmt::format("unsigned integer {} is out of range", number));
        }
        return static_cast<std::int64_t>(number);
    }
    case value_t::number_float:
        return json.get<double>();
    case value_t::string:
        return json.get<std::string>();
    case value_t::array: {
        Sequence seq;
        seq.reserve(json.size());
        for (const auto& elem : json) {
            seq.push_back(from_json(elem));
        }
        return seq;
    }
    case value_t::object: {
        Mapping map;
        for (const auto& [key, elem] : json.items()) {
            map.emplace(key, from_json(elem));
        }
        return map;
    }
    case value_t::binary:
    case value_t::discarded:
        break;
    }

    throw std::invalid_argument(fmt::format("json of type {} has no Value representation", json.type_name()));
}

} // namespace lunajudge
