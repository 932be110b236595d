/// \file
/// Conversion between Value and nlohmann::json, used to put values on the wire
#pragma once

#include <lunajudge/value/value.hpp>

#include <nlohmann/json.hpp>

namespace lunajudge {

/// nlohmann::json keeps integers and floats apart, and its binary encodings (CBOR) keep
/// non-finite floats, so a Value survives the trip unchanged
nlohmann::json to_json(const Value& value);

/// Inverse of ``to_json``. Throws ``std::invalid_argument`` for json that no Value produces
/// (binary strings, discarded values, unsigned integers beyond int64)
Value from_json(const nlohmann::json& json);

} // namespace lunajudge
