#include "catch2_custom.hpp"

#include <lunajudge/common/error_types.hpp>
#include <lunajudge/value/value.hpp>
#include <lunajudge/value/value_codec.hpp>
#include <lunajudge/worker/worker_outcome.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <variant>
#include <vector>

using lunajudge::ErrorClass;
using lunajudge::ErrorKind;
using lunajudge::Mapping;
using lunajudge::Sequence;
using lunajudge::Value;
using lunajudge::WorkerFailure;
using lunajudge::WorkerOutcome;
using lunajudge::WorkerSuccess;

namespace {

WorkerOutcome reencode(const WorkerOutcome& outcome) {
    auto decoded = lunajudge::decode_outcome(lunajudge::encode_outcome(outcome));
    REQUIRE(decoded);
    return decoded.value();
}

} // namespace

TEST_CASE("Values keep their exact kind through the wire format") {
    Value value = Mapping{
        {"int", 10},
        {"float", 10.0},
        {"big", std::numeric_limits<std::int64_t>::min()},
        {"nested", Sequence{Sequence{}, Mapping{}, "s", true, Value{}}},
    };

    auto outcome = reencode(WorkerSuccess{.return_value = value, .elapsed_ms = 1.25});

    const auto& success = std::get<WorkerSuccess>(outcome);
    REQUIRE(success.return_value == value);
    REQUIRE(success.return_value.as_mapping().at("float").is_float());
    REQUIRE(success.return_value.as_mapping().at("int").is_int());
    REQUIRE(success.elapsed_ms == 1.25);
}

TEST_CASE("Non-finite floats survive encoding") {
    auto outcome = reencode(WorkerSuccess{.return_value = Sequence{std::numeric_limits<double>::infinity(), std::nan("")},
                                          .elapsed_ms = 0});

    const auto& seq = std::get<WorkerSuccess>(outcome).return_value.as_sequence();
    REQUIRE(std::isinf(seq.at(0).as_float()));
    REQUIRE(std::isnan(seq.at(1).as_float()));
}

TEST_CASE("Failures keep their class and message") {
    WorkerFailure failure{.error_class = ErrorClass::NameNotFound, .message = "Function 'solve' not found in code"};

    REQUIRE(reencode(failure) == WorkerOutcome{failure});
}

TEST_CASE("Garbage payloads are reported as malformed") {
    REQUIRE(lunajudge::decode_outcome({}) == ErrorKind::MalformedMessage);
    REQUIRE(lunajudge::decode_outcome({0xFF, 0x00, 0x13}) == ErrorKind::MalformedMessage);

    // Valid CBOR, wrong shape
    REQUIRE(lunajudge::decode_outcome(nlohmann::json::to_cbor(nlohmann::json{{"status", "pending"}})) ==
            ErrorKind::MalformedMessage);
    REQUIRE(lunajudge::decode_outcome(nlohmann::json::to_cbor(nlohmann::json{
                {"status", "failure"}, {"error_class", "Bogus"}, {"message", "x"}})) == ErrorKind::MalformedMessage);
}

TEST_CASE("json without a Value representation is rejected") {
    REQUIRE_THROWS_AS(lunajudge::from_json(nlohmann::json::binary({1, 2, 3})), std::invalid_argument);
    REQUIRE_THROWS_AS(lunajudge::from_json(nlohmann::json(std::numeric_limits<std::uint64_t>::max())),
                      std::invalid_argument);
}
