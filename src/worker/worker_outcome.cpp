#include <lunajudge/common/error_types.hpp>
#include <lunajudge/common/overloaded.hpp>
#include <lunajudge/logging.hpp>
#include <lunajudge/value/value_codec.hpp>
#include <lunajudge/worker/worker_outcome.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lunajudge {

namespace {

constexpr std::string_view SUCCESS_TAG = "success";
constexpr std::string_view FAILURE_TAG = "failure";

std::optional<ErrorClass> parse_error_class(std::string_view str) {
    for (ErrorClass error_class : {ErrorClass::Syntax, ErrorClass::NameNotFound, ErrorClass::Runtime}) {
        if (str == fmt::formatter<ErrorClass>::to_string(error_class)) {
            return error_class;
        }
    }

    return std::nullopt;
}

WorkerOutcome outcome_from_json(const nlohmann::json& json) {
    const auto& status = json.at("status").get_ref<const std::string&>();

    if (status == SUCCESS_TAG) {
        return WorkerSuccess{.return_value = from_json(json.at("value")),
                             .elapsed_ms = json.at("elapsed_ms").get<double>()};
    }

    if (status == FAILURE_TAG) {
        const auto& class_name = json.at("error_class").get_ref<const std::string&>();
        std::optional<ErrorClass> error_class = parse_error_class(class_name);

        if (!error_class) {
            throw std::invalid_argument(fmt::format("unknown error class {:?}", class_name));
        }

        return WorkerFailure{.error_class = *error_class, .message = json.at("message").get<std::string>()};
    }

    throw std::invalid_argument(fmt::format("unknown outcome status {:?}", status));
}

} // namespace

std::vector<std::uint8_t> encode_outcome(const WorkerOutcome& outcome) {
    nlohmann::json json = std::visit(
        Overloaded{
            [](const WorkerSuccess& success) {
                return nlohmann::json{
                    {"status", std::string{SUCCESS_TAG}},
                    {"value", to_json(success.return_value)},
                    {"elapsed_ms", success.elapsed_ms},
                };
            },
            [](const WorkerFailure& failure) {
                return nlohmann::json{
                    {"status", std::string{FAILURE_TAG}},
                    {"error_class", std::string{fmt::formatter<ErrorClass>::to_string(failure.error_class)}},
                    {"message", failure.message},
                };
            },
        },
        outcome);

    return nlohmann::json::to_cbor(json);
}

Result<WorkerOutcome> decode_outcome(const std::vector<std::uint8_t>& payload) {
    nlohmann::json json = nlohmann::json::from_cbor(payload, /*strict=*/true, /*allow_exceptions=*/false);

    if (json.is_discarded()) {
        LOG_WARN("Result payload of {} bytes is not valid CBOR", payload.size());
        return ErrorKind::MalformedMessage;
    }

    try {
        return outcome_from_json(json);
    } catch (const std::exception& ex) {
        LOG_WARN("Result payload has an unexpected shape: {}", ex.what());
        return ErrorKind::MalformedMessage;
    }
}

} // namespace lunajudge
