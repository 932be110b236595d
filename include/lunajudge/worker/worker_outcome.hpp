/// \file
/// The single message a worker sends back to the supervisor
#pragma once

#include <lunajudge/common/error_types.hpp>
#include <lunajudge/common/formatters.hpp>
#include <lunajudge/value/value.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace lunajudge {

struct WorkerSuccess
{
    /// First value returned by the function (nil if it returned nothing)
    Value return_value;

    /// Wall-clock duration of the call alone
    double elapsed_ms{};

    bool operator==(const WorkerSuccess& rhs) const = default;
};

enum class ErrorClass { Syntax, NameNotFound, Runtime };

struct WorkerFailure
{
    ErrorClass error_class{};
    std::string message;

    bool operator==(const WorkerFailure& rhs) const = default;
};

using WorkerOutcome = std::variant<WorkerSuccess, WorkerFailure>;

/// CBOR encoding of an outcome. Integers, floats (including non-finite ones) and nested
/// containers are preserved exactly
std::vector<std::uint8_t> encode_outcome(const WorkerOutcome& outcome);

/// Inverse of ``encode_outcome``. Fails with MalformedMessage on anything it did not produce
Result<WorkerOutcome> decode_outcome(const std::vector<std::uint8_t>& payload);

} // namespace lunajudge

LUNAJUDGE_FORMAT_ENUM(lunajudge::ErrorClass, Syntax, NameNotFound, Runtime);

template <>
struct fmt::formatter<::lunajudge::WorkerOutcome> : ::lunajudge::DebugFormatter
{
    template <typename FormatContext>
    auto format(const ::lunajudge::WorkerOutcome& from, FormatContext& ctx) const {
        if (const auto* success = std::get_if<::lunajudge::WorkerSuccess>(&from)) {
            return fmt::format_to(ctx.out(), "Success({}, {}ms)", success->return_value, success->elapsed_ms);
        }

        const auto& failure = std::get<::lunajudge::WorkerFailure>(from);
        return fmt::format_to(ctx.out(), "Failure({}, {:?})", failure.error_class, failure.message);
    }
};
