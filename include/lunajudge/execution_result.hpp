/// \file
/// Defines data classes for the input and result data of a single Executor::execute call
#pragma once

#include <lunajudge/common/formatters.hpp>
#include <lunajudge/value/value.hpp>

#include <fmt/format.h>

#include <optional>
#include <string>
#include <vector>

namespace lunajudge {

struct TestCase
{
    /// Arguments, keyed by the parameter name of the function under test
    Mapping input;
    Value expected;
    std::optional<std::string> description;
    /// Hidden cases are graded like any other; the flag is only for presenters
    bool hidden = false;
};

enum class TestStatus { Accepted, WrongAnswer, RuntimeError, Timeout, MemoryLimit };

struct TestResult
{
    TestCase test_case;
    bool passed{};
    TestStatus status{};

    /// Only present if the function returned
    std::optional<Value> actual;

    /// Duration of the call itself for completed runs; the wall-clock limit for timed-out runs
    double execution_ms{};

    std::optional<std::string> error_message;
};

struct ExecutionResult
{
    bool success{};
    std::vector<TestResult> test_results;
    double total_ms{};

    int passed_count() const;

    int total_count() const { return static_cast<int>(test_results.size()); }

    /// The result that stopped the run, if any
    const TestResult* first_failure() const;

    /// Accepted on success, otherwise the status of the failing test
    TestStatus status() const;
};

/// A condition that prevented any ExecutionResult from being produced
struct ExecutionError
{
    enum class Kind { Syntax, Runtime };

    std::string message;
    Kind kind = Kind::Runtime;

    /// Line of a syntax error
    std::optional<int> line;

    bool operator==(const ExecutionError& rhs) const = default;
};

} // namespace lunajudge

LUNAJUDGE_FORMAT_ENUM(lunajudge::TestStatus, Accepted, WrongAnswer, RuntimeError, Timeout, MemoryLimit);
LUNAJUDGE_FORMAT_ENUM(lunajudge::ExecutionError::Kind, Syntax, Runtime);

template <>
struct fmt::formatter<::lunajudge::ExecutionError> : ::lunajudge::DebugFormatter
{
    template <typename FormatContext>
    auto format(const ::lunajudge::ExecutionError& from, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{} error: {}", from.kind, from.message);
    }
};
