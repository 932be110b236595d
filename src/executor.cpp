#include <lunajudge/channel/result_channel.hpp>
#include <lunajudge/common/error_types.hpp>
#include <lunajudge/common/overloaded.hpp>
#include <lunajudge/executor.hpp>
#include <lunajudge/logging.hpp>
#include <lunajudge/sandbox/syntax_validator.hpp>
#include <lunajudge/subprocess/termination.hpp>
#include <lunajudge/subprocess/worker_process.hpp>
#include <lunajudge/value/comparator.hpp>
#include <lunajudge/worker/worker.hpp>
#include <lunajudge/worker/worker_outcome.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace lunajudge {

namespace {

TestResult judge_success(const TestCase& test_case, WorkerSuccess success) {
    bool passed = equivalent(success.return_value, test_case.expected);

    TestResult res{.test_case = test_case,
                   .passed = passed,
                   .status = passed ? TestStatus::Accepted : TestStatus::WrongAnswer,
                   .actual = std::move(success.return_value),
                   .execution_ms = success.elapsed_ms,
                   .error_message = std::nullopt};

    if (!passed) {
        res.error_message = fmt::format("Expected {}, got {}", test_case.expected, res.actual.value());
    }

    return res;
}

TestResult judge_failure(const TestCase& test_case, WorkerFailure failure) {
    bool out_of_memory = failure.message.starts_with("MemoryError");

    return {.test_case = test_case,
            .passed = false,
            .status = out_of_memory ? TestStatus::MemoryLimit : TestStatus::RuntimeError,
            .actual = std::nullopt,
            .execution_ms = 0,
            .error_message = std::move(failure.message)};
}

} // namespace

std::string format_time_limit(std::chrono::milliseconds limit) {
    if (limit.count() % 1000 == 0) {
        return fmt::format("{}s", limit.count() / 1000);
    }

    return fmt::format("{}ms", limit.count());
}

Executor::Executor(ExecutorConfig config)
    : Executor{std::move(config), worker_main} {}

Executor::Executor(ExecutorConfig config, WorkerEntry worker_entry)
    : config_{std::move(config)}
    , worker_entry_{std::move(worker_entry)} {
    auto valid = config_.validate();
    ASSERT(valid.has_value(), "Invalid executor configuration", valid.error_or(""));
    ASSERT(static_cast<bool>(worker_entry_), "Executor needs a worker entry point");
}

Expected<Executor, std::string> Executor::create(ExecutorConfig config) {
    TRY(config.validate());

    return Executor{std::move(config)};
}

Expected<void, ExecutionError> Executor::validate_syntax(std::string_view code) const {
    return sandbox::validate_syntax(code);
}

Expected<ExecutionResult, ExecutionError> Executor::execute(std::string_view code,
                                                            std::span<const TestCase> test_cases,
                                                            std::string_view function_name,
                                                            std::optional<std::chrono::milliseconds> timeout) const {
    const std::chrono::milliseconds limit = timeout.value_or(config_.timeout);
    ASSERT(limit.count() > 0, "Time limit must be positive", limit);

    if (auto syntax = validate_syntax(code); !syntax) {
        LOG_DEBUG("Rejected code with a syntax error: {}", syntax.error().message);
        return syntax.error();
    }

    LOG_DEBUG("Running '{}' against {} test case(s) with a limit of {}", function_name, test_cases.size(), limit);

    ExecutionResult result{.success = true, .test_results = {}, .total_ms = 0};

    for (std::size_t i = 0; i < test_cases.size(); ++i) {
        Result<TestResult> test_result = run_one(code, test_cases[i], function_name, limit);

        if (!test_result) {
            LOG_ERROR("Internal error while running test case {}: {}", i, test_result.error());
            return ExecutionError{
                .message = fmt::format("Worker process terminated unexpectedly ({})", test_result.error()),
                .kind = ExecutionError::Kind::Runtime,
                .line = std::nullopt};
        }

        result.total_ms += test_result->execution_ms;
        result.test_results.push_back(std::move(test_result).value());

        if (!result.test_results.back().passed) {
            LOG_DEBUG("Test case {} did not pass ({}); stopping", i, result.test_results.back().status);
            result.success = false;
            break;
        }
    }

    return result;
}

Result<TestResult> Executor::run_one(std::string_view code, const TestCase& test_case,
                                     std::string_view function_name, std::chrono::milliseconds timeout) const {
    using std::chrono::steady_clock;

    // Copied in full so the worker owns everything it touches
    const WorkerRequest request{.code = std::string{code},
                                .function_name = std::string{function_name},
                                .input = test_case.input,
                                .memory_limit_bytes = config_.memory_limit_bytes()};

    Result<ResultChannel> created = ResultChannel::create();
    if (!created) {
        return created.error();
    }

    ResultChannel channel = std::move(created).value();

    WorkerProcess worker{[this, &request, &channel] { return worker_entry_(request, channel); }, channel.write_fd()};

    const auto deadline = steady_clock::now() + timeout;

    TRY(worker.start());
    TRY(channel.close_write_end());

    LOG_DEBUG("Spawned worker {} for '{}'", worker.get_pid(), function_name);

    Result<std::vector<std::uint8_t>> payload = channel.receive(deadline);

    if (!payload && payload.error() == ErrorKind::TimedOut) {
        LOG_DEBUG("Worker {} exceeded {}; terminating", worker.get_pid(), timeout);

        TerminationSequence termination{worker, config_.grace_period};
        ExitStatus status = TRY(termination.run());

        LOG_DEBUG("Timed out worker {} {}", worker.get_pid(), status);

        return TestResult{.test_case = test_case,
                          .passed = false,
                          .status = TestStatus::Timeout,
                          .actual = std::nullopt,
                          .execution_ms = std::chrono::duration<double, std::milli>(timeout).count(),
                          .error_message = fmt::format("Timeout: exceeded {}", format_time_limit(timeout))};
    }

    ExitStatus status = TRY(reap(worker));

    if (!payload) {
        LOG_WARN("Worker {} {} without a result: {}", worker.get_pid(), status, payload.error());
        return payload.error();
    }

    WorkerOutcome outcome = TRY(decode_outcome(payload.value()));

    LOG_TRACE("Worker {} reported {}", worker.get_pid(), outcome);

    return std::visit(Overloaded{
                          [&](WorkerSuccess& success) { return judge_success(test_case, std::move(success)); },
                          [&](WorkerFailure& failure) { return judge_failure(test_case, std::move(failure)); },
                      },
                      outcome);
}

Result<ExitStatus> Executor::reap(WorkerProcess& worker) const {
    Result<ExitStatus> status = worker.wait_for_exit(config_.grace_period);

    if (status || status.error() != ErrorKind::TimedOut) {
        return status;
    }

    LOG_WARN("Worker {} lingered after reporting; terminating", worker.get_pid());

    TerminationSequence termination{worker, config_.grace_period};
    return termination.run();
}

} // namespace lunajudge
