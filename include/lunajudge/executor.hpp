/// \file
/// Entry point of the engine: grade submitted code against a list of test cases
#pragma once

#include <lunajudge/common/error_types.hpp>
#include <lunajudge/common/expected.hpp>
#include <lunajudge/execution_result.hpp>
#include <lunajudge/executor_config.hpp>
#include <lunajudge/subprocess/exit_status.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace lunajudge {

class ResultChannel;
class WorkerProcess;
struct WorkerRequest;

/**
 * \brief Runs submitted code against test cases, one isolated worker process per case
 *
 * Test cases run in order and the run stops at the first one that does not pass. Every
 * worker gets the configured time limit; one that overruns it is sent SIGTERM, then SIGKILL
 * after the grace period.
 *
 * The Executor holds nothing but its configuration and may be shared between threads.
 */
class Executor
{
public:
    /// What a forked worker runs; returns the worker's exit code
    using WorkerEntry = std::function<int(const WorkerRequest&, ResultChannel&)>;

    /// ``config`` must be valid; see ``create`` for caller-supplied configurations
    explicit Executor(ExecutorConfig config = {});

    /// Workers run ``worker_entry`` instead of ``worker_main``
    Executor(ExecutorConfig config, WorkerEntry worker_entry);

    /// Validating constructor. Fails with the message from ``ExecutorConfig::validate``
    static Expected<Executor, std::string> create(ExecutorConfig config);

    const ExecutorConfig& get_config() const { return config_; }

    /// Check that ``code`` compiles, without running it
    Expected<void, ExecutionError> validate_syntax(std::string_view code) const;

    /// Grade ``code`` by calling ``function_name`` once per test case.
    ///
    /// ``timeout`` overrides the configured limit for this call.
    /// Per-test failures (wrong answers, runtime errors, timeouts) are reported inside the
    /// ExecutionResult; an ExecutionError is returned only for a syntax error, or when a worker
    /// ends without reporting anything.
    Expected<ExecutionResult, ExecutionError> execute(std::string_view code, std::span<const TestCase> test_cases,
                                                      std::string_view function_name,
                                                      std::optional<std::chrono::milliseconds> timeout = {}) const;

    /// Run a single test case in a fresh worker
    Result<TestResult> run_one(std::string_view code, const TestCase& test_case, std::string_view function_name,
                               std::chrono::milliseconds timeout) const;

private:
    /// Reap a worker that has already reported, escalating if it does not exit on its own
    Result<ExitStatus> reap(WorkerProcess& worker) const;

    ExecutorConfig config_;
    WorkerEntry worker_entry_;
};

/// "1s" for whole seconds, "1500ms" otherwise
std::string format_time_limit(std::chrono::milliseconds limit);

} // namespace lunajudge
