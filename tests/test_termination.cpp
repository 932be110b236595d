#include "catch2_custom.hpp"

#include <lunajudge/common/error_types.hpp>
#include <lunajudge/subprocess/exit_status.hpp>
#include <lunajudge/subprocess/process_controller.hpp>
#include <lunajudge/subprocess/termination.hpp>

#include <chrono>
#include <optional>
#include <vector>

#include <signal.h>

using lunajudge::ErrorKind;
using lunajudge::ExitStatus;
using lunajudge::Result;
using lunajudge::TerminationSequence;
using State = TerminationSequence::State;
using namespace std::chrono_literals;

namespace {

/// Scripted stand-in for a child process
class FakeProcess : public lunajudge::ProcessController
{
public:
    /// Signal that makes the process exit; anything else is ignored
    std::optional<int> dies_on = SIGTERM;

    /// Error returned by the next bounded wait, instead of the usual behaviour
    std::optional<ErrorKind> wait_error;

    std::vector<int> signals_received;
    std::vector<std::chrono::milliseconds> bounded_waits;
    int unbounded_waits = 0;

    Result<void> send_signal(int signal_num) override {
        signals_received.push_back(signal_num);
        if (dies_on == signal_num) {
            dead_by_ = signal_num;
        }
        return {};
    }

    Result<ExitStatus> wait_for_exit(std::chrono::milliseconds timeout) override {
        bounded_waits.push_back(timeout);

        if (wait_error) {
            return *wait_error;
        }
        if (!dead_by_) {
            return ErrorKind::TimedOut;
        }
        return ExitStatus::make_killed(*dead_by_);
    }

    Result<ExitStatus> wait_for_exit() override {
        ++unbounded_waits;
        REQUIRE(dead_by_.has_value());
        return ExitStatus::make_killed(*dead_by_);
    }

private:
    std::optional<int> dead_by_;
};

} // namespace

TEST_CASE("A process that obeys SIGTERM is never killed") {
    FakeProcess process;
    TerminationSequence sequence{process, 250ms};

    REQUIRE(sequence.get_state() == State::Running);

    REQUIRE(sequence.advance() == State::TerminateRequested);
    REQUIRE(process.signals_received == std::vector{SIGTERM});

    REQUIRE(sequence.advance() == State::Exited);
    REQUIRE(process.bounded_waits.size() == 1);
    REQUIRE(process.bounded_waits.front().count() == 250);
    REQUIRE(process.unbounded_waits == 0);

    REQUIRE(sequence.get_exit_status() == ExitStatus::make_killed(SIGTERM));
}

TEST_CASE("A process that ignores SIGTERM is killed after the grace period") {
    FakeProcess process;
    process.dies_on = SIGKILL;
    TerminationSequence sequence{process, 100ms};

    REQUIRE(sequence.advance() == State::TerminateRequested);
    REQUIRE(sequence.advance() == State::KillRequested);
    REQUIRE(process.signals_received == std::vector{SIGTERM, SIGKILL});

    REQUIRE(sequence.advance() == State::Exited);
    REQUIRE(process.unbounded_waits == 1);
    REQUIRE(sequence.get_exit_status() == ExitStatus::make_killed(SIGKILL));
}

TEST_CASE("run drives the sequence to completion") {
    FakeProcess process;
    process.dies_on = SIGKILL;
    TerminationSequence sequence{process, 10ms};

    auto status = sequence.run();

    REQUIRE(status == ExitStatus::make_killed(SIGKILL));
    REQUIRE(sequence.get_state() == State::Exited);
}

TEST_CASE("Exited is terminal") {
    FakeProcess process;
    TerminationSequence sequence{process, 10ms};

    REQUIRE(sequence.run());

    REQUIRE(sequence.advance() == State::Exited);
    REQUIRE(sequence.run() == ExitStatus::make_killed(SIGTERM));
    REQUIRE(process.signals_received.size() == 1);
}

TEST_CASE("Wait failures other than a timeout are propagated") {
    FakeProcess process;
    process.wait_error = ErrorKind::SyscallFailure;
    TerminationSequence sequence{process, 10ms};

    REQUIRE(sequence.advance() == State::TerminateRequested);
    REQUIRE(sequence.advance() == ErrorKind::SyscallFailure);

    // No escalation on an unexpected failure
    REQUIRE(process.signals_received == std::vector{SIGTERM});
    REQUIRE(sequence.get_state() == State::TerminateRequested);
    REQUIRE_FALSE(sequence.get_exit_status().has_value());
}
