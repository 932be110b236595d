/// \file
/// Graceful-then-forceful termination of a worker that has overstayed its time limit
#pragma once

#include <lunajudge/common/error_types.hpp>
#include <lunajudge/common/formatters.hpp>
#include <lunajudge/subprocess/exit_status.hpp>
#include <lunajudge/subprocess/process_controller.hpp>

#include <chrono>
#include <optional>

namespace lunajudge {

/// Drives a process through
///
///     Running -> TerminateRequested -> Exited
///                                   -> KillRequested -> Exited
///
/// SIGTERM is sent first. If the process has not exited once the grace period is over, it is
/// sent SIGKILL and waited for without a time limit.
class TerminationSequence
{
public:
    enum class State { Running, TerminateRequested, KillRequested, Exited };

    TerminationSequence(ProcessController& process, std::chrono::milliseconds grace_period);

    /// Take the next step and return the state it leads to. A no-op once Exited
    Result<State> advance();

    /// Advance until the process has exited
    Result<ExitStatus> run();

    State get_state() const { return state_; }

    /// Set once Exited
    const std::optional<ExitStatus>& get_exit_status() const { return exit_status_; }

private:
    ProcessController* process_;
    std::chrono::milliseconds grace_period_;

    State state_ = State::Running;
    std::optional<ExitStatus> exit_status_;
};

} // namespace lunajudge

LUNAJUDGE_FORMAT_ENUM(lunajudge::TerminationSequence::State, Running, TerminateRequested, KillRequested, Exited);
