#include <lunajudge/common/error_types.hpp>
#include <lunajudge/logging.hpp>
#include <lunajudge/subprocess/termination.hpp>

#include <libassert/assert.hpp>

#include <chrono>

#include <signal.h>

namespace lunajudge {

TerminationSequence::TerminationSequence(ProcessController& process, std::chrono::milliseconds grace_period)
    : process_{&process}
    , grace_period_{grace_period} {}

Result<TerminationSequence::State> TerminationSequence::advance() {
    switch (state_) {
    case State::Running:
        TRY(process_->send_signal(SIGTERM));
        state_ = State::TerminateRequested;
        break;

    case State::TerminateRequested: {
        Result<ExitStatus> status = process_->wait_for_exit(grace_period_);

        if (status) {
            exit_status_ = status.value();
            state_ = State::Exited;
            break;
        }

        if (status.error() != ErrorKind::TimedOut) {
            return status.error();
        }

        LOG_DEBUG("Process ignored SIGTERM for {}; sending SIGKILL", grace_period_);

        TRY(process_->send_signal(SIGKILL));
        state_ = State::KillRequested;
        break;
    }

    case State::KillRequested:
        exit_status_ = TRY(process_->wait_for_exit());
        state_ = State::Exited;
        break;

    case State::Exited:
        break;
    }

    return state_;
}

Result<ExitStatus> TerminationSequence::run() {
    while (state_ != State::Exited) {
        TRY(advance());
    }

    DEBUG_ASSERT(exit_status_.has_value());

    return exit_status_.value();
}

} // namespace lunajudge
