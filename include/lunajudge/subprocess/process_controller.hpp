#pragma once

#include <lunajudge/common/error_types.hpp>
#include <lunajudge/subprocess/exit_status.hpp>

#include <chrono>

namespace lunajudge {

/// The operations needed to bring a child process to an end
class ProcessController
{
public:
    ProcessController() = default;
    ProcessController(const ProcessController&) = delete;
    ProcessController& operator=(const ProcessController&) = delete;
    ProcessController(ProcessController&&) = delete;
    ProcessController& operator=(ProcessController&&) = delete;

    virtual ~ProcessController() = default;

    virtual Result<void> send_signal(int signal_num) = 0;

    /// Reap the process if it terminates within ``timeout``. Fails with TimedOut otherwise
    virtual Result<ExitStatus> wait_for_exit(std::chrono::milliseconds timeout) = 0;

    /// Block until the process terminates, then reap it
    virtual Result<ExitStatus> wait_for_exit() = 0;
};

} // namespace lunajudge
