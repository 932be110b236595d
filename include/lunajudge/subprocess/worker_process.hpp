#pragma once

#include <lunajudge/common/class_traits.hpp>
#include <lunajudge/common/error_types.hpp>
#include <lunajudge/subprocess/exit_status.hpp>
#include <lunajudge/subprocess/process_controller.hpp>

#include <chrono>
#include <functional>
#include <optional>

#include <sys/types.h>

namespace lunajudge {

/// A forked child that runs a single function and exits with its return value.
///
/// The child is not exec'd. Before the entry point runs, the child asks the kernel to
/// SIGKILL it should the parent die, and closes every inherited file descriptor other
/// than stderr and ``kept_fd``. The entry point runs in the child's copy of the parent's
/// address space, so anything it captures by reference must stay alive until ``start``
/// returns in the parent.
class WorkerProcess : public ProcessController
{
public:
    using EntryPoint = std::function<int()>;

    WorkerProcess(EntryPoint entry, int kept_fd);

    /// Kills and reaps a child that is still running
    ~WorkerProcess() override;

    Result<void> start();

    /// 0 before ``start``
    pid_t get_pid() const { return child_pid_; }

    /// Started and not yet reaped
    bool is_running() const { return child_pid_ != 0 && !exit_status_; }

    /// Set once the child has been reaped
    const std::optional<ExitStatus>& get_exit_status() const { return exit_status_; }

    /// Signals to a child that has already been reaped are dropped
    Result<void> send_signal(int signal_num) override;

    Result<ExitStatus> wait_for_exit(std::chrono::milliseconds timeout) override;

    Result<ExitStatus> wait_for_exit() override;

private:
    static constexpr std::chrono::milliseconds POLL_PERIOD{1};

    [[noreturn]] void run_child();

    /// Close every descriptor except stderr and kept_fd_
    Result<void> close_inherited_fds() const;

    EntryPoint entry_;
    int kept_fd_;

    pid_t parent_pid_ = 0;
    pid_t child_pid_ = 0;
    std::optional<ExitStatus> exit_status_;
};

} // namespace lunajudge
