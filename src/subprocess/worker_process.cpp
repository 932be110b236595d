#include <lunajudge/common/error_types.hpp>
#include <lunajudge/common/expected.hpp>
#include <lunajudge/common/linux.hpp>
#include <lunajudge/logging.hpp>
#include <lunajudge/subprocess/worker_process.hpp>

#include <gsl/util>
#include <libassert/assert.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <climits>
#include <cstdlib>
#include <system_error>
#include <thread>
#include <tuple>
#include <utility>

#include <signal.h>
#include <sys/prctl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace lunajudge {

WorkerProcess::WorkerProcess(EntryPoint entry, int kept_fd)
    : entry_{std::move(entry)}
    , kept_fd_{kept_fd} {
    ASSERT(kept_fd_ >= 0, "The kept descriptor must be open", kept_fd_);
}

WorkerProcess::~WorkerProcess() {
    if (!is_running()) {
        return;
    }

    LOG_DEBUG("Worker {} still running on destruction; killing it", child_pid_);

    std::ignore = send_signal(SIGKILL);
    std::ignore = wait_for_exit();
}

Result<void> WorkerProcess::start() {
    ASSERT(child_pid_ == 0, "A WorkerProcess can only be started once");

    parent_pid_ = linux::getpid();

    linux::Fork fork_res = TRYE(linux::fork(), SyscallFailure);

    if (fork_res.which == linux::Fork::Child) {
        run_child();
    }

    child_pid_ = fork_res.pid;

    return {};
}

void WorkerProcess::run_child() {
    // Nothing in here may log: another thread of the parent could have held the logger's lock at fork time

    if (!linux::prctl(PR_SET_PDEATHSIG, SIGKILL)) {
        std::_Exit(EXIT_FAILURE);
    }

    // The parent may have died before the death signal was armed
    if (::getppid() != parent_pid_) {
        std::_Exit(EXIT_FAILURE);
    }

    if (!close_inherited_fds()) {
        std::_Exit(EXIT_FAILURE);
    }

    // _Exit, so that the parent's atexit handlers and static destructors are not run a second time
    std::_Exit(entry_());
}

Result<void> WorkerProcess::close_inherited_fds() const {
    std::array<unsigned int, 2> kept{static_cast<unsigned int>(STDERR_FILENO), static_cast<unsigned int>(kept_fd_)};
    std::sort(kept.begin(), kept.end());

    unsigned int first = 0;

    for (unsigned int fd : kept) {
        if (fd > first) {
            TRYE(linux::close_range(first, fd - 1), SyscallFailure);
        }
        first = std::max(first, fd + 1);
    }

    TRYE(linux::close_range(first, UINT_MAX), SyscallFailure);

    return {};
}

Result<void> WorkerProcess::send_signal(int signal_num) {
    if (!is_running()) {
        return {};
    }

    LOG_TRACE("Sending signal {} to worker {}", signal_num, child_pid_);

    TRYE(linux::kill(child_pid_, signal_num), SyscallFailure);

    return {};
}

Result<ExitStatus> WorkerProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    using std::chrono::steady_clock;

    if (exit_status_) {
        return exit_status_.value();
    }

    ASSERT(child_pid_ != 0, "Attempt to wait for a worker that was never started");

    const auto start_time = steady_clock::now();

    // Checked at least once, even with a zero timeout
    do {
        siginfo_t info = TRYE(linux::waitid(P_PID, gsl::narrow_cast<id_t>(child_pid_), WEXITED | WNOHANG),
                              SyscallFailure);

        // si_pid will only be 0 if waitid returned early from WNOHANG
        // see waitid(2)
        if (info.si_pid != 0) {
            exit_status_ = ExitStatus::from_siginfo(info);
            LOG_DEBUG("Worker {} {}", child_pid_, exit_status_.value());
            return exit_status_.value();
        }

        std::this_thread::sleep_for(POLL_PERIOD);
    } while (steady_clock::now() - start_time < timeout);

    LOG_DEBUG("Worker {} still running after {}", child_pid_, timeout);

    return ErrorKind::TimedOut;
}

Result<ExitStatus> WorkerProcess::wait_for_exit() {
    if (exit_status_) {
        return exit_status_.value();
    }

    ASSERT(child_pid_ != 0, "Attempt to wait for a worker that was never started");

    while (true) {
        auto info = linux::waitid(P_PID, gsl::narrow_cast<id_t>(child_pid_), WEXITED);

        if (info) {
            exit_status_ = ExitStatus::from_siginfo(info.value());
            LOG_DEBUG("Worker {} {}", child_pid_, exit_status_.value());
            return exit_status_.value();
        }

        if (info.error() != std::errc::interrupted) {
            return ErrorKind::SyscallFailure;
        }
    }
}

} // namespace lunajudge
