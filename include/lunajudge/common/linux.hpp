#pragma once

#include <lunajudge/common/expected.hpp>
#include <lunajudge/logging.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace lunajudge::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// writes to a file descriptor. See write(2)
/// returns the number of bytes written; logs failure at debug level
inline Expected<std::size_t> write(int fd, std::span<const std::byte> data) {
    ssize_t res = ::write(fd, data.data(), data.size());

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("write failed: '{}'", err);
        return err;
    }

    return static_cast<std::size_t>(res);
}

/// writes all of ``data``, retrying on partial writes and EINTR
/// Called in forked children, so nothing is logged
inline Expected<> write_all(int fd, std::span<const std::byte> data) {
    while (!data.empty()) {
        ssize_t res = ::write(fd, data.data(), data.size());

        if (res == -1) {
            if (errno == EINTR) {
                continue;
            }
            return make_error_code(errno);
        }

        data = data.subspan(static_cast<std::size_t>(res));
    }

    return {};
}

/// reads up to ``buffer.size()`` bytes from a file descriptor. See read(2)
/// returns the number of bytes read (0 on EOF); logs failure at debug level
inline Expected<std::size_t> read(int fd, std::span<std::byte> buffer) {
    ssize_t res = ::read(fd, buffer.data(), buffer.size());

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("read failed: '{}'", err);
        return err;
    }

    DEBUG_ASSERT(res >= 0, "read result is negative and != -1");

    return static_cast<std::size_t>(res);
}

/// closes a file descriptor. See close(2)
/// returns success/failure; logs failure at debug level
inline Expected<> close(int fd) {
    int res = ::close(fd);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close failed: '{}'", err);
        return err;
    }

    return {};
}

/// closes every file descriptor in [first, last]. See close_range(2)
/// Called in forked children only, so nothing is logged
inline Expected<> close_range(unsigned int first, unsigned int last) {
    if (first > last) {
        return {};
    }

    // NOLINTNEXTLINE(*vararg)
    long res = ::syscall(SYS_close_range, first, last, 0U);

    if (res == -1) {
        return make_error_code(errno);
    }

    return {};
}

/// see kill(2)
/// returns success/failure; logs failure at debug level
inline Expected<> kill(pid_t pid, int sig) {
    int res = ::kill(pid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("kill failed: '{}'", err);
        return err;
    }

    return {};
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; // Only valid if which == Parent
};

/// see fork(2)
/// returns result from enum; logs failure at debug level
inline Expected<Fork> fork() {
    pid_t res = ::fork();

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fork failed: '{}'", err);
        return err;
    }

    if (res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = res};
}

/// see fcntl(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> fcntl(int fd, int cmd, int arg) {
    // NOLINTNEXTLINE(*vararg)
    int res = ::fcntl(fd, cmd, arg);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("fcntl failed: '{}'", err);

        return err;
    }

    return res;
}

/// see waitid(2)
/// returns success/failure; logs failure at debug level
/// With WNOHANG, a child that has not changed state yields ``si_pid == 0``
inline Expected<siginfo_t> waitid(idtype_t idtype, id_t id, int options = WEXITED) {
    siginfo_t info{};
    int res = ::waitid(idtype, id, &info, options);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("waitid failed: '{}'", err);

        return err;
    }

    return info;
}

/// see poll(2)
/// returns the ``revents`` of the single polled fd, or 0 on timeout
inline Expected<short> poll(int fd, short events, std::chrono::milliseconds timeout) {
    struct pollfd poll_struct = {.fd = fd, .events = events, .revents = 0};

    int res = ::poll(&poll_struct, 1, static_cast<int>(timeout.count()));

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("poll failed: '{}'", err);

        return err;
    }

    if (res == 0) {
        return short{0};
    }

    return poll_struct.revents;
}

/// see prctl(2)
/// Called in forked children only, so nothing is logged
inline Expected<> prctl(int option, unsigned long arg) { // NOLINT(google-runtime-int)
    // NOLINTNEXTLINE(*vararg)
    int res = ::prctl(option, arg, 0UL, 0UL, 0UL);

    if (res == -1) {
        return make_error_code(errno);
    }

    return {};
}

struct Pipe
{
    int read_fd;
    int write_fd;
};

// Ensure that fds are packed so that pipe works properly
static_assert(offsetof(Pipe, read_fd) + sizeof(Pipe::read_fd) == offsetof(Pipe, write_fd));

/// see pipe2(2)
/// returns success/failure; logs failure at debug level
inline Expected<Pipe> pipe2(int flags = 0) {
    Pipe pipe{};

    int res = ::pipe2(&pipe.read_fd, flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("pipe failed: '{}'", err);

        return err;
    }

    return pipe;
}

/// see getpid(2)
/// this function "cannot fail" according to the manpage. This wrapper is provided
/// just for consistency.
inline pid_t getpid() {
    return ::getpid();
}

/// Human-readable name of a signal, e.g. "Killed"
inline std::string signal_description(int signal_num) {
    const char* descr = sigdescr_np(signal_num);
    return descr != nullptr ? descr : fmt::format("signal {}", signal_num);
}

} // namespace lunajudge::linux
