/// \file
/// One-shot, framed transport of a worker's outcome to its supervisor.
///
/// A frame is the payload length as 4 little-endian bytes followed by the payload.
#pragma once

#include <lunajudge/common/class_traits.hpp>
#include <lunajudge/common/error_types.hpp>
#include <lunajudge/common/linux.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace lunajudge {

class ResultChannel : NonCopyable
{
public:
    static constexpr std::size_t HEADER_SIZE = 4;

    /// Larger frames are treated as corrupt
    static constexpr std::size_t MAX_PAYLOAD_SIZE = std::size_t{64} * 1024 * 1024;

    using Deadline = std::chrono::steady_clock::time_point;

    static Result<ResultChannel> create();

    ResultChannel(ResultChannel&& other) noexcept;
    ResultChannel& operator=(ResultChannel&& rhs) noexcept;

    ~ResultChannel();

    int read_fd() const { return pipe_.read_fd; }

    int write_fd() const { return pipe_.write_fd; }

    /// Supervisor side, right after the fork, so that the worker's exit is seen as end-of-file
    Result<void> close_write_end();

    Result<void> close_read_end();

    /// Write one frame. Blocks until the whole frame is in the pipe; never logs, as it runs in the worker
    Result<void> send(std::span<const std::uint8_t> payload);

    /// Read one frame, waiting no later than ``deadline``
    ///
    /// Errors:
    ///   TimedOut         - the deadline passed before a full frame arrived
    ///   WorkerVanished   - the write end was closed without a single byte being written
    ///   MalformedMessage - the write end was closed mid-frame, or the header is implausible
    ///   SyscallFailure   - poll or read failed
    Result<std::vector<std::uint8_t>> receive(Deadline deadline);

private:
    explicit ResultChannel(linux::Pipe pipe)
        : pipe_{pipe} {}

    /// Read until ``buffer`` is full or end-of-file; returns the number of bytes read
    Result<std::size_t> read_exact(std::span<std::byte> buffer, Deadline deadline);

    linux::Pipe pipe_{.read_fd = -1, .write_fd = -1};
};

} // namespace lunajudge
