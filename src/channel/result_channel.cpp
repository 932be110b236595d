#include <lunajudge/channel/result_channel.hpp>
#include <lunajudge/common/error_types.hpp>
#include <lunajudge/common/linux.hpp>
#include <lunajudge/logging.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>

namespace lunajudge {

Result<ResultChannel> ResultChannel::create() {
    linux::Pipe pipe = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);

    return ResultChannel{pipe};
}

ResultChannel::ResultChannel(ResultChannel&& other) noexcept
    : pipe_{std::exchange(other.pipe_, {.read_fd = -1, .write_fd = -1})} {}

ResultChannel& ResultChannel::operator=(ResultChannel&& rhs) noexcept {
    std::ignore = close_read_end();
    std::ignore = close_write_end();

    pipe_ = std::exchange(rhs.pipe_, {.read_fd = -1, .write_fd = -1});

    return *this;
}

ResultChannel::~ResultChannel() {
    std::ignore = close_read_end();
    std::ignore = close_write_end();
}

Result<void> ResultChannel::close_write_end() {
    if (pipe_.write_fd != -1) {
        int fd = std::exchange(pipe_.write_fd, -1);
        TRYE(linux::close(fd), SyscallFailure);
    }

    return {};
}

Result<void> ResultChannel::close_read_end() {
    if (pipe_.read_fd != -1) {
        int fd = std::exchange(pipe_.read_fd, -1);
        TRYE(linux::close(fd), SyscallFailure);
    }

    return {};
}

Result<void> ResultChannel::send(std::span<const std::uint8_t> payload) {
    if (payload.size() > MAX_PAYLOAD_SIZE) {
        return ErrorKind::MalformedMessage;
    }

    const auto length = static_cast<std::uint32_t>(payload.size());
    std::array<std::byte, HEADER_SIZE> header{};

    for (std::size_t i = 0; i < HEADER_SIZE; ++i) {
        header.at(i) = static_cast<std::byte>((length >> (8 * i)) & 0xFFU);
    }

    TRYE(linux::write_all(pipe_.write_fd, header), SyscallFailure);
    TRYE(linux::write_all(pipe_.write_fd, std::as_bytes(payload)), SyscallFailure);

    return {};
}

Result<std::size_t> ResultChannel::read_exact(std::span<std::byte> buffer, Deadline deadline) {
    using std::chrono::steady_clock;

    std::size_t total = 0;

    while (total < buffer.size()) {
        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - steady_clock::now());

        if (remaining.count() <= 0) {
            return ErrorKind::TimedOut;
        }

        auto revents = linux::poll(pipe_.read_fd, POLLIN, remaining);

        if (!revents) {
            if (revents.error() == std::errc::interrupted) {
                continue;
            }
            return ErrorKind::SyscallFailure;
        }

        // Poll timed out; the deadline check above ends the loop
        if (revents.value() == 0) {
            continue;
        }

        auto num_read = linux::read(pipe_.read_fd, buffer.subspan(total));

        if (!num_read) {
            if (num_read.error() == std::errc::interrupted) {
                continue;
            }
            return ErrorKind::SyscallFailure;
        }

        // End of file
        if (num_read.value() == 0) {
            break;
        }

        total += num_read.value();
    }

    return total;
}

Result<std::vector<std::uint8_t>> ResultChannel::receive(Deadline deadline) {
    std::array<std::byte, HEADER_SIZE> header{};

    std::size_t header_read = TRY(read_exact(header, deadline));

    if (header_read == 0) {
        return ErrorKind::WorkerVanished;
    }

    if (header_read < HEADER_SIZE) {
        LOG_WARN("Result channel closed after {} header bytes", header_read);
        return ErrorKind::MalformedMessage;
    }

    std::uint32_t length = 0;
    for (std::size_t i = 0; i < HEADER_SIZE; ++i) {
        length |= std::to_integer<std::uint32_t>(header.at(i)) << (8 * i);
    }

    if (length > MAX_PAYLOAD_SIZE) {
        LOG_WARN("Result frame announces an implausible payload of {} bytes", length);
        return ErrorKind::MalformedMessage;
    }

    std::vector<std::uint8_t> payload(length);

    std::size_t payload_read = TRY(read_exact(std::as_writable_bytes(std::span{payload}), deadline));

    if (payload_read < length) {
        LOG_WARN("Result channel closed after {} of {} payload bytes", payload_read, length);
        return ErrorKind::MalformedMessage;
    }

    LOG_TRACE("Received result frame of {} bytes", length);

    return payload;
}

} // namespace lunajudge
