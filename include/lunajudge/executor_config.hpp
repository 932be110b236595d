#pragma once

#include <lunajudge/common/expected.hpp>
#include <lunajudge/common/formatters.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>
#include <cstddef>
#include <string>

namespace lunajudge {

/// Limits applied to every test case run by an Executor. Fixed for the Executor's lifetime
struct ExecutorConfig
{
    /// Wall-clock limit for a single test case
    std::chrono::milliseconds timeout = DEFAULT_TIMEOUT;

    /// Heap budget of the worker's Lua interpreter, in MiB. 0 = unlimited
    int memory_limit_mb = DEFAULT_MEMORY_LIMIT_MB;

    /// How long a worker is given to exit after SIGTERM before it is sent SIGKILL
    std::chrono::milliseconds grace_period = DEFAULT_GRACE_PERIOD;

    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT = std::chrono::seconds{5};
    static constexpr int DEFAULT_MEMORY_LIMIT_MB = 256;
    static constexpr std::chrono::milliseconds DEFAULT_GRACE_PERIOD = std::chrono::seconds{1};

    static constexpr const char* TIMEOUT_ENV_VAR = "LUNAJUDGE_TIMEOUT_SEC";
    static constexpr const char* MEMORY_LIMIT_ENV_VAR = "LUNAJUDGE_MEMORY_LIMIT_MB";

    std::size_t memory_limit_bytes() const { return static_cast<std::size_t>(memory_limit_mb) * 1024 * 1024; }

    /// Verify that all fields are valid
    Expected<void, std::string> validate() const;

    /// Defaults, overridden by LUNAJUDGE_TIMEOUT_SEC and LUNAJUDGE_MEMORY_LIMIT_MB when set.
    /// Malformed variables are reported rather than ignored
    static Expected<ExecutorConfig, std::string> from_environment();
};

} // namespace lunajudge

template <>
struct fmt::formatter<::lunajudge::ExecutorConfig> : ::lunajudge::DebugFormatter
{
    template <typename FormatContext>
    auto format(const ::lunajudge::ExecutorConfig& from, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "ExecutorConfig{{timeout={}, memory_limit_mb={}, grace_period={}}}",
                              from.timeout, from.memory_limit_mb, from.grace_period);
    }
};
