#include <lunajudge/executor_config.hpp>

#include <lunajudge/common/error_types.hpp>
#include <lunajudge/logging.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace lunajudge {

namespace {

/// Reads a non-negative integer from the environment. nullopt if unset
Expected<std::optional<int>, std::string> read_int_env(const char* name) {
    const char* raw = std::getenv(name);

    if (raw == nullptr) {
        return std::optional<int>{};
    }

    std::string_view str{raw};
    int parsed{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), parsed);

    if (ec != std::errc{} || ptr != str.data() + str.size()) {
        return fmt::format("{}={:?} is not an integer", name, str);
    }

    return std::optional<int>{parsed};
}

} // namespace

Expected<void, std::string> ExecutorConfig::validate() const {
    if (timeout <= std::chrono::milliseconds::zero()) {
        return fmt::format("timeout must be positive (got {})", timeout);
    }

    if (grace_period < std::chrono::milliseconds::zero()) {
        return fmt::format("grace period must not be negative (got {})", grace_period);
    }

    if (memory_limit_mb < 0) {
        return fmt::format("memory limit must not be negative (got {} MiB)", memory_limit_mb);
    }

    return {};
}

Expected<ExecutorConfig, std::string> ExecutorConfig::from_environment() {
    ExecutorConfig config;

    auto timeout_sec = TRY(read_int_env(TIMEOUT_ENV_VAR));
    auto memory_limit_mb = TRY(read_int_env(MEMORY_LIMIT_ENV_VAR));

    if (timeout_sec) {
        config.timeout = std::chrono::seconds{*timeout_sec};
    }
    if (memory_limit_mb) {
        config.memory_limit_mb = *memory_limit_mb;
    }

    TRY(config.validate());

    LOG_DEBUG("Executor config from environment: {}", config);

    return config;
}

} // namespace lunajudge
