#include <lunajudge/sandbox/syntax_validator.hpp>

#include <fmt/format.h>
#include <sol/sol.hpp>

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace lunajudge::sandbox {

LocatedMessage split_location(std::string_view lua_message) {
    // "=submission" is reported as just "submission"
    const std::string_view prefix = CHUNK_NAME.substr(1);

    if (!lua_message.starts_with(prefix) || !lua_message.substr(prefix.size()).starts_with(':')) {
        return {.line = std::nullopt, .message = std::string{lua_message}};
    }

    std::string_view rest = lua_message.substr(prefix.size() + 1);

    int line = 0;
    auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), line);

    if (ec != std::errc{} || ptr == rest.data() + rest.size() || *ptr != ':') {
        return {.line = std::nullopt, .message = std::string{lua_message}};
    }

    rest.remove_prefix(static_cast<std::size_t>(ptr - rest.data()) + 1);

    if (rest.starts_with(' ')) {
        rest.remove_prefix(1);
    }

    return {.line = line, .message = std::string{rest}};
}

Expected<void, ExecutionError> validate_syntax(std::string_view code) {
    // No libraries are opened; nothing is executed
    sol::state lua;

    sol::load_result res = lua.load(code, std::string{CHUNK_NAME}, sol::load_mode::text);

    if (res.valid()) {
        return {};
    }

    sol::error err = res;
    auto [line, message] = split_location(err.what());

    // Errors without a location (e.g. a binary chunk) are attributed to the first line
    int reported_line = line.value_or(1);

    return ExecutionError{.message = fmt::format("Line {}: {}", reported_line, message),
                          .kind = ExecutionError::Kind::Syntax,
                          .line = reported_line};
}

} // namespace lunajudge::sandbox
