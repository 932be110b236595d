#pragma once

#include <lunajudge/common/expected.hpp>
#include <lunajudge/execution_result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace lunajudge::sandbox {

/// Chunk name given to submitted code. Lua prefixes its messages with "submission:<line>:"
inline constexpr std::string_view CHUNK_NAME = "=submission";

/// A Lua error message split into its source location and the message proper
struct LocatedMessage
{
    std::optional<int> line;
    std::string message;
};

/// Split a "submission:<line>: <message>" string. Messages from other chunks, or with
/// no location at all, are returned unchanged with no line
LocatedMessage split_location(std::string_view lua_message);

/// Compile ``code`` as a text chunk in a bare interpreter without running it.
///
/// Fails with ``ExecutionError{kind = Syntax}`` and the message ``"Line <n>: <parser message>"``.
/// Precompiled chunks are rejected. Empty code is valid.
Expected<void, ExecutionError> validate_syntax(std::string_view code);

} // namespace lunajudge::sandbox
