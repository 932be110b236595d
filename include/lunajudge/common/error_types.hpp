#pragma once

#include <lunajudge/common/expected.hpp>
#include <lunajudge/common/formatters.hpp>

#include <boost/preprocessor/cat.hpp>

namespace lunajudge {

// NOLINTNEXTLINE
enum class ErrorKind {
    TimedOut,         ///< Operation surpassed its deadline (generally the per-test timeout)
    SyscallFailure,   ///< A Linux syscall failed
    WorkerVanished,   ///< A worker exited without writing anything to its result channel
    MalformedMessage, ///< A result channel frame was truncated or could not be decoded
    UnknownError,     ///< As named; use this as little as possible

    MaxErrorNum // Not a proper error; used to determine the number of errors
};

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace lunajudge

LUNAJUDGE_FORMAT_ENUM(lunajudge::ErrorKind, TimedOut, SyscallFailure, WorkerVanished, MalformedMessage, UnknownError,
                      MaxErrorNum);

/// If the supplied argument is an error (unexpected) type, then propagate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        const auto& ident = val;                                                                                       \
        if (!ident.has_value()) {                                                                                      \
            using enum ::lunajudge::ErrorKind;                                                                         \
            return e;                                                                                                  \
        }                                                                                                              \
        ident.value();                                                                                                 \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propagate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
