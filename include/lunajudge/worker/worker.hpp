/// \file
/// What runs inside a worker process: load the submitted code into a sandbox, call the
/// requested function with the test case's arguments, and describe the outcome.
#pragma once

#include <lunajudge/value/value.hpp>
#include <lunajudge/worker/worker_outcome.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace lunajudge {

class ResultChannel;

struct WorkerRequest
{
    std::string code;
    std::string function_name;

    /// Arguments keyed by parameter name; owned by the request so the worker shares nothing with its parent
    Mapping input;

    /// Interpreter heap budget; 0 = unlimited
    std::size_t memory_limit_bytes = 0;
};

/// Run ``request`` in the calling process.
///
/// Every error, including C++ exceptions raised while driving the interpreter, is reported
/// as a WorkerFailure. Does not log, as it normally runs in a forked child.
WorkerOutcome run_worker(const WorkerRequest& request);

/// Prefix a Lua error message with the kind of error it describes, e.g.
/// ``"submission:2: attempt to perform 'n//0'"`` -> ``"ZeroDivisionError: submission:2: attempt to perform 'n//0'"``
std::string classify_error_message(std::string_view message);

/// Reported instead of a return value whose encoding exceeds ResultChannel::MAX_PAYLOAD_SIZE
inline constexpr std::string_view OVERSIZED_RESULT_MESSAGE = "MemoryError: return value too large to report";

/// Entry point of a worker process. Sends the outcome of ``run_worker`` through ``channel``
/// and returns the process exit code
int worker_main(const WorkerRequest& request, ResultChannel& channel);

} // namespace lunajudge
