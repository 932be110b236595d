#include <lunajudge/channel/result_channel.hpp>
#include <lunajudge/common/expected.hpp>
#include <lunajudge/sandbox/lua_convert.hpp>
#include <lunajudge/sandbox/sandbox_environment.hpp>
#include <lunajudge/sandbox/syntax_validator.hpp>
#include <lunajudge/worker/worker.hpp>

#include <fmt/format.h>
#include <lua.hpp>
#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <sol/sol.hpp>

#include <array>
#include <cstdint>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <memory>
#include <new>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lunajudge {

namespace {

struct ErrorPattern
{
    std::string_view fragment;
    std::string_view kind;
};

// First match wins
constexpr std::array<ErrorPattern, 7> ERROR_PATTERNS{{
    {.fragment = "attempt to perform 'n//0'", .kind = "ZeroDivisionError"},
    {.fragment = "attempt to perform 'n%0'", .kind = "ZeroDivisionError"},
    {.fragment = "a nil value (global '", .kind = "NameError"},
    {.fragment = "not enough memory", .kind = "MemoryError"},
    {.fragment = "stack overflow", .kind = "RecursionError"},
    {.fragment = "attempt to", .kind = "TypeError"},
    {.fragment = "bad argument", .kind = "TypeError"},
}};

WorkerFailure runtime_failure(std::string message) {
    return {.error_class = ErrorClass::Runtime, .message = std::move(message)};
}

WorkerFailure failure_from_error_object(const sol::object& error) {
    if (auto described = sandbox::describe_exception(error)) {
        return runtime_failure(std::move(*described));
    }

    return runtime_failure(classify_error_message(sandbox::describe(error)));
}

struct ParameterList
{
    std::vector<std::string> names;
    bool is_native = false;
};

ParameterList parameter_list(const sol::protected_function& func) {
    lua_State* lua = func.lua_state();
    lua_Debug info{};

    func.push(lua);

    // '>' consumes the copy; the original stays on top for lua_getlocal
    lua_pushvalue(lua, -1);
    lua_getinfo(lua, ">Su", &info);

    ParameterList res{.names = {}, .is_native = std::string_view{info.what} == "C"};

    for (int i = 1; i <= static_cast<int>(info.nparams); ++i) {
        const char* name = lua_getlocal(lua, nullptr, i);
        res.names.emplace_back(name != nullptr ? name : "");
    }

    lua_pop(lua, 1);

    return res;
}

/// Match the input mapping against the function's declared parameter names
Expected<std::vector<sol::object>, WorkerFailure> bind_arguments(sol::state& lua, const sol::protected_function& func,
                                                                 std::string_view function_name, const Mapping& input) {
    ParameterList params = parameter_list(func);

    if (params.is_native) {
        if (!input.empty()) {
            return runtime_failure(
                fmt::format("TypeError: {}() is a builtin and cannot take named arguments", function_name));
        }
        return std::vector<sol::object>{};
    }

    for (const auto& entry : input) {
        if (ranges::find(params.names, entry.first) == params.names.end()) {
            return runtime_failure(
                fmt::format("TypeError: {}() got an unexpected keyword argument '{}'", function_name, entry.first));
        }
    }

    std::vector<sol::object> args;
    args.reserve(params.names.size());

    for (const std::string& name : params.names) {
        auto iter = input.find(name);

        if (iter == input.end()) {
            return runtime_failure(fmt::format("TypeError: {}() missing argument '{}'", function_name, name));
        }

        args.push_back(sandbox::to_lua(lua, iter->second));
    }

    return args;
}

WorkerOutcome run_worker_impl(const WorkerRequest& request) {
    // Declared first so every Lua reference below is released before the state closes
    std::unique_ptr<sandbox::SandboxEnvironment> sandbox = sandbox::build_sandbox_context(request.memory_limit_bytes);
    sol::state& lua = sandbox->lua();

    sol::load_result chunk = lua.load(request.code, std::string{sandbox::CHUNK_NAME}, sol::load_mode::text);

    if (!chunk.valid()) {
        sol::error err = chunk;
        auto [line, message] = sandbox::split_location(err.what());

        return WorkerFailure{.error_class = ErrorClass::Syntax,
                             .message = fmt::format("Line {}: {}", line.value_or(1), message)};
    }

    sol::protected_function definitions = chunk;
    sol::set_environment(sandbox->scope(), definitions);

    {
        sol::protected_function_result defined = definitions();

        if (!defined.valid()) {
            return failure_from_error_object(defined.get<sol::object>());
        }
    }

    auto target = sandbox->scope().get<sol::object>(request.function_name);

    if (!target.valid() || target.get_type() == sol::type::lua_nil) {
        return WorkerFailure{.error_class = ErrorClass::NameNotFound,
                             .message = fmt::format("Function '{}' not found in code", request.function_name)};
    }

    if (target.get_type() != sol::type::function) {
        return runtime_failure(fmt::format("TypeError: '{}' is a {}, not a function", request.function_name,
                                           lua_typename(lua.lua_state(), static_cast<int>(target.get_type()))));
    }

    auto func = target.as<sol::protected_function>();

    auto args = bind_arguments(lua, func, request.function_name, request.input);
    if (!args) {
        return args.error();
    }

    using std::chrono::steady_clock;
    const auto start_time = steady_clock::now();

    sol::protected_function_result returned = func(sol::as_args(args.value()));

    const auto elapsed_ms = std::chrono::duration<double, std::milli>(steady_clock::now() - start_time).count();

    if (!returned.valid()) {
        return failure_from_error_object(returned.get<sol::object>());
    }

    sol::object first = returned.return_count() > 0 ? returned.get<sol::object>(0) : sol::make_object(lua, sol::lua_nil);

    auto value = sandbox::from_lua(first);
    if (!value) {
        return runtime_failure(fmt::format("TypeError: cannot return from '{}': {}", request.function_name,
                                           value.error().message));
    }

    return WorkerSuccess{.return_value = std::move(value).value(), .elapsed_ms = elapsed_ms};
}

} // namespace

std::string classify_error_message(std::string_view message) {
    auto match = ranges::find_if(ERROR_PATTERNS, [message](const ErrorPattern& pattern) {
        return message.find(pattern.fragment) != std::string_view::npos;
    });

    std::string_view kind = match != ERROR_PATTERNS.end() ? match->kind : "RuntimeError";

    return fmt::format("{}: {}", kind, message);
}

WorkerOutcome run_worker(const WorkerRequest& request) {
    try {
        return run_worker_impl(request);
    } catch (const std::bad_alloc&) {
        return runtime_failure("MemoryError: not enough memory");
    } catch (const std::exception& ex) {
        // sol2 turns errors raised outside of a protected call into exceptions
        return runtime_failure(classify_error_message(ex.what()));
    }
}

int worker_main(const WorkerRequest& request, ResultChannel& channel) {
    std::vector<std::uint8_t> payload = encode_outcome(run_worker(request));

    // A value that cannot be framed is the submission's fault, not a lost worker
    if (payload.size() > ResultChannel::MAX_PAYLOAD_SIZE) {
        payload = encode_outcome(runtime_failure(std::string{OVERSIZED_RESULT_MESSAGE}));
    }

    if (!channel.send(payload)) {
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

} // namespace lunajudge
