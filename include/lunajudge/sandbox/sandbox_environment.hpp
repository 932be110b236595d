/// \file
/// The restricted scope that submitted code runs in
#pragma once

#include <lunajudge/common/class_traits.hpp>

#include <sol/sol.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace lunajudge::sandbox {

/// Heap accounting for a single Lua state.
///
/// ``allocate`` has the signature of ``lua_Alloc``, with a MemoryBudget as its userdata.
/// An allocation that would take the total above the limit fails, which Lua reports
/// as a "not enough memory" error. A limit of 0 disables the check.
class MemoryBudget : NonMovable
{
public:
    explicit MemoryBudget(std::size_t limit_bytes)
        : limit_{limit_bytes} {}

    static void* allocate(void* userdata, void* ptr, std::size_t old_size, std::size_t new_size) noexcept;

    std::size_t limit() const { return limit_; }

    std::size_t used() const { return used_; }

private:
    std::size_t limit_;
    std::size_t used_ = 0;
};

/// A Lua state together with the scope built for it from the capability table.
///
/// The state's own globals hold the full standard libraries and are never reachable from
/// submitted code; code is given ``scope()`` as its ``_ENV``.
class SandboxEnvironment : NonMovable
{
public:
    explicit SandboxEnvironment(std::size_t memory_limit_bytes);

    sol::state& lua() { return lua_; }

    sol::environment& scope() { return scope_; }

    const MemoryBudget& budget() const { return budget_; }

private:
    void bind_base_functions();
    void bind_libraries();
    void bind_host_builtins();
    void bind_exception_types();

    // Must outlive lua_
    MemoryBudget budget_;
    sol::state lua_;
    sol::environment scope_;
};

/// Build a fresh sandbox whose interpreter heap is limited to ``memory_limit_bytes`` (0 = unlimited)
std::unique_ptr<SandboxEnvironment> build_sandbox_context(std::size_t memory_limit_bytes);

/// Whether ``obj`` is one of the sandbox's exception types (not an instance of one)
bool is_exception_type(const sol::object& obj);

/// Whether ``value`` is an instance of exception type ``type`` or of a type derived from it
bool is_exception_instance(const sol::object& value, const sol::table& type);

/// ``"<TypeName>: <message>"`` (or just the type name for an empty message) if ``obj`` is an
/// exception instance; nullopt otherwise
std::optional<std::string> describe_exception(const sol::object& obj);

} // namespace lunajudge::sandbox
