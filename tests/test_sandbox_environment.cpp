#include "catch2_custom.hpp"

#include "lua_helpers.hpp"

#include <lunajudge/sandbox/capabilities.hpp>
#include <lunajudge/sandbox/lua_convert.hpp>
#include <lunajudge/sandbox/sandbox_environment.hpp>

#include <sol/sol.hpp>

#include <memory>
#include <string>
#include <string_view>

using lunajudge::sandbox::build_sandbox_context;
using lunajudge::sandbox::CAPABILITIES;
using lunajudge::sandbox::describe;
using lunajudge::sandbox::describe_exception;

namespace {

constexpr std::size_t MIB = std::size_t{1024} * 1024;

} // namespace

TEST_CASE("Everything in the capability table is bound") {
    auto sandbox = build_sandbox_context(0);

    for (std::string_view name : CAPABILITIES.base_functions) {
        INFO(name);
        REQUIRE(eval_sandboxed(*sandbox, std::string{"type("} + std::string{name} + ")").as<std::string>() ==
                "function");
    }

    for (const auto& library : CAPABILITIES.libraries) {
        for (std::string_view member : library.members) {
            INFO(library.name << "." << member);
            std::string expr = std::string{library.name} + "." + std::string{member} + " ~= nil";
            REQUIRE(eval_sandboxed(*sandbox, expr).as<bool>());
        }
    }

    for (std::string_view name : CAPABILITIES.host_builtins) {
        INFO(name);
        REQUIRE(eval_sandboxed(*sandbox, std::string{"type("} + std::string{name} + ")").as<std::string>() ==
                "function");
    }

    for (const auto& exception : CAPABILITIES.exception_types) {
        INFO(exception.name);
        REQUIRE(eval_sandboxed(*sandbox, std::string{exception.name} + ".__name").as<std::string>() == exception.name);
    }

    REQUIRE(eval_sandboxed(*sandbox, "unpack({4, 5, 6})").as<int>() == 4);
}

TEST_CASE("Dangerous bindings do not exist") {
    auto sandbox = build_sandbox_context(0);

    auto name = GENERATE(as<std::string>{}, "io", "os", "package", "require", "debug", "load", "loadfile", "dofile",
                         "loadstring", "collectgarbage", "getmetatable", "print", "coroutine", "_G", "string.dump",
                         "math.random", "math.randomseed", "('').dump");

    INFO(name);
    REQUIRE(eval_sandboxed(*sandbox, name).get_type() == sol::type::lua_nil);
}

TEST_CASE("String methods go through the restricted string table") {
    auto sandbox = build_sandbox_context(0);

    REQUIRE(eval_sandboxed(*sandbox, "('abc'):upper()").as<std::string>() == "ABC");
    REQUIRE(eval_sandboxed(*sandbox, "('%d-%s'):format(4, 'x')").as<std::string>() == "4-x");
}

TEST_CASE("Calling a missing global is an error inside the sandbox") {
    auto sandbox = build_sandbox_context(0);

    auto err = error_of_sandboxed(*sandbox, "io.open('/etc/passwd')");
    REQUIRE_THAT(describe(err), Catch::Matchers::ContainsSubstring("global 'io'"));
}

TEST_CASE("Sandboxes share nothing") {
    auto first = build_sandbox_context(0);
    auto second = build_sandbox_context(0);

    run_sandboxed(*first, "leaked = 1; string.upper = nil");

    REQUIRE(eval_sandboxed(*second, "leaked").get_type() == sol::type::lua_nil);
    REQUIRE(eval_sandboxed(*second, "string.upper('a')").as<std::string>() == "A");
}

TEST_CASE("isinstance checks type names") {
    auto sandbox = build_sandbox_context(0);

    REQUIRE(eval_sandboxed(*sandbox, "isinstance(1, 'integer')").as<bool>());
    REQUIRE(eval_sandboxed(*sandbox, "isinstance(1, 'number')").as<bool>());
    REQUIRE_FALSE(eval_sandboxed(*sandbox, "isinstance(1, 'float')").as<bool>());
    REQUIRE(eval_sandboxed(*sandbox, "isinstance(1.5, 'float')").as<bool>());
    REQUIRE(eval_sandboxed(*sandbox, "isinstance('s', 'string')").as<bool>());
    REQUIRE(eval_sandboxed(*sandbox, "isinstance({}, 'table')").as<bool>());
    REQUIRE(eval_sandboxed(*sandbox, "isinstance(nil, 'nil')").as<bool>());
    REQUIRE(eval_sandboxed(*sandbox, "isinstance(print, 'nil')").as<bool>());
    REQUIRE(eval_sandboxed(*sandbox, "isinstance(pairs, 'function')").as<bool>());
    REQUIRE_FALSE(eval_sandboxed(*sandbox, "isinstance(true, 'number')").as<bool>());

    auto err = error_of_sandboxed(*sandbox, "return isinstance(1, 'widget')");
    REQUIRE_THAT(describe(err), Catch::Matchers::ContainsSubstring("bad argument #2 to 'isinstance'"));
}

TEST_CASE("Exception types") {
    auto sandbox = build_sandbox_context(0);

    SECTION("Instances know their type and base") {
        REQUIRE(eval_sandboxed(*sandbox, "isinstance(ValueError('x'), ValueError)").as<bool>());
        REQUIRE(eval_sandboxed(*sandbox, "isinstance(ValueError('x'), Exception)").as<bool>());
        REQUIRE_FALSE(eval_sandboxed(*sandbox, "isinstance(ValueError('x'), TypeError)").as<bool>());
        REQUIRE_FALSE(eval_sandboxed(*sandbox, "isinstance(Exception('x'), ValueError)").as<bool>());
        REQUIRE_FALSE(eval_sandboxed(*sandbox, "isinstance({}, Exception)").as<bool>());
        REQUIRE_FALSE(eval_sandboxed(*sandbox, "isinstance(setmetatable({}, {__index = KeyError}), KeyError)").as<bool>());
    }

    SECTION("Raised and caught with pcall") {
        auto res = run_sandboxed(*sandbox, R"(
            local ok, err = pcall(function() error(KeyError("missing")) end)
            assert(not ok)
            assert(isinstance(err, KeyError))
            return err.message .. "|" .. tostring(err)
        )");

        REQUIRE(res.as<std::string>() == "missing|KeyError: missing");
    }

    SECTION("Described for reporting") {
        REQUIRE(describe_exception(eval_sandboxed(*sandbox, "ZeroDivisionError('nope')")) == "ZeroDivisionError: nope");
        REQUIRE(describe_exception(eval_sandboxed(*sandbox, "StopIteration()")) == "StopIteration");
        REQUIRE(describe_exception(eval_sandboxed(*sandbox, "IndexError(3)")) == "IndexError: 3");
        REQUIRE_FALSE(describe_exception(eval_sandboxed(*sandbox, "'just text'")).has_value());
        REQUIRE_FALSE(describe_exception(eval_sandboxed(*sandbox, "{message = 'fake'}")).has_value());
    }
}

TEST_CASE("hasattr") {
    auto sandbox = build_sandbox_context(0);

    REQUIRE(eval_sandboxed(*sandbox, "hasattr({a = 1}, 'a')").as<bool>());
    REQUIRE_FALSE(eval_sandboxed(*sandbox, "hasattr({a = 1}, 'b')").as<bool>());
    REQUIRE(eval_sandboxed(*sandbox, "hasattr({10}, 1)").as<bool>());
    REQUIRE(eval_sandboxed(*sandbox, "hasattr('abc', 'upper')").as<bool>());
    REQUIRE_FALSE(eval_sandboxed(*sandbox, "hasattr('abc', 'dump')").as<bool>());
    REQUIRE_FALSE(eval_sandboxed(*sandbox, "hasattr(5, 'x')").as<bool>());
    REQUIRE(eval_sandboxed(*sandbox, "hasattr(ValueError('x'), 'message')").as<bool>());
}

TEST_CASE("The interpreter heap is limited") {
    auto sandbox = build_sandbox_context(4 * MIB);

    auto err = error_of_sandboxed(*sandbox, "local t = {} for i = 1, 1e8 do t[i] = i end");

    REQUIRE_THAT(describe(err), Catch::Matchers::ContainsSubstring("not enough memory"));
    REQUIRE(sandbox->budget().used() <= 4 * MIB);
    REQUIRE(sandbox->budget().limit() == 4 * MIB);
}

TEST_CASE("A zero limit means unlimited") {
    auto sandbox = build_sandbox_context(0);

    run_sandboxed(*sandbox, "local t = {} for i = 1, 1e6 do t[i] = i end");

    REQUIRE(sandbox->budget().used() > 0);
}
