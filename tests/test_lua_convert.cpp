#include "catch2_custom.hpp"

#include "lua_helpers.hpp"

#include <lunajudge/sandbox/lua_convert.hpp>
#include <lunajudge/sandbox/sandbox_environment.hpp>
#include <lunajudge/value/value.hpp>

#include <sol/sol.hpp>

#include <string>

using lunajudge::Mapping;
using lunajudge::Sequence;
using lunajudge::Value;
using lunajudge::sandbox::build_sandbox_context;
using lunajudge::sandbox::from_lua;
using lunajudge::sandbox::to_lua;

TEST_CASE("Scalars keep their Lua subtype") {
    auto sandbox = build_sandbox_context(0);

    auto convert = [&](const char* expr) {
        auto res = from_lua(eval_sandboxed(*sandbox, expr));
        REQUIRE(res.has_value());
        return res.value();
    };

    REQUIRE(convert("nil") == Value{});
    REQUIRE(convert("false") == Value{false});
    REQUIRE(convert("42") == Value{42});
    REQUIRE(convert("42.0") == Value{42.0});
    REQUIRE(convert("7 // 2") == Value{3});
    REQUIRE(convert("7 / 2") == Value{3.5});
    REQUIRE(convert("'text'") == Value{"text"});
    REQUIRE(convert("math.maxinteger") == Value{9223372036854775807LL});
}

TEST_CASE("Tables become sequences or mappings") {
    auto sandbox = build_sandbox_context(0);

    auto convert = [&](const char* expr) {
        auto res = from_lua(eval_sandboxed(*sandbox, expr));
        REQUIRE(res.has_value());
        return res.value();
    };

    REQUIRE(convert("{}") == Value{Sequence{}});
    REQUIRE(convert("{1, 'two', 3.0}") == Value{Sequence{1, "two", 3.0}});
    REQUIRE(convert("{[2] = 'b', [1] = 'a'}") == Value{Sequence{"a", "b"}});
    REQUIRE(convert("{x = 1, y = {2, 3}}") == Value{Mapping{{"x", 1}, {"y", Sequence{2, 3}}}});
    REQUIRE(convert("{{}, {{}}}") == Value{Sequence{Sequence{}, Sequence{Sequence{}}}});
}

TEST_CASE("Values with no host representation are rejected") {
    auto sandbox = build_sandbox_context(0);

    auto error_for = [&](const char* code) {
        auto res = from_lua(run_sandboxed(*sandbox, code));
        REQUIRE_FALSE(res.has_value());
        return res.error().message;
    };

    REQUIRE_THAT(error_for("return {1, 2, x = 3}"), Catch::Matchers::ContainsSubstring("mixes"));
    REQUIRE_THAT(error_for("return {[1] = 1, [3] = 3}"), Catch::Matchers::ContainsSubstring("not a sequence"));
    REQUIRE_THAT(error_for("return {[1.5] = true}"), Catch::Matchers::ContainsSubstring("mixes"));
    REQUIRE_THAT(error_for("return function() end"), Catch::Matchers::ContainsSubstring("function"));
    REQUIRE_THAT(error_for("return {pairs}"), Catch::Matchers::ContainsSubstring("function"));
    REQUIRE_THAT(error_for("local t = {} t[1] = t return t"), Catch::Matchers::ContainsSubstring("nesting"));
}

TEST_CASE("Nesting up to the limit is accepted") {
    auto sandbox = build_sandbox_context(0);

    auto res = from_lua(run_sandboxed(*sandbox, "local t = 1 for i = 1, 150 do t = {t} end return t"));

    REQUIRE(res.has_value());
}

TEST_CASE("Host values are visible to Lua with the same shape") {
    auto sandbox = build_sandbox_context(0);

    Value value = Mapping{{"list", Sequence{1, 2.5, "s"}}, {"flag", true}};
    sandbox->scope()["value"] = to_lua(sandbox->lua(), value);

    REQUIRE(eval_sandboxed(*sandbox, "math.type(value.list[1])").as<std::string>() == "integer");
    REQUIRE(eval_sandboxed(*sandbox, "math.type(value.list[2])").as<std::string>() == "float");
    REQUIRE(eval_sandboxed(*sandbox, "#value.list").as<int>() == 3);
    REQUIRE(eval_sandboxed(*sandbox, "value.flag").as<bool>());

    auto back = from_lua(eval_sandboxed(*sandbox, "value"));
    REQUIRE(back.has_value());
    REQUIRE(back.value() == value);
}

TEST_CASE("describe follows tostring") {
    auto sandbox = build_sandbox_context(0);

    REQUIRE(lunajudge::sandbox::describe(eval_sandboxed(*sandbox, "1.5")) == "1.5");
    REQUIRE(lunajudge::sandbox::describe(eval_sandboxed(*sandbox, "10 // 1")) == "10");
    REQUIRE(lunajudge::sandbox::describe(eval_sandboxed(*sandbox, "nil")) == "nil");
    REQUIRE(lunajudge::sandbox::describe(eval_sandboxed(*sandbox, "TypeError('bad')")) == "TypeError: bad");
}
