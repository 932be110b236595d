#include "catch2_custom.hpp"

#include <lunajudge/execution_result.hpp>
#include <lunajudge/sandbox/syntax_validator.hpp>

#include <string>

using lunajudge::ExecutionError;
using lunajudge::sandbox::split_location;
using lunajudge::sandbox::validate_syntax;

TEST_CASE("Well-formed code is accepted without being run") {
    REQUIRE(validate_syntax("function solution(x) return x * 2 end"));

    // Would fail if it were run; io is not even opened
    REQUIRE(validate_syntax("io.write('hi') error('boom')"));
}

TEST_CASE("Empty code is accepted") {
    REQUIRE(validate_syntax(""));
    REQUIRE(validate_syntax("\n\n-- only a comment\n"));
}

TEST_CASE("Syntax errors report their line") {
    auto res = validate_syntax("function solution(x)\n  return x +\nend\n");

    REQUIRE_FALSE(res);
    REQUIRE(res.error().kind == ExecutionError::Kind::Syntax);
    REQUIRE(res.error().line == 3);
    REQUIRE_THAT(res.error().message, Catch::Matchers::StartsWith("Line 3: "));
    REQUIRE_THAT(res.error().message, Catch::Matchers::ContainsSubstring("unexpected symbol"));
}

TEST_CASE("Unterminated blocks are reported at end of input") {
    auto res = validate_syntax("function solution(x)\n  return x");

    REQUIRE_FALSE(res);
    REQUIRE(res.error().line == 2);
    REQUIRE_THAT(res.error().message, Catch::Matchers::ContainsSubstring("'end' expected"));
}

TEST_CASE("Precompiled chunks are rejected") {
    // "\x1bLua" is the signature of a binary chunk
    auto res = validate_syntax(std::string{"\x1bLua\x54\x00", 6});

    REQUIRE_FALSE(res);
    REQUIRE(res.error().kind == ExecutionError::Kind::Syntax);
    REQUIRE_THAT(res.error().message, Catch::Matchers::ContainsSubstring("binary"));
}

TEST_CASE("Location prefixes are split off") {
    auto located = split_location("submission:12: unexpected symbol near 'x'");
    REQUIRE(located.line == 12);
    REQUIRE(located.message == "unexpected symbol near 'x'");

    auto foreign = split_location("other:3: message");
    REQUIRE_FALSE(foreign.line.has_value());
    REQUIRE(foreign.message == "other:3: message");

    auto bare = split_location("not enough memory");
    REQUIRE_FALSE(bare.line.has_value());
    REQUIRE(bare.message == "not enough memory");
}
