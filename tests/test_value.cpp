#include "catch2_custom.hpp"

#include <lunajudge/value/value.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

using lunajudge::Mapping;
using lunajudge::Sequence;
using lunajudge::Value;
using lunajudge::ValueKind;

TEST_CASE("Kinds follow the constructor argument") {
    REQUIRE(Value{}.kind() == ValueKind::Nil);
    REQUIRE(Value{nullptr}.kind() == ValueKind::Nil);
    REQUIRE(Value{true}.kind() == ValueKind::Boolean);
    REQUIRE(Value{10}.kind() == ValueKind::Integer);
    REQUIRE(Value{std::uint8_t{3}}.kind() == ValueKind::Integer);
    REQUIRE(Value{10.0}.kind() == ValueKind::Float);
    REQUIRE(Value{1.5F}.kind() == ValueKind::Float);
    REQUIRE(Value{"abc"}.kind() == ValueKind::String);
    REQUIRE(Value{Sequence{}}.kind() == ValueKind::Sequence);
    REQUIRE(Value{Mapping{}}.kind() == ValueKind::Mapping);
}

TEST_CASE("Lua type names") {
    REQUIRE(Value{}.type_name() == "nil");
    REQUIRE(Value{false}.type_name() == "boolean");
    REQUIRE(Value{1}.type_name() == "integer");
    REQUIRE(Value{1.0}.type_name() == "float");
    REQUIRE(Value{"s"}.type_name() == "string");
    REQUIRE(Value{Sequence{1, 2}}.type_name() == "table");
    REQUIRE(Value{Mapping{{"a", 1}}}.type_name() == "table");
}

TEST_CASE("Display form") {
    REQUIRE(Value{}.to_display_string() == "nil");
    REQUIRE(Value{true}.to_display_string() == "true");
    REQUIRE(Value{-42}.to_display_string() == "-42");
    REQUIRE(Value{10.0}.to_display_string() == "10.0");
    REQUIRE(Value{0.1}.to_display_string() == "0.1");
    REQUIRE(Value{std::numeric_limits<double>::infinity()}.to_display_string() == "inf");
    REQUIRE(Value{-std::numeric_limits<double>::infinity()}.to_display_string() == "-inf");
    REQUIRE(Value{std::nan("")}.to_display_string() == "nan");
    REQUIRE(Value{"a\"b"}.to_display_string() == R"("a\"b")");

    Value nested = Sequence{1, 2.5, "abc", Mapping{{"k", Value{}}, {"a", Sequence{}}}};
    REQUIRE(nested.to_display_string() == R"([1, 2.5, "abc", {"a": [], "k": nil}])");

    REQUIRE(fmt::format("{}", Value{Sequence{1, 2}}) == "[1, 2]");
}

TEST_CASE("Strict equality keeps integer and float apart") {
    REQUIRE(Value{1} == Value{1});
    REQUIRE(Value{1} != Value{1.0});
    REQUIRE(Value{"1"} != Value{1});
    REQUIRE(Value{Sequence{1, "x"}} == Value{Sequence{1, "x"}});
    REQUIRE(Value{Sequence{}} != Value{Mapping{}});
}

TEST_CASE("Copies do not share structure") {
    Value original = Sequence{Sequence{1, 2}, 3};
    Value copy = original;

    copy.as_sequence().at(0).as_sequence().push_back(99);

    REQUIRE(original.as_sequence().at(0).as_sequence().size() == 2);
    REQUIRE(copy.as_sequence().at(0).as_sequence().size() == 3);
}
