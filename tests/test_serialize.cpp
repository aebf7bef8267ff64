#include <tidy/expr/evaluate.hpp>
#include <tidy/expr/serialize.hpp>

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <string>

using namespace tidy;
using namespace tidy::expr;
using nlohmann::json;

namespace {

auto parse_error(const json& value) -> ErrorKind {
    auto result = from_json(value);
    REQUIRE_FALSE(result.has_value());
    return result.error().kind;
}

}  // namespace

TEST_CASE("serialize: nested array form", "[expr][serialize]") {
    auto e = binary(BinaryOp::Greater, column("red"), number(0.0));
    CHECK(to_json(*e) == json::parse(R"(["@expr", "greater",
                                         ["@expr", "column", "red"],
                                         ["@expr", "number", 0.0]])"));
    CHECK(to_json(*rownum()) == json::parse(R"(["@expr", "rownum"])"));
    CHECK(to_json(*normal(1.0, 2.0)) == json::parse(R"(["@expr", "normal", 1.0, 2.0])"));
    CHECK(to_json(*exponential(0.5)) == json::parse(R"(["@expr", "exponential", 0.5])"));
}

TEST_CASE("serialize: literal scalars", "[expr][serialize]") {
    CHECK(to_json(*datetime(*make_datetime(1984, 1, 1))) ==
          json::parse(R"(["@expr", "datetime", "1984-01-01T00:00:00.000Z"])"));
    CHECK(to_json(*missing(LiteralKind::Number)) == json::parse(R"(["@expr", "number", null])"));
    CHECK(to_json(*logical(true)) == json::parse(R"(["@expr", "logical", true])"));
    CHECK(to_json(*text("a\"b")) == json::parse(R"(["@expr", "text", "a\"b"])"));
}

TEST_CASE("serialize: text conversion travels as toString", "[expr][serialize]") {
    const std::string wire = R"(["@expr","toString",["@expr","number",1]])";
    auto parsed = deserialize(wire);
    REQUIRE(parsed.has_value());
    CHECK(equal(**parsed, *unary(UnaryOp::ToText, number(1.0))));
    CHECK(serialize(**parsed) == wire);
    CHECK(to_json(*unary(UnaryOp::ToText, column("x")))[1].get<std::string>() == "toString");
    CHECK(parse_error(json::parse(R"(["@expr", "toText", ["@expr", "number", 1]])")) ==
          ErrorKind::MalformedExpression);
}

TEST_CASE("serialize: whole numbers keep their integer text", "[expr][serialize]") {
    CHECK(serialize(*number(0.0)) == R"(["@expr","number",0])");
    CHECK(serialize(*number(-3.0)) == R"(["@expr","number",-3])");
    CHECK(serialize(*number(2.5)) == R"(["@expr","number",2.5])");
    CHECK(serialize(*uniform(0.0, 1.0)) == R"(["@expr","uniform",0,1])");

    const std::string edited =
        R"(["@expr","notEqual",["@expr","column","red"],["@expr","number",0]])";
    auto parsed = deserialize(edited);
    REQUIRE(parsed.has_value());
    CHECK(serialize(**parsed) == edited);
}

TEST_CASE("serialize: canonical text round-trips", "[expr][serialize]") {
    const std::string canonical[] = {
        R"(["@expr","column","name"])",
        R"(["@expr","number",1.5])",
        R"(["@expr","number",null])",
        R"(["@expr","datetime","1984-01-01T00:00:00.000Z"])",
        R"(["@expr","datetime",null])",
        R"(["@expr","uniform",0,1])",
        R"(["@expr","isMissing",["@expr","column","x"]])",
        R"(["@expr","and",["@expr","logical",true],["@expr","text","t"]])",
        R"(["@expr","ifElse",["@expr","column","c"],["@expr","number",1],["@expr","number",2.5]])",
    };
    for (const auto& text : canonical) {
        auto parsed = deserialize(text);
        REQUIRE(parsed.has_value());
        CHECK(serialize(**parsed) == text);
    }
}

TEST_CASE("serialize: round-trip preserves evaluation", "[expr][serialize]") {
    auto e = if_else(binary(BinaryOp::Less, column("n"), number(3.0)),
                     unary(UnaryOp::ToText, column("n")), text("big"));
    auto back = from_json(to_json(*e));
    REQUIRE(back.has_value());
    CHECK(equal(*e, **back));
    Row row{{"n", 2.0}};
    CHECK(evaluate(*e, row, 0) == evaluate(**back, row, 0));
}

TEST_CASE("serialize: malformed input", "[expr][serialize]") {
    CHECK(parse_error(json::parse(R"(["@nope", "column", "x"])")) ==
          ErrorKind::MalformedExpression);
    CHECK(parse_error(json::parse(R"(["@expr", "frobnicate"])")) ==
          ErrorKind::MalformedExpression);
    CHECK(parse_error(json::parse(R"(["@expr", "column", ""])")) ==
          ErrorKind::MalformedExpression);
    CHECK(parse_error(json::parse(R"(["@expr", "add", ["@expr", "number", 1], 2])")) ==
          ErrorKind::MalformedExpression);
    CHECK(parse_error(json::parse(R"(["@expr", "not"])")) == ErrorKind::MalformedExpression);
    CHECK(parse_error(json::parse(R"(["@expr", "number", "one"])")) ==
          ErrorKind::MalformedExpression);
    CHECK(parse_error(json::parse(R"(["@expr", "datetime", "not a date"])")) ==
          ErrorKind::MalformedExpression);
    CHECK(parse_error(json::parse(R"(["@expr", "normal", 0])")) ==
          ErrorKind::MalformedExpression);

    auto bad_text = deserialize("[\"@expr\", ");
    REQUIRE_FALSE(bad_text.has_value());
    CHECK(bad_text.error().kind == ErrorKind::MalformedExpression);
}
