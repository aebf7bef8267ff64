#include <tidy/expr/evaluate.hpp>
#include <tidy/expr/expr.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace tidy;
using namespace tidy::expr;

namespace {

auto sample_row() -> Row {
    return Row{
        {"num", 7.0},
        {"neg", -2.0},
        {"text", std::string("123.45abc")},
        {"flag", true},
        {"when", *make_datetime(1984, 1, 1, 13, 45, 30)},
        {"gap", kMissing},
    };
}

auto eval(const ExprPtr& e, const Row& row = sample_row(), std::size_t index = 0)
    -> Result<Value> {
    return evaluate(*e, row, index);
}

auto eval_ok(const ExprPtr& e, const Row& row = sample_row(), std::size_t index = 0) -> Value {
    auto result = eval(e, row, index);
    REQUIRE(result.has_value());
    return *result;
}

auto eval_error(const ExprPtr& e, const Row& row = sample_row()) -> ErrorKind {
    auto result = eval(e, row);
    REQUIRE_FALSE(result.has_value());
    return result.error().kind;
}

}  // namespace

TEST_CASE("evaluate: leaves", "[expr][evaluate]") {
    CHECK(eval_ok(column("num")) == Value{7.0});
    CHECK(eval_ok(number(2.5)) == Value{2.5});
    CHECK(eval_ok(text("hi")) == Value{std::string("hi")});
    CHECK(eval_ok(logical(false)) == Value{false});
    CHECK(is_missing(eval_ok(missing(LiteralKind::Number))));
    CHECK(eval_ok(rownum(), sample_row(), 4) == Value{4.0});
}

TEST_CASE("evaluate: unknown column", "[expr][evaluate]") {
    auto result = eval(column("nope"));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == ErrorKind::UnknownColumn);
    CHECK(result.error().message.find("nope") != std::string::npos);
}

TEST_CASE("evaluate: arithmetic", "[expr][evaluate]") {
    CHECK(eval_ok(binary(BinaryOp::Add, column("num"), number(3.0))) == Value{10.0});
    CHECK(eval_ok(binary(BinaryOp::Subtract, column("num"), column("neg"))) == Value{9.0});
    CHECK(eval_ok(binary(BinaryOp::Multiply, column("num"), column("neg"))) == Value{-14.0});
    CHECK(eval_ok(binary(BinaryOp::Divide, number(7.0), number(2.0))) == Value{3.5});
    CHECK(eval_ok(binary(BinaryOp::Remainder, number(7.0), number(3.0))) == Value{1.0});
    CHECK(eval_ok(binary(BinaryOp::Remainder, number(-7.0), number(3.0))) == Value{-1.0});
    CHECK(eval_ok(binary(BinaryOp::Power, number(2.0), number(10.0))) == Value{1024.0});
    CHECK(eval_ok(unary(UnaryOp::Negate, column("neg"))) == Value{2.0});
}

TEST_CASE("evaluate: non-finite arithmetic becomes Missing", "[expr][evaluate]") {
    CHECK(is_missing(eval_ok(binary(BinaryOp::Divide, number(1.0), number(0.0)))));
    CHECK(is_missing(eval_ok(binary(BinaryOp::Remainder, number(1.0), number(0.0)))));
    CHECK(is_missing(eval_ok(binary(BinaryOp::Power, number(-8.0), number(0.5)))));
    CHECK(is_missing(eval_ok(binary(BinaryOp::Multiply, number(1e308), number(10.0)))));
}

TEST_CASE("evaluate: Missing propagates through arithmetic and comparison", "[expr][evaluate]") {
    for (auto op : {BinaryOp::Add, BinaryOp::Subtract, BinaryOp::Multiply, BinaryOp::Divide,
                    BinaryOp::Remainder, BinaryOp::Power, BinaryOp::Equal, BinaryOp::NotEqual,
                    BinaryOp::Greater, BinaryOp::GreaterEqual, BinaryOp::Less,
                    BinaryOp::LessEqual}) {
        CHECK(is_missing(eval_ok(binary(op, column("gap"), number(1.0)))));
        CHECK(is_missing(eval_ok(binary(op, number(1.0), column("gap")))));
    }
    CHECK(is_missing(eval_ok(unary(UnaryOp::Negate, column("gap")))));
    CHECK(is_missing(eval_ok(unary(UnaryOp::Not, column("gap")))));
}

TEST_CASE("evaluate: arithmetic requires numbers", "[expr][evaluate]") {
    CHECK(eval_error(binary(BinaryOp::Add, column("text"), number(1.0))) == ErrorKind::TypeError);
    CHECK(eval_error(binary(BinaryOp::Add, number(1.0), column("flag"))) == ErrorKind::TypeError);
    CHECK(eval_error(unary(UnaryOp::Negate, column("text"))) == ErrorKind::TypeError);

    // The left operand is checked before the right one is evaluated.
    auto result = eval(binary(BinaryOp::Add, column("text"), column("nope")));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == ErrorKind::TypeError);
}

TEST_CASE("evaluate: comparisons", "[expr][evaluate]") {
    CHECK(eval_ok(binary(BinaryOp::Greater, column("num"), number(3.0))) == Value{true});
    CHECK(eval_ok(binary(BinaryOp::LessEqual, number(3.0), number(3.0))) == Value{true});
    CHECK(eval_ok(binary(BinaryOp::Less, text("abc"), text("abd"))) == Value{true});
    CHECK(eval_ok(binary(BinaryOp::Less, logical(false), logical(true))) == Value{true});
    CHECK(eval_ok(binary(BinaryOp::Equal, column("when"), column("when"))) == Value{true});
    CHECK(eval_ok(binary(BinaryOp::NotEqual, text("a"), text("a"))) == Value{false});
    CHECK(eval_error(binary(BinaryOp::Equal, number(1.0), text("1"))) ==
          ErrorKind::TypeMismatch);
}

TEST_CASE("evaluate: and/or return the deciding operand", "[expr][evaluate]") {
    CHECK(eval_ok(binary(BinaryOp::And, number(0.0), column("nope"))) == Value{0.0});
    CHECK(eval_ok(binary(BinaryOp::And, number(2.0), text("x"))) == Value{std::string("x")});
    CHECK(eval_ok(binary(BinaryOp::Or, text("first"), column("nope"))) ==
          Value{std::string("first")});
    CHECK(eval_ok(binary(BinaryOp::Or, logical(false), number(5.0))) == Value{5.0});
    CHECK(is_missing(eval_ok(binary(BinaryOp::And, column("gap"), logical(true)))));
    CHECK(eval_ok(binary(BinaryOp::Or, column("gap"), logical(true))) == Value{true});
}

TEST_CASE("evaluate: not", "[expr][evaluate]") {
    CHECK(eval_ok(unary(UnaryOp::Not, number(0.0))) == Value{true});
    CHECK(eval_ok(unary(UnaryOp::Not, text("x"))) == Value{false});
}

TEST_CASE("evaluate: ifElse evaluates only the chosen branch", "[expr][evaluate]") {
    CHECK(eval_ok(if_else(logical(true), number(1.0), column("nope"))) == Value{1.0});
    CHECK(eval_ok(if_else(number(0.0), column("nope"), text("no"))) ==
          Value{std::string("no")});
    CHECK(is_missing(eval_ok(if_else(column("gap"), number(1.0), number(2.0)))));
}

TEST_CASE("evaluate: type predicates", "[expr][evaluate]") {
    CHECK(eval_ok(unary(UnaryOp::IsNumber, column("num"))) == Value{true});
    CHECK(eval_ok(unary(UnaryOp::IsText, column("num"))) == Value{false});
    CHECK(eval_ok(unary(UnaryOp::IsLogical, column("flag"))) == Value{true});
    CHECK(eval_ok(unary(UnaryOp::IsDatetime, column("when"))) == Value{true});
    CHECK(is_missing(eval_ok(unary(UnaryOp::IsNumber, column("gap")))));
    CHECK(eval_ok(unary(UnaryOp::IsMissing, column("gap"))) == Value{true});
    CHECK(eval_ok(unary(UnaryOp::IsMissing, column("num"))) == Value{false});
}

TEST_CASE("evaluate: conversions", "[expr][evaluate]") {
    SECTION("toNumber") {
        CHECK(eval_ok(unary(UnaryOp::ToNumber, column("text"))) == Value{123.45});
        CHECK(eval_ok(unary(UnaryOp::ToNumber, text("  -4e2x"))) == Value{-400.0});
        CHECK(is_missing(eval_ok(unary(UnaryOp::ToNumber, text("abc")))));
        CHECK(eval_ok(unary(UnaryOp::ToNumber, logical(true))) == Value{1.0});
        CHECK(eval_ok(unary(UnaryOp::ToNumber, datetime(Datetime{86'400'000}))) ==
              Value{86'400'000.0});
    }
    SECTION("toDatetime") {
        auto parsed = eval(unary(UnaryOp::ToDatetime, text("1984-01-01")));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == Value{*make_datetime(1984, 1, 1)});
        CHECK(eval_ok(unary(UnaryOp::ToDatetime, number(1000.0))) == Value{Datetime{1000}});
        CHECK(is_missing(eval_ok(unary(UnaryOp::ToDatetime, logical(true)))));
        CHECK(is_missing(eval_ok(unary(UnaryOp::ToDatetime, number(8.64e15)))));
        CHECK(is_missing(eval_ok(unary(
            UnaryOp::ToDatetime, number(static_cast<double>(kMaxDatetimeMillis) + 1.0)))));

        auto last = eval_ok(unary(UnaryOp::ToDatetime,
                                  number(static_cast<double>(kMaxDatetimeMillis))));
        auto as_text = convert_to_text(last);
        CHECK(as_text == Value{std::string("9999-12-31T23:59:59.999Z")});
        CHECK(convert_to_datetime(as_text) == last);

        auto invalid = eval(unary(UnaryOp::ToDatetime, text("abc")));
        REQUIRE(invalid.has_value());
        CHECK(is_missing(*invalid));
    }
    SECTION("toText") {
        CHECK(eval_ok(unary(UnaryOp::ToText, number(-999.0))) == Value{std::string("-999")});
        CHECK(eval_ok(unary(UnaryOp::ToText, number(123.45))) == Value{std::string("123.45")});
        CHECK(eval_ok(unary(UnaryOp::ToText, logical(false))) == Value{std::string("false")});
        CHECK(eval_ok(unary(UnaryOp::ToText, datetime(Datetime{0}))) ==
              Value{std::string("1970-01-01T00:00:00.000Z")});
        CHECK(is_missing(eval_ok(unary(UnaryOp::ToText, column("gap")))));
    }
    SECTION("toLogical") {
        CHECK(eval_ok(unary(UnaryOp::ToLogical, number(2.0))) == Value{true});
        CHECK(eval_ok(unary(UnaryOp::ToLogical, text(""))) == Value{false});
        CHECK(is_missing(eval_ok(unary(UnaryOp::ToLogical, column("gap")))));
    }
}

TEST_CASE("evaluate: datetime fields", "[expr][evaluate]") {
    CHECK(eval_ok(unary(UnaryOp::ToYear, column("when"))) == Value{1984.0});
    CHECK(eval_ok(unary(UnaryOp::ToMonth, column("when"))) == Value{1.0});
    CHECK(eval_ok(unary(UnaryOp::ToDay, column("when"))) == Value{1.0});
    CHECK(eval_ok(unary(UnaryOp::ToWeekday, column("when"))) == Value{7.0});
    CHECK(eval_ok(unary(UnaryOp::ToHours, column("when"))) == Value{13.0});
    CHECK(eval_ok(unary(UnaryOp::ToMinutes, column("when"))) == Value{45.0});
    CHECK(eval_ok(unary(UnaryOp::ToSeconds, column("when"))) == Value{30.0});
    CHECK(is_missing(eval_ok(unary(UnaryOp::ToYear, column("gap")))));
    CHECK(eval_error(unary(UnaryOp::ToYear, column("num"))) == ErrorKind::TypeError);
}

TEST_CASE("evaluate: random variates", "[expr][evaluate]") {
    seed_random(42);
    for (int i = 0; i < 100; ++i) {
        auto u = eval_ok(uniform(2.0, 3.0));
        REQUIRE(std::holds_alternative<double>(u));
        CHECK(std::get<double>(u) >= 2.0);
        CHECK(std::get<double>(u) < 3.0);
        auto e = eval_ok(exponential(1.5));
        REQUIRE(std::holds_alternative<double>(e));
        CHECK(std::get<double>(e) >= 0.0);
    }
    CHECK(std::holds_alternative<double>(eval_ok(normal(0.0, 1.0))));
    CHECK(is_missing(eval_ok(exponential(-1.0))));

    seed_random(7);
    auto first = eval_ok(normal(10.0, 2.0));
    seed_random(7);
    auto second = eval_ok(normal(10.0, 2.0));
    CHECK(first == second);
}

TEST_CASE("evaluate: empty child slot is malformed", "[expr][evaluate]") {
    CHECK(eval_error(unary(UnaryOp::Not, nullptr)) == ErrorKind::MalformedExpression);
    CHECK(eval_error(binary(BinaryOp::Add, number(1.0), nullptr)) ==
          ErrorKind::MalformedExpression);
}

TEST_CASE("expr: structural equality and clone", "[expr]") {
    auto a = binary(BinaryOp::Add, column("x"), number(1.0));
    auto b = binary(BinaryOp::Add, column("x"), number(1.0));
    auto c = binary(BinaryOp::Add, column("x"), number(2.0));
    CHECK(equal(*a, *b));
    CHECK_FALSE(equal(*a, *c));
    CHECK_FALSE(equal(*number(1.0), *text("1")));
    CHECK_FALSE(equal(*normal(0.0, 1.0), *normal(0.0, 2.0)));
    auto copy = clone(*c);
    CHECK(equal(*copy, *c));
    CHECK(equal(*missing(LiteralKind::Text), *missing(LiteralKind::Text)));
    CHECK_FALSE(equal(*missing(LiteralKind::Text), *missing(LiteralKind::Number)));
}
