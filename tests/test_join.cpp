#include <tidy/expr/expr.hpp>
#include <tidy/pipeline/engine.hpp>
#include <tidy/pipeline/ops.hpp>
#include <tidy/runtime/datasets.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace tidy;
namespace ex = tidy::expr;
namespace pl = tidy::pipeline;

namespace {

auto nonzero(const std::string& column) -> ex::ExprPtr {
    return ex::binary(ex::BinaryOp::NotEqual, ex::column(column), ex::number(0.0));
}

auto names(const Table& table, std::string_view column) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (std::size_t i = 0; i < table.rows(); ++i) {
        out.push_back(to_text(table.at(i, column)));
    }
    return out;
}

}  // namespace

TEST_CASE("join: single with double on first", "[pipeline][join]") {
    auto out = pl::ops::inner_join(runtime::single_table(), "first", runtime::double_table(),
                                   "first");
    REQUIRE(out.has_value());
    CHECK(out->columns() == std::vector<std::string>{"_join_", "right_second"});
    REQUIRE(out->rows() == 1);
    CHECK(out->at(0, "_join_") == Value{1.0});
    CHECK(out->at(0, "right_second") == Value{100.0});
}

TEST_CASE("join: every left match pairs with every right match", "[pipeline][join]") {
    auto colors = runtime::colors_table();
    auto left = pl::ops::filter(colors, *nonzero("red"));
    auto right = pl::ops::filter(colors, *nonzero("green"));
    REQUIRE(left.has_value());
    REQUIRE(right.has_value());

    auto out = pl::ops::inner_join(*left, "red", *right, "green");
    REQUIRE(out.has_value());
    CHECK(out->columns() ==
          std::vector<std::string>{"_join_", "left_name", "left_green", "left_blue",
                                   "right_name", "right_red", "right_blue"});
    // Four left rows at 255 meet four right rows at 255; maroon meets green at 128.
    CHECK(out->rows() == 17);
    CHECK(names(*out, "left_name").front() == "red");
    CHECK(names(*out, "right_name").front() == "lime");
}

TEST_CASE("join: Missing keys never match", "[pipeline][join]") {
    auto table = runtime::missing_table();
    auto out = pl::ops::inner_join(table, "name", table, "name");
    REQUIRE(out.has_value());
    CHECK(names(*out, "_join_") == std::vector<std::string>{"ann", "bob", "dan"});
    CHECK(out->at(1, "left_score") == Value{kMissing});
}

TEST_CASE("join: no matches keeps the schema", "[pipeline][join]") {
    auto out = pl::ops::inner_join(runtime::single_table(), "first", runtime::colors_table(),
                                   "red");
    REQUIRE(out.has_value());
    CHECK(out->rows() == 0);
    CHECK(out->columns().size() == 4);
}

TEST_CASE("join: key types must agree", "[pipeline][join]") {
    auto out = pl::ops::inner_join(runtime::colors_table(), "name", runtime::double_table(),
                                   "first");
    REQUIRE_FALSE(out.has_value());
    CHECK(out.error().kind == ErrorKind::TypeMismatch);

    auto unknown = pl::ops::inner_join(runtime::single_table(), "zzz", runtime::double_table(),
                                       "first");
    REQUIRE_FALSE(unknown.has_value());
    CHECK(unknown.error().kind == ErrorKind::UnknownColumn);
}

TEST_CASE("join: program joins published tables", "[pipeline][join]") {
    pl::Program program(3);
    program[0].push_back(pl::join("left", "red", "right", "green"));
    program[0].push_back(pl::filter(nonzero("left_blue")));
    program[0].push_back(pl::filter(nonzero("right_blue")));
    program[1].push_back(pl::data("colors"));
    program[1].push_back(pl::filter(nonzero("red")));
    program[1].push_back(pl::notify("left"));
    program[2].push_back(pl::data("colors"));
    program[2].push_back(pl::filter(nonzero("green")));
    program[2].push_back(pl::notify("right"));

    pl::Manager manager;
    auto sources = runtime::builtin_sources();
    auto result = pl::run_program(program, manager, sources);
    INFO(result.error);
    REQUIRE(result.ok());
    const auto& out = result.table;
    REQUIRE(out.rows() == 4);
    CHECK(names(out, "left_name") ==
          std::vector<std::string>{"white", "white", "fuchsia", "fuchsia"});
    CHECK(names(out, "right_name") == std::vector<std::string>{"aqua", "white", "aqua", "white"});
    CHECK(manager.names() == std::vector<std::string>{"left", "right"});
}

TEST_CASE("join: unpublished input is an unknown name", "[pipeline][join]") {
    pl::Pipeline pipeline;
    pipeline.push_back(pl::join("a", "x", "b", "x"));
    pl::Manager manager;
    auto sources = runtime::builtin_sources();
    auto result = pl::run(pipeline, manager, sources);
    REQUIRE_FALSE(result.ok());
    CHECK(result.error.starts_with("UnknownRegistryName:"));
}
