#include <tidy/pipeline/engine.hpp>
#include <tidy/runtime/config.hpp>
#include <tidy/runtime/csv.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using namespace tidy;

namespace {

void write_csv(const std::filesystem::path& path, const char* content) {
    std::ofstream out(path);
    out << content;
}

auto tmp(const char* name) -> std::filesystem::path {
    return std::filesystem::temp_directory_path() / name;
}

}  // namespace

TEST_CASE("csv: columns are typed independently", "[runtime][csv]") {
    auto path = tmp("tidy_test_typed.csv");
    write_csv(path,
              "name,score,active\n"
              "ann,10,true\n"
              "bob,2.5,false\n"
              "cy,-3,true\n");

    auto table = runtime::read_csv(path.string());
    REQUIRE(table.has_value());
    CHECK(table->columns() == std::vector<std::string>{"name", "score", "active"});
    REQUIRE(table->rows() == 3);
    CHECK(table->at(0, "name") == Value{std::string("ann")});
    CHECK(table->at(1, "score") == Value{2.5});
    CHECK(table->at(2, "score") == Value{-3.0});
    CHECK(table->at(1, "active") == Value{false});
    std::filesystem::remove(path);
}

TEST_CASE("csv: null tokens become Missing", "[runtime][csv]") {
    auto path = tmp("tidy_test_nulls.csv");
    write_csv(path,
              "city,pop\n"
              "Oslo,NA\n"
              ",700\n"
              "Rome,-\n");

    auto defaults = runtime::read_csv(path.string());
    REQUIRE(defaults.has_value());
    CHECK(is_missing(defaults->at(0, "pop")));
    CHECK(is_missing(defaults->at(1, "city")));
    // "-" is not a null token by default, so the column stays text.
    CHECK(defaults->at(1, "pop") == Value{std::string("700")});

    auto dashes = runtime::read_csv(path.string(), runtime::parse_null_spec("NA,-"));
    REQUIRE(dashes.has_value());
    CHECK(dashes->at(1, "pop") == Value{700.0});
    CHECK(is_missing(dashes->at(2, "pop")));
    CHECK(dashes->at(1, "city") == Value{std::string()});
    std::filesystem::remove(path);
}

TEST_CASE("csv: null spec parsing", "[runtime][csv]") {
    auto options = runtime::parse_null_spec("<empty>, NA ,null");
    CHECK(options.null_tokens.size() == 3);
    CHECK(options.null_tokens.contains(""));
    CHECK(options.null_tokens.contains("NA"));
    CHECK(options.null_tokens.contains("null"));
    CHECK(runtime::parse_null_spec("").null_tokens.empty());
}

TEST_CASE("csv: header-only file keeps its schema", "[runtime][csv]") {
    auto path = tmp("tidy_test_header.csv");
    write_csv(path, "a,b\n");
    auto table = runtime::read_csv(path.string());
    REQUIRE(table.has_value());
    CHECK(table->rows() == 0);
    CHECK(table->columns() == std::vector<std::string>{"a", "b"});
    std::filesystem::remove(path);
}

TEST_CASE("csv: unreadable file is a source error", "[runtime][csv]") {
    auto table = runtime::read_csv(tmp("tidy_test_does_not_exist.csv").string());
    REQUIRE_FALSE(table.has_value());
    CHECK(table.error().kind == ErrorKind::SourceError);
}

TEST_CASE("csv: bound files feed data operations", "[runtime][csv]") {
    auto dir = std::filesystem::temp_directory_path();
    auto path = dir / "tidy_test_bound.csv";
    write_csv(path,
              "k,v\n"
              "x,1\n"
              "y,2\n");

    runtime::RunConfig config;
    config.data = {"kv=tidy_test_bound.csv", "gone=tidy_test_gone.csv"};
    config.data_path = dir.string();
    auto sources = runtime::build_sources(config);
    REQUIRE(sources.has_value());
    CHECK(sources->contains("colors"));
    CHECK(sources->contains("kv"));

    pipeline::Manager manager;
    pipeline::Pipeline ok;
    ok.push_back(pipeline::data("kv"));
    auto result = pipeline::run(ok, manager, *sources);
    REQUIRE(result.ok());
    CHECK(result.table.rows() == 2);

    // Sources are lazy: a missing file only fails when it is read.
    pipeline::Pipeline gone;
    gone.push_back(pipeline::data("gone"));
    auto failed = pipeline::run(gone, manager, *sources);
    REQUIRE_FALSE(failed.ok());
    CHECK(failed.error.starts_with("SourceError:"));
    std::filesystem::remove(path);
}

TEST_CASE("config: data bindings", "[runtime][config]") {
    auto good = runtime::parse_binding("sales=data/sales.csv");
    REQUIRE(good.has_value());
    CHECK(good->first == "sales");
    CHECK(good->second == "data/sales.csv");

    for (const char* bad : {"sales", "=x.csv", "sales="}) {
        auto parsed = runtime::parse_binding(bad);
        REQUIRE_FALSE(parsed.has_value());
        CHECK(parsed.error().kind == ErrorKind::SourceError);
    }

    runtime::RunConfig config;
    config.data = {"broken"};
    auto sources = runtime::build_sources(config);
    REQUIRE_FALSE(sources.has_value());
    CHECK(sources.error().kind == ErrorKind::SourceError);
}
