#include <tidy/runtime/datasets.hpp>

#include <initializer_list>

namespace tidy::runtime {

namespace {

auto make_table(std::vector<std::string> columns,
                std::initializer_list<std::initializer_list<Value>> records) -> Table {
    std::vector<Row> rows;
    rows.reserve(records.size());
    for (const auto& record : records) {
        Row row;
        std::size_t c = 0;
        for (const auto& value : record) {
            row.set(columns[c++], value);
        }
        rows.push_back(std::move(row));
    }
    Table table(std::move(columns));
    table.assign_rows(std::move(rows));
    return table;
}

auto date(int year, unsigned month, unsigned day) -> Value {
    if (auto dt = make_datetime(year, month, day)) {
        return *dt;
    }
    return kMissing;
}

}  // namespace

auto colors_table() -> Table {
    return make_table({"name", "red", "green", "blue"},
                      {
                          {std::string("black"), 0.0, 0.0, 0.0},
                          {std::string("red"), 255.0, 0.0, 0.0},
                          {std::string("maroon"), 128.0, 0.0, 0.0},
                          {std::string("lime"), 0.0, 255.0, 0.0},
                          {std::string("green"), 0.0, 128.0, 0.0},
                          {std::string("yellow"), 255.0, 255.0, 0.0},
                          {std::string("aqua"), 0.0, 255.0, 255.0},
                          {std::string("white"), 255.0, 255.0, 255.0},
                          {std::string("fuchsia"), 255.0, 0.0, 255.0},
                          {std::string("blue"), 0.0, 0.0, 255.0},
                          {std::string("navy"), 0.0, 0.0, 128.0},
                      });
}

auto single_table() -> Table {
    return make_table({"first"}, {{1.0}});
}

auto double_table() -> Table {
    return make_table({"first", "second"}, {{1.0, 100.0}, {2.0, 200.0}});
}

auto missing_table() -> Table {
    return make_table({"name", "score", "joined"},
                      {
                          {std::string("ann"), 10.0, date(2020, 1, 1)},
                          {std::string("bob"), kMissing, date(2020, 2, 1)},
                          {kMissing, 30.0, date(2020, 3, 1)},
                          {std::string("dan"), 40.0, kMissing},
                      });
}

void register_builtin_datasets(SourceRegistry& registry) {
    registry.register_source("colors", []() -> Result<Table> { return colors_table(); });
    registry.register_source("single", []() -> Result<Table> { return single_table(); });
    registry.register_source("double", []() -> Result<Table> { return double_table(); });
    registry.register_source("missing", []() -> Result<Table> { return missing_table(); });
}

auto builtin_sources() -> SourceRegistry {
    SourceRegistry registry;
    register_builtin_datasets(registry);
    return registry;
}

}  // namespace tidy::runtime
