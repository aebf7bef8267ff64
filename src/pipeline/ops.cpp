#include <tidy/expr/evaluate.hpp>
#include <tidy/pipeline/ops.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <numeric>
#include <optional>

namespace tidy::pipeline::ops {

namespace {

auto unknown_column(const Table& table, std::string_view name) -> std::unexpected<Error> {
    return make_error(ErrorKind::UnknownColumn,
                      fmt::format("unknown column: {} (available: {})", name,
                                  format_columns(table.columns())));
}

/// Three-way comparison with Missing ordered first. Types are checked beforehand.
auto compare_keys(const Value& lhs, const Value& rhs) -> int {
    bool lhs_missing = is_missing(lhs);
    bool rhs_missing = is_missing(rhs);
    if (lhs_missing || rhs_missing) {
        return static_cast<int>(rhs_missing) - static_cast<int>(lhs_missing);
    }
    return compare_same_type(lhs, rhs);
}

}  // namespace

auto sequence(const std::string& column, std::size_t count) -> Table {
    std::vector<Row> rows;
    rows.reserve(count);
    for (std::size_t i = 1; i <= count; ++i) {
        rows.push_back(Row{Cell{.name = column, .value = static_cast<double>(i)}});
    }
    Table table(std::vector<std::string>{column});
    table.assign_rows(std::move(rows));
    return table;
}

auto filter(const Table& table, const expr::Expr& predicate) -> Result<Table> {
    std::vector<Row> kept;
    for (std::size_t i = 0; i < table.rows(); ++i) {
        auto keep = expr::evaluate(predicate, table.row(i), i);
        if (!keep) {
            return std::unexpected(keep.error());
        }
        if (is_truthy(*keep)) {
            kept.push_back(table.row(i));
        }
    }
    Table out(table.columns());
    out.assign_rows(std::move(kept));
    return out;
}

auto mutate(const Table& table, const std::string& column, const expr::Expr& value)
    -> Result<Table> {
    std::vector<Value> values;
    values.reserve(table.rows());
    for (std::size_t i = 0; i < table.rows(); ++i) {
        auto v = expr::evaluate(value, table.row(i), i);
        if (!v) {
            return std::unexpected(v.error());
        }
        values.push_back(std::move(*v));
    }
    Table out = table;
    out.set_column(column, values);
    return out;
}

auto select(const Table& table, const std::vector<std::string>& columns) -> Result<Table> {
    std::vector<std::string> kept;
    kept.reserve(columns.size());
    for (const auto& name : columns) {
        if (!table.has_column(name)) {
            return unknown_column(table, name);
        }
        if (std::ranges::find(kept, name) == kept.end()) {
            kept.push_back(name);
        }
    }
    std::vector<Row> rows;
    rows.reserve(table.rows());
    for (const auto& row : table) {
        Row projected;
        for (const auto& name : kept) {
            projected.set(name, *row.find(name));
        }
        rows.push_back(std::move(projected));
    }
    Table out(std::move(kept));
    out.assign_rows(std::move(rows));
    return out;
}

auto sort(const Table& table, const std::vector<std::string>& columns, bool descending)
    -> Result<Table> {
    std::vector<std::vector<Value>> keys;
    keys.reserve(columns.size());
    for (const auto& name : columns) {
        auto values = table.column_values(name);
        if (!values) {
            return std::unexpected(values.error());
        }
        std::optional<ValueType> seen;
        for (const auto& v : *values) {
            if (is_missing(v)) {
                continue;
            }
            if (!seen) {
                seen = type_of(v);
            } else if (*seen != type_of(v)) {
                return make_error(ErrorKind::TypeMismatch,
                                  fmt::format("sort key '{}' mixes {} and {} values", name,
                                              type_name(*seen), type_name(type_of(v))));
            }
        }
        keys.push_back(std::move(*values));
    }

    std::vector<std::size_t> order(table.rows());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::ranges::stable_sort(order, [&](std::size_t a, std::size_t b) {
        for (const auto& key : keys) {
            int cmp = compare_keys(key[a], key[b]);
            if (cmp != 0) {
                return descending ? cmp > 0 : cmp < 0;
            }
        }
        return false;
    });

    std::vector<Row> rows;
    rows.reserve(order.size());
    for (auto index : order) {
        rows.push_back(table.row(index));
    }
    Table out(table.columns());
    out.assign_rows(std::move(rows));
    return out;
}

auto ungroup(const Table& table) -> Table {
    Table out = table;
    out.drop_column(kGroupColumn);
    return out;
}

}  // namespace tidy::pipeline::ops
