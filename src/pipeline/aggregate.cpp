#include <tidy/pipeline/ops.hpp>

#include <fmt/format.h>
#include <robin_hood.h>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace tidy::pipeline::ops {

namespace {

using KeyIndex = robin_hood::unordered_map<Value, std::size_t, ValueKeyHash, ValueKeyEq>;

auto present_values(const std::vector<Value>& values) -> std::vector<Value> {
    std::vector<Value> out;
    out.reserve(values.size());
    for (const auto& v : values) {
        if (!is_missing(v)) {
            out.push_back(v);
        }
    }
    return out;
}

auto require_numbers(AggFunc func, const std::vector<Value>& values)
    -> Result<std::vector<double>> {
    std::vector<double> out;
    out.reserve(values.size());
    for (const auto& v : values) {
        const auto* d = std::get_if<double>(&v);
        if (d == nullptr) {
            return make_error(ErrorKind::TypeError,
                              fmt::format("summarize {} requires numbers, got {}", agg_name(func),
                                          type_name(type_of(v))));
        }
        out.push_back(*d);
    }
    return out;
}

auto sum_of(const std::vector<double>& xs) -> double {
    double total = 0.0;
    for (double x : xs) {
        total += x;
    }
    return total;
}

auto median_of(std::vector<double> xs) -> double {
    std::ranges::sort(xs);
    std::size_t mid = xs.size() / 2;
    if (xs.size() % 2 == 1) {
        return xs[mid];
    }
    return (xs[mid - 1] + xs[mid]) / 2.0;
}

/// Variance over the present values with an n denominator; `xs` is never empty.
auto variance_of(const std::vector<double>& xs) -> double {
    double mean = sum_of(xs) / static_cast<double>(xs.size());
    double squares = 0.0;
    for (double x : xs) {
        squares += (x - mean) * (x - mean);
    }
    return squares / static_cast<double>(xs.size());
}

auto extreme_of(AggFunc func, const std::vector<Value>& present) -> Result<Value> {
    const Value* best = &present.front();
    for (const auto& v : present) {
        if (type_of(v) != type_of(*best)) {
            return make_error(
                ErrorKind::TypeMismatch,
                fmt::format("summarize {} requires values of one type, got {} and {}",
                            agg_name(func), type_name(type_of(*best)), type_name(type_of(v))));
        }
        int cmp = compare_same_type(v, *best);
        if ((func == AggFunc::Min && cmp < 0) || (func == AggFunc::Max && cmp > 0)) {
            best = &v;
        }
    }
    return *best;
}

}  // namespace

auto aggregate(AggFunc func, const std::vector<Value>& values) -> Result<Value> {
    if (func == AggFunc::Count) {
        return Value{static_cast<double>(values.size())};
    }
    auto present = present_values(values);
    if (present.empty()) {
        return Value{kMissing};
    }
    if (func == AggFunc::Min || func == AggFunc::Max) {
        return extreme_of(func, present);
    }

    auto numbers = require_numbers(func, present);
    if (!numbers) {
        return std::unexpected(numbers.error());
    }
    const auto& xs = *numbers;
    switch (func) {
        case AggFunc::Sum:
            return safe_number(sum_of(xs));
        case AggFunc::Mean:
            return safe_number(sum_of(xs) / static_cast<double>(xs.size()));
        case AggFunc::Median:
            return safe_number(median_of(xs));
        case AggFunc::Variance:
            return safe_number(variance_of(xs));
        case AggFunc::Std:
            return safe_number(std::sqrt(variance_of(xs)));
        default:
            break;
    }
    return Value{kMissing};
}

auto group_by(const Table& table, const std::string& column) -> Result<Table> {
    auto keys = table.column_values(column);
    if (!keys) {
        return std::unexpected(keys.error());
    }
    KeyIndex ranks;
    std::vector<Value> groups;
    groups.reserve(keys->size());
    for (const auto& key : *keys) {
        auto [it, inserted] = ranks.try_emplace(key, ranks.size());
        groups.emplace_back(static_cast<double>(it->second));
    }
    Table out = table;
    out.set_column(kGroupColumn, groups);
    return out;
}

auto summarize(const Table& table, const std::vector<AggSpec>& aggregates) -> Result<Table> {
    for (const auto& spec : aggregates) {
        if (!table.has_column(spec.column)) {
            return make_error(ErrorKind::UnknownColumn,
                              fmt::format("unknown column: {} (available: {})", spec.column,
                                          format_columns(table.columns())));
        }
    }

    const bool grouped = table.has_column(kGroupColumn);
    std::vector<std::string> columns;
    if (grouped) {
        columns.emplace_back(kGroupColumn);
    }
    for (const auto& spec : aggregates) {
        auto name = output_name(spec);
        if (std::ranges::find(columns, name) == columns.end()) {
            columns.push_back(std::move(name));
        }
    }
    Table out(columns);
    if (table.empty()) {
        return out;
    }

    // Row indices per group, groups in order of first appearance.
    std::vector<Value> group_keys;
    std::vector<std::vector<std::size_t>> members;
    if (grouped) {
        KeyIndex index;
        for (std::size_t i = 0; i < table.rows(); ++i) {
            const auto& key = table.at(i, kGroupColumn);
            auto [it, inserted] = index.try_emplace(key, group_keys.size());
            if (inserted) {
                group_keys.push_back(key);
                members.emplace_back();
            }
            members[it->second].push_back(i);
        }
    } else {
        members.emplace_back(table.rows());
        std::iota(members.front().begin(), members.front().end(), std::size_t{0});
    }

    std::vector<Row> rows;
    rows.reserve(members.size());
    for (std::size_t g = 0; g < members.size(); ++g) {
        Row row;
        if (grouped) {
            row.set(kGroupColumn, group_keys[g]);
        }
        for (const auto& spec : aggregates) {
            std::vector<Value> values;
            values.reserve(members[g].size());
            for (auto i : members[g]) {
                values.push_back(table.at(i, spec.column));
            }
            auto result = aggregate(spec.func, values);
            if (!result) {
                return std::unexpected(result.error());
            }
            row.set(output_name(spec), std::move(*result));
        }
        rows.push_back(std::move(row));
    }
    out.assign_rows(std::move(rows));
    return out;
}

}  // namespace tidy::pipeline::ops
