#include <tidy/pipeline/ops.hpp>

#include <fmt/format.h>
#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <optional>

namespace tidy::pipeline::ops {

namespace {

/// The single concrete type of the non-missing values, or an error if they mix.
auto key_type(const std::vector<Value>& keys, std::optional<ValueType> seen,
              const std::string& column) -> Result<std::optional<ValueType>> {
    for (const auto& key : keys) {
        if (is_missing(key)) {
            continue;
        }
        if (!seen) {
            seen = type_of(key);
        } else if (*seen != type_of(key)) {
            return make_error(ErrorKind::TypeMismatch,
                              fmt::format("join keys must share one type, '{}' has {} against {}",
                                          column, type_name(type_of(key)), type_name(*seen)));
        }
    }
    return seen;
}

auto prefixed(std::string_view side, std::string_view column) -> std::string {
    return fmt::format("{}_{}", side, column);
}

}  // namespace

auto inner_join(const Table& left, const std::string& left_column, const Table& right,
                const std::string& right_column) -> Result<Table> {
    auto left_keys = left.column_values(left_column);
    if (!left_keys) {
        return std::unexpected(left_keys.error());
    }
    auto right_keys = right.column_values(right_column);
    if (!right_keys) {
        return std::unexpected(right_keys.error());
    }
    auto type = key_type(*left_keys, std::nullopt, left_column);
    if (!type) {
        return std::unexpected(type.error());
    }
    if (auto both = key_type(*right_keys, *type, right_column); !both) {
        return std::unexpected(both.error());
    }

    std::vector<std::string> left_rest;
    std::vector<std::string> right_rest;
    std::vector<std::string> columns{std::string(kJoinColumn)};
    for (const auto& name : left.columns()) {
        if (name != left_column) {
            left_rest.push_back(name);
            columns.push_back(prefixed("left", name));
        }
    }
    for (const auto& name : right.columns()) {
        if (name != right_column) {
            right_rest.push_back(name);
            columns.push_back(prefixed("right", name));
        }
    }

    // Right row indices per key. Missing keys are never indexed, so they never match.
    robin_hood::unordered_map<Value, std::vector<std::size_t>, ValueKeyHash, ValueKeyEq> index;
    for (std::size_t i = 0; i < right_keys->size(); ++i) {
        const auto& key = (*right_keys)[i];
        if (!is_missing(key)) {
            index[key].push_back(i);
        }
    }

    std::vector<Row> rows;
    for (std::size_t l = 0; l < left_keys->size(); ++l) {
        const auto& key = (*left_keys)[l];
        if (is_missing(key)) {
            continue;
        }
        auto it = index.find(key);
        if (it == index.end()) {
            continue;
        }
        for (auto r : it->second) {
            Row row;
            row.set(kJoinColumn, key);
            for (const auto& name : left_rest) {
                row.set(prefixed("left", name), left.at(l, name));
            }
            for (const auto& name : right_rest) {
                row.set(prefixed("right", name), right.at(r, name));
            }
            rows.push_back(std::move(row));
        }
    }
    spdlog::debug("join: {} x {} rows on {}={} -> {} rows", left.rows(), right.rows(),
                  left_column, right_column, rows.size());

    Table out(std::move(columns));
    out.assign_rows(std::move(rows));
    return out;
}

}  // namespace tidy::pipeline::ops
