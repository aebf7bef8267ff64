#pragma once

#include <tidy/core/error.hpp>
#include <tidy/core/table.hpp>
#include <tidy/expr/expr.hpp>
#include <tidy/pipeline/transform.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace tidy::pipeline::ops {

// ─── Table operations ─────────────────────────────────────────────────────────
//  One function per pipeline operation. Each takes its input by const
//  reference and returns a new table; none of them touch the manager.

/// One column of Numbers 1..count.
[[nodiscard]] auto sequence(const std::string& column, std::size_t count) -> Table;

/// Rows whose predicate evaluates truthy, in order.
[[nodiscard]] auto filter(const Table& table, const expr::Expr& predicate) -> Result<Table>;

/// Set or overwrite `column` in every row. The column is added even when
/// the table has no rows.
[[nodiscard]] auto mutate(const Table& table, const std::string& column, const expr::Expr& value)
    -> Result<Table>;

/// Project to `columns` in the given order. Repeated names keep their first position.
[[nodiscard]] auto select(const Table& table, const std::vector<std::string>& columns)
    -> Result<Table>;

/// Stable sort on one or more key columns; Missing orders before every value.
[[nodiscard]] auto sort(const Table& table, const std::vector<std::string>& columns,
                        bool descending) -> Result<Table>;

/// Add (or replace) `_group_` with the first-appearance rank of each row's key.
[[nodiscard]] auto group_by(const Table& table, const std::string& column) -> Result<Table>;

/// Drop `_group_` if present.
[[nodiscard]] auto ungroup(const Table& table) -> Table;

/// Aggregate per group (or over the whole table when ungrouped).
[[nodiscard]] auto summarize(const Table& table, const std::vector<AggSpec>& aggregates)
    -> Result<Table>;

/// Inner equi-join; output columns are `_join_`, `left_*`, `right_*`.
[[nodiscard]] auto inner_join(const Table& left, const std::string& left_column,
                              const Table& right, const std::string& right_column)
    -> Result<Table>;

// ─── Aggregate kernels ────────────────────────────────────────────────────────
//  Exposed for tests; `values` may contain Missing.

[[nodiscard]] auto aggregate(AggFunc func, const std::vector<Value>& values) -> Result<Value>;

}  // namespace tidy::pipeline::ops
