#pragma once

#include <tidy/core/error.hpp>
#include <tidy/core/value.hpp>

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tidy {

/// Name of the grouping column added by groupBy.
inline constexpr std::string_view kGroupColumn = "_group_";

/// Name of the key column produced by join.
inline constexpr std::string_view kJoinColumn = "_join_";

struct Cell {
    std::string name;
    Value value;

    auto operator==(const Cell&) const -> bool = default;
};

/// One record: an ordered mapping from column name to value.
///
/// Column order is insertion order; it matters only for display.
class Row {
   public:
    Row() = default;
    Row(std::initializer_list<Cell> cells) : cells_(cells) {}

    [[nodiscard]] auto find(std::string_view name) const noexcept -> const Value*;
    [[nodiscard]] auto contains(std::string_view name) const noexcept -> bool {
        return find(name) != nullptr;
    }

    /// Overwrite the value of an existing column, or append a new one.
    void set(std::string_view name, Value value);

    /// Remove a column. Returns false if it was not present.
    auto erase(std::string_view name) -> bool;

    [[nodiscard]] auto cells() const noexcept -> const std::vector<Cell>& { return cells_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return cells_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return cells_.empty(); }

    auto operator==(const Row&) const -> bool = default;

   private:
    std::vector<Cell> cells_;
};

/// An in-memory table: a column list plus rows that all carry exactly those columns.
///
/// The column list survives when there are no rows, so an empty table still
/// knows its schema.
class Table {
   public:
    Table() = default;
    explicit Table(std::vector<std::string> columns) : columns_(std::move(columns)) {}

    /// Build a table from rows; the first row defines the column list.
    [[nodiscard]] static auto from_rows(std::vector<Row> rows) -> Result<Table>;

    [[nodiscard]] auto rows() const noexcept -> std::size_t { return rows_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return rows_.empty(); }
    [[nodiscard]] auto columns() const noexcept -> const std::vector<std::string>& {
        return columns_;
    }
    [[nodiscard]] auto has_column(std::string_view name) const noexcept -> bool;

    [[nodiscard]] auto row(std::size_t index) const -> const Row& { return rows_.at(index); }
    [[nodiscard]] auto row_list() const noexcept -> const std::vector<Row>& { return rows_; }
    [[nodiscard]] auto begin() const noexcept { return rows_.begin(); }
    [[nodiscard]] auto end() const noexcept { return rows_.end(); }

    /// Append a row whose column set must match the table's.
    auto append_row(Row row) -> Result<void>;

    /// Add (or replace) a column from a vector of values, one per row.
    /// When the table has no columns yet, the vector defines the row count.
    auto add_column(std::string name, std::vector<Value> values) -> Result<void>;

    /// Overwrite (or add) column `name` row by row; `values.size()` must equal rows().
    void set_column(std::string_view name, const std::vector<Value>& values);

    /// Remove a column from the schema and every row. No-op when absent.
    void drop_column(std::string_view name);

    /// All values of a column in row order.
    [[nodiscard]] auto column_values(std::string_view name) const -> Result<std::vector<Value>>;

    [[nodiscard]] auto at(std::size_t row, std::string_view column) const -> const Value&;

    /// Replace the rows wholesale; the schema is kept as is.
    void assign_rows(std::vector<Row> rows) { rows_ = std::move(rows); }

    auto operator==(const Table&) const -> bool = default;

   private:
    std::vector<std::string> columns_;
    std::vector<Row> rows_;
};

/// Comma separated column list used in error messages.
[[nodiscard]] auto format_columns(const std::vector<std::string>& columns) -> std::string;

}  // namespace tidy
