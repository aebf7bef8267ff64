#include <tidy/core/table.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <stdexcept>

namespace tidy {

namespace {

auto same_column_set(const Row& row, const std::vector<std::string>& columns) -> bool {
    if (row.size() != columns.size()) {
        return false;
    }
    return std::ranges::all_of(columns,
                               [&](const std::string& name) { return row.contains(name); });
}

}  // namespace

auto Row::find(std::string_view name) const noexcept -> const Value* {
    for (const auto& cell : cells_) {
        if (cell.name == name) {
            return &cell.value;
        }
    }
    return nullptr;
}

void Row::set(std::string_view name, Value value) {
    for (auto& cell : cells_) {
        if (cell.name == name) {
            cell.value = std::move(value);
            return;
        }
    }
    cells_.push_back(Cell{.name = std::string(name), .value = std::move(value)});
}

auto Row::erase(std::string_view name) -> bool {
    auto it = std::ranges::find_if(cells_, [&](const Cell& cell) { return cell.name == name; });
    if (it == cells_.end()) {
        return false;
    }
    cells_.erase(it);
    return true;
}

auto Table::from_rows(std::vector<Row> rows) -> Result<Table> {
    Table table;
    if (rows.empty()) {
        return table;
    }
    for (const auto& cell : rows.front().cells()) {
        table.columns_.push_back(cell.name);
    }
    for (auto& row : rows) {
        auto appended = table.append_row(std::move(row));
        if (!appended) {
            return std::unexpected(appended.error());
        }
    }
    return table;
}

auto Table::has_column(std::string_view name) const noexcept -> bool {
    return std::ranges::find(columns_, name) != columns_.end();
}

auto Table::append_row(Row row) -> Result<void> {
    if (!same_column_set(row, columns_)) {
        std::vector<std::string> names;
        names.reserve(row.size());
        for (const auto& cell : row.cells()) {
            names.push_back(cell.name);
        }
        return make_error(ErrorKind::UnknownColumn,
                          fmt::format("row columns ({}) do not match table columns ({})",
                                      format_columns(names), format_columns(columns_)));
    }
    rows_.push_back(std::move(row));
    return {};
}

auto Table::add_column(std::string name, std::vector<Value> values) -> Result<void> {
    if (columns_.empty() && rows_.empty()) {
        rows_.resize(values.size());
    }
    if (values.size() != rows_.size()) {
        return make_error(ErrorKind::MalformedPipeline,
                          fmt::format("column '{}' has {} values but the table has {} rows", name,
                                      values.size(), rows_.size()));
    }
    set_column(name, values);
    return {};
}

void Table::set_column(std::string_view name, const std::vector<Value>& values) {
    if (!has_column(name)) {
        columns_.emplace_back(name);
    }
    for (std::size_t i = 0; i < rows_.size(); ++i) {
        rows_[i].set(name, values[i]);
    }
}

void Table::drop_column(std::string_view name) {
    auto it = std::ranges::find(columns_, name);
    if (it == columns_.end()) {
        return;
    }
    columns_.erase(it);
    for (auto& row : rows_) {
        row.erase(name);
    }
}

auto Table::column_values(std::string_view name) const -> Result<std::vector<Value>> {
    if (!has_column(name)) {
        return make_error(ErrorKind::UnknownColumn,
                          fmt::format("unknown column: {} (available: {})", name,
                                      format_columns(columns_)));
    }
    std::vector<Value> values;
    values.reserve(rows_.size());
    for (const auto& row : rows_) {
        values.push_back(*row.find(name));
    }
    return values;
}

auto Table::at(std::size_t row, std::string_view column) const -> const Value& {
    const auto* value = rows_.at(row).find(column);
    if (value == nullptr) {
        throw std::out_of_range(fmt::format("no column '{}' in row {}", column, row));
    }
    return *value;
}

auto format_columns(const std::vector<std::string>& columns) -> std::string {
    if (columns.empty()) {
        return "<none>";
    }
    return fmt::format("{}", fmt::join(columns, ", "));
}

}  // namespace tidy
