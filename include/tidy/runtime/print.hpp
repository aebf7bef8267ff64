#pragma once

#include <tidy/core/table.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace tidy::runtime {

/// Display form of a cell: text is quoted, Missing prints as `NA`.
[[nodiscard]] auto format_cell(const Value& value) -> std::string;

/// Render a boxed ASCII table showing at most `max_rows` rows.
[[nodiscard]] auto render_table(const Table& table, std::size_t max_rows = 10) -> std::string;

/// Print `render_table` to stdout.
void print_table(const Table& table, std::size_t max_rows = 10);

/// One line listing registered names, e.g. `tables: left right`.
void print_names(std::string_view label, const std::vector<std::string>& names);

}  // namespace tidy::runtime
