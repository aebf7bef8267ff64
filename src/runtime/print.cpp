#include <tidy/runtime/print.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace tidy::runtime {

namespace {

auto quote_and_escape(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');
    for (char ch : text) {
        switch (ch) {
            case '"':
                out.append("\\\"");
                break;
            case '\\':
                out.append("\\\\");
                break;
            case '\n':
                out.append("\\n");
                break;
            case '\t':
                out.append("\\t");
                break;
            case '\r':
                out.append("\\r");
                break;
            default:
                out.push_back(ch);
                break;
        }
    }
    out.push_back('"');
    return out;
}

}  // namespace

auto format_cell(const Value& value) -> std::string {
    if (is_missing(value)) {
        return "NA";
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        return quote_and_escape(*s);
    }
    return to_text(value);
}

auto render_table(const Table& table, std::size_t max_rows) -> std::string {
    if (table.columns().empty()) {
        return "<empty>\n";
    }
    std::string out = fmt::format("rows: {}\n", table.rows());
    auto sink = std::back_inserter(out);

    const auto& columns = table.columns();
    const std::size_t col_count = columns.size();
    const std::size_t shown_rows = std::min(table.rows(), max_rows);

    std::vector<std::size_t> widths(col_count);
    std::vector<std::vector<std::string>> cells(col_count);
    for (std::size_t c = 0; c < col_count; ++c) {
        widths[c] = columns[c].size();
        cells[c].reserve(shown_rows);
        for (std::size_t r = 0; r < shown_rows; ++r) {
            auto cell = format_cell(table.at(r, columns[c]));
            widths[c] = std::max(widths[c], cell.size());
            cells[c].push_back(std::move(cell));
        }
    }

    auto separator = [&]() {
        fmt::format_to(sink, "+");
        for (std::size_t c = 0; c < col_count; ++c) {
            fmt::format_to(sink, "{:-<{}}+", "", widths[c] + 2);
        }
        fmt::format_to(sink, "\n");
    };

    separator();
    fmt::format_to(sink, "|");
    for (std::size_t c = 0; c < col_count; ++c) {
        fmt::format_to(sink, " {:<{}} |", columns[c], widths[c]);
    }
    fmt::format_to(sink, "\n");
    separator();

    for (std::size_t r = 0; r < shown_rows; ++r) {
        fmt::format_to(sink, "|");
        for (std::size_t c = 0; c < col_count; ++c) {
            fmt::format_to(sink, " {:<{}} |", cells[c][r], widths[c]);
        }
        fmt::format_to(sink, "\n");
    }
    separator();

    if (table.rows() > shown_rows) {
        fmt::format_to(sink, "... ({} more rows)\n", table.rows() - shown_rows);
    }
    return out;
}

void print_table(const Table& table, std::size_t max_rows) {
    fmt::print("{}", render_table(table, max_rows));
}

void print_names(std::string_view label, const std::vector<std::string>& names) {
    if (names.empty()) {
        fmt::print("{}: <none>\n", label);
        return;
    }
    fmt::print("{}:", label);
    for (const auto& name : names) {
        fmt::print(" {}", name);
    }
    fmt::print("\n");
}

}  // namespace tidy::runtime
