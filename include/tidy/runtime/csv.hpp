#pragma once

#include <tidy/core/error.hpp>
#include <tidy/core/table.hpp>

#include <string>
#include <string_view>
#include <unordered_set>

namespace tidy::runtime {

struct CsvReadOptions {
    /// Cells equal to one of these (after trimming) become Missing.
    std::unordered_set<std::string> null_tokens{"", "NA"};
};

/// Parse a comma-separated null list such as `"<empty>,NA"`; `<empty>` stands
/// for the empty cell.
[[nodiscard]] auto parse_null_spec(std::string_view spec) -> CsvReadOptions;

/// Read a CSV file with a header row.
///
/// Each column is typed independently: all present cells numeric gives
/// Numbers, all `true`/`false` gives Logicals, anything else stays Text. I/O
/// and parse failures are reported as SourceError.
[[nodiscard]] auto read_csv(const std::string& path, const CsvReadOptions& options = {})
    -> Result<Table>;

}  // namespace tidy::runtime
