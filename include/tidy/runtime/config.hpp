#pragma once

#include <tidy/core/error.hpp>
#include <tidy/runtime/source_registry.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tidy::runtime {

/// Settings for one `tidy_run` invocation, filled from the command line.
struct RunConfig {
    std::string program_path;
    /// `name=path` CSV bindings for `data(name)`.
    std::vector<std::string> data;
    /// Directory for relative CSV paths; falls back to TIDY_DATA_PATH.
    std::string data_path;
    /// Null tokens for CSV cells, e.g. `<empty>,NA`.
    std::string nulls = "<empty>,NA";
    std::size_t max_rows = 10;
    std::optional<std::uint64_t> seed;
    bool verbose = false;
    bool list_tables = false;
};

/// Fill unset fields from the environment (TIDY_DATA_PATH).
void apply_environment(RunConfig& config);

/// Split a `name=path` binding. Both halves must be non-empty.
[[nodiscard]] auto parse_binding(const std::string& binding)
    -> Result<std::pair<std::string, std::string>>;

/// Built-in datasets plus one lazy CSV source per `--data` binding.
[[nodiscard]] auto build_sources(const RunConfig& config) -> Result<SourceRegistry>;

/// Apply `--verbose` or TIDY_LOG_LEVEL to spdlog's default logger.
void configure_logging(const RunConfig& config);

}  // namespace tidy::runtime
