#pragma once

#include <tidy/core/table.hpp>
#include <tidy/runtime/source_registry.hpp>

namespace tidy::runtime {

// ─── Built-in datasets ────────────────────────────────────────────────────────

/// Eleven named web colors with `name`, `red`, `green`, `blue` channels.
[[nodiscard]] auto colors_table() -> Table;

/// `{first: 1}`.
[[nodiscard]] auto single_table() -> Table;

/// `{first: 1, second: 100}`, `{first: 2, second: 200}`.
[[nodiscard]] auto double_table() -> Table;

/// Four rows of `name`, `score`, `joined` with one Missing cell per column.
[[nodiscard]] auto missing_table() -> Table;

/// Register `colors`, `single`, `double` and `missing` in `registry`.
void register_builtin_datasets(SourceRegistry& registry);

/// A fresh registry holding only the built-in datasets.
[[nodiscard]] auto builtin_sources() -> SourceRegistry;

}  // namespace tidy::runtime
