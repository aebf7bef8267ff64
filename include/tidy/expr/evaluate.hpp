#pragma once

#include <tidy/core/error.hpp>
#include <tidy/core/table.hpp>
#include <tidy/core/value.hpp>
#include <tidy/expr/expr.hpp>

#include <cstddef>
#include <cstdint>

namespace tidy::expr {

/// Evaluate an expression against one row.
///
/// `row_index` is the row's position in the table being processed; it is what
/// `rownum` returns. Missing operands propagate through arithmetic, comparison
/// and conversion nodes; `and`/`or` short-circuit and return the deciding
/// operand value unchanged. Ill-typed operands fail with TypeError or
/// TypeMismatch, an absent column with UnknownColumn, and an empty child slot
/// with MalformedExpression.
[[nodiscard]] auto evaluate(const Expr& expr, const Row& row, std::size_t row_index)
    -> Result<Value>;

/// Reseed the process-wide generator used by the random-variate nodes.
void seed_random(std::uint64_t seed);

// ─── Conversions ─────────────────────────────────────────────────────────────
//  Exposed for the pipeline engine and tests. Each maps Missing to Missing.

[[nodiscard]] auto convert_to_number(const Value& value) -> Value;
[[nodiscard]] auto convert_to_datetime(const Value& value) -> Value;
[[nodiscard]] auto convert_to_text(const Value& value) -> Value;
[[nodiscard]] auto convert_to_logical(const Value& value) -> Value;

}  // namespace tidy::expr
