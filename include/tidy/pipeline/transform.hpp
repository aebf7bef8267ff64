#pragma once

#include <tidy/expr/expr.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tidy::pipeline {

// ─── Sources ──────────────────────────────────────────────────────────────────

/// Load a table from the source registry.
struct DataOp {
    std::string name;
};

/// One column `column` holding 1..count.
struct SequenceOp {
    std::string column;
    std::size_t count = 0;
};

/// Largest row count a `sequence` may generate.
inline constexpr std::size_t kMaxSequenceCount = 4'294'967'295;

/// Inner join of two published tables; also a source.
struct JoinOp {
    std::string left_name;
    std::string left_column;
    std::string right_name;
    std::string right_column;
};

// ─── Row operations ───────────────────────────────────────────────────────────

struct FilterOp {
    expr::ExprPtr predicate;
};

struct MutateOp {
    std::string column;
    expr::ExprPtr value;
};

struct SelectOp {
    std::vector<std::string> columns;
};

struct SortOp {
    std::vector<std::string> columns;
    bool descending = false;
};

struct GroupByOp {
    std::string column;
};

struct UngroupOp {};

enum class AggFunc : std::uint8_t {
    Count,
    Sum,
    Mean,
    Median,
    Min,
    Max,
    Variance,
    Std,
};

[[nodiscard]] auto agg_name(AggFunc func) noexcept -> std::string_view;
[[nodiscard]] auto parse_agg_func(std::string_view name) noexcept -> std::optional<AggFunc>;

struct AggSpec {
    AggFunc func = AggFunc::Count;
    std::string column;

    auto operator==(const AggSpec&) const -> bool = default;
};

/// Output column name of an aggregate: `${column}_${func}`.
[[nodiscard]] auto output_name(const AggSpec& spec) -> std::string;

struct SummarizeOp {
    std::vector<AggSpec> aggregates;
};

/// Publish the current table into the manager under `name`.
struct NotifyOp {
    std::string name;
};

using Transform = std::variant<DataOp, SequenceOp, JoinOp, FilterOp, MutateOp, SelectOp, SortOp,
                               GroupByOp, UngroupOp, SummarizeOp, NotifyOp>;

using Pipeline = std::vector<Transform>;

/// Pipelines run in order against one manager; join dependencies may defer some.
using Program = std::vector<Pipeline>;

/// Wire name of the operation (`data`, `filter`, `groupBy`, ...).
[[nodiscard]] auto op_name(const Transform& op) noexcept -> std::string_view;

/// True for operations that produce a table from nothing (data, sequence, join).
[[nodiscard]] auto is_source(const Transform& op) noexcept -> bool;

/// Structural equality; expressions compare with expr::equal.
[[nodiscard]] auto equal(const Transform& lhs, const Transform& rhs) -> bool;
[[nodiscard]] auto equal(const Pipeline& lhs, const Pipeline& rhs) -> bool;

/// Names the pipeline's leading join reads; empty when it starts with another source.
[[nodiscard]] auto join_inputs(const Pipeline& pipeline) -> std::vector<std::string>;

// ─── Builders ─────────────────────────────────────────────────────────────────

[[nodiscard]] auto data(std::string name) -> Transform;
[[nodiscard]] auto sequence(std::string column, std::size_t count) -> Transform;
[[nodiscard]] auto join(std::string left_name, std::string left_column, std::string right_name,
                        std::string right_column) -> Transform;
[[nodiscard]] auto filter(expr::ExprPtr predicate) -> Transform;
[[nodiscard]] auto mutate(std::string column, expr::ExprPtr value) -> Transform;
[[nodiscard]] auto select(std::vector<std::string> columns) -> Transform;
[[nodiscard]] auto sort(std::vector<std::string> columns, bool descending = false) -> Transform;
[[nodiscard]] auto group_by(std::string column) -> Transform;
[[nodiscard]] auto ungroup() -> Transform;
[[nodiscard]] auto summarize(std::vector<AggSpec> aggregates) -> Transform;
[[nodiscard]] auto notify(std::string name) -> Transform;

}  // namespace tidy::pipeline
