#include <tidy/pipeline/transform.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <utility>

namespace tidy::pipeline {

namespace {

constexpr std::array<std::pair<AggFunc, std::string_view>, 8> kAggNames = {{
    {AggFunc::Count, "count"},
    {AggFunc::Sum, "sum"},
    {AggFunc::Mean, "mean"},
    {AggFunc::Median, "median"},
    {AggFunc::Min, "min"},
    {AggFunc::Max, "max"},
    {AggFunc::Variance, "variance"},
    {AggFunc::Std, "std"},
}};

auto expr_equal(const expr::ExprPtr& lhs, const expr::ExprPtr& rhs) -> bool {
    if (!lhs || !rhs) {
        return !lhs && !rhs;
    }
    return expr::equal(*lhs, *rhs);
}

}  // namespace

auto agg_name(AggFunc func) noexcept -> std::string_view {
    for (const auto& [entry, name] : kAggNames) {
        if (entry == func) {
            return name;
        }
    }
    return "unknown";
}

auto parse_agg_func(std::string_view name) noexcept -> std::optional<AggFunc> {
    for (const auto& [entry, text] : kAggNames) {
        if (text == name) {
            return entry;
        }
    }
    return std::nullopt;
}

auto output_name(const AggSpec& spec) -> std::string {
    return fmt::format("{}_{}", spec.column, agg_name(spec.func));
}

auto op_name(const Transform& op) noexcept -> std::string_view {
    return std::visit(
        [](const auto& o) -> std::string_view {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, DataOp>) {
                return "data";
            } else if constexpr (std::is_same_v<T, SequenceOp>) {
                return "sequence";
            } else if constexpr (std::is_same_v<T, JoinOp>) {
                return "join";
            } else if constexpr (std::is_same_v<T, FilterOp>) {
                return "filter";
            } else if constexpr (std::is_same_v<T, MutateOp>) {
                return "mutate";
            } else if constexpr (std::is_same_v<T, SelectOp>) {
                return "select";
            } else if constexpr (std::is_same_v<T, SortOp>) {
                return "sort";
            } else if constexpr (std::is_same_v<T, GroupByOp>) {
                return "groupBy";
            } else if constexpr (std::is_same_v<T, UngroupOp>) {
                return "ungroup";
            } else if constexpr (std::is_same_v<T, SummarizeOp>) {
                return "summarize";
            } else {
                return "notify";
            }
        },
        op);
}

auto is_source(const Transform& op) noexcept -> bool {
    return std::holds_alternative<DataOp>(op) || std::holds_alternative<SequenceOp>(op) ||
           std::holds_alternative<JoinOp>(op);
}

auto equal(const Transform& lhs, const Transform& rhs) -> bool {
    if (lhs.index() != rhs.index()) {
        return false;
    }
    return std::visit(
        [&rhs](const auto& l) -> bool {
            using T = std::decay_t<decltype(l)>;
            const auto& r = std::get<T>(rhs);
            if constexpr (std::is_same_v<T, DataOp>) {
                return l.name == r.name;
            } else if constexpr (std::is_same_v<T, SequenceOp>) {
                return l.column == r.column && l.count == r.count;
            } else if constexpr (std::is_same_v<T, JoinOp>) {
                return l.left_name == r.left_name && l.left_column == r.left_column &&
                       l.right_name == r.right_name && l.right_column == r.right_column;
            } else if constexpr (std::is_same_v<T, FilterOp>) {
                return expr_equal(l.predicate, r.predicate);
            } else if constexpr (std::is_same_v<T, MutateOp>) {
                return l.column == r.column && expr_equal(l.value, r.value);
            } else if constexpr (std::is_same_v<T, SelectOp>) {
                return l.columns == r.columns;
            } else if constexpr (std::is_same_v<T, SortOp>) {
                return l.columns == r.columns && l.descending == r.descending;
            } else if constexpr (std::is_same_v<T, GroupByOp>) {
                return l.column == r.column;
            } else if constexpr (std::is_same_v<T, UngroupOp>) {
                return true;
            } else if constexpr (std::is_same_v<T, SummarizeOp>) {
                return l.aggregates == r.aggregates;
            } else {
                return l.name == r.name;
            }
        },
        lhs);
}

auto equal(const Pipeline& lhs, const Pipeline& rhs) -> bool {
    return std::ranges::equal(lhs, rhs, [](const Transform& l, const Transform& r) {
        return equal(l, r);
    });
}

auto join_inputs(const Pipeline& pipeline) -> std::vector<std::string> {
    if (pipeline.empty()) {
        return {};
    }
    if (const auto* j = std::get_if<JoinOp>(&pipeline.front())) {
        return {j->left_name, j->right_name};
    }
    return {};
}

// ─── Builders ─────────────────────────────────────────────────────────────────

auto data(std::string name) -> Transform {
    return DataOp{.name = std::move(name)};
}

auto sequence(std::string column, std::size_t count) -> Transform {
    return SequenceOp{.column = std::move(column), .count = count};
}

auto join(std::string left_name, std::string left_column, std::string right_name,
          std::string right_column) -> Transform {
    return JoinOp{.left_name = std::move(left_name),
                  .left_column = std::move(left_column),
                  .right_name = std::move(right_name),
                  .right_column = std::move(right_column)};
}

auto filter(expr::ExprPtr predicate) -> Transform {
    return FilterOp{.predicate = std::move(predicate)};
}

auto mutate(std::string column, expr::ExprPtr value) -> Transform {
    return MutateOp{.column = std::move(column), .value = std::move(value)};
}

auto select(std::vector<std::string> columns) -> Transform {
    return SelectOp{.columns = std::move(columns)};
}

auto sort(std::vector<std::string> columns, bool descending) -> Transform {
    return SortOp{.columns = std::move(columns), .descending = descending};
}

auto group_by(std::string column) -> Transform {
    return GroupByOp{.column = std::move(column)};
}

auto ungroup() -> Transform {
    return UngroupOp{};
}

auto summarize(std::vector<AggSpec> aggregates) -> Transform {
    return SummarizeOp{.aggregates = std::move(aggregates)};
}

auto notify(std::string name) -> Transform {
    return NotifyOp{.name = std::move(name)};
}

}  // namespace tidy::pipeline
