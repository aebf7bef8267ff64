#include <tidy/expr/serialize.hpp>
#include <tidy/pipeline/codec.hpp>

#include <fmt/format.h>

#include <array>
#include <cmath>

namespace tidy::pipeline {

namespace {

using nlohmann::json;

auto malformed(std::string message) -> std::unexpected<Error> {
    return make_error(ErrorKind::MalformedPipeline, std::move(message));
}

auto is_transform_json(const json& value) -> bool {
    return value.is_array() && !value.empty() && value[0].is_string() &&
           value[0].get_ref<const std::string&>() == kTransformTag;
}

auto expr_to_json(const expr::ExprPtr& e) -> json {
    return e ? expr::to_json(*e) : json(nullptr);
}

/// Cursor over the operands of one operation array, with typed accessors.
class Operands {
   public:
    Operands(const json& array, std::string_view op) : array_(array), op_(op) {}

    auto expect_count(std::size_t count) const -> Result<void> {
        if (array_.size() != count + 2) {
            return malformed(fmt::format("{} expects {} operand(s), got {}", op_, count,
                                         array_.size() - 2));
        }
        return {};
    }

    [[nodiscard]] auto count() const -> std::size_t { return array_.size() - 2; }

    [[nodiscard]] auto string(std::size_t i) const -> Result<std::string> {
        const auto& v = array_[i + 2];
        if (!v.is_string() || v.get_ref<const std::string&>().empty()) {
            return malformed(
                fmt::format("{} operand {} must be a non-empty string, got {}", op_, i, v.dump()));
        }
        return v.get<std::string>();
    }

    [[nodiscard]] auto strings(std::size_t i) const -> Result<std::vector<std::string>> {
        const auto& v = array_[i + 2];
        if (!v.is_array()) {
            return malformed(fmt::format("{} operand {} must be a list of column names, got {}",
                                         op_, i, v.dump()));
        }
        std::vector<std::string> out;
        out.reserve(v.size());
        for (const auto& item : v) {
            if (!item.is_string() || item.get_ref<const std::string&>().empty()) {
                return malformed(fmt::format("{} column names must be non-empty strings, got {}",
                                             op_, item.dump()));
            }
            out.push_back(item.get<std::string>());
        }
        return out;
    }

    [[nodiscard]] auto boolean(std::size_t i) const -> Result<bool> {
        const auto& v = array_[i + 2];
        if (!v.is_boolean()) {
            return malformed(
                fmt::format("{} operand {} must be a boolean, got {}", op_, i, v.dump()));
        }
        return v.get<bool>();
    }

    [[nodiscard]] auto count_operand(std::size_t i) const -> Result<std::size_t> {
        const auto& v = array_[i + 2];
        auto too_large = [&] {
            return malformed(fmt::format("{} operand {} must be at most {}, got {}", op_, i,
                                         kMaxSequenceCount, v.dump()));
        };
        if (v.is_number_unsigned()) {
            auto n = v.get<std::uint64_t>();
            if (n > kMaxSequenceCount) {
                return too_large();
            }
            return static_cast<std::size_t>(n);
        }
        if (v.is_number_integer() && v.get<std::int64_t>() >= 0) {
            auto n = static_cast<std::uint64_t>(v.get<std::int64_t>());
            if (n > kMaxSequenceCount) {
                return too_large();
            }
            return static_cast<std::size_t>(n);
        }
        if (v.is_number_float()) {
            double d = v.get<double>();
            if (d >= 0.0 && std::floor(d) == d) {
                if (d > static_cast<double>(kMaxSequenceCount)) {
                    return too_large();
                }
                return static_cast<std::size_t>(d);
            }
        }
        return malformed(fmt::format("{} operand {} must be a non-negative integer, got {}", op_,
                                     i, v.dump()));
    }

    [[nodiscard]] auto expression(std::size_t i) const -> Result<expr::ExprPtr> {
        const auto& v = array_[i + 2];
        if (!expr::is_expr_json(v)) {
            return malformed(
                fmt::format("{} operand {} must be an expression, got {}", op_, i, v.dump()));
        }
        return expr::from_json(v);
    }

    [[nodiscard]] auto aggregate(std::size_t i) const -> Result<AggSpec> {
        const auto& v = array_[i + 2];
        if (!v.is_array() || v.size() != 2 || !v[0].is_string() || !v[1].is_string() ||
            v[1].get_ref<const std::string&>().empty()) {
            return malformed(fmt::format("summarize expects [function, column] pairs, got {}",
                                         v.dump()));
        }
        auto func = parse_agg_func(v[0].get_ref<const std::string&>());
        if (!func) {
            return malformed(fmt::format("unknown summarize function: {}", v[0].dump()));
        }
        return AggSpec{.func = *func, .column = v[1].get<std::string>()};
    }

   private:
    const json& array_;
    std::string_view op_;
};

auto decode(const Operands& in, std::string_view op) -> Result<Transform> {
    if (op == "data") {
        if (auto ok = in.expect_count(1); !ok) {
            return std::unexpected(ok.error());
        }
        return in.string(0).transform([](std::string name) { return data(std::move(name)); });
    }
    if (op == "sequence") {
        if (auto ok = in.expect_count(2); !ok) {
            return std::unexpected(ok.error());
        }
        auto column = in.string(0);
        if (!column) {
            return std::unexpected(column.error());
        }
        auto count = in.count_operand(1);
        if (!count) {
            return std::unexpected(count.error());
        }
        return sequence(std::move(*column), *count);
    }
    if (op == "filter") {
        if (auto ok = in.expect_count(1); !ok) {
            return std::unexpected(ok.error());
        }
        return in.expression(0).transform(
            [](expr::ExprPtr predicate) { return filter(std::move(predicate)); });
    }
    if (op == "mutate") {
        if (auto ok = in.expect_count(2); !ok) {
            return std::unexpected(ok.error());
        }
        auto column = in.string(0);
        if (!column) {
            return std::unexpected(column.error());
        }
        auto value = in.expression(1);
        if (!value) {
            return std::unexpected(value.error());
        }
        return mutate(std::move(*column), std::move(*value));
    }
    if (op == "select") {
        if (auto ok = in.expect_count(1); !ok) {
            return std::unexpected(ok.error());
        }
        return in.strings(0).transform(
            [](std::vector<std::string> columns) { return select(std::move(columns)); });
    }
    if (op == "sort") {
        if (auto ok = in.expect_count(2); !ok) {
            return std::unexpected(ok.error());
        }
        auto columns = in.strings(0);
        if (!columns) {
            return std::unexpected(columns.error());
        }
        auto descending = in.boolean(1);
        if (!descending) {
            return std::unexpected(descending.error());
        }
        return sort(std::move(*columns), *descending);
    }
    if (op == "groupBy") {
        if (auto ok = in.expect_count(1); !ok) {
            return std::unexpected(ok.error());
        }
        return in.string(0).transform(
            [](std::string column) { return group_by(std::move(column)); });
    }
    if (op == "ungroup") {
        if (auto ok = in.expect_count(0); !ok) {
            return std::unexpected(ok.error());
        }
        return ungroup();
    }
    if (op == "summarize") {
        std::vector<AggSpec> aggregates;
        aggregates.reserve(in.count());
        for (std::size_t i = 0; i < in.count(); ++i) {
            auto spec = in.aggregate(i);
            if (!spec) {
                return std::unexpected(spec.error());
            }
            aggregates.push_back(std::move(*spec));
        }
        return summarize(std::move(aggregates));
    }
    if (op == "join") {
        if (auto ok = in.expect_count(4); !ok) {
            return std::unexpected(ok.error());
        }
        std::array<std::string, 4> parts;
        for (std::size_t i = 0; i < parts.size(); ++i) {
            auto part = in.string(i);
            if (!part) {
                return std::unexpected(part.error());
            }
            parts[i] = std::move(*part);
        }
        return join(std::move(parts[0]), std::move(parts[1]), std::move(parts[2]),
                    std::move(parts[3]));
    }
    if (op == "notify") {
        if (auto ok = in.expect_count(1); !ok) {
            return std::unexpected(ok.error());
        }
        return in.string(0).transform([](std::string name) { return notify(std::move(name)); });
    }
    return malformed(fmt::format("unknown operation: {}", op));
}

}  // namespace

auto to_json(const Transform& op) -> json {
    json out = json::array({std::string(kTransformTag), std::string(op_name(op))});
    std::visit(
        [&out](const auto& o) {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, DataOp>) {
                out.push_back(o.name);
            } else if constexpr (std::is_same_v<T, SequenceOp>) {
                out.push_back(o.column);
                out.push_back(o.count);
            } else if constexpr (std::is_same_v<T, JoinOp>) {
                out.push_back(o.left_name);
                out.push_back(o.left_column);
                out.push_back(o.right_name);
                out.push_back(o.right_column);
            } else if constexpr (std::is_same_v<T, FilterOp>) {
                out.push_back(expr_to_json(o.predicate));
            } else if constexpr (std::is_same_v<T, MutateOp>) {
                out.push_back(o.column);
                out.push_back(expr_to_json(o.value));
            } else if constexpr (std::is_same_v<T, SelectOp>) {
                out.push_back(o.columns);
            } else if constexpr (std::is_same_v<T, SortOp>) {
                out.push_back(o.columns);
                out.push_back(o.descending);
            } else if constexpr (std::is_same_v<T, GroupByOp>) {
                out.push_back(o.column);
            } else if constexpr (std::is_same_v<T, SummarizeOp>) {
                for (const auto& spec : o.aggregates) {
                    out.push_back(json::array({std::string(agg_name(spec.func)), spec.column}));
                }
            } else if constexpr (std::is_same_v<T, NotifyOp>) {
                out.push_back(o.name);
            }
        },
        op);
    return out;
}

auto to_json(const Pipeline& pipeline) -> json {
    json out = json::array();
    for (const auto& op : pipeline) {
        out.push_back(to_json(op));
    }
    return out;
}

auto to_json(const Program& program) -> json {
    json out = json::array();
    for (const auto& pipeline : program) {
        out.push_back(to_json(pipeline));
    }
    return out;
}

auto transform_from_json(const json& value) -> Result<Transform> {
    if (!is_transform_json(value)) {
        return malformed(fmt::format("not an operation: {}", value.dump()));
    }
    if (value.size() < 2 || !value[1].is_string()) {
        return malformed(fmt::format("operation name must be a string: {}", value.dump()));
    }
    const auto& op = value[1].get_ref<const std::string&>();
    return decode(Operands(value, op), op);
}

auto pipeline_from_json(const json& value) -> Result<Pipeline> {
    if (!value.is_array()) {
        return malformed(fmt::format("pipeline must be an array, got {}", value.dump()));
    }
    Pipeline pipeline;
    pipeline.reserve(value.size());
    for (const auto& item : value) {
        auto op = transform_from_json(item);
        if (!op) {
            return std::unexpected(op.error());
        }
        pipeline.push_back(std::move(*op));
    }
    return pipeline;
}

auto program_from_json(const json& value) -> Result<Program> {
    if (!value.is_array()) {
        return malformed(fmt::format("program must be an array, got {}", value.dump()));
    }
    Program program;
    program.reserve(value.size());
    for (const auto& item : value) {
        auto pipeline = pipeline_from_json(item);
        if (!pipeline) {
            return std::unexpected(pipeline.error());
        }
        program.push_back(std::move(*pipeline));
    }
    return program;
}

auto parse_program(std::string_view text) -> Result<Program> {
    auto parsed = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return malformed("program is not valid JSON");
    }
    if (parsed.is_array() && !parsed.empty() && is_transform_json(parsed[0])) {
        auto pipeline = pipeline_from_json(parsed);
        if (!pipeline) {
            return std::unexpected(pipeline.error());
        }
        Program program;
        program.push_back(std::move(*pipeline));
        return program;
    }
    return program_from_json(parsed);
}

auto serialize(const Pipeline& pipeline) -> std::string {
    return to_json(pipeline).dump();
}

}  // namespace tidy::pipeline
