#include <tidy/expr/serialize.hpp>

#include <fmt/format.h>

#include <cmath>
#include <cstdint>

namespace tidy::expr {

namespace {

using nlohmann::json;

auto malformed(std::string message) -> std::unexpected<Error> {
    return make_error(ErrorKind::MalformedExpression, std::move(message));
}

auto child_to_json(const ExprPtr& child) -> json {
    // An empty slot serializes as null; from_json rejects it.
    return child ? to_json(*child) : json(nullptr);
}

// Whole numbers are written as JSON integers so `0` stays `0` and not `0.0`.
auto number_to_json(double d) -> json {
    constexpr double kExactLimit = 9'007'199'254'740'992.0;  // 2^53
    if (std::isfinite(d) && std::trunc(d) == d && std::fabs(d) < kExactLimit &&
        !(d == 0.0 && std::signbit(d))) {
        return static_cast<std::int64_t>(d);
    }
    return d;
}

auto literal_to_json(const LiteralExpr& lit) -> json {
    return std::visit(
        [](const auto& v) -> json {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Missing>) {
                return nullptr;
            } else if constexpr (std::is_same_v<T, Datetime>) {
                return format_datetime(v);
            } else if constexpr (std::is_same_v<T, double>) {
                return number_to_json(v);
            } else {
                return v;
            }
        },
        lit.value);
}

auto literal_from_json(LiteralKind kind, const json& value) -> Result<Value> {
    if (value.is_null()) {
        return Value{kMissing};
    }
    switch (kind) {
        case LiteralKind::Number:
            if (value.is_number()) {
                return Value{value.get<double>()};
            }
            break;
        case LiteralKind::Text:
            if (value.is_string()) {
                return Value{value.get<std::string>()};
            }
            break;
        case LiteralKind::Logical:
            if (value.is_boolean()) {
                return Value{value.get<bool>()};
            }
            break;
        case LiteralKind::Datetime:
            if (value.is_string()) {
                if (auto parsed = parse_datetime(value.get<std::string>())) {
                    return Value{*parsed};
                }
                return malformed(fmt::format("invalid datetime literal: {}", value.dump()));
            }
            break;
    }
    return malformed(fmt::format("{} literal cannot hold {}", literal_name(kind), value.dump()));
}

auto number_param(const json& value, std::string_view kind) -> Result<double> {
    if (!value.is_number()) {
        return malformed(fmt::format("{} requires numeric parameters, got {}", kind,
                                     value.dump()));
    }
    return value.get<double>();
}

auto require_arity(const json& array, std::size_t operands, std::string_view kind)
    -> Result<void> {
    if (array.size() != operands + 2) {
        return malformed(fmt::format("{} expects {} operand(s), got {}", kind, operands,
                                     array.size() - 2));
    }
    return {};
}

auto child_from_json(const json& value, std::string_view kind, std::string_view slot)
    -> Result<ExprPtr> {
    if (!is_expr_json(value)) {
        return malformed(fmt::format("require expression as {} child of {}", slot, kind));
    }
    return from_json(value);
}

}  // namespace

auto is_expr_json(const json& value) -> bool {
    return value.is_array() && !value.empty() && value[0].is_string() &&
           value[0].get_ref<const std::string&>() == kExprTag;
}

auto to_json(const Expr& expr) -> json {
    json out = json::array({std::string(kExprTag), std::string(kind_name(expr))});
    std::visit(
        [&out](const auto& n) {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, ColumnExpr>) {
                out.push_back(n.name);
            } else if constexpr (std::is_same_v<T, LiteralExpr>) {
                out.push_back(literal_to_json(n));
            } else if constexpr (std::is_same_v<T, RandomExpr>) {
                out.push_back(number_to_json(n.first));
                if (n.kind != RandomKind::Exponential) {
                    out.push_back(number_to_json(n.second));
                }
            } else if constexpr (std::is_same_v<T, UnaryExpr>) {
                out.push_back(child_to_json(n.operand));
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                out.push_back(child_to_json(n.left));
                out.push_back(child_to_json(n.right));
            } else if constexpr (std::is_same_v<T, IfElseExpr>) {
                out.push_back(child_to_json(n.condition));
                out.push_back(child_to_json(n.then_branch));
                out.push_back(child_to_json(n.else_branch));
            }
        },
        expr.node);
    return out;
}

auto from_json(const json& value) -> Result<ExprPtr> {
    if (!is_expr_json(value)) {
        return malformed(fmt::format("not an expression: {}", value.dump()));
    }
    if (value.size() < 2 || !value[1].is_string()) {
        return malformed(fmt::format("expression kind must be a string: {}", value.dump()));
    }
    const auto& kind = value[1].get_ref<const std::string&>();

    if (kind == "column") {
        if (auto ok = require_arity(value, 1, kind); !ok) {
            return std::unexpected(ok.error());
        }
        if (!value[2].is_string() || value[2].get_ref<const std::string&>().empty()) {
            return malformed("column name must be a non-empty string");
        }
        return column(value[2].get<std::string>());
    }
    if (kind == "rownum") {
        if (auto ok = require_arity(value, 0, kind); !ok) {
            return std::unexpected(ok.error());
        }
        return rownum();
    }
    if (auto lit_kind = parse_literal_kind(kind)) {
        if (auto ok = require_arity(value, 1, kind); !ok) {
            return std::unexpected(ok.error());
        }
        auto literal = literal_from_json(*lit_kind, value[2]);
        if (!literal) {
            return std::unexpected(literal.error());
        }
        return std::make_unique<Expr>(
            Expr{LiteralExpr{.kind = *lit_kind, .value = std::move(literal.value())}});
    }
    if (auto rnd_kind = parse_random_kind(kind)) {
        std::size_t params = *rnd_kind == RandomKind::Exponential ? 1 : 2;
        if (auto ok = require_arity(value, params, kind); !ok) {
            return std::unexpected(ok.error());
        }
        auto first = number_param(value[2], kind);
        if (!first) {
            return std::unexpected(first.error());
        }
        if (*rnd_kind == RandomKind::Exponential) {
            return exponential(*first);
        }
        auto second = number_param(value[3], kind);
        if (!second) {
            return std::unexpected(second.error());
        }
        return *rnd_kind == RandomKind::Normal ? normal(*first, *second)
                                               : uniform(*first, *second);
    }
    if (auto op = parse_unary_op(kind)) {
        if (auto ok = require_arity(value, 1, kind); !ok) {
            return std::unexpected(ok.error());
        }
        auto operand = child_from_json(value[2], kind, "operand");
        if (!operand) {
            return operand;
        }
        return unary(*op, std::move(operand.value()));
    }
    if (auto op = parse_binary_op(kind)) {
        if (auto ok = require_arity(value, 2, kind); !ok) {
            return std::unexpected(ok.error());
        }
        auto left = child_from_json(value[2], kind, "left");
        if (!left) {
            return left;
        }
        auto right = child_from_json(value[3], kind, "right");
        if (!right) {
            return right;
        }
        return binary(*op, std::move(left.value()), std::move(right.value()));
    }
    if (kind == "ifElse") {
        if (auto ok = require_arity(value, 3, kind); !ok) {
            return std::unexpected(ok.error());
        }
        auto condition = child_from_json(value[2], kind, "left");
        if (!condition) {
            return condition;
        }
        auto then_branch = child_from_json(value[3], kind, "middle");
        if (!then_branch) {
            return then_branch;
        }
        auto else_branch = child_from_json(value[4], kind, "right");
        if (!else_branch) {
            return else_branch;
        }
        return if_else(std::move(condition.value()), std::move(then_branch.value()),
                       std::move(else_branch.value()));
    }
    return malformed(fmt::format("unknown expression kind: {}", kind));
}

auto serialize(const Expr& expr) -> std::string {
    return to_json(expr).dump();
}

auto deserialize(std::string_view text) -> Result<ExprPtr> {
    auto parsed = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return malformed(fmt::format("invalid JSON: {}", text));
    }
    return from_json(parsed);
}

}  // namespace tidy::expr
