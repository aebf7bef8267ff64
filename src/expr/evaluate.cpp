#include <tidy/expr/evaluate.hpp>

#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <cmath>
#include <random>

namespace tidy::expr {

namespace {

auto random_engine() -> std::mt19937_64& {
    static std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

auto malformed(std::string_view what) -> std::unexpected<Error> {
    return make_error(ErrorKind::MalformedExpression,
                      fmt::format("{} requires an expression as child", what));
}

auto require_number(const Value& value, std::string_view op) -> Result<void> {
    if (is_missing(value) || std::holds_alternative<double>(value)) {
        return {};
    }
    return make_error(ErrorKind::TypeError,
                      fmt::format("require number for {}, got {}", op,
                                  type_name(type_of(value))));
}

auto parse_number_prefix(std::string_view text) -> Value {
    std::size_t pos = 0;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
        ++pos;
    }
    if (pos < text.size() && text[pos] == '+') {
        ++pos;
        if (pos < text.size() && text[pos] == '-') {
            return kMissing;
        }
    }
    double parsed = 0.0;
    auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + text.size(), parsed);
    if (ec != std::errc{}) {
        return kMissing;
    }
    return safe_number(parsed);
}

auto sample(const RandomExpr& node) -> Value {
    auto& engine = random_engine();
    switch (node.kind) {
        case RandomKind::Exponential: {
            if (!(node.first > 0.0) || !std::isfinite(node.first)) {
                return kMissing;
            }
            std::exponential_distribution<double> dist{node.first};
            return safe_number(dist(engine));
        }
        case RandomKind::Normal: {
            if (!(node.second > 0.0) || !std::isfinite(node.first) ||
                !std::isfinite(node.second)) {
                return kMissing;
            }
            std::normal_distribution<double> dist{node.first, node.second};
            return safe_number(dist(engine));
        }
        case RandomKind::Uniform: {
            if (!(node.first < node.second) || !std::isfinite(node.first) ||
                !std::isfinite(node.second)) {
                return kMissing;
            }
            std::uniform_real_distribution<double> dist{node.first, node.second};
            return safe_number(dist(engine));
        }
    }
    return kMissing;
}

auto apply_arithmetic(BinaryOp op, double lhs, double rhs) -> Value {
    switch (op) {
        case BinaryOp::Add:
            return safe_number(lhs + rhs);
        case BinaryOp::Subtract:
            return safe_number(lhs - rhs);
        case BinaryOp::Multiply:
            return safe_number(lhs * rhs);
        case BinaryOp::Divide:
            return safe_number(lhs / rhs);
        case BinaryOp::Remainder:
            return safe_number(std::fmod(lhs, rhs));
        case BinaryOp::Power:
            return safe_number(std::pow(lhs, rhs));
        default:
            return kMissing;
    }
}

auto apply_comparison(BinaryOp op, const Value& lhs, const Value& rhs) -> Result<Value> {
    if (is_missing(lhs) || is_missing(rhs)) {
        return kMissing;
    }
    if (lhs.index() != rhs.index()) {
        return make_error(ErrorKind::TypeMismatch,
                          fmt::format("require equal types for {}, got {} and {}",
                                      binary_name(op), type_name(type_of(lhs)),
                                      type_name(type_of(rhs))));
    }
    int order = compare_same_type(lhs, rhs);
    switch (op) {
        case BinaryOp::Equal:
            return Value{values_equal(lhs, rhs)};
        case BinaryOp::NotEqual:
            return Value{!values_equal(lhs, rhs)};
        case BinaryOp::Greater:
            return Value{order > 0};
        case BinaryOp::GreaterEqual:
            return Value{order >= 0};
        case BinaryOp::Less:
            return Value{order < 0};
        case BinaryOp::LessEqual:
            return Value{order <= 0};
        default:
            return kMissing;
    }
}

auto extract_field(UnaryOp op, const Value& value) -> Result<Value> {
    if (is_missing(value)) {
        return kMissing;
    }
    const auto* dt = std::get_if<Datetime>(&value);
    if (dt == nullptr) {
        return make_error(ErrorKind::TypeError,
                          fmt::format("require datetime for {}, got {}", unary_name(op),
                                      type_name(type_of(value))));
    }
    auto fields = datetime_fields(*dt);
    switch (op) {
        case UnaryOp::ToYear:
            return Value{static_cast<double>(fields.year)};
        case UnaryOp::ToMonth:
            return Value{static_cast<double>(fields.month)};
        case UnaryOp::ToDay:
            return Value{static_cast<double>(fields.day)};
        case UnaryOp::ToWeekday:
            return Value{static_cast<double>(fields.weekday)};
        case UnaryOp::ToHours:
            return Value{static_cast<double>(fields.hours)};
        case UnaryOp::ToMinutes:
            return Value{static_cast<double>(fields.minutes)};
        case UnaryOp::ToSeconds:
            return Value{static_cast<double>(fields.seconds)};
        default:
            return kMissing;
    }
}

auto type_check(UnaryOp op, const Value& value) -> Value {
    if (op == UnaryOp::IsMissing) {
        return is_missing(value);
    }
    if (is_missing(value)) {
        return kMissing;
    }
    switch (op) {
        case UnaryOp::IsDatetime:
            return std::holds_alternative<Datetime>(value);
        case UnaryOp::IsLogical:
            return std::holds_alternative<bool>(value);
        case UnaryOp::IsNumber:
            return std::holds_alternative<double>(value);
        case UnaryOp::IsText:
            return std::holds_alternative<std::string>(value);
        default:
            return kMissing;
    }
}

auto eval_unary(const UnaryExpr& node, const Row& row, std::size_t row_index) -> Result<Value> {
    if (!node.operand) {
        return malformed(unary_name(node.op));
    }
    auto operand = evaluate(*node.operand, row, row_index);
    if (!operand) {
        return operand;
    }
    const Value& value = operand.value();
    switch (node.op) {
        case UnaryOp::Negate: {
            if (auto ok = require_number(value, "negate"); !ok) {
                return std::unexpected(ok.error());
            }
            if (is_missing(value)) {
                return kMissing;
            }
            return safe_number(-std::get<double>(value));
        }
        case UnaryOp::Not:
            if (is_missing(value)) {
                return kMissing;
            }
            return Value{!is_truthy(value)};
        case UnaryOp::IsDatetime:
        case UnaryOp::IsLogical:
        case UnaryOp::IsMissing:
        case UnaryOp::IsNumber:
        case UnaryOp::IsText:
            return type_check(node.op, value);
        case UnaryOp::ToDatetime:
            return convert_to_datetime(value);
        case UnaryOp::ToLogical:
            return convert_to_logical(value);
        case UnaryOp::ToNumber:
            return convert_to_number(value);
        case UnaryOp::ToText:
            return convert_to_text(value);
        case UnaryOp::ToYear:
        case UnaryOp::ToMonth:
        case UnaryOp::ToDay:
        case UnaryOp::ToWeekday:
        case UnaryOp::ToHours:
        case UnaryOp::ToMinutes:
        case UnaryOp::ToSeconds:
            return extract_field(node.op, value);
    }
    return make_error(ErrorKind::MalformedExpression, "unknown unary operator");
}

auto eval_binary(const BinaryExpr& node, const Row& row, std::size_t row_index)
    -> Result<Value> {
    if (!node.left || !node.right) {
        return malformed(binary_name(node.op));
    }
    auto left = evaluate(*node.left, row, row_index);
    if (!left) {
        return left;
    }

    // Short-circuit: the deciding operand is returned as is.
    if (node.op == BinaryOp::And) {
        if (!is_truthy(left.value())) {
            return left;
        }
        return evaluate(*node.right, row, row_index);
    }
    if (node.op == BinaryOp::Or) {
        if (is_truthy(left.value())) {
            return left;
        }
        return evaluate(*node.right, row, row_index);
    }

    switch (node.op) {
        case BinaryOp::Add:
        case BinaryOp::Subtract:
        case BinaryOp::Multiply:
        case BinaryOp::Divide:
        case BinaryOp::Remainder:
        case BinaryOp::Power: {
            if (auto ok = require_number(left.value(), binary_name(node.op)); !ok) {
                return std::unexpected(ok.error());
            }
            auto right = evaluate(*node.right, row, row_index);
            if (!right) {
                return right;
            }
            if (auto ok = require_number(right.value(), binary_name(node.op)); !ok) {
                return std::unexpected(ok.error());
            }
            if (is_missing(left.value()) || is_missing(right.value())) {
                return kMissing;
            }
            return apply_arithmetic(node.op, std::get<double>(left.value()),
                                    std::get<double>(right.value()));
        }
        default: {
            auto right = evaluate(*node.right, row, row_index);
            if (!right) {
                return right;
            }
            return apply_comparison(node.op, left.value(), right.value());
        }
    }
}

auto eval_if_else(const IfElseExpr& node, const Row& row, std::size_t row_index)
    -> Result<Value> {
    if (!node.condition || !node.then_branch || !node.else_branch) {
        return malformed("ifElse");
    }
    auto condition = evaluate(*node.condition, row, row_index);
    if (!condition) {
        return condition;
    }
    if (is_missing(condition.value())) {
        return kMissing;
    }
    const auto& branch = is_truthy(condition.value()) ? *node.then_branch : *node.else_branch;
    return evaluate(branch, row, row_index);
}

}  // namespace

auto evaluate(const Expr& expr, const Row& row, std::size_t row_index) -> Result<Value> {
    if (const auto* col = std::get_if<ColumnExpr>(&expr.node)) {
        const auto* value = row.find(col->name);
        if (value == nullptr) {
            std::vector<std::string> names;
            names.reserve(row.size());
            for (const auto& cell : row.cells()) {
                names.push_back(cell.name);
            }
            return make_error(ErrorKind::UnknownColumn,
                              fmt::format("unknown column in expression: {} (available: {})",
                                          col->name, format_columns(names)));
        }
        return *value;
    }
    if (const auto* lit = std::get_if<LiteralExpr>(&expr.node)) {
        return lit->value;
    }
    if (std::holds_alternative<RowNumExpr>(expr.node)) {
        return Value{static_cast<double>(row_index)};
    }
    if (const auto* rnd = std::get_if<RandomExpr>(&expr.node)) {
        return sample(*rnd);
    }
    if (const auto* un = std::get_if<UnaryExpr>(&expr.node)) {
        return eval_unary(*un, row, row_index);
    }
    if (const auto* bin = std::get_if<BinaryExpr>(&expr.node)) {
        return eval_binary(*bin, row, row_index);
    }
    return eval_if_else(std::get<IfElseExpr>(expr.node), row, row_index);
}

void seed_random(std::uint64_t seed) {
    random_engine().seed(seed);
}

auto convert_to_number(const Value& value) -> Value {
    return std::visit(
        [](const auto& v) -> Value {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Missing>) {
                return kMissing;
            } else if constexpr (std::is_same_v<T, double>) {
                return v;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return parse_number_prefix(v);
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? 1.0 : 0.0;
            } else {
                return static_cast<double>(v.millis);
            }
        },
        value);
}

auto convert_to_datetime(const Value& value) -> Value {
    if (const auto* dt = std::get_if<Datetime>(&value)) {
        return *dt;
    }
    if (const auto* num = std::get_if<double>(&value)) {
        if (!std::isfinite(*num) || std::trunc(*num) < static_cast<double>(kMinDatetimeMillis) ||
            std::trunc(*num) > static_cast<double>(kMaxDatetimeMillis)) {
            return kMissing;
        }
        return Datetime{static_cast<std::int64_t>(std::trunc(*num))};
    }
    if (const auto* str = std::get_if<std::string>(&value)) {
        if (auto parsed = parse_datetime(*str)) {
            return *parsed;
        }
    }
    return kMissing;
}

auto convert_to_text(const Value& value) -> Value {
    if (is_missing(value)) {
        return kMissing;
    }
    return to_text(value);
}

auto convert_to_logical(const Value& value) -> Value {
    if (is_missing(value)) {
        return kMissing;
    }
    return is_truthy(value);
}

}  // namespace tidy::expr
