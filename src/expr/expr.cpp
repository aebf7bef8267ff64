#include <tidy/expr/expr.hpp>

#include <array>
#include <utility>

namespace tidy::expr {

namespace {

template <typename Enum, std::size_t N>
auto lookup_name(const std::array<std::pair<Enum, std::string_view>, N>& table,
                 std::string_view name) noexcept -> std::optional<Enum> {
    for (const auto& [value, text] : table) {
        if (text == name) {
            return value;
        }
    }
    return std::nullopt;
}

template <typename Enum, std::size_t N>
auto name_of(const std::array<std::pair<Enum, std::string_view>, N>& table, Enum value) noexcept
    -> std::string_view {
    for (const auto& [entry, text] : table) {
        if (entry == value) {
            return text;
        }
    }
    return "unknown";
}

constexpr std::array<std::pair<LiteralKind, std::string_view>, 4> kLiteralNames = {{
    {LiteralKind::Datetime, "datetime"},
    {LiteralKind::Logical, "logical"},
    {LiteralKind::Number, "number"},
    {LiteralKind::Text, "text"},
}};

constexpr std::array<std::pair<RandomKind, std::string_view>, 3> kRandomNames = {{
    {RandomKind::Exponential, "exponential"},
    {RandomKind::Normal, "normal"},
    {RandomKind::Uniform, "uniform"},
}};

constexpr std::array<std::pair<UnaryOp, std::string_view>, 18> kUnaryNames = {{
    {UnaryOp::Negate, "negate"},
    {UnaryOp::Not, "not"},
    {UnaryOp::IsDatetime, "isDatetime"},
    {UnaryOp::IsLogical, "isLogical"},
    {UnaryOp::IsMissing, "isMissing"},
    {UnaryOp::IsNumber, "isNumber"},
    {UnaryOp::IsText, "isText"},
    {UnaryOp::ToDatetime, "toDatetime"},
    {UnaryOp::ToLogical, "toLogical"},
    {UnaryOp::ToNumber, "toNumber"},
    {UnaryOp::ToText, "toString"},
    {UnaryOp::ToYear, "toYear"},
    {UnaryOp::ToMonth, "toMonth"},
    {UnaryOp::ToDay, "toDay"},
    {UnaryOp::ToWeekday, "toWeekday"},
    {UnaryOp::ToHours, "toHours"},
    {UnaryOp::ToMinutes, "toMinutes"},
    {UnaryOp::ToSeconds, "toSeconds"},
}};

constexpr std::array<std::pair<BinaryOp, std::string_view>, 14> kBinaryNames = {{
    {BinaryOp::Add, "add"},
    {BinaryOp::Subtract, "subtract"},
    {BinaryOp::Multiply, "multiply"},
    {BinaryOp::Divide, "divide"},
    {BinaryOp::Remainder, "remainder"},
    {BinaryOp::Power, "power"},
    {BinaryOp::Equal, "equal"},
    {BinaryOp::NotEqual, "notEqual"},
    {BinaryOp::Greater, "greater"},
    {BinaryOp::GreaterEqual, "greaterEqual"},
    {BinaryOp::Less, "less"},
    {BinaryOp::LessEqual, "lessEqual"},
    {BinaryOp::And, "and"},
    {BinaryOp::Or, "or"},
}};

auto child_equal(const ExprPtr& lhs, const ExprPtr& rhs) -> bool {
    if (!lhs || !rhs) {
        return !lhs && !rhs;
    }
    return equal(*lhs, *rhs);
}

auto clone_child(const ExprPtr& child) -> ExprPtr {
    return child ? clone(*child) : nullptr;
}

auto make(auto node) -> ExprPtr {
    return std::make_unique<Expr>(Expr{std::move(node)});
}

}  // namespace

auto literal_name(LiteralKind kind) noexcept -> std::string_view {
    return name_of(kLiteralNames, kind);
}

auto random_name(RandomKind kind) noexcept -> std::string_view {
    return name_of(kRandomNames, kind);
}

auto unary_name(UnaryOp op) noexcept -> std::string_view {
    return name_of(kUnaryNames, op);
}

auto binary_name(BinaryOp op) noexcept -> std::string_view {
    return name_of(kBinaryNames, op);
}

auto parse_literal_kind(std::string_view name) noexcept -> std::optional<LiteralKind> {
    return lookup_name(kLiteralNames, name);
}

auto parse_random_kind(std::string_view name) noexcept -> std::optional<RandomKind> {
    return lookup_name(kRandomNames, name);
}

auto parse_unary_op(std::string_view name) noexcept -> std::optional<UnaryOp> {
    return lookup_name(kUnaryNames, name);
}

auto parse_binary_op(std::string_view name) noexcept -> std::optional<BinaryOp> {
    return lookup_name(kBinaryNames, name);
}

auto kind_name(const Expr& expr) noexcept -> std::string_view {
    if (std::holds_alternative<ColumnExpr>(expr.node)) {
        return "column";
    }
    if (const auto* lit = std::get_if<LiteralExpr>(&expr.node)) {
        return literal_name(lit->kind);
    }
    if (std::holds_alternative<RowNumExpr>(expr.node)) {
        return "rownum";
    }
    if (const auto* rnd = std::get_if<RandomExpr>(&expr.node)) {
        return random_name(rnd->kind);
    }
    if (const auto* un = std::get_if<UnaryExpr>(&expr.node)) {
        return unary_name(un->op);
    }
    if (const auto* bin = std::get_if<BinaryExpr>(&expr.node)) {
        return binary_name(bin->op);
    }
    return "ifElse";
}

auto equal(const Expr& lhs, const Expr& rhs) -> bool {
    if (lhs.node.index() != rhs.node.index()) {
        return false;
    }
    return std::visit(
        [&rhs](const auto& l) -> bool {
            using T = std::decay_t<decltype(l)>;
            const auto& r = std::get<T>(rhs.node);
            if constexpr (std::is_same_v<T, ColumnExpr>) {
                return l.name == r.name;
            } else if constexpr (std::is_same_v<T, LiteralExpr>) {
                // Structural: two Missing literals of the same kind are the same node.
                return l.kind == r.kind && l.value == r.value;
            } else if constexpr (std::is_same_v<T, RowNumExpr>) {
                return true;
            } else if constexpr (std::is_same_v<T, RandomExpr>) {
                return l.kind == r.kind && l.first == r.first && l.second == r.second;
            } else if constexpr (std::is_same_v<T, UnaryExpr>) {
                return l.op == r.op && child_equal(l.operand, r.operand);
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                return l.op == r.op && child_equal(l.left, r.left) &&
                       child_equal(l.right, r.right);
            } else {
                return child_equal(l.condition, r.condition) &&
                       child_equal(l.then_branch, r.then_branch) &&
                       child_equal(l.else_branch, r.else_branch);
            }
        },
        lhs.node);
}

auto clone(const Expr& expr) -> ExprPtr {
    return std::visit(
        [](const auto& n) -> ExprPtr {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, UnaryExpr>) {
                return make(UnaryExpr{.op = n.op, .operand = clone_child(n.operand)});
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                return make(BinaryExpr{
                    .op = n.op, .left = clone_child(n.left), .right = clone_child(n.right)});
            } else if constexpr (std::is_same_v<T, IfElseExpr>) {
                return make(IfElseExpr{.condition = clone_child(n.condition),
                                       .then_branch = clone_child(n.then_branch),
                                       .else_branch = clone_child(n.else_branch)});
            } else {
                return make(n);
            }
        },
        expr.node);
}

auto is_random(const Expr& expr) -> bool {
    return std::visit(
        [](const auto& n) -> bool {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, RandomExpr>) {
                return true;
            } else if constexpr (std::is_same_v<T, UnaryExpr>) {
                return n.operand && is_random(*n.operand);
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                return (n.left && is_random(*n.left)) || (n.right && is_random(*n.right));
            } else if constexpr (std::is_same_v<T, IfElseExpr>) {
                return (n.condition && is_random(*n.condition)) ||
                       (n.then_branch && is_random(*n.then_branch)) ||
                       (n.else_branch && is_random(*n.else_branch));
            } else {
                return false;
            }
        },
        expr.node);
}

// ─── Builders ─────────────────────────────────────────────────────────────────

auto column(std::string name) -> ExprPtr {
    return make(ColumnExpr{.name = std::move(name)});
}

auto number(double value) -> ExprPtr {
    return make(LiteralExpr{.kind = LiteralKind::Number, .value = value});
}

auto text(std::string value) -> ExprPtr {
    return make(LiteralExpr{.kind = LiteralKind::Text, .value = std::move(value)});
}

auto logical(bool value) -> ExprPtr {
    return make(LiteralExpr{.kind = LiteralKind::Logical, .value = value});
}

auto datetime(Datetime value) -> ExprPtr {
    return make(LiteralExpr{.kind = LiteralKind::Datetime, .value = value});
}

auto missing(LiteralKind kind) -> ExprPtr {
    return make(LiteralExpr{.kind = kind, .value = kMissing});
}

auto rownum() -> ExprPtr {
    return make(RowNumExpr{});
}

auto exponential(double rate) -> ExprPtr {
    return make(RandomExpr{.kind = RandomKind::Exponential, .first = rate, .second = 0.0});
}

auto normal(double mean, double std_dev) -> ExprPtr {
    return make(RandomExpr{.kind = RandomKind::Normal, .first = mean, .second = std_dev});
}

auto uniform(double low, double high) -> ExprPtr {
    return make(RandomExpr{.kind = RandomKind::Uniform, .first = low, .second = high});
}

auto unary(UnaryOp op, ExprPtr operand) -> ExprPtr {
    return make(UnaryExpr{.op = op, .operand = std::move(operand)});
}

auto binary(BinaryOp op, ExprPtr left, ExprPtr right) -> ExprPtr {
    return make(BinaryExpr{.op = op, .left = std::move(left), .right = std::move(right)});
}

auto if_else(ExprPtr condition, ExprPtr then_branch, ExprPtr else_branch) -> ExprPtr {
    return make(IfElseExpr{.condition = std::move(condition),
                           .then_branch = std::move(then_branch),
                           .else_branch = std::move(else_branch)});
}

}  // namespace tidy::expr
