#pragma once

#include <tidy/core/value.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace tidy::expr {

/// Row-level scalar expression tree.
///
/// Each node is a tagged union over the node shapes below; children are
/// owned exclusively through unique_ptr, so an expression is always a tree.
struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

/// Literal kinds. A literal may also hold Missing.
enum class LiteralKind : std::uint8_t {
    Datetime,
    Logical,
    Number,
    Text,
};

enum class RandomKind : std::uint8_t {
    Exponential,
    Normal,
    Uniform,
};

enum class UnaryOp : std::uint8_t {
    Negate,
    Not,
    IsDatetime,
    IsLogical,
    IsMissing,
    IsNumber,
    IsText,
    ToDatetime,
    ToLogical,
    ToNumber,
    ToText,
    ToYear,
    ToMonth,
    ToDay,
    ToWeekday,
    ToHours,
    ToMinutes,
    ToSeconds,
};

enum class BinaryOp : std::uint8_t {
    Add,
    Subtract,
    Multiply,
    Divide,
    Remainder,
    Power,
    Equal,
    NotEqual,
    Greater,
    GreaterEqual,
    Less,
    LessEqual,
    And,
    Or,
};

/// Value of a named column in the current row.
struct ColumnExpr {
    std::string name;
};

/// Constant. `value` is Missing or matches `kind`.
struct LiteralExpr {
    LiteralKind kind = LiteralKind::Number;
    Value value;
};

/// Index of the current row.
struct RowNumExpr {};

/// Fresh random sample per evaluation. Exponential uses `first` as the rate;
/// normal uses (mean, std dev); uniform uses (low, high).
struct RandomExpr {
    RandomKind kind = RandomKind::Uniform;
    double first = 0.0;
    double second = 1.0;
};

struct UnaryExpr {
    UnaryOp op = UnaryOp::Not;
    ExprPtr operand;
};

struct BinaryExpr {
    BinaryOp op = BinaryOp::Add;
    ExprPtr left;
    ExprPtr right;
};

/// Selection: `condition ? then_branch : else_branch`.
struct IfElseExpr {
    ExprPtr condition;
    ExprPtr then_branch;
    ExprPtr else_branch;
};

struct Expr {
    std::variant<ColumnExpr, LiteralExpr, RowNumExpr, RandomExpr, UnaryExpr, BinaryExpr,
                 IfElseExpr>
        node;
};

// ─── Kind names ──────────────────────────────────────────────────────────────
//  The wire name of every node kind, e.g. "column", "add", "toWeekday".

[[nodiscard]] auto kind_name(const Expr& expr) noexcept -> std::string_view;
[[nodiscard]] auto literal_name(LiteralKind kind) noexcept -> std::string_view;
[[nodiscard]] auto random_name(RandomKind kind) noexcept -> std::string_view;
[[nodiscard]] auto unary_name(UnaryOp op) noexcept -> std::string_view;
[[nodiscard]] auto binary_name(BinaryOp op) noexcept -> std::string_view;

[[nodiscard]] auto parse_literal_kind(std::string_view name) noexcept
    -> std::optional<LiteralKind>;
[[nodiscard]] auto parse_random_kind(std::string_view name) noexcept -> std::optional<RandomKind>;
[[nodiscard]] auto parse_unary_op(std::string_view name) noexcept -> std::optional<UnaryOp>;
[[nodiscard]] auto parse_binary_op(std::string_view name) noexcept -> std::optional<BinaryOp>;

// ─── Structural operations ───────────────────────────────────────────────────

/// Structural equality: same node kind, same literals/parameters, equal children.
[[nodiscard]] auto equal(const Expr& lhs, const Expr& rhs) -> bool;

[[nodiscard]] auto clone(const Expr& expr) -> ExprPtr;

/// True when the tree contains a random-variate node.
[[nodiscard]] auto is_random(const Expr& expr) -> bool;

// ─── Builders ────────────────────────────────────────────────────────────────
//  Convenience factories used by the codec, tests and embedding code.

[[nodiscard]] auto column(std::string name) -> ExprPtr;
[[nodiscard]] auto number(double value) -> ExprPtr;
[[nodiscard]] auto text(std::string value) -> ExprPtr;
[[nodiscard]] auto logical(bool value) -> ExprPtr;
[[nodiscard]] auto datetime(Datetime value) -> ExprPtr;
/// A literal of the given kind holding Missing.
[[nodiscard]] auto missing(LiteralKind kind = LiteralKind::Number) -> ExprPtr;
[[nodiscard]] auto rownum() -> ExprPtr;
[[nodiscard]] auto exponential(double rate) -> ExprPtr;
[[nodiscard]] auto normal(double mean, double std_dev) -> ExprPtr;
[[nodiscard]] auto uniform(double low, double high) -> ExprPtr;
[[nodiscard]] auto unary(UnaryOp op, ExprPtr operand) -> ExprPtr;
[[nodiscard]] auto binary(BinaryOp op, ExprPtr left, ExprPtr right) -> ExprPtr;
[[nodiscard]] auto if_else(ExprPtr condition, ExprPtr then_branch, ExprPtr else_branch)
    -> ExprPtr;

}  // namespace tidy::expr
