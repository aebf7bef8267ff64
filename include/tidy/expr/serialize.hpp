#pragma once

#include <tidy/core/error.hpp>
#include <tidy/expr/expr.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace tidy::expr {

/// First element of every serialized expression array.
inline constexpr std::string_view kExprTag = "@expr";

/// Serialize to the nested-array form `["@expr", kind, ...children]`.
///
/// Leaves carry literal scalars: numbers, strings and booleans as themselves,
/// datetimes as canonical ISO-8601 strings, Missing as null.
[[nodiscard]] auto to_json(const Expr& expr) -> nlohmann::json;

/// Rebuild an expression from its nested-array form. Any structural problem
/// (wrong tag, unknown kind, wrong arity, a child slot that is not an
/// expression, a literal of the wrong type) is a MalformedExpression.
[[nodiscard]] auto from_json(const nlohmann::json& json) -> Result<ExprPtr>;

/// True when `json` is an array starting with the expression tag.
[[nodiscard]] auto is_expr_json(const nlohmann::json& json) -> bool;

/// String convenience wrappers around to_json / from_json.
[[nodiscard]] auto serialize(const Expr& expr) -> std::string;
[[nodiscard]] auto deserialize(std::string_view text) -> Result<ExprPtr>;

}  // namespace tidy::expr
