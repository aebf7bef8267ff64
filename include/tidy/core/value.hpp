#pragma once

#include <tidy/core/time.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace tidy {

/// Sentinel for "no data here". Distinct from NaN and from an invalid date,
/// both of which collapse to Missing.
struct Missing {
    auto operator==(const Missing&) const -> bool = default;
};

inline constexpr Missing kMissing{};

/// A single cell value. Numbers are always doubles.
using Value = std::variant<Missing, double, std::string, bool, Datetime>;

enum class ValueType : std::uint8_t {
    Missing,
    Number,
    Text,
    Logical,
    Datetime,
};

[[nodiscard]] auto type_of(const Value& value) noexcept -> ValueType;
[[nodiscard]] auto type_name(ValueType type) noexcept -> std::string_view;

[[nodiscard]] inline auto is_missing(const Value& value) noexcept -> bool {
    return std::holds_alternative<Missing>(value);
}

/// Collapse non-finite numbers (overflow, division by zero, domain errors) to Missing.
[[nodiscard]] auto safe_number(double value) -> Value;

/// Truthiness: Missing and false are falsy, as are 0, NaN, and the empty string.
/// Every Datetime is truthy.
[[nodiscard]] auto is_truthy(const Value& value) noexcept -> bool;

/// Comparison equality: false whenever either side is Missing or the types differ.
[[nodiscard]] auto values_equal(const Value& lhs, const Value& rhs) noexcept -> bool;

/// Three-way ordering of two values of the same concrete type (-1, 0, 1).
/// Callers check the types first.
[[nodiscard]] auto compare_same_type(const Value& lhs, const Value& rhs) noexcept -> int;

/// Text form used by `toString` and the table printer.
[[nodiscard]] auto format_number(double value) -> std::string;
[[nodiscard]] auto to_text(const Value& value) -> std::string;

/// Hash and equality for using values as grouping keys. Unlike values_equal,
/// Missing equals Missing here so that all missing keys land in one group.
struct ValueKeyHash {
    auto operator()(const Value& value) const noexcept -> std::size_t;
};

struct ValueKeyEq {
    auto operator()(const Value& lhs, const Value& rhs) const noexcept -> bool {
        return lhs == rhs;
    }
};

}  // namespace tidy
