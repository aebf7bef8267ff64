#include <tidy/core/value.hpp>

#include <fmt/format.h>

#include <array>
#include <charconv>
#include <cmath>
#include <functional>

namespace tidy {

auto type_of(const Value& value) noexcept -> ValueType {
    switch (value.index()) {
        case 1:
            return ValueType::Number;
        case 2:
            return ValueType::Text;
        case 3:
            return ValueType::Logical;
        case 4:
            return ValueType::Datetime;
        default:
            return ValueType::Missing;
    }
}

auto type_name(ValueType type) noexcept -> std::string_view {
    switch (type) {
        case ValueType::Missing:
            return "missing";
        case ValueType::Number:
            return "number";
        case ValueType::Text:
            return "text";
        case ValueType::Logical:
            return "logical";
        case ValueType::Datetime:
            return "datetime";
    }
    return "unknown";
}

auto safe_number(double value) -> Value {
    if (!std::isfinite(value)) {
        return kMissing;
    }
    return value;
}

auto is_truthy(const Value& value) noexcept -> bool {
    return std::visit(
        [](const auto& v) -> bool {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Missing>) {
                return false;
            } else if constexpr (std::is_same_v<T, double>) {
                return v != 0.0 && !std::isnan(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return !v.empty();
            } else if constexpr (std::is_same_v<T, bool>) {
                return v;
            } else {
                return true;
            }
        },
        value);
}

auto values_equal(const Value& lhs, const Value& rhs) noexcept -> bool {
    if (is_missing(lhs) || is_missing(rhs)) {
        return false;
    }
    return lhs == rhs;
}

auto compare_same_type(const Value& lhs, const Value& rhs) noexcept -> int {
    auto three_way = [](const auto& a, const auto& b) -> int {
        if (a < b) {
            return -1;
        }
        if (b < a) {
            return 1;
        }
        return 0;
    };
    if (const auto* l = std::get_if<double>(&lhs)) {
        return three_way(*l, std::get<double>(rhs));
    }
    if (const auto* l = std::get_if<std::string>(&lhs)) {
        return three_way(*l, std::get<std::string>(rhs));
    }
    if (const auto* l = std::get_if<bool>(&lhs)) {
        return three_way(*l, std::get<bool>(rhs));
    }
    if (const auto* l = std::get_if<Datetime>(&lhs)) {
        return three_way(*l, std::get<Datetime>(rhs));
    }
    return 0;
}

auto format_number(double value) -> std::string {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "Infinity" : "-Infinity";
    }
    if (value == 0.0) {
        return "0";
    }
    std::array<char, 64> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec == std::errc{}) {
        return std::string(buffer.data(), ptr);
    }
    return fmt::format("{}", value);
}

auto to_text(const Value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Missing>) {
                return "";
            } else if constexpr (std::is_same_v<T, double>) {
                return format_number(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else {
                return format_datetime(v);
            }
        },
        value);
}

auto ValueKeyHash::operator()(const Value& value) const noexcept -> std::size_t {
    std::size_t seed = value.index();
    std::size_t h = std::visit(
        [](const auto& v) -> std::size_t {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Missing>) {
                return 0;
            } else {
                return std::hash<T>{}(v);
            }
        },
        value);
    return seed ^ (h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

}  // namespace tidy
