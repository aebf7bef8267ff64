#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace tidy {

/// Instant in milliseconds since 1970-01-01T00:00:00Z (Unix epoch).
struct Datetime {
    std::int64_t millis = 0;
    auto operator<=>(const Datetime&) const = default;
};

/// Calendar fields of a Datetime, all in UTC.
struct DatetimeFields {
    int year = 1970;
    unsigned month = 1;    // 1-12
    unsigned day = 1;      // 1-31
    unsigned weekday = 4;  // ISO: 1 = Monday ... 7 = Sunday
    unsigned hours = 0;
    unsigned minutes = 0;
    unsigned seconds = 0;
    unsigned millis = 0;
};

// Representable instants: 0000-01-01T00:00:00.000Z through 9999-12-31T23:59:59.999Z,
// the years the canonical four-digit text form can carry.
inline constexpr std::int64_t kMinDatetimeMillis = -62'167'219'200'000;
inline constexpr std::int64_t kMaxDatetimeMillis = 253'402'300'799'999;

[[nodiscard]] constexpr auto in_datetime_range(std::int64_t millis) noexcept -> bool {
    return millis >= kMinDatetimeMillis && millis <= kMaxDatetimeMillis;
}

[[nodiscard]] auto datetime_fields(Datetime dt) -> DatetimeFields;

/// Build a Datetime from UTC calendar fields. Returns nullopt for invalid dates and
/// years outside 0-9999.
[[nodiscard]] auto make_datetime(int year, unsigned month, unsigned day, unsigned hours = 0,
                                 unsigned minutes = 0, unsigned seconds = 0,
                                 unsigned millis = 0) -> std::optional<Datetime>;

/// Parse ISO-8601 text: `YYYY-MM-DD`, optionally followed by `T` or a space and
/// `HH:MM[:SS[.fff]]`, optionally followed by `Z` or `+HH:MM` / `-HH:MM`.
/// Instants that an offset moves out of range are rejected.
[[nodiscard]] auto parse_datetime(std::string_view text) -> std::optional<Datetime>;

/// Canonical form: `YYYY-MM-DDTHH:MM:SS.mmmZ`.
[[nodiscard]] auto format_datetime(Datetime dt) -> std::string;

}  // namespace tidy

namespace std {

template <>
struct hash<tidy::Datetime> {
    auto operator()(const tidy::Datetime& dt) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(dt.millis);
    }
};

}  // namespace std
