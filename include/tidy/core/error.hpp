#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace tidy {

/// Categories of failure that abort a run.
enum class ErrorKind : std::uint8_t {
    TypeError,
    TypeMismatch,
    UnknownColumn,
    UnknownRegistryName,
    MalformedExpression,
    MalformedPipeline,
    SourceError,  // a data source (CSV file) could not be read
};

struct Error {
    ErrorKind kind = ErrorKind::TypeError;
    std::string message;

    auto operator==(const Error&) const -> bool = default;
};

template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] auto kind_name(ErrorKind kind) noexcept -> std::string_view;

/// Render as "<Kind>: <message>", the form surfaced in a run's error string.
[[nodiscard]] auto to_string(const Error& error) -> std::string;

[[nodiscard]] inline auto make_error(ErrorKind kind, std::string message)
    -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = kind, .message = std::move(message)});
}

}  // namespace tidy
