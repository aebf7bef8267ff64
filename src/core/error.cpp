#include <tidy/core/error.hpp>

#include <fmt/format.h>

namespace tidy {

auto kind_name(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::TypeError:
            return "TypeError";
        case ErrorKind::TypeMismatch:
            return "TypeMismatch";
        case ErrorKind::UnknownColumn:
            return "UnknownColumn";
        case ErrorKind::UnknownRegistryName:
            return "UnknownRegistryName";
        case ErrorKind::MalformedExpression:
            return "MalformedExpression";
        case ErrorKind::MalformedPipeline:
            return "MalformedPipeline";
        case ErrorKind::SourceError:
            return "SourceError";
    }
    return "Error";
}

auto to_string(const Error& error) -> std::string {
    return fmt::format("{}: {}", kind_name(error.kind), error.message);
}

}  // namespace tidy
