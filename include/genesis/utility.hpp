#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace genesis {

enum class ErrorKind {
    ConfigNotFound,
    ConfigMalformed,
    DependencyMissing,
    VersionUndetermined,
    BuildFailed,
    Cancelled,
    ArtifactMissing,
    Io,
    Process,
};

std::string_view to_string(ErrorKind kind);

struct Error {
    ErrorKind kind;
    std::string message;

    std::string describe() const {
        return std::format("{}: {}", to_string(kind), message);
    }
};

template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Shorthand for building the error side of a Result.
 */
template <typename... Args>
std::unexpected<Error> fail(ErrorKind kind, std::format_string<Args...> fmt, Args &&...args) {
    return std::unexpected(Error{kind, std::format(fmt, std::forward<Args>(args)...)});
}

inline std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::ConfigNotFound:
        return "ConfigNotFound";
    case ErrorKind::ConfigMalformed:
        return "ConfigMalformed";
    case ErrorKind::DependencyMissing:
        return "DependencyMissing";
    case ErrorKind::VersionUndetermined:
        return "VersionUndetermined";
    case ErrorKind::BuildFailed:
        return "BuildFailed";
    case ErrorKind::Cancelled:
        return "Cancelled";
    case ErrorKind::ArtifactMissing:
        return "ArtifactMissing";
    case ErrorKind::Io:
        return "Io";
    case ErrorKind::Process:
        return "Process";
    }
    return "Unknown";
}

} // namespace genesis
