#ifndef EXTPROC_LAUNCH_ERROR_HPP
#define EXTPROC_LAUNCH_ERROR_HPP

#include <cstdint>      // for uint8_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace extproc {

/// Category of a launch failure.
enum class ErrorKind : std::uint8_t {
    /// Caller error detected before any I/O (empty command, bad working directory).
    InvalidArgument,
    /// Operational failure (environment resolution, spawn, exit value).
    CoreError
};

/// Status severity carried by a CoreError.
enum class Severity : std::uint8_t {
    Info,
    Warning,
    Error
};

/// @brief Error reported by every fallible extproc operation.
struct LaunchError {
    ErrorKind kind{ErrorKind::CoreError};
    Severity severity{Severity::Error};
    std::string message;
    /// Underlying reason, e.g. strerror() text of a failed syscall.
    std::optional<std::string> cause{};
};

/// @brief Creates an InvalidArgument error.
[[nodiscard]] auto invalid_argument(std::string message) noexcept -> LaunchError;

/// @brief Creates a CoreError with error severity.
[[nodiscard]] auto core_error(std::string message, std::optional<std::string> cause = std::nullopt) noexcept -> LaunchError;

/// @brief Converts ErrorKind to string.
[[nodiscard]] auto error_kind_to_string(ErrorKind kind) noexcept -> std::string_view;

/// @brief Renders the error as a single line: "kind: message (cause)".
[[nodiscard]] auto to_string(const LaunchError& error) noexcept -> std::string;

}  // namespace extproc

#endif  // EXTPROC_LAUNCH_ERROR_HPP
