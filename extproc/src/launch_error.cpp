#include "extproc/launch_error.hpp"

#include <utility>  // for move

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace extproc {

auto invalid_argument(std::string message) noexcept -> LaunchError {
    return LaunchError{
        .kind     = ErrorKind::InvalidArgument,
        .severity = Severity::Error,
        .message  = std::move(message),
    };
}

auto core_error(std::string message, std::optional<std::string> cause) noexcept -> LaunchError {
    return LaunchError{
        .kind     = ErrorKind::CoreError,
        .severity = Severity::Error,
        .message  = std::move(message),
        .cause    = std::move(cause),
    };
}

auto error_kind_to_string(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
    case ErrorKind::InvalidArgument:
        return "invalid argument"sv;
    case ErrorKind::CoreError:
        return "core error"sv;
    }
    return "unknown"sv;
}

auto to_string(const LaunchError& error) noexcept -> std::string {
    if (error.cause) {
        return fmt::format(FMT_COMPILE("{}: {} ({})"), error_kind_to_string(error.kind), error.message, *error.cause);
    }
    return fmt::format(FMT_COMPILE("{}: {}"), error_kind_to_string(error.kind), error.message);
}

}  // namespace extproc
