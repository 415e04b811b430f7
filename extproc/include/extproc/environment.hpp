#ifndef EXTPROC_ENVIRONMENT_HPP
#define EXTPROC_ENVIRONMENT_HPP

#include "extproc/launch_error.hpp"

#include <expected>     // for expected
#include <map>          // for map
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace extproc {

/// Environment variables by name.
using Environment = std::map<std::string, std::string>;

}  // namespace extproc

namespace extproc::env {

/// @brief Returns the value of an environment variable, or an empty view if unset.
auto safe_getenv(const char* env_name) noexcept -> std::string_view;

/// @brief Snapshot of the environment of the current process.
[[nodiscard]] auto native_environment() noexcept -> Environment;

/// @brief Renders the environment as NAME=value strings.
[[nodiscard]] auto to_envp(const Environment& environment) noexcept -> std::vector<std::string>;

/// @brief Expands ${env_var:NAME} references from the current environment.
/// @param value The text to expand.
/// @return The expanded text, or CoreError on an undefined or malformed reference.
[[nodiscard]] auto substitute_variables(std::string_view value) noexcept -> std::expected<std::string, LaunchError>;

}  // namespace extproc::env

#endif  // EXTPROC_ENVIRONMENT_HPP
