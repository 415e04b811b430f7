#ifndef EXTPROC_COMMAND_LINE_HPP
#define EXTPROC_COMMAND_LINE_HPP

#include "extproc/launch_error.hpp"

#include <expected>     // for expected
#include <span>         // for span
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace extproc {

/// Executable followed by its arguments.
using Command = std::vector<std::string>;

}  // namespace extproc

namespace extproc::cmdline {

/// @brief Split a command line into argument tokens.
///
/// Whitespace separates tokens. Double quotes group text and honour the
/// \" and \\ escapes, single quotes group text literally, and outside of
/// quotes a backslash escapes the next character. Adjacent quoted and
/// unquoted parts form one token. No shell metacharacter is interpreted.
/// @param command_line The command line to split.
/// @return The tokens, or InvalidArgument if the command line is empty.
[[nodiscard]] auto parse_arguments(std::string_view command_line) noexcept -> std::expected<Command, LaunchError>;

/// @brief Render a command as a display string.
///
/// Every token is preceded by a single space, each '"' is escaped with a
/// backslash and tokens containing a space are wrapped in double quotes.
/// The result is meant for logs only and is not re-parsed.
/// @param command The tokens to render.
/// @return The rendered command line, starting with a space.
[[nodiscard]] auto render_command_line(std::span<const std::string> command) noexcept -> std::string;

}  // namespace extproc::cmdline

#endif  // EXTPROC_COMMAND_LINE_HPP
