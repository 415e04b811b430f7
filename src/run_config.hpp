#ifndef RUN_CONFIG_HPP
#define RUN_CONFIG_HPP

#include <chrono>       // for milliseconds
#include <expected>     // for expected
#include <optional>     // for optional
#include <span>         // for span
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace runner {

/// Options of a single extproc-run invocation.
struct RunConfig {
    /// Command tokens given after "--".
    std::vector<std::string> command{};
    /// JSON launch configuration file.
    std::optional<std::string> config_file{};
    std::optional<std::string> working_dir{};
    /// Log file, the console is used when unset.
    std::optional<std::string> log_file{};
    std::optional<std::chrono::milliseconds> timeout{};
    bool trace{false};
    bool show_help{false};
};

/// Usage text printed for --help and on errors.
[[nodiscard]] auto usage() noexcept -> std::string_view;

/// Parses command line arguments (without the program name).
/// @param args The arguments.
/// @return RunConfig on success, or error string on failure.
[[nodiscard]] auto parse_run_args(std::span<const std::string_view> args) noexcept
    -> std::expected<RunConfig, std::string>;

}  // namespace runner

#endif  // RUN_CONFIG_HPP
