#include "run_config.hpp"

#include <charconv>      // for from_chars
#include <cstddef>       // for size_t
#include <cstdint>       // for int64_t
#include <system_error>  // for errc
#include <utility>       // for move

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {

auto parse_timeout(std::string_view value) noexcept -> std::optional<std::chrono::milliseconds> {
    std::int64_t millis{};
    const auto* end = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(value.data(), end, millis);
    if (ec != std::errc{} || ptr != end || millis <= 0) {
        return std::nullopt;
    }
    return std::chrono::milliseconds{millis};
}

}  // namespace

namespace runner {

auto usage() noexcept -> std::string_view {
    return "Usage: extproc-run [options] -- <command> [args...]\n"
           "       extproc-run [options] -- '<command line>'\n"
           "\n"
           "Options:\n"
           "  --config <file>   JSON launch configuration (name, label, environment)\n"
           "  --cwd <dir>       working directory of the process\n"
           "  --log <file>      write the log to <file> instead of the console\n"
           "  --timeout <ms>    cancel the process after <ms> milliseconds\n"
           "  --trace           trace process output to the log\n"
           "  -h, --help        show this help\n"sv;
}

auto parse_run_args(std::span<const std::string_view> args) noexcept
    -> std::expected<RunConfig, std::string> {
    RunConfig config{};

    std::size_t i = 0;
    // options taking a value
    auto take_value = [&](std::string_view option) -> std::expected<std::string, std::string> {
        if (i + 1 >= args.size()) {
            return std::unexpected(fmt::format(FMT_COMPILE("'{}' requires a value"), option));
        }
        return std::string{args[++i]};
    };

    for (; i < args.size(); ++i) {
        const auto arg = args[i];
        if (arg == "--"sv) {
            for (++i; i < args.size(); ++i) {
                config.command.emplace_back(args[i]);
            }
            break;
        }

        if (arg == "-h"sv || arg == "--help"sv) {
            config.show_help = true;
        } else if (arg == "--trace"sv) {
            config.trace = true;
        } else if (arg == "--config"sv || arg == "--cwd"sv || arg == "--log"sv || arg == "--timeout"sv) {
            auto value = take_value(arg);
            if (!value) {
                return std::unexpected(std::move(value.error()));
            }
            if (arg == "--config"sv) {
                config.config_file = std::move(*value);
            } else if (arg == "--cwd"sv) {
                config.working_dir = std::move(*value);
            } else if (arg == "--log"sv) {
                config.log_file = std::move(*value);
            } else {
                config.timeout = parse_timeout(*value);
                if (!config.timeout) {
                    return std::unexpected(fmt::format(FMT_COMPILE("Invalid timeout '{}', expected a positive number of milliseconds"), *value));
                }
            }
        } else {
            return std::unexpected(fmt::format(FMT_COMPILE("Unknown option '{}'"), arg));
        }
    }

    if (!config.show_help && config.command.empty()) {
        return std::unexpected("No command given after '--'");
    }
    return config;
}

}  // namespace runner
