#include "run_config.hpp"

// import extproc
#include "extproc/command_line.hpp"
#include "extproc/launch_configuration.hpp"
#include "extproc/launcher.hpp"
#include "extproc/logger.hpp"

#include <atomic>       // for atomic_bool
#include <chrono>       // for steady_clock, milliseconds
#include <csignal>      // for signal, SIGINT
#include <cstdio>       // for stdout, stderr, fflush
#include <memory>       // for make_shared
#include <optional>     // for optional
#include <stop_token>   // for stop_token
#include <string_view>  // for string_view
#include <thread>       // for jthread, sleep_for
#include <utility>      // for move
#include <vector>       // for vector

#include <fmt/core.h>

#include <spdlog/async.h>                    // for create_async
#include <spdlog/common.h>                   // for debug
#include <spdlog/sinks/basic_file_sink.h>    // for basic_file_sink_mt
#include <spdlog/sinks/stdout_color_sinks.h> // for stderr_color_mt
#include <spdlog/spdlog.h>                   // for set_default_logger, set_level

namespace {

std::atomic_bool g_interrupted{false};

void handle_sigint(int /*signal*/) {
    g_interrupted.store(true);
}

auto make_forwarder(std::FILE* stream) -> std::shared_ptr<extproc::StreamListener> {
    return std::make_shared<extproc::CallbackStreamListener>([stream](std::string_view text) {
        fmt::print(stream, "{}", text);
        std::fflush(stream);
    });
}

auto run_command(const runner::RunConfig& run_config) -> int {
    using namespace std::chrono_literals;

    // A single token is a whole command line.
    extproc::Command command = run_config.command;
    if (command.size() == 1) {
        auto parsed = extproc::cmdline::parse_arguments(command.front());
        if (!parsed) {
            spdlog::error("{}", extproc::to_string(parsed.error()));
            return 2;
        }
        command = std::move(*parsed);
    }

    auto monitor = std::make_shared<extproc::CancellationMonitor>();
    extproc::LaunchOptions options{
        .out_listener = make_forwarder(stdout),
        .err_listener = make_forwarder(stderr),
        .monitor      = monitor,
    };
    if (run_config.working_dir) {
        options.working_dir = *run_config.working_dir;
    }
    if (run_config.config_file) {
        auto launch_config = extproc::load_launch_configuration(*run_config.config_file);
        if (!launch_config) {
            spdlog::error("Invalid launch configuration '{}': {}", *run_config.config_file, launch_config.error());
            return 2;
        }
        options.launch_config = std::make_shared<extproc::StaticLaunchConfiguration>(std::move(*launch_config));
    }

    std::signal(SIGINT, handle_sigint);
    const auto deadline = run_config.timeout
        ? std::optional{std::chrono::steady_clock::now() + *run_config.timeout}
        : std::nullopt;
    std::jthread watchdog([&](const std::stop_token& stop) {
        while (!stop.stop_requested()) {
            if (g_interrupted.load() || (deadline && std::chrono::steady_clock::now() >= *deadline)) {
                spdlog::info("Canceling '{}'", command.front());
                monitor->cancel();
                return;
            }
            std::this_thread::sleep_for(20ms);
        }
    });

    const extproc::ProcessLauncher launcher(extproc::LauncherConfig{.trace_streams = run_config.trace}, nullptr, nullptr);
    const auto& exit_code = launcher.launch_sync(command, options);
    if (!exit_code) {
        spdlog::error("{}", extproc::to_string(exit_code.error()));
        return 1;
    }

    spdlog::debug("'{}' exited with {}", command.front(), *exit_code);
    return *exit_code;
}

}  // namespace

int main(int argc, char** argv) {
    const std::vector<std::string_view> args(argv + 1, argv + argc);
    const auto& run_config = runner::parse_run_args(args);
    if (!run_config) {
        fmt::print(stderr, "extproc-run: {}\n\n{}", run_config.error(), runner::usage());
        return 2;
    }
    if (run_config->show_help) {
        fmt::print("{}", runner::usage());
        return 0;
    }

    // Initialize logger.
    std::shared_ptr<spdlog::logger> logger;
    if (run_config->log_file) {
        logger = spdlog::create_async<spdlog::sinks::basic_file_sink_mt>("extproc_logger", *run_config->log_file);
    } else {
        logger = spdlog::stderr_color_mt("extproc_logger");
    }
    extproc::logger::set_logger(logger);
    spdlog::set_pattern("[%r][%^---%L---%$] %v");
    spdlog::set_level(run_config->trace ? spdlog::level::trace : spdlog::level::info);
    spdlog::flush_every(std::chrono::seconds(5));

    const int exit_code = run_command(*run_config);

    spdlog::shutdown();
    return exit_code;
}
