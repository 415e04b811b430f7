#include "extproc/launcher.hpp"
#include "extproc/posix_process.hpp"
#include "extproc/tracing_listener.hpp"

#include <system_error>  // for error_code
#include <utility>       // for move

#include <fmt/compile.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace extproc {

ProcessLauncher::ProcessLauncher(LauncherConfig config, std::shared_ptr<ProcessSpawner> spawner, std::shared_ptr<LaunchRegistry> registry) noexcept
  : m_config(config),
    m_spawner(spawner ? std::move(spawner) : std::make_shared<PosixSpawner>()) {
    if (registry) {
        m_registry = std::move(registry);
        return;
    }
    m_owned_registry = std::make_shared<LaunchManager>();
    m_registry       = m_owned_registry;
}

auto ProcessLauncher::launch_async(std::span<const std::string> command, const LaunchOptions& options) const
    -> std::expected<void, LaunchError> {
    spdlog::debug("Async execute command line:{}", cmdline::render_command_line(command));

    auto async_options          = options;
    async_options.monitor       = nullptr;
    async_options.launch_config = nullptr;

    auto process = launch(command, async_options);
    if (!process) {
        return std::unexpected(std::move(process.error()));
    }
    return {};
}

auto ProcessLauncher::launch_async(std::string_view command_line, const LaunchOptions& options) const
    -> std::expected<void, LaunchError> {
    const auto& command = cmdline::parse_arguments(command_line);
    if (!command) {
        return std::unexpected(command.error());
    }
    return launch_async(*command, options);
}

auto ProcessLauncher::launch_sync(std::span<const std::string> command, const LaunchOptions& options) const
    -> std::expected<int, LaunchError> {
    spdlog::debug("Sync execute command line:{}", cmdline::render_command_line(command));

    auto process = launch(command, options);
    if (!process) {
        return std::unexpected(std::move(process.error()));
    }
    // nothing ran, the monitor was canceled before the spawn
    if (*process == nullptr) {
        return 0;
    }

    auto& managed = **process;
    while (!managed.wait_for(m_config.poll_interval)) {
        if (options.monitor && options.monitor->is_canceled()) {
            spdlog::info("Launch of '{}' canceled, terminating pid {}", managed.label(), managed.pid());
            managed.terminate();
            managed.wait_for(m_config.termination_grace);
            break;
        }
    }
    auto exit_value = managed.exit_value();

    process->reset();
    prune_owned_registry();
    return exit_value;
}

auto ProcessLauncher::launch_sync(std::string_view command_line, const LaunchOptions& options) const
    -> std::expected<int, LaunchError> {
    const auto& command = cmdline::parse_arguments(command_line);
    if (!command) {
        return std::unexpected(command.error());
    }
    return launch_sync(*command, options);
}

auto ProcessLauncher::launch(std::span<const std::string> command, const LaunchOptions& options) const
    -> std::expected<std::shared_ptr<ManagedProcess>, LaunchError> {
    if (command.empty()) {
        return std::unexpected(invalid_argument("Empty commands array"));
    }
    if (options.working_dir) {
        std::error_code err{};
        if (!fs::is_directory(*options.working_dir, err)) {
            return std::unexpected(invalid_argument(fmt::format(FMT_COMPILE("{} is not a valid directory"), options.working_dir->string())));
        }
    }

    const std::shared_ptr<ProgressMonitor> monitor = options.monitor ? options.monitor : std::make_shared<NullProgressMonitor>();

    auto environment = options.env;
    if (!environment && options.launch_config) {
        auto resolved = options.launch_config->resolve_environment();
        if (!resolved) {
            spdlog::error("[ProcessLauncher] {}", to_string(resolved.error()));
            return std::unexpected(std::move(resolved.error()));
        }
        environment = std::move(*resolved);
    }

    if (monitor->is_canceled()) {
        spdlog::debug("[ProcessLauncher] launch of '{}' canceled before start", command[0]);
        return std::shared_ptr<ManagedProcess>{};
    }

    ProcessAttributes attributes{
        .process_type = command[0],
        .command_line = cmdline::render_command_line(command),
    };
    std::string label = command[0];
    if (options.launch_config) {
        // looked up before the spawn so a failure leaves no orphan process behind
        auto configured = options.launch_config->attribute(attr::process_label, command[0]);
        if (!configured) {
            return std::unexpected(std::move(configured.error()));
        }
        label            = *configured;
        attributes.label = std::move(*configured);
    }

    const Command argv(command.begin(), command.end());
    auto raw_process = m_spawner->spawn(argv, options.working_dir, environment);
    if (!raw_process) {
        return std::unexpected(std::move(raw_process.error()));
    }

    auto launch_record = std::make_shared<LaunchRecord>(options.launch_config, "run");
    auto process       = std::make_shared<ManagedProcess>(launch_record, std::move(*raw_process), std::move(label), std::move(attributes));
    launch_record->add_process(process);

    attach_listeners(command, options, *process);
    prune_owned_registry();
    m_registry->add_launch(std::move(launch_record));
    return process;
}

void ProcessLauncher::attach_listeners(std::span<const std::string> command, const LaunchOptions& options, ManagedProcess& process) const noexcept {
    auto out_listener = options.out_listener;
    auto err_listener = options.err_listener;
    if (m_config.trace_streams) {
        spdlog::debug("Creating tracing stream listeners for{}", process.attributes().command_line);
        out_listener = std::make_shared<TracingStreamListener>(out_listener, StreamKind::Output, command[0]);
        err_listener = std::make_shared<TracingStreamListener>(err_listener, StreamKind::Error, command[0]);
    }

    // fast processes may write (or even exit) before this point, the
    // monitors replay what they buffered until then
    process.output_stream().attach_listener(std::move(out_listener));
    process.error_stream().attach_listener(std::move(err_listener));
}

void ProcessLauncher::prune_owned_registry() const noexcept {
    if (!m_owned_registry) {
        return;
    }
    if (const auto removed = m_owned_registry->remove_terminated_launches(); removed > 0) {
        spdlog::debug("[ProcessLauncher] released {} terminated launch(es)", removed);
    }
}

}  // namespace extproc
