#ifndef EXTPROC_LAUNCHER_HPP
#define EXTPROC_LAUNCHER_HPP

#include "extproc/command_line.hpp"
#include "extproc/environment.hpp"
#include "extproc/launch_configuration.hpp"
#include "extproc/launch_error.hpp"
#include "extproc/launch_registry.hpp"
#include "extproc/process.hpp"
#include "extproc/stream_monitor.hpp"

#include <atomic>       // for atomic_bool
#include <chrono>       // for milliseconds
#include <expected>     // for expected
#include <filesystem>   // for path
#include <memory>       // for shared_ptr
#include <optional>     // for optional
#include <span>         // for span
#include <string>       // for string
#include <string_view>  // for string_view

namespace extproc {

/// @brief Cancellation source polled by the launcher.
class ProgressMonitor {
 public:
    virtual ~ProgressMonitor() = default;

    [[nodiscard]] virtual auto is_canceled() const noexcept -> bool = 0;
};

/// @brief Monitor which never reports cancellation.
class NullProgressMonitor final : public ProgressMonitor {
 public:
    [[nodiscard]] auto is_canceled() const noexcept -> bool override { return false; }
};

/// @brief Monitor which can be canceled from any thread.
class CancellationMonitor final : public ProgressMonitor {
 public:
    [[nodiscard]] auto is_canceled() const noexcept -> bool override { return m_canceled.load(); }

    void cancel() noexcept { m_canceled.store(true); }

 private:
    std::atomic_bool m_canceled{false};
};

/// Launcher settings.
struct LauncherConfig {
    /// Wrap stream listeners in TracingStreamListener.
    bool trace_streams{false};
    /// Upper bound between two cancellation checks while waiting.
    std::chrono::milliseconds poll_interval{50};
    /// How long to wait for the exit after terminating a canceled process.
    std::chrono::milliseconds termination_grace{500};
};

/// Optional inputs of a launch. Every member may be left empty.
struct LaunchOptions {
    /// Working directory, the current one when absent.
    std::optional<std::filesystem::path> working_dir{};
    std::shared_ptr<StreamListener> out_listener{};
    std::shared_ptr<StreamListener> err_listener{};
    /// Cancellation source, NullProgressMonitor when absent.
    std::shared_ptr<ProgressMonitor> monitor{};
    /// Complete environment. When absent it comes from launch_config,
    /// and without a launch configuration the parent one is inherited.
    std::optional<Environment> env{};
    std::shared_ptr<const LaunchConfiguration> launch_config{};
};

/// @brief Launches external processes.
class ProcessLauncher final {
 public:
    ProcessLauncher(LauncherConfig config, std::shared_ptr<ProcessSpawner> spawner, std::shared_ptr<LaunchRegistry> registry) noexcept;

    /// @brief Start a process and return without waiting for it.
    ///
    /// No monitor and no launch configuration are used, the process handle
    /// is only kept by the launch registry.
    [[nodiscard]] auto launch_async(std::span<const std::string> command, const LaunchOptions& options = {}) const
        -> std::expected<void, LaunchError>;

    /// @brief Same as above, the command line is split with cmdline::parse_arguments.
    [[nodiscard]] auto launch_async(std::string_view command_line, const LaunchOptions& options = {}) const
        -> std::expected<void, LaunchError>;

    /// @brief Start a process and block until it terminates.
    ///
    /// A monitor canceled before the spawn means nothing ran and yields 0.
    /// A cancellation while waiting terminates the process.
    /// @return The exit code of the process.
    [[nodiscard]] auto launch_sync(std::span<const std::string> command, const LaunchOptions& options = {}) const
        -> std::expected<int, LaunchError>;

    /// @brief Same as above, the command line is split with cmdline::parse_arguments.
    [[nodiscard]] auto launch_sync(std::string_view command_line, const LaunchOptions& options = {}) const
        -> std::expected<int, LaunchError>;

    /// @brief Spawn a process, attach the listeners and register the launch.
    /// @return The managed process, or nullptr if the monitor was canceled before the spawn.
    [[nodiscard]] auto launch(std::span<const std::string> command, const LaunchOptions& options = {}) const
        -> std::expected<std::shared_ptr<ManagedProcess>, LaunchError>;

    [[nodiscard]] auto config() const noexcept -> const LauncherConfig& { return m_config; }

    /// @brief The registry launches are recorded in.
    ///
    /// Without an injected registry this is a LaunchManager owned by the
    /// launcher, which drops terminated launches on every launch.
    [[nodiscard]] auto registry() const noexcept -> const std::shared_ptr<LaunchRegistry>& { return m_registry; }

 private:
    void attach_listeners(std::span<const std::string> command, const LaunchOptions& options, ManagedProcess& process) const noexcept;
    void prune_owned_registry() const noexcept;

    LauncherConfig m_config;
    std::shared_ptr<ProcessSpawner> m_spawner;
    std::shared_ptr<LaunchRegistry> m_registry;
    // set when no registry was injected
    std::shared_ptr<LaunchManager> m_owned_registry;
};

}  // namespace extproc

#endif  // EXTPROC_LAUNCHER_HPP
