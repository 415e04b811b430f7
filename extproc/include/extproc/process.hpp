#ifndef EXTPROC_PROCESS_HPP
#define EXTPROC_PROCESS_HPP

#include "extproc/command_line.hpp"
#include "extproc/environment.hpp"
#include "extproc/launch_error.hpp"
#include "extproc/stream_monitor.hpp"

#include <sys/types.h>  // for pid_t

#include <chrono>              // for milliseconds
#include <condition_variable>  // for condition_variable
#include <cstddef>             // for size_t
#include <cstdint>             // for uint8_t
#include <expected>            // for expected
#include <filesystem>          // for path
#include <memory>              // for unique_ptr, shared_ptr, weak_ptr
#include <mutex>               // for mutex
#include <optional>            // for optional
#include <span>                // for span
#include <stop_token>          // for stop_token
#include <string>              // for string
#include <thread>              // for jthread

namespace extproc {

class LaunchRecord;

/// @brief Handle on a process created by a ProcessSpawner.
///
/// wait(), terminate() and read() of different streams may be called
/// concurrently from different threads.
class RawProcess {
 public:
    virtual ~RawProcess() = default;

    [[nodiscard]] virtual auto pid() const noexcept -> pid_t = 0;

    /// @brief Block until the process exits.
    /// @return The exit code, 128 + signal number for a signalled process.
    virtual auto wait() noexcept -> int = 0;

    /// @brief Ask the process to stop (SIGTERM).
    /// @return true if the request was delivered.
    virtual auto terminate() noexcept -> bool = 0;

    /// @brief Force the process to stop (SIGKILL).
    virtual auto kill() noexcept -> bool = 0;

    /// @brief Read from one of the process streams.
    /// @return std::nullopt when no data arrived within a short timeout,
    ///         0 at the end of the stream, otherwise the number of bytes read.
    virtual auto read(StreamKind kind, std::span<char> buffer) noexcept -> std::optional<std::size_t> = 0;
};

/// @brief OS primitive creating processes.
class ProcessSpawner {
 public:
    virtual ~ProcessSpawner() = default;

    /// @brief Create a process.
    /// @param command Executable and arguments, never empty.
    /// @param working_dir Working directory, the current one when absent.
    /// @param environment Complete environment, inherited when absent.
    /// @return The process handle, or CoreError if it could not be started.
    [[nodiscard]] virtual auto spawn(const Command& command,
        const std::optional<std::filesystem::path>& working_dir,
        const std::optional<Environment>& environment) noexcept
        -> std::expected<std::unique_ptr<RawProcess>, LaunchError> = 0;
};

/// Display attributes of a managed process.
struct ProcessAttributes {
    /// Executable name, command[0].
    std::string process_type;
    /// Rendered command line.
    std::string command_line;
    /// Label from the launch configuration, if there was one.
    std::optional<std::string> label{};
};

/// @brief Managed handle on a spawned process.
///
/// Owns the stream monitors fed from the process output and the helper
/// threads reading them. The process counts as terminated once it has
/// exited and both streams reached end of file.
class ManagedProcess final {
 public:
    ManagedProcess(std::shared_ptr<LaunchRecord> launch, std::unique_ptr<RawProcess> process,
        std::string label, ProcessAttributes attributes);
    ~ManagedProcess();

    // explicitly deleted (threads refer to this)
    ManagedProcess(const ManagedProcess&) = delete;
    auto operator=(const ManagedProcess&) = delete;

    [[nodiscard]] auto is_terminated() const noexcept -> bool;

    /// @brief Request termination, no-op when the process already exited.
    auto terminate() noexcept -> bool;

    /// @return The exit code, or CoreError while the process is still running.
    [[nodiscard]] auto exit_value() const noexcept -> std::expected<int, LaunchError>;

    /// @brief Block until terminated or until the timeout expires.
    /// @return true if the process is terminated.
    auto wait_for(std::chrono::milliseconds timeout) const noexcept -> bool;

    [[nodiscard]] auto output_stream() noexcept -> StreamMonitor& { return m_output; }
    [[nodiscard]] auto error_stream() noexcept -> StreamMonitor& { return m_error; }

    [[nodiscard]] auto pid() const noexcept -> pid_t { return m_process->pid(); }
    [[nodiscard]] auto label() const noexcept -> const std::string& { return m_label; }
    [[nodiscard]] auto attributes() const noexcept -> const ProcessAttributes& { return m_attributes; }
    [[nodiscard]] auto launch() const noexcept -> std::shared_ptr<LaunchRecord> { return m_launch.lock(); }

 private:
    void read_stream(const std::stop_token& stop, StreamKind kind) noexcept;
    void wait_process() noexcept;
    [[nodiscard]] auto has_exited() const noexcept -> bool;

    std::weak_ptr<LaunchRecord> m_launch;
    std::unique_ptr<RawProcess> m_process;
    std::string m_label;
    ProcessAttributes m_attributes;

    StreamMonitor m_output{StreamKind::Output};
    StreamMonitor m_error{StreamKind::Error};

    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
    std::optional<int> m_exit_code{};
    std::uint8_t m_open_streams{2};

    // declared last so they are joined before anything they use goes away
    std::jthread m_output_reader;
    std::jthread m_error_reader;
    std::jthread m_waiter;
};

}  // namespace extproc

#endif  // EXTPROC_PROCESS_HPP
