#ifndef EXTPROC_POSIX_PROCESS_HPP
#define EXTPROC_POSIX_PROCESS_HPP

#include "extproc/process.hpp"

#include <sys/types.h>  // for pid_t

#include <mutex>  // for mutex

namespace extproc {

/// @brief Child process created with fork/exec.
///
/// Standard input is /dev/null, standard output and error are pipes.
class PosixProcess final : public RawProcess {
 public:
    PosixProcess(pid_t pid, int stdout_fd, int stderr_fd) noexcept;
    ~PosixProcess() override;

    // explicitly deleted (owns descriptors)
    PosixProcess(const PosixProcess&) = delete;
    auto operator=(const PosixProcess&) = delete;

    [[nodiscard]] auto pid() const noexcept -> pid_t override { return m_pid; }
    auto wait() noexcept -> int override;
    auto terminate() noexcept -> bool override;
    auto kill() noexcept -> bool override;
    auto read(StreamKind kind, std::span<char> buffer) noexcept -> std::optional<std::size_t> override;

 private:
    auto send_signal(int signal) noexcept -> bool;

    pid_t m_pid;
    int m_stdout_fd;
    int m_stderr_fd;

    // guards reaping against signalling a recycled pid
    std::mutex m_mutex;
    bool m_reaped{false};
    int m_exit_code{-1};
};

/// @brief ProcessSpawner using fork/exec with PATH lookup.
class PosixSpawner final : public ProcessSpawner {
 public:
    [[nodiscard]] auto spawn(const Command& command,
        const std::optional<std::filesystem::path>& working_dir,
        const std::optional<Environment>& environment) noexcept
        -> std::expected<std::unique_ptr<RawProcess>, LaunchError> override;
};

}  // namespace extproc

#endif  // EXTPROC_POSIX_PROCESS_HPP
