#include "extproc/posix_process.hpp"

#include <fcntl.h>     // for open, O_RDONLY, O_CLOEXEC
#include <poll.h>      // for poll, pollfd
#include <signal.h>    // for kill, SIGTERM, SIGKILL
#include <sys/wait.h>  // for waitid, waitpid
#include <unistd.h>    // for fork, execvp, pipe2, dup2, chdir

#include <cerrno>       // for errno, EINTR
#include <cstdint>      // for int32_t
#include <cstring>      // for strerror
#include <string_view>  // for string_view
#include <utility>      // for move
#include <vector>       // for vector

#include <fmt/compile.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

constexpr int kReadPollTimeoutMs = 100;

/// Stage at which the child failed, written to the status pipe.
enum class ChildStage : std::int32_t {
    Redirect,
    ChangeDirectory,
    Exec
};

struct ChildFailure {
    ChildStage stage;
    std::int32_t error;
};

constexpr auto child_stage_to_string(ChildStage stage) noexcept -> std::string_view {
    switch (stage) {
    case ChildStage::Redirect:
        return "redirect standard streams of"sv;
    case ChildStage::ChangeDirectory:
        return "change working directory of"sv;
    case ChildStage::Exec:
        return "execute"sv;
    }
    return "start"sv;
}

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// only async-signal-safe calls from here on, the parent may have other threads
[[noreturn]] void report_child_failure(int status_fd, ChildStage stage) noexcept {
    const ChildFailure failure{.stage = stage, .error = errno};
    [[maybe_unused]] const auto written = ::write(status_fd, &failure, sizeof(failure));
    ::_exit(127);
}

auto decode_wait_status(int status) noexcept -> int {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

}  // namespace

namespace extproc {

PosixProcess::PosixProcess(pid_t pid, int stdout_fd, int stderr_fd) noexcept
  : m_pid(pid), m_stdout_fd(stdout_fd), m_stderr_fd(stderr_fd) { }

PosixProcess::~PosixProcess() {
    close_fd(m_stdout_fd);
    close_fd(m_stderr_fd);

    const std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_reaped) {
        // collect the zombie if it has exited meanwhile
        int status{};
        if (::waitpid(m_pid, &status, WNOHANG) == m_pid) {
            m_reaped = true;
        }
    }
}

auto PosixProcess::wait() noexcept -> int {
    // wait without reaping first, so the pid stays valid for terminate()
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(m_pid), &info, WEXITED | WNOWAIT) != 0) {
        if (errno != EINTR) {
            break;
        }
    }

    const std::lock_guard<std::mutex> lock(m_mutex);
    if (m_reaped) {
        return m_exit_code;
    }

    int status{};
    pid_t ret{};
    do {
        ret = ::waitpid(m_pid, &status, 0);
    } while (ret == -1 && errno == EINTR);

    if (ret == -1) {
        spdlog::error("[PosixProcess] waitpid({}) failed: {}", m_pid, std::strerror(errno));
        m_exit_code = -1;
    } else {
        m_exit_code = decode_wait_status(status);
    }
    m_reaped = true;
    return m_exit_code;
}

auto PosixProcess::terminate() noexcept -> bool {
    return send_signal(SIGTERM);
}

auto PosixProcess::kill() noexcept -> bool {
    return send_signal(SIGKILL);
}

auto PosixProcess::send_signal(int signal) noexcept -> bool {
    const std::lock_guard<std::mutex> lock(m_mutex);
    if (m_reaped) {
        return false;
    }
    if (::kill(m_pid, signal) != 0) {
        spdlog::error("[PosixProcess] failed to send signal {} to {}: {}", signal, m_pid, std::strerror(errno));
        return false;
    }
    return true;
}

auto PosixProcess::read(StreamKind kind, std::span<char> buffer) noexcept -> std::optional<std::size_t> {
    const int fd = (kind == StreamKind::Output) ? m_stdout_fd : m_stderr_fd;
    if (fd < 0) {
        return 0;
    }

    pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
    const int ready = ::poll(&pfd, 1, kReadPollTimeoutMs);
    if (ready == 0 || (ready < 0 && errno == EINTR)) {
        return std::nullopt;
    }
    if (ready < 0) {
        spdlog::error("[PosixProcess] poll on {} of {} failed: {}", stream_kind_to_string(kind), m_pid, std::strerror(errno));
        return 0;
    }

    ssize_t bytes_read{};
    do {
        bytes_read = ::read(fd, buffer.data(), buffer.size());
    } while (bytes_read < 0 && errno == EINTR);

    if (bytes_read < 0) {
        if (errno == EAGAIN) {
            return std::nullopt;
        }
        spdlog::error("[PosixProcess] read on {} of {} failed: {}", stream_kind_to_string(kind), m_pid, std::strerror(errno));
        return 0;
    }
    return static_cast<std::size_t>(bytes_read);
}

auto PosixSpawner::spawn(const Command& command,
    const std::optional<std::filesystem::path>& working_dir,
    const std::optional<Environment>& environment) noexcept
    -> std::expected<std::unique_ptr<RawProcess>, LaunchError> {
    if (command.empty()) {
        return std::unexpected(invalid_argument("Empty commands array"));
    }

    const bool log_exec_cmds = env::safe_getenv("EXTPROC_LOG_EXEC_CMDS") == "1"sv;
    if (log_exec_cmds && spdlog::default_logger_raw() != nullptr) {
        spdlog::debug("[PosixSpawner] cmd := {}", command);
    }

    // everything the child needs is prepared before fork
    std::vector<char*> args;
    args.reserve(command.size() + 1);
    for (const auto& arg : command) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    std::vector<std::string> env_strings;
    std::vector<char*> envp;
    if (environment) {
        env_strings = env::to_envp(*environment);
        envp.reserve(env_strings.size() + 1);
        for (auto& entry : env_strings) {
            envp.push_back(entry.data());
        }
        envp.push_back(nullptr);
    }

    const std::string cwd = working_dir ? working_dir->string() : std::string{};

    int out_pipe[2]    = {-1, -1};
    int err_pipe[2]    = {-1, -1};
    int status_pipe[2] = {-1, -1};
    auto close_pipes   = [&] {
        for (int* fds : {out_pipe, err_pipe, status_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
    };

    if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 || ::pipe2(status_pipe, O_CLOEXEC) != 0) {
        const int error = errno;
        close_pipes();
        return std::unexpected(core_error(fmt::format(FMT_COMPILE("Failed to create pipes for '{}'"), command[0]), std::strerror(error)));
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int error = errno;
        close_pipes();
        return std::unexpected(core_error(fmt::format(FMT_COMPILE("Failed to fork for '{}'"), command[0]), std::strerror(error)));
    }

    if (pid == 0) {
        const int dev_null = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (dev_null < 0 || ::dup2(dev_null, STDIN_FILENO) < 0
            || ::dup2(out_pipe[1], STDOUT_FILENO) < 0 || ::dup2(err_pipe[1], STDERR_FILENO) < 0) {
            report_child_failure(status_pipe[1], ChildStage::Redirect);
        }
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            report_child_failure(status_pipe[1], ChildStage::ChangeDirectory);
        }
        if (environment) {
            ::execvpe(args[0], args.data(), envp.data());
        } else {
            ::execvp(args[0], args.data());
        }
        report_child_failure(status_pipe[1], ChildStage::Exec);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);

    // the status pipe is closed by a successful exec, data means failure
    ChildFailure failure{};
    ssize_t bytes_read{};
    do {
        bytes_read = ::read(status_pipe[0], &failure, sizeof(failure));
    } while (bytes_read < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (bytes_read == static_cast<ssize_t>(sizeof(failure))) {
        int status{};
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) { }
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);

        auto error = core_error(fmt::format(FMT_COMPILE("Failed to {} '{}'"), child_stage_to_string(failure.stage), command[0]),
            std::strerror(failure.error));
        spdlog::error("[PosixSpawner] {}", to_string(error));
        return std::unexpected(std::move(error));
    }

    spdlog::debug("[PosixSpawner] started '{}' as pid {}", command[0], pid);
    return std::make_unique<PosixProcess>(pid, out_pipe[0], err_pipe[0]);
}

}  // namespace extproc
