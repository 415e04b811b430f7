#include "extproc/process.hpp"
#include "extproc/launch_registry.hpp"

#include <array>    // for array
#include <utility>  // for move

#include <fmt/compile.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

using namespace std::chrono_literals;

namespace {
// how long a process gets to exit after SIGTERM before it is killed on destruction
constexpr auto kDestroyGracePeriod = 1s;
}  // namespace

namespace extproc {

ManagedProcess::ManagedProcess(std::shared_ptr<LaunchRecord> launch, std::unique_ptr<RawProcess> process,
    std::string label, ProcessAttributes attributes)
  : m_launch(std::move(launch)), m_process(std::move(process)),
    m_label(std::move(label)), m_attributes(std::move(attributes)) {
    m_output_reader = std::jthread([this](const std::stop_token& stop) { read_stream(stop, StreamKind::Output); });
    m_error_reader  = std::jthread([this](const std::stop_token& stop) { read_stream(stop, StreamKind::Error); });
    m_waiter        = std::jthread([this] { wait_process(); });
}

ManagedProcess::~ManagedProcess() {
    if (!has_exited()) {
        spdlog::debug("[ManagedProcess] terminating '{}' (pid {}) on destruction", m_label, m_process->pid());
        m_process->terminate();

        std::unique_lock<std::mutex> lock(m_mutex);
        if (!m_cv.wait_for(lock, kDestroyGracePeriod, [this] { return m_exit_code.has_value(); })) {
            lock.unlock();
            spdlog::warn("[ManagedProcess] '{}' (pid {}) ignored SIGTERM, killing it", m_label, m_process->pid());
            m_process->kill();
        }
    }
    m_output_reader.request_stop();
    m_error_reader.request_stop();
}

auto ManagedProcess::is_terminated() const noexcept -> bool {
    const std::lock_guard<std::mutex> lock(m_mutex);
    return m_exit_code.has_value() && m_open_streams == 0;
}

auto ManagedProcess::terminate() noexcept -> bool {
    if (has_exited()) {
        return true;
    }
    spdlog::debug("[ManagedProcess] terminate '{}' (pid {})", m_label, m_process->pid());
    return m_process->terminate();
}

auto ManagedProcess::exit_value() const noexcept -> std::expected<int, LaunchError> {
    const std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_exit_code) {
        return std::unexpected(core_error(fmt::format(FMT_COMPILE("Process '{}' has not terminated"), m_label)));
    }
    return *m_exit_code;
}

auto ManagedProcess::wait_for(std::chrono::milliseconds timeout) const noexcept -> bool {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, timeout, [this] { return m_exit_code.has_value() && m_open_streams == 0; });
}

auto ManagedProcess::has_exited() const noexcept -> bool {
    const std::lock_guard<std::mutex> lock(m_mutex);
    return m_exit_code.has_value();
}

void ManagedProcess::read_stream(const std::stop_token& stop, StreamKind kind) noexcept {
    auto& monitor = (kind == StreamKind::Output) ? m_output : m_error;

    std::array<char, 8192> buf{};
    while (!stop.stop_requested()) {
        const auto bytes_read = m_process->read(kind, buf);
        if (!bytes_read) {
            continue;
        }
        if (*bytes_read == 0) {
            break;
        }
        monitor.append(std::string_view{buf.data(), *bytes_read});
    }

    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        --m_open_streams;
    }
    m_cv.notify_all();
}

void ManagedProcess::wait_process() noexcept {
    const int exit_code = m_process->wait();
    spdlog::debug("[ManagedProcess] '{}' (pid {}) exited with {}", m_label, m_process->pid(), exit_code);
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        m_exit_code = exit_code;
    }
    m_cv.notify_all();
}

}  // namespace extproc
