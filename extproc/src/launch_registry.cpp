#include "extproc/launch_registry.hpp"

#include <algorithm>  // for all_of, find, partition
#include <iterator>   // for make_move_iterator
#include <utility>    // for move

#include <spdlog/spdlog.h>

namespace extproc {

LaunchRecord::LaunchRecord(std::shared_ptr<const LaunchConfiguration> configuration, std::string mode) noexcept
  : m_configuration(std::move(configuration)), m_mode(std::move(mode)),
    m_created_at(std::chrono::system_clock::now()) { }

void LaunchRecord::add_process(std::shared_ptr<ManagedProcess> process) noexcept {
    const std::lock_guard<std::mutex> lock(m_mutex);
    m_processes.emplace_back(std::move(process));
}

auto LaunchRecord::processes() const noexcept -> std::vector<std::shared_ptr<ManagedProcess>> {
    const std::lock_guard<std::mutex> lock(m_mutex);
    return m_processes;
}

auto LaunchRecord::is_terminated() const noexcept -> bool {
    const std::lock_guard<std::mutex> lock(m_mutex);
    return std::ranges::all_of(m_processes, [](auto&& process) { return process->is_terminated(); });
}

void LaunchManager::add_launch(std::shared_ptr<LaunchRecord> launch) noexcept {
    if (!launch) {
        return;
    }
    const std::lock_guard<std::mutex> lock(m_mutex);
    if (std::ranges::find(m_launches, launch) != m_launches.end()) {
        return;
    }
    spdlog::debug("[LaunchManager] registered '{}' launch ({} total)",
        launch->configuration() ? launch->configuration()->name() : std::string_view{"anonymous"}, m_launches.size() + 1);
    m_launches.emplace_back(std::move(launch));
}

auto LaunchManager::remove_launch(const std::shared_ptr<LaunchRecord>& launch) noexcept -> bool {
    const std::lock_guard<std::mutex> lock(m_mutex);
    return std::erase(m_launches, launch) > 0;
}

auto LaunchManager::remove_terminated_launches() noexcept -> std::size_t {
    std::vector<std::shared_ptr<LaunchRecord>> removed;
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        const auto first = std::ranges::partition(m_launches, [](auto&& launch) { return !launch->is_terminated(); }).begin();
        removed.assign(std::make_move_iterator(first), std::make_move_iterator(m_launches.end()));
        m_launches.erase(first, m_launches.end());
    }
    // records are released outside the lock, their processes join helper threads
    return removed.size();
}

auto LaunchManager::launches() const noexcept -> std::vector<std::shared_ptr<LaunchRecord>> {
    const std::lock_guard<std::mutex> lock(m_mutex);
    return m_launches;
}

}  // namespace extproc
