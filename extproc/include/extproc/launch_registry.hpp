#ifndef EXTPROC_LAUNCH_REGISTRY_HPP
#define EXTPROC_LAUNCH_REGISTRY_HPP

#include "extproc/launch_configuration.hpp"
#include "extproc/process.hpp"

#include <chrono>       // for system_clock
#include <cstddef>      // for size_t
#include <memory>       // for shared_ptr
#include <mutex>        // for mutex
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace extproc {

/// @brief Record of one launch and the processes it created.
///
/// The configuration is null for anonymous launches.
class LaunchRecord final {
 public:
    LaunchRecord(std::shared_ptr<const LaunchConfiguration> configuration, std::string mode) noexcept;

    // explicitly deleted (shared between the launcher and the registry)
    LaunchRecord(const LaunchRecord&) = delete;
    auto operator=(const LaunchRecord&) = delete;

    void add_process(std::shared_ptr<ManagedProcess> process) noexcept;

    [[nodiscard]] auto processes() const noexcept -> std::vector<std::shared_ptr<ManagedProcess>>;

    /// @return true when every process of the launch is terminated.
    [[nodiscard]] auto is_terminated() const noexcept -> bool;

    [[nodiscard]] auto configuration() const noexcept -> const std::shared_ptr<const LaunchConfiguration>& { return m_configuration; }
    [[nodiscard]] auto mode() const noexcept -> std::string_view { return m_mode; }
    [[nodiscard]] auto created_at() const noexcept -> std::chrono::system_clock::time_point { return m_created_at; }

 private:
    std::shared_ptr<const LaunchConfiguration> m_configuration;
    std::string m_mode;
    std::chrono::system_clock::time_point m_created_at;

    mutable std::mutex m_mutex;
    std::vector<std::shared_ptr<ManagedProcess>> m_processes;
};

/// @brief Service recording launches for later inspection.
class LaunchRegistry {
 public:
    virtual ~LaunchRegistry() = default;

    virtual void add_launch(std::shared_ptr<LaunchRecord> launch) noexcept = 0;
};

/// @brief Thread-safe in-memory launch registry.
class LaunchManager final : public LaunchRegistry {
 public:
    void add_launch(std::shared_ptr<LaunchRecord> launch) noexcept override;

    auto remove_launch(const std::shared_ptr<LaunchRecord>& launch) noexcept -> bool;

    /// @brief Drop every launch whose processes are all terminated.
    /// @return The number of removed launches.
    auto remove_terminated_launches() noexcept -> std::size_t;

    [[nodiscard]] auto launches() const noexcept -> std::vector<std::shared_ptr<LaunchRecord>>;

 private:
    mutable std::mutex m_mutex;
    std::vector<std::shared_ptr<LaunchRecord>> m_launches;
};

}  // namespace extproc

#endif  // EXTPROC_LAUNCH_REGISTRY_HPP
