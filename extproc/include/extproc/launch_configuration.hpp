#ifndef EXTPROC_LAUNCH_CONFIGURATION_HPP
#define EXTPROC_LAUNCH_CONFIGURATION_HPP

#include "extproc/environment.hpp"
#include "extproc/launch_error.hpp"

#include <expected>     // for expected
#include <functional>   // for less
#include <map>          // for map
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace extproc {

namespace attr {
/// Human readable label of the launched process.
inline constexpr std::string_view process_label = "process_label";
}  // namespace attr

/// @brief Descriptor supplying the environment and display label of a launch.
class LaunchConfiguration {
 public:
    virtual ~LaunchConfiguration() = default;

    [[nodiscard]] virtual auto name() const noexcept -> std::string_view = 0;

    /// @brief Look up a string attribute.
    /// @param key The attribute name.
    /// @param default_value Returned when the attribute is not set.
    [[nodiscard]] virtual auto attribute(std::string_view key, std::string_view default_value) const
        -> std::expected<std::string, LaunchError> = 0;

    /// @brief Resolve the environment of the launch.
    /// @return The environment, std::nullopt to inherit the parent one, or CoreError.
    [[nodiscard]] virtual auto resolve_environment() const
        -> std::expected<std::optional<Environment>, LaunchError> = 0;
};

/// @brief In-memory launch configuration.
class StaticLaunchConfiguration final : public LaunchConfiguration {
 public:
    using attribute_map_t = std::map<std::string, std::string, std::less<>>;

    StaticLaunchConfiguration() = default;
    explicit StaticLaunchConfiguration(std::string name) noexcept;

    [[nodiscard]] auto name() const noexcept -> std::string_view override { return m_name; }

    [[nodiscard]] auto attribute(std::string_view key, std::string_view default_value) const
        -> std::expected<std::string, LaunchError> override;

    /// Declared variables are expanded with env::substitute_variables and,
    /// when append_environment() is set, merged over the native environment.
    /// Without declared variables the parent environment is inherited.
    [[nodiscard]] auto resolve_environment() const
        -> std::expected<std::optional<Environment>, LaunchError> override;

    void set_attribute(std::string key, std::string value) noexcept;
    void set_variable(std::string name, std::string value) noexcept;
    void set_append_environment(bool append) noexcept { m_append_environment = append; }

    [[nodiscard]] auto attributes() const noexcept -> const attribute_map_t& { return m_attributes; }
    [[nodiscard]] auto variables() const noexcept -> const Environment& { return m_variables; }
    [[nodiscard]] auto append_environment() const noexcept -> bool { return m_append_environment; }

 private:
    std::string m_name{};
    attribute_map_t m_attributes{};
    Environment m_variables{};
    bool m_append_environment{true};
};

/// @brief Parses a launch configuration from JSON string content.
///
/// Expected layout:
/// {"name": "...", "label": "...", "append_environment": true,
///  "environment": {"NAME": "value"}, "attributes": {"key": "value"}}
/// @param json_content The JSON configuration content.
/// @return The configuration on success, or error string on failure.
[[nodiscard]] auto parse_launch_configuration(std::string_view json_content) noexcept
    -> std::expected<StaticLaunchConfiguration, std::string>;

/// @brief Reads and parses a launch configuration file.
[[nodiscard]] auto load_launch_configuration(std::string_view filepath) noexcept
    -> std::expected<StaticLaunchConfiguration, std::string>;

}  // namespace extproc

#endif  // EXTPROC_LAUNCH_CONFIGURATION_HPP
