#include "extproc/launch_configuration.hpp"

#include <cerrno>   // for errno
#include <cstdio>   // for fopen, fread, fclose
#include <cstring>  // for strerror
#include <memory>   // for unique_ptr
#include <utility>  // for move

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace {

auto read_whole_file(std::string_view filepath) noexcept -> std::expected<std::string, std::string> {
    const std::string path{filepath};
    const std::unique_ptr<std::FILE, decltype(&std::fclose)> file(std::fopen(path.c_str(), "rb"), std::fclose);
    if (!file) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' read failed: {}"), filepath, std::strerror(errno)));
    }

    std::fseek(file.get(), 0, SEEK_END);
    const auto size = std::ftell(file.get());
    std::fseek(file.get(), 0, SEEK_SET);
    if (size < 0) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' read failed: {}"), filepath, std::strerror(errno)));
    }

    std::string buf;
    buf.resize(static_cast<std::size_t>(size));

    const std::size_t read = std::fread(buf.data(), sizeof(char), buf.size(), file.get());
    if (read != buf.size()) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' read failed: short read"), filepath));
    }
    return buf;
}

}  // namespace

namespace extproc {

StaticLaunchConfiguration::StaticLaunchConfiguration(std::string name) noexcept
  : m_name(std::move(name)) { }

auto StaticLaunchConfiguration::attribute(std::string_view key, std::string_view default_value) const
    -> std::expected<std::string, LaunchError> {
    if (auto it = m_attributes.find(key); it != m_attributes.end()) {
        return it->second;
    }
    return std::string{default_value};
}

auto StaticLaunchConfiguration::resolve_environment() const
    -> std::expected<std::optional<Environment>, LaunchError> {
    if (m_variables.empty()) {
        return std::nullopt;
    }

    Environment result{};
    if (m_append_environment) {
        result = env::native_environment();
    }
    for (const auto& [name, value] : m_variables) {
        auto expanded = env::substitute_variables(value);
        if (!expanded) {
            auto error    = std::move(expanded.error());
            error.message = fmt::format(FMT_COMPILE("Failed to resolve environment of '{}': {}"), m_name, error.message);
            return std::unexpected(std::move(error));
        }
        result.insert_or_assign(name, std::move(*expanded));
    }
    return result;
}

void StaticLaunchConfiguration::set_attribute(std::string key, std::string value) noexcept {
    m_attributes.insert_or_assign(std::move(key), std::move(value));
}

void StaticLaunchConfiguration::set_variable(std::string name, std::string value) noexcept {
    m_variables.insert_or_assign(std::move(name), std::move(value));
}

auto parse_launch_configuration(std::string_view json_content) noexcept
    -> std::expected<StaticLaunchConfiguration, std::string> {
    rapidjson::Document doc;
    doc.Parse(json_content.data(), json_content.size());
    if (doc.HasParseError()) {
        return std::unexpected(fmt::format(FMT_COMPILE("JSON parse error at offset {}: {}"),
            doc.GetErrorOffset(), rapidjson::GetParseError_En(doc.GetParseError())));
    }
    if (!doc.IsObject()) {
        return std::unexpected("JSON root must be an object");
    }

    // Parse name (required)
    if (!doc.HasMember("name") || !doc["name"].IsString()) {
        return std::unexpected("'name' field is required and must be a string");
    }
    StaticLaunchConfiguration config{doc["name"].GetString()};

    // Parse label (optional, defaults to the executable name at launch)
    if (doc.HasMember("label")) {
        if (!doc["label"].IsString()) {
            return std::unexpected("'label' must be a string");
        }
        config.set_attribute(std::string{attr::process_label}, doc["label"].GetString());
    }

    // Parse append_environment (optional, default true)
    if (doc.HasMember("append_environment")) {
        if (!doc["append_environment"].IsBool()) {
            return std::unexpected("'append_environment' must be a boolean");
        }
        config.set_append_environment(doc["append_environment"].GetBool());
    }

    if (doc.HasMember("environment")) {
        const auto& environment = doc["environment"];
        if (!environment.IsObject()) {
            return std::unexpected("'environment' must be an object");
        }
        for (const auto& member : environment.GetObject()) {
            if (!member.value.IsString()) {
                return std::unexpected(fmt::format(FMT_COMPILE("Environment variable '{}' must be a string"), member.name.GetString()));
            }
            config.set_variable(member.name.GetString(), member.value.GetString());
        }
    }

    if (doc.HasMember("attributes")) {
        const auto& attributes = doc["attributes"];
        if (!attributes.IsObject()) {
            return std::unexpected("'attributes' must be an object");
        }
        for (const auto& member : attributes.GetObject()) {
            if (!member.value.IsString()) {
                return std::unexpected(fmt::format(FMT_COMPILE("Attribute '{}' must be a string"), member.name.GetString()));
            }
            config.set_attribute(member.name.GetString(), member.value.GetString());
        }
    }

    return config;
}

auto load_launch_configuration(std::string_view filepath) noexcept
    -> std::expected<StaticLaunchConfiguration, std::string> {
    auto content = read_whole_file(filepath);
    if (!content) {
        spdlog::error("[LaunchConfiguration] {}", content.error());
        return std::unexpected(std::move(content.error()));
    }
    return parse_launch_configuration(*content);
}

}  // namespace extproc
