#include "extproc/environment.hpp"

#include <unistd.h>  // for environ

#include <cstdlib>  // for getenv

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace extproc::env {

auto safe_getenv(const char* env_name) noexcept -> std::string_view {
    const char* const raw_val = std::getenv(env_name);
    return raw_val != nullptr ? std::string_view{raw_val} : std::string_view{};
}

auto native_environment() noexcept -> Environment {
    Environment result{};
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string_view line{*entry};
        const auto pos = line.find('=');
        if (pos == std::string_view::npos || pos == 0) {
            continue;
        }
        result.insert_or_assign(std::string{line.substr(0, pos)}, std::string{line.substr(pos + 1)});
    }
    return result;
}

auto to_envp(const Environment& environment) noexcept -> std::vector<std::string> {
    std::vector<std::string> result{};
    result.reserve(environment.size());
    for (const auto& [name, value] : environment) {
        result.emplace_back(fmt::format(FMT_COMPILE("{}={}"), name, value));
    }
    return result;
}

auto substitute_variables(std::string_view value) noexcept -> std::expected<std::string, LaunchError> {
    static constexpr auto prefix = "${env_var:"sv;

    std::string result{};
    std::size_t pos{};
    while (pos < value.size()) {
        const auto start = value.find(prefix, pos);
        if (start == std::string_view::npos) {
            result += value.substr(pos);
            break;
        }
        result += value.substr(pos, start - pos);

        const auto name_begin = start + prefix.size();
        const auto end        = value.find('}', name_begin);
        if (end == std::string_view::npos) {
            return std::unexpected(core_error(fmt::format(FMT_COMPILE("Unterminated variable reference in '{}'"), value)));
        }

        const std::string name{value.substr(name_begin, end - name_begin)};
        const char* const raw_val = std::getenv(name.c_str());
        if (name.empty() || raw_val == nullptr) {
            return std::unexpected(core_error(fmt::format(FMT_COMPILE("Reference to undefined variable env_var:{}"), name)));
        }
        result += raw_val;
        pos = end + 1;
    }
    return result;
}

}  // namespace extproc::env
