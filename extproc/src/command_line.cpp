#include "extproc/command_line.hpp"

#include <cstddef>  // for size_t
#include <cstdint>  // for uint8_t
#include <utility>  // for move

namespace {

enum class QuoteState : std::uint8_t {
    None,
    Single,
    Double
};

constexpr auto is_blank(char ch) noexcept -> bool {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

}  // namespace

namespace extproc::cmdline {

auto parse_arguments(std::string_view command_line) noexcept -> std::expected<Command, LaunchError> {
    if (command_line.empty()) {
        return std::unexpected(invalid_argument("Missing command line"));
    }

    Command tokens{};
    std::string current{};
    // set once anything (even an empty quoted string) belongs to the token
    bool in_token{false};
    auto quote = QuoteState::None;

    const auto size = command_line.size();
    for (std::size_t i = 0; i < size; ++i) {
        const char ch = command_line[i];
        switch (quote) {
        case QuoteState::Single:
            if (ch == '\'') {
                quote = QuoteState::None;
            } else {
                current += ch;
            }
            break;
        case QuoteState::Double:
            if (ch == '"') {
                quote = QuoteState::None;
            } else if (ch == '\\' && i + 1 < size && (command_line[i + 1] == '"' || command_line[i + 1] == '\\')) {
                current += command_line[++i];
            } else {
                current += ch;
            }
            break;
        case QuoteState::None:
            if (is_blank(ch)) {
                if (in_token) {
                    tokens.emplace_back(std::move(current));
                    current.clear();
                    in_token = false;
                }
            } else if (ch == '"') {
                quote    = QuoteState::Double;
                in_token = true;
            } else if (ch == '\'') {
                quote    = QuoteState::Single;
                in_token = true;
            } else if (ch == '\\' && i + 1 < size) {
                current += command_line[++i];
                in_token = true;
            } else {
                current += ch;
                in_token = true;
            }
            break;
        }
    }

    // unterminated quotes run to the end of the line
    if (in_token) {
        tokens.emplace_back(std::move(current));
    }
    return tokens;
}

auto render_command_line(std::span<const std::string> command) noexcept -> std::string {
    std::string result{};
    for (const auto& token : command) {
        result += ' ';

        std::string escaped{};
        escaped.reserve(token.size());
        bool contains_space{false};
        for (const char ch : token) {
            if (ch == '"') {
                escaped += '\\';
            } else if (ch == ' ') {
                contains_space = true;
            }
            escaped += ch;
        }

        if (contains_space) {
            result += '"';
            result += escaped;
            result += '"';
        } else {
            result += escaped;
        }
    }
    return result;
}

}  // namespace extproc::cmdline
