#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "extproc/command_line.hpp"

#include <string>
#include <string_view>
#include <vector>

using namespace std::string_literals;
using namespace std::string_view_literals;

TEST_CASE("parse arguments test")
{
    SECTION("empty command line")
    {
        const auto& tokens = extproc::cmdline::parse_arguments(""sv);
        REQUIRE(!tokens);
        REQUIRE_EQ(tokens.error().kind, extproc::ErrorKind::InvalidArgument);
        REQUIRE_EQ(tokens.error().message, "Missing command line");
    }
    SECTION("whitespace only")
    {
        const auto& tokens = extproc::cmdline::parse_arguments(" \t  "sv);
        REQUIRE(tokens);
        REQUIRE(tokens->empty());
    }
    SECTION("plain tokens")
    {
        const auto& tokens = extproc::cmdline::parse_arguments("  ls   -la\t/tmp  "sv);
        REQUIRE(tokens);
        REQUIRE_EQ(*tokens, std::vector{"ls"s, "-la"s, "/tmp"s});
    }
    SECTION("double quoted token")
    {
        const auto& tokens = extproc::cmdline::parse_arguments("echo \"hello world\""sv);
        REQUIRE(tokens);
        REQUIRE_EQ(*tokens, std::vector{"echo"s, "hello world"s});
    }
    SECTION("single quotes are literal")
    {
        const auto& tokens = extproc::cmdline::parse_arguments(R"(sh -c 'echo "$HOME" \n')"sv);
        REQUIRE(tokens);
        REQUIRE_EQ(*tokens, std::vector{"sh"s, "-c"s, R"(echo "$HOME" \n)"s});
    }
    SECTION("escapes inside double quotes")
    {
        const auto& tokens = extproc::cmdline::parse_arguments(R"(say "a \"quoted\" \\ word \n")"sv);
        REQUIRE(tokens);
        REQUIRE_EQ(*tokens, std::vector{"say"s, R"(a "quoted" \ word \n)"s});
    }
    SECTION("escaped space outside quotes")
    {
        const auto& tokens = extproc::cmdline::parse_arguments(R"(cat My\ Documents/file.txt)"sv);
        REQUIRE(tokens);
        REQUIRE_EQ(*tokens, std::vector{"cat"s, "My Documents/file.txt"s});
    }
    SECTION("adjacent parts form one token")
    {
        const auto& tokens = extproc::cmdline::parse_arguments(R"(--name="John Doe"'s' x)"sv);
        REQUIRE(tokens);
        REQUIRE_EQ(*tokens, std::vector{"--name=John Does"s, "x"s});
    }
    SECTION("empty quoted token")
    {
        const auto& tokens = extproc::cmdline::parse_arguments(R"(prog "" '' end)"sv);
        REQUIRE(tokens);
        REQUIRE_EQ(*tokens, std::vector{"prog"s, ""s, ""s, "end"s});
    }
    SECTION("unterminated quote runs to the end")
    {
        const auto& tokens = extproc::cmdline::parse_arguments(R"(echo "never closed)"sv);
        REQUIRE(tokens);
        REQUIRE_EQ(*tokens, std::vector{"echo"s, "never closed"s});
    }
    SECTION("no shell metacharacters")
    {
        const auto& tokens = extproc::cmdline::parse_arguments("cat *.txt | grep x > out"sv);
        REQUIRE(tokens);
        REQUIRE_EQ(*tokens, std::vector{"cat"s, "*.txt"s, "|"s, "grep"s, "x"s, ">"s, "out"s});
    }
}

TEST_CASE("render command line test")
{
    SECTION("empty command")
    {
        REQUIRE_EQ(extproc::cmdline::render_command_line(std::vector<std::string>{}), "");
    }
    SECTION("plain tokens are neither quoted nor escaped")
    {
        const std::vector<std::string> command{"ls", "-la", "/tmp"};
        REQUIRE_EQ(extproc::cmdline::render_command_line(command), " ls -la /tmp");
    }
    SECTION("token with space is quoted")
    {
        const std::vector<std::string> command{"echo", "hello world"};
        REQUIRE_EQ(extproc::cmdline::render_command_line(command), R"( echo "hello world")");
    }
    SECTION("quotes are escaped")
    {
        const std::vector<std::string> command{"say", R"(a"b)"};
        REQUIRE_EQ(extproc::cmdline::render_command_line(command), R"( say a\"b)");
    }
    SECTION("quotes are escaped before the token is quoted")
    {
        const std::vector<std::string> command{"say", R"(he said "hi")"};
        REQUIRE_EQ(extproc::cmdline::render_command_line(command), R"( say "he said \"hi\"")");
    }
    SECTION("tabs do not trigger quoting")
    {
        const std::vector<std::string> command{"x", "a\tb"};
        REQUIRE_EQ(extproc::cmdline::render_command_line(command), " x a\tb");
    }
    SECTION("parse then render")
    {
        const auto& tokens = extproc::cmdline::parse_arguments("echo \"hello world\""sv);
        REQUIRE(tokens);
        REQUIRE_EQ(extproc::cmdline::render_command_line(*tokens), R"( echo "hello world")");
    }
}
