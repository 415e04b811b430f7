#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "extproc/logger.hpp"
#include "extproc/stream_monitor.hpp"
#include "extproc/tracing_listener.hpp"

#include <algorithm>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

struct RecordingListener final : extproc::StreamListener {
    void stream_appended(std::string_view text) override { chunks.emplace_back(text); }

    std::vector<std::string> chunks{};
};

}  // namespace

TEST_CASE("stream monitor test")
{
    extproc::StreamMonitor monitor{extproc::StreamKind::Output};

    SECTION("text is buffered while no listener is attached")
    {
        monitor.append("hello "sv);
        monitor.append("world"sv);
        REQUIRE_EQ(monitor.buffered_contents(), "hello world");
    }
    SECTION("text is dispatched once a listener is attached")
    {
        monitor.append("early"sv);

        auto listener = std::make_shared<RecordingListener>();
        monitor.add_listener(listener);
        monitor.append("late"sv);

        REQUIRE_EQ(listener->chunks, std::vector<std::string>{"late"});
        REQUIRE_EQ(monitor.buffered_contents(), "early");
    }
    SECTION("attached listener receives the buffer first")
    {
        monitor.append("early "sv);
        monitor.append("start"sv);

        auto listener = std::make_shared<RecordingListener>();
        monitor.attach_listener(listener);
        monitor.append("late"sv);

        REQUIRE_EQ(listener->chunks, std::vector<std::string>{"early start", "late"});
        REQUIRE(monitor.buffered_contents().empty());
    }
    SECTION("dispatched text is not kept")
    {
        auto listener = std::make_shared<RecordingListener>();
        monitor.attach_listener(listener);
        for (int i = 0; i < 100; ++i) {
            monitor.append("0123456789"sv);
        }
        REQUIRE_EQ(listener->chunks.size(), 100);
        REQUIRE(monitor.buffered_contents().empty());
    }
    SECTION("attaching without buffered text replays nothing")
    {
        auto listener = std::make_shared<RecordingListener>();
        monitor.attach_listener(listener);
        monitor.attach_listener(nullptr);
        REQUIRE(listener->chunks.empty());

        monitor.append("x"sv);
        REQUIRE_EQ(listener->chunks, std::vector<std::string>{"x"});
    }
    SECTION("replay comes before text appended concurrently")
    {
        monitor.append("early;"sv);

        std::jthread writer([&monitor] {
            for (int i = 0; i < 2000; ++i) {
                monitor.append("x"sv);
            }
        });
        auto listener = std::make_shared<RecordingListener>();
        monitor.attach_listener(listener);
        writer.join();

        std::string received;
        for (const auto& chunk : listener->chunks) {
            received += chunk;
        }
        REQUIRE(received.starts_with("early;"));
        REQUIRE_EQ(std::ranges::count(received, 'x'), 2000);
        REQUIRE(monitor.buffered_contents().empty());
    }
    SECTION("listener attached twice is notified once")
    {
        auto listener = std::make_shared<RecordingListener>();
        monitor.add_listener(listener);
        monitor.add_listener(listener);
        monitor.append("x"sv);
        REQUIRE_EQ(listener->chunks.size(), 1);
    }
    SECTION("removed listener is not notified")
    {
        auto listener = std::make_shared<RecordingListener>();
        monitor.add_listener(listener);
        monitor.remove_listener(listener);
        monitor.append("x"sv);
        REQUIRE(listener->chunks.empty());
    }
    SECTION("null listener is ignored")
    {
        monitor.add_listener(nullptr);
        monitor.append("x"sv);
        REQUIRE_EQ(monitor.buffered_contents(), "x");
    }
    SECTION("empty text is dropped")
    {
        auto listener = std::make_shared<RecordingListener>();
        monitor.add_listener(listener);
        monitor.append(""sv);
        REQUIRE(listener->chunks.empty());
    }
    SECTION("throwing listener does not stop the others")
    {
        auto throwing = std::make_shared<extproc::CallbackStreamListener>([](std::string_view) {
            throw std::runtime_error("listener failure");
        });
        auto listener = std::make_shared<RecordingListener>();
        monitor.add_listener(throwing);
        monitor.add_listener(listener);
        monitor.append("x"sv);
        REQUIRE_EQ(listener->chunks, std::vector<std::string>{"x"});
    }
}

TEST_CASE("tracing listener test")
{
    std::ostringstream log_stream;
    auto ostream_sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(log_stream);
    auto logger       = std::make_shared<spdlog::logger>("default", ostream_sink);
    logger->set_pattern("%v");
    logger->set_level(spdlog::level::trace);
    extproc::logger::set_logger(logger);

    SECTION("forwards to the delegate and traces")
    {
        auto delegate = std::make_shared<RecordingListener>();
        extproc::TracingStreamListener tracing{delegate, extproc::StreamKind::Error, "make"};
        tracing.stream_appended("build failed"sv);

        REQUIRE_EQ(delegate->chunks, std::vector<std::string>{"build failed"});
        REQUIRE_EQ(log_stream.str(), "[make:stderr] build failed\n");
    }
    SECTION("null logger keeps the current one")
    {
        extproc::logger::set_logger(nullptr);
        REQUIRE_EQ(spdlog::default_logger(), logger);
    }
    SECTION("traces without a delegate")
    {
        extproc::TracingStreamListener tracing{nullptr, extproc::StreamKind::Output, "ls"};
        tracing.stream_appended("a.txt"sv);
        REQUIRE_EQ(log_stream.str(), "[ls:stdout] a.txt\n");
    }
}
