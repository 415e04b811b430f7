#include "extproc/stream_monitor.hpp"

#include <algorithm>  // for find
#include <exception>  // for exception
#include <utility>    // for move, exchange

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace extproc {

auto stream_kind_to_string(StreamKind kind) noexcept -> std::string_view {
    switch (kind) {
    case StreamKind::Output:
        return "stdout"sv;
    case StreamKind::Error:
        return "stderr"sv;
    }
    return "unknown"sv;
}

CallbackStreamListener::CallbackStreamListener(callback_t callback) noexcept
  : m_callback(std::move(callback)) { }

void CallbackStreamListener::stream_appended(std::string_view text) {
    if (m_callback) {
        m_callback(text);
    }
}

StreamMonitor::StreamMonitor(StreamKind kind) noexcept
  : m_kind(kind) { }

void StreamMonitor::add_listener(std::shared_ptr<StreamListener> listener) noexcept {
    if (!listener) {
        return;
    }
    const std::lock_guard<std::mutex> lock(m_mutex);
    if (std::ranges::find(m_listeners, listener) == m_listeners.end()) {
        m_listeners.emplace_back(std::move(listener));
    }
}

void StreamMonitor::remove_listener(const std::shared_ptr<StreamListener>& listener) noexcept {
    const std::lock_guard<std::mutex> lock(m_mutex);
    std::erase(m_listeners, listener);
}

void StreamMonitor::attach_listener(std::shared_ptr<StreamListener> listener) noexcept {
    if (!listener) {
        return;
    }

    const std::lock_guard<std::mutex> dispatch_lock(m_dispatch_mutex);
    std::string buffered;
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        if (std::ranges::find(m_listeners, listener) == m_listeners.end()) {
            m_listeners.emplace_back(listener);
        }
        buffered = std::exchange(m_buffer, std::string{});
    }
    if (!buffered.empty()) {
        notify({listener}, buffered);
    }
}

auto StreamMonitor::buffered_contents() const noexcept -> std::string {
    const std::lock_guard<std::mutex> lock(m_mutex);
    return m_buffer;
}

void StreamMonitor::append(std::string_view text) noexcept {
    if (text.empty()) {
        return;
    }

    const std::lock_guard<std::mutex> dispatch_lock(m_dispatch_mutex);
    std::vector<std::shared_ptr<StreamListener>> listeners;
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        if (m_listeners.empty()) {
            m_buffer += text;
            return;
        }
        listeners = m_listeners;
    }
    notify(listeners, text);
}

// listeners run without m_mutex held, so they may add or remove listeners
void StreamMonitor::notify(const std::vector<std::shared_ptr<StreamListener>>& listeners, std::string_view text) const noexcept {
    for (const auto& listener : listeners) {
        try {
            listener->stream_appended(text);
        } catch (const std::exception& e) {
            spdlog::error("[StreamMonitor] {} listener failed: {}", stream_kind_to_string(m_kind), e.what());
        }
    }
}

}  // namespace extproc
