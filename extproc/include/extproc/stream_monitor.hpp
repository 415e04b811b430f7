#ifndef EXTPROC_STREAM_MONITOR_HPP
#define EXTPROC_STREAM_MONITOR_HPP

#include <cstdint>      // for uint8_t
#include <functional>   // for function
#include <memory>       // for shared_ptr
#include <mutex>        // for mutex
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace extproc {

/// Standard stream of a spawned process.
enum class StreamKind : std::uint8_t {
    Output,
    Error
};

/// @brief Converts StreamKind to string.
[[nodiscard]] auto stream_kind_to_string(StreamKind kind) noexcept -> std::string_view;

/// @brief Sink for text produced on a process stream.
///
/// Listeners are invoked from the thread reading the stream and must be
/// safe to call from it.
class StreamListener {
 public:
    virtual ~StreamListener() = default;

    /// @brief Called with newly produced text.
    virtual void stream_appended(std::string_view text) = 0;
};

/// @brief Listener forwarding text to a callable.
class CallbackStreamListener final : public StreamListener {
 public:
    using callback_t = std::function<void(std::string_view)>;

    explicit CallbackStreamListener(callback_t callback) noexcept;

    void stream_appended(std::string_view text) override;

 private:
    callback_t m_callback;
};

/// @brief Monitors one stream of a process and notifies listeners.
///
/// Text appended while no listener is attached is kept in the buffer and
/// can be fetched with buffered_contents(). Once a listener is attached,
/// new text is dispatched to listeners instead of being buffered. Dispatched
/// text is not retained.
class StreamMonitor final {
 public:
    explicit StreamMonitor(StreamKind kind) noexcept;

    // explicitly deleted (shared by reference)
    StreamMonitor(const StreamMonitor&) = delete;
    auto operator=(const StreamMonitor&) = delete;

    void add_listener(std::shared_ptr<StreamListener> listener) noexcept;
    void remove_listener(const std::shared_ptr<StreamListener>& listener) noexcept;

    /// @brief Add a listener and replay the buffered text to it.
    ///
    /// The buffer is handed over and cleared. No chunk read from the stream
    /// reaches the listener before the replayed text. Must not be called
    /// from a listener of this monitor.
    void attach_listener(std::shared_ptr<StreamListener> listener) noexcept;

    /// @brief Text produced before any listener was attached.
    [[nodiscard]] auto buffered_contents() const noexcept -> std::string;

    /// @brief Append text read from the stream.
    void append(std::string_view text) noexcept;

    [[nodiscard]] auto kind() const noexcept -> StreamKind { return m_kind; }

 private:
    void notify(const std::vector<std::shared_ptr<StreamListener>>& listeners, std::string_view text) const noexcept;

    StreamKind m_kind;

    // serializes dispatching with attach_listener(), taken before m_mutex
    std::mutex m_dispatch_mutex;
    mutable std::mutex m_mutex;
    std::vector<std::shared_ptr<StreamListener>> m_listeners;
    std::string m_buffer;
};

}  // namespace extproc

#endif  // EXTPROC_STREAM_MONITOR_HPP
