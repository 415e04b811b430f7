#ifndef EXTPROC_TRACING_LISTENER_HPP
#define EXTPROC_TRACING_LISTENER_HPP

#include "extproc/stream_monitor.hpp"

#include <memory>       // for shared_ptr
#include <string>       // for string
#include <string_view>  // for string_view

namespace extproc {

/// @brief Listener decorator which traces every chunk to the default logger.
///
/// The wrapped listener may be null, in which case the text is only traced.
class TracingStreamListener final : public StreamListener {
 public:
    TracingStreamListener(std::shared_ptr<StreamListener> delegate, StreamKind kind, std::string process_type) noexcept;

    void stream_appended(std::string_view text) override;

    [[nodiscard]] auto delegate() const noexcept -> const std::shared_ptr<StreamListener>& { return m_delegate; }

 private:
    std::shared_ptr<StreamListener> m_delegate;
    StreamKind m_kind;
    std::string m_process_type;
};

}  // namespace extproc

#endif  // EXTPROC_TRACING_LISTENER_HPP
