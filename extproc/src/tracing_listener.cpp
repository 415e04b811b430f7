#include "extproc/tracing_listener.hpp"

#include <utility>  // for move

#include <spdlog/spdlog.h>

namespace extproc {

TracingStreamListener::TracingStreamListener(std::shared_ptr<StreamListener> delegate, StreamKind kind, std::string process_type) noexcept
  : m_delegate(std::move(delegate)), m_kind(kind), m_process_type(std::move(process_type)) { }

void TracingStreamListener::stream_appended(std::string_view text) {
    if (!text.empty()) {
        spdlog::trace("[{}:{}] {}", m_process_type, stream_kind_to_string(m_kind), text);
    }
    if (m_delegate) {
        m_delegate->stream_appended(text);
    }
}

}  // namespace extproc
