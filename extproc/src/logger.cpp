#include "extproc/logger.hpp"

#include <utility>  // for move

namespace extproc::logger {

void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept {
    if (!default_logger) {
        spdlog::warn("[extproc] ignoring null logger, keeping '{}'", spdlog::default_logger_raw()->name());
        return;
    }
    spdlog::set_default_logger(std::move(default_logger));
}

}  // namespace extproc::logger
