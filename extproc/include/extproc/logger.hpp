#ifndef EXTPROC_LOGGER_HPP
#define EXTPROC_LOGGER_HPP

#include <memory>  // for shared_ptr

#include <spdlog/spdlog.h>

namespace extproc::logger {

// Set library default logger
void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept;

}  // namespace extproc::logger

#endif  // EXTPROC_LOGGER_HPP
