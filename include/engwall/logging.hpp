#pragma once

/**
 * @file logging.hpp
 * @brief Application logger (spdlog)
 */

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace engwall {

/// Get the application logger (created on first use, level "warn")
[[nodiscard]] std::shared_ptr<spdlog::logger> get_logger();

/// Replace the application logger with one at the given level.
/// Unknown level names fall back to "warn".
void init_logging(const std::string& level = "warn",
                  const std::string& pattern = "[%H:%M:%S.%e] [%n] [%^%l%$] %v");

}  // namespace engwall

#define ENGWALL_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::engwall::get_logger(), __VA_ARGS__)
#define ENGWALL_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::engwall::get_logger(), __VA_ARGS__)
#define ENGWALL_LOG_INFO(...) SPDLOG_LOGGER_INFO(::engwall::get_logger(), __VA_ARGS__)
#define ENGWALL_LOG_WARN(...) SPDLOG_LOGGER_WARN(::engwall::get_logger(), __VA_ARGS__)
#define ENGWALL_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::engwall::get_logger(), __VA_ARGS__)
