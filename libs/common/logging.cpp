/**
 * @file logging.cpp
 * @brief Application logger (spdlog)
 */

#include "engwall/logging.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace engwall {

namespace {

constexpr const char* kLoggerName = "engwall";

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;

[[nodiscard]] spdlog::level::level_enum parse_level(std::string level)
{
    std::ranges::transform(level, level.begin(), [](unsigned char c) noexcept {
        return static_cast<char>(std::tolower(c));
    });
    if (level == "trace") {
        return spdlog::level::trace;
    }
    if (level == "debug") {
        return spdlog::level::debug;
    }
    if (level == "info") {
        return spdlog::level::info;
    }
    if (level == "error") {
        return spdlog::level::err;
    }
    if (level == "off") {
        return spdlog::level::off;
    }
    return spdlog::level::warn;
}

[[nodiscard]] std::shared_ptr<spdlog::logger> make_logger(const std::string& level,
                                                          const std::string& pattern)
{
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sink);
    logger->set_pattern(pattern);
    logger->set_level(parse_level(level));
    return logger;
}

}  // namespace

std::shared_ptr<spdlog::logger> get_logger()
{
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger) {
        g_logger = make_logger("warn", "[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    }
    return g_logger;
}

void init_logging(const std::string& level, const std::string& pattern)
{
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_logger = make_logger(level, pattern);
}

}  // namespace engwall
