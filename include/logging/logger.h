/**
 * @file logger.h
 * @brief Structured logging API for the playout engine
 *
 * Thin facade over spdlog shared by the decode worker, the mixer and the
 * render tool. Supports console output, rotating file output and
 * configurable log levels.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

// Forward declare spdlog logger
namespace spdlog {
class logger;
}  // namespace spdlog

namespace playout {
namespace logging {

/**
 * @brief Log level enumeration
 */
enum class LogLevel : std::uint8_t {
    Trace,     // Per-chunk scheduling detail
    Debug,     // Chain lifecycle, yield/resume decisions
    Info,      // Queue and playback state changes
    Warn,      // Recoverable conditions (underrun, clamped config)
    Error,     // Chain failures
    Critical,  // Engine cannot continue
    Off        // Disable logging
};

/**
 * @brief Logging configuration
 *
 * Filled from the "logging" section of the engine JSON config.
 */
struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath;                                        // Empty = no file output
    size_t maxFileSize = static_cast<size_t>(10 * 1024 * 1024);  // 10 MB
    size_t maxBackups = 3;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

/**
 * @brief Initialize the logging system
 *
 * Calling it again after a successful initialization only updates the level
 * and pattern.
 *
 * @param config Logging configuration
 * @return true if initialization succeeded, false otherwise
 */
bool initialize(const LogConfig& config = LogConfig{});

/**
 * @brief Early initialization with stderr output only
 *
 * Used by the render tool before its config file has been read.
 */
bool initializeEarly();

/**
 * @brief Initialize logging from the engine JSON config file
 *
 * Reads the "logging" section. A missing file or section falls back to
 * defaults.
 *
 * @param configPath Path to JSON config file
 * @return true if initialization succeeded, false otherwise
 */
bool initializeFromConfig(const std::string& configPath);

/**
 * @brief Flush pending messages and release sinks.
 */
void shutdown();

void setLevel(LogLevel level);
LogLevel getLevel();

void flush();

/**
 * @brief Get the underlying spdlog logger
 *
 * Lazily initializes with defaults on first use.
 */
std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);

/**
 * @brief Convert string to LogLevel
 *
 * @param str Level name (case-insensitive)
 * @return Corresponding LogLevel, defaults to Info if unknown
 */
LogLevel stringToLevel(std::string_view str);

}  // namespace logging
}  // namespace playout

// Include spdlog for macro usage
#include <spdlog/spdlog.h>

#define LOG_TRACE(...)                                \
    do {                                              \
        auto logger = playout::logging::getLogger(); \
        if (logger)                                   \
            SPDLOG_LOGGER_TRACE(logger, __VA_ARGS__); \
    } while (0)

#define LOG_DEBUG(...)                                \
    do {                                              \
        auto logger = playout::logging::getLogger(); \
        if (logger)                                   \
            SPDLOG_LOGGER_DEBUG(logger, __VA_ARGS__); \
    } while (0)

#define LOG_INFO(...)                                 \
    do {                                              \
        auto logger = playout::logging::getLogger(); \
        if (logger)                                   \
            SPDLOG_LOGGER_INFO(logger, __VA_ARGS__);  \
    } while (0)

#define LOG_WARN(...)                                 \
    do {                                              \
        auto logger = playout::logging::getLogger(); \
        if (logger)                                   \
            SPDLOG_LOGGER_WARN(logger, __VA_ARGS__);  \
    } while (0)

#define LOG_ERROR(...)                                \
    do {                                              \
        auto logger = playout::logging::getLogger(); \
        if (logger)                                   \
            SPDLOG_LOGGER_ERROR(logger, __VA_ARGS__); \
    } while (0)

#define LOG_CRITICAL(...)                                \
    do {                                                 \
        auto logger = playout::logging::getLogger();    \
        if (logger)                                      \
            SPDLOG_LOGGER_CRITICAL(logger, __VA_ARGS__); \
    } while (0)

/**
 * @brief Log if condition is true
 */
#define LOG_IF(level, condition, ...) \
    do {                              \
        if (condition)                \
            LOG_##level(__VA_ARGS__); \
    } while (0)

/**
 * @brief Log every N occurrences
 *
 * Rate-limits logs on the output path (underruns).
 */
#define LOG_EVERY_N(level, n, ...)                            \
    do {                                                      \
        static std::atomic<uint64_t> log_count_##__LINE__{0}; \
        if (log_count_##__LINE__.fetch_add(1) % (n) == 0) {   \
            LOG_##level(__VA_ARGS__);                         \
        }                                                     \
    } while (0)

/**
 * @brief Log at most once
 */
#define LOG_ONCE(level, ...)                                             \
    do {                                                                 \
        static std::atomic<bool> logged_##__LINE__{false};               \
        bool expected = false;                                           \
        if (logged_##__LINE__.compare_exchange_strong(expected, true)) { \
            LOG_##level(__VA_ARGS__);                                    \
        }                                                                \
    } while (0)
