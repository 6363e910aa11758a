/**
 * @file logger.h
 * @brief Logging facade for the speaker remote daemon
 *
 * Thin wrapper over spdlog. Console output is always available; a rotating
 * file sink is added when the "logging.filePath" config key is set.
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

namespace speaker_remote {
namespace logging {

/**
 * @brief Log level enumeration
 */
enum class LogLevel : std::uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * @brief Logging configuration
 */
struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath = "";  // Empty = no file output
    size_t maxFileSize = static_cast<size_t>(5 * 1024 * 1024);
    size_t maxBackups = 3;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

/**
 * @brief Initialize the logging system
 *
 * Calling it again after a successful initialization only updates the
 * level and pattern of the existing logger.
 *
 * @param config Logging configuration
 * @return true if initialization succeeded, false otherwise
 */
bool initialize(const LogConfig& config = LogConfig{});

/**
 * @brief Early initialization with stderr output only
 *
 * Used before the configuration document has been read so that config
 * errors still reach the console.
 */
bool initializeEarly();

/**
 * @brief Initialize logging from the "logging" section of a JSON config file
 *
 * Missing file or section falls back to defaults.
 *
 * @param configPath Path to JSON config file
 * @param verbose Force debug level regardless of the configured level
 */
bool initializeFromConfig(const std::string& configPath, bool verbose = false);

/**
 * @brief Parse a "logging" JSON section into a LogConfig
 *
 * Unknown keys are ignored. Returns false if the text is not valid JSON.
 */
bool parseLogConfig(const std::string& jsonText, LogConfig& outConfig);

/**
 * @brief Flush and drop all sinks
 */
void shutdown();

void setLevel(LogLevel level);
LogLevel getLevel();
void flush();

/**
 * @brief Get the underlying spdlog logger (initializes defaults on first use)
 */
std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);

/**
 * @brief Convert string to LogLevel (case-insensitive, Info if unknown)
 */
LogLevel stringToLevel(std::string_view str);

}  // namespace logging
}  // namespace speaker_remote

#include <spdlog/spdlog.h>

#define LOG_TRACE(...)                                      \
    do {                                                    \
        auto logger = speaker_remote::logging::getLogger(); \
        if (logger)                                         \
            SPDLOG_LOGGER_TRACE(logger, __VA_ARGS__);       \
    } while (0)

#define LOG_DEBUG(...)                                      \
    do {                                                    \
        auto logger = speaker_remote::logging::getLogger(); \
        if (logger)                                         \
            SPDLOG_LOGGER_DEBUG(logger, __VA_ARGS__);       \
    } while (0)

#define LOG_INFO(...)                                       \
    do {                                                    \
        auto logger = speaker_remote::logging::getLogger(); \
        if (logger)                                         \
            SPDLOG_LOGGER_INFO(logger, __VA_ARGS__);        \
    } while (0)

#define LOG_WARN(...)                                       \
    do {                                                    \
        auto logger = speaker_remote::logging::getLogger(); \
        if (logger)                                         \
            SPDLOG_LOGGER_WARN(logger, __VA_ARGS__);        \
    } while (0)

#define LOG_ERROR(...)                                      \
    do {                                                    \
        auto logger = speaker_remote::logging::getLogger(); \
        if (logger)                                         \
            SPDLOG_LOGGER_ERROR(logger, __VA_ARGS__);       \
    } while (0)

#define LOG_CRITICAL(...)                                   \
    do {                                                    \
        auto logger = speaker_remote::logging::getLogger(); \
        if (logger)                                         \
            SPDLOG_LOGGER_CRITICAL(logger, __VA_ARGS__);    \
    } while (0)

/**
 * @brief Log every N calls from the same call site
 *
 * Rate-limits logs for events that can arrive in bursts.
 */
#define LOG_EVERY_N(level, n, ...)                            \
    do {                                                      \
        static std::atomic<uint64_t> log_count_##__LINE__{0}; \
        if (log_count_##__LINE__.fetch_add(1) % (n) == 0) {   \
            LOG_##level(__VA_ARGS__);                         \
        }                                                     \
    } while (0)
