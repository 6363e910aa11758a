/**
 * @file logger.cpp
 * @brief spdlog-backed implementation of the logging facade
 */

#include "logging/logger.h"

#include <cctype>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace speaker_remote {
namespace logging {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_init_mutex;
std::atomic<bool> g_initialized{false};

constexpr const char* kLoggerName = "speaker_remote";

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return spdlog::level::trace;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Critical:
        return spdlog::level::critical;
    case LogLevel::Off:
        return spdlog::level::off;
    default:
        return spdlog::level::info;
    }
}

LogLevel fromSpdlogLevel(spdlog::level::level_enum level) {
    switch (level) {
    case spdlog::level::trace:
        return LogLevel::Trace;
    case spdlog::level::debug:
        return LogLevel::Debug;
    case spdlog::level::info:
        return LogLevel::Info;
    case spdlog::level::warn:
        return LogLevel::Warn;
    case spdlog::level::err:
        return LogLevel::Error;
    case spdlog::level::critical:
        return LogLevel::Critical;
    case spdlog::level::off:
        return LogLevel::Off;
    default:
        return LogLevel::Info;
    }
}

void installLogger(std::shared_ptr<spdlog::logger> logger, const LogConfig& config) {
    logger->set_level(toSpdlogLevel(config.level));
    logger->set_pattern(config.pattern);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    g_logger = std::move(logger);
    g_initialized.store(true, std::memory_order_release);
}

}  // namespace

bool initialize(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_initialized.load(std::memory_order_acquire) && g_logger) {
        // Sinks stay as they are; only level and pattern follow the new config
        g_logger->set_level(toSpdlogLevel(config.level));
        for (auto& sink : g_logger->sinks()) {
            sink->set_level(toSpdlogLevel(config.level));
        }
        g_logger->set_pattern(config.pattern);
        if (config.filePath.empty()) {
            return true;
        }
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.consoleOutput) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(toSpdlogLevel(config.level));
            if (!config.coloredOutput) {
                console_sink->set_color_mode(spdlog::color_mode::never);
            }
            sinks.push_back(console_sink);
        }

        if (!config.filePath.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.maxFileSize, config.maxBackups);
            file_sink->set_level(toSpdlogLevel(config.level));
            sinks.push_back(file_sink);
        }

        spdlog::drop(kLoggerName);
        installLogger(std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end()),
                      config);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        return false;
    }

    if (!config.filePath.empty()) {
        g_logger->info("Log file: {} (max {}MB x {} backups)", config.filePath,
                       config.maxFileSize / (1024 * 1024), config.maxBackups);
    }
    return true;
}

bool initializeEarly() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_initialized.load(std::memory_order_acquire)) {
        return true;
    }
    try {
        LogConfig config;
        installLogger(spdlog::stderr_color_mt(kLoggerName), config);
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Early logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

bool parseLogConfig(const std::string& jsonText, LogConfig& config) {
    try {
        auto logSection = nlohmann::json::parse(jsonText);
        if (!logSection.is_object()) {
            return false;
        }
        if (logSection.contains("level") && logSection["level"].is_string()) {
            config.level = stringToLevel(logSection["level"].get<std::string>());
        }
        if (logSection.contains("filePath") && logSection["filePath"].is_string()) {
            config.filePath = logSection["filePath"].get<std::string>();
        }
        if (logSection.contains("maxFileSize")) {
            config.maxFileSize = logSection["maxFileSize"].get<size_t>();
        }
        if (logSection.contains("maxBackups")) {
            config.maxBackups = logSection["maxBackups"].get<size_t>();
        }
        if (logSection.contains("consoleOutput")) {
            config.consoleOutput = logSection["consoleOutput"].get<bool>();
        }
        if (logSection.contains("coloredOutput")) {
            config.coloredOutput = logSection["coloredOutput"].get<bool>();
        }
        if (logSection.contains("pattern") && logSection["pattern"].is_string()) {
            config.pattern = logSection["pattern"].get<std::string>();
        }
        return true;
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "Failed to parse logging config: " << ex.what() << std::endl;
        return false;
    }
}

bool initializeFromConfig(const std::string& configPath, bool verbose) {
    LogConfig config;

    std::ifstream file(configPath);
    if (file.is_open()) {
        try {
            nlohmann::json json;
            file >> json;
            if (json.contains("logging") && !parseLogConfig(json["logging"].dump(), config)) {
                std::cerr << "Invalid logging section, using defaults" << std::endl;
            }
        } catch (const nlohmann::json::exception& ex) {
            // The config loader reports the real error; keep defaults here
            std::cerr << "Failed to read logging section: " << ex.what() << std::endl;
        }
    }

    if (verbose) {
        config.level = LogLevel::Debug;
    }

    bool ok = initialize(config);
    if (ok && verbose) {
        LOG_DEBUG("Verbose mode enabled");
    }
    return ok;
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_logger) {
        g_logger->flush();
    }

    g_initialized.store(false, std::memory_order_release);
    spdlog::shutdown();
    g_logger.reset();
}

void setLevel(LogLevel level) {
    if (g_logger) {
        g_logger->set_level(toSpdlogLevel(level));
        for (auto& sink : g_logger->sinks()) {
            sink->set_level(toSpdlogLevel(level));
        }
    }
}

LogLevel getLevel() {
    if (g_logger) {
        return fromSpdlogLevel(g_logger->level());
    }
    return LogLevel::Info;
}

void flush() {
    if (g_logger) {
        g_logger->flush();
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (g_initialized.load(std::memory_order_acquire)) {
        return g_logger;
    }
    initialize();
    return g_logger;
}

std::string_view levelToString(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    case LogLevel::Critical:
        return "critical";
    case LogLevel::Off:
        return "off";
    default:
        return "info";
    }
}

LogLevel stringToLevel(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace")
        return LogLevel::Trace;
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warn;
    if (lower == "error" || lower == "err")
        return LogLevel::Error;
    if (lower == "critical" || lower == "fatal")
        return LogLevel::Critical;
    if (lower == "off" || lower == "none")
        return LogLevel::Off;

    return LogLevel::Info;
}

}  // namespace logging
}  // namespace speaker_remote
