#pragma once

/// @file logging.h
/// @brief kpiwatch logging utilities wrapping spdlog

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace kpiwatch {

class Config;

/// @brief Log levels matching spdlog levels
enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kCritical = spdlog::level::critical,
    kOff = spdlog::level::off
};

/// @brief Logging configuration
struct LogConfig {
    std::string name = "kpiwatch";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v";

    // File logging (optional)
    bool enable_file = false;
    std::string file_path = "kpiwatch.log";
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 5;

    /// @brief Build from the "logging" section of a configuration
    ///
    /// Recognized keys: logging.level, logging.file, logging.max_file_size,
    /// logging.max_files. A non-empty logging.file enables the file sink.
    static LogConfig FromConfig(const Config& config);
};

/// @brief Parse a level name (trace, debug, info, warn, error, critical, off)
/// @return Parsed level, or kInfo for unrecognized names
LogLevel ParseLogLevel(std::string_view name);

/// @brief Initialize the global logger with the given configuration
///
/// Only the first call takes effect.
void InitLogging(const LogConfig& config = {});

/// @brief Get the global logger instance
std::shared_ptr<spdlog::logger> GetLogger();

/// @brief Set the global log level
void SetLogLevel(LogLevel level);

/// @brief Flush all log messages
void FlushLogs();

/// @brief Shutdown the logging system
void ShutdownLogging();

// Convenience macros for logging
#define KPIWATCH_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::kpiwatch::GetLogger(), __VA_ARGS__)
#define KPIWATCH_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::kpiwatch::GetLogger(), __VA_ARGS__)
#define KPIWATCH_LOG_INFO(...) SPDLOG_LOGGER_INFO(::kpiwatch::GetLogger(), __VA_ARGS__)
#define KPIWATCH_LOG_WARN(...) SPDLOG_LOGGER_WARN(::kpiwatch::GetLogger(), __VA_ARGS__)
#define KPIWATCH_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::kpiwatch::GetLogger(), __VA_ARGS__)
#define KPIWATCH_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::kpiwatch::GetLogger(), __VA_ARGS__)

}  // namespace kpiwatch
