#include "logging.h"

#include <mutex>
#include <vector>

#include <absl/strings/ascii.h>

#include "config.h"

namespace kpiwatch {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::once_flag g_init_flag;
std::mutex g_logger_mutex;

}  // namespace

LogConfig LogConfig::FromConfig(const Config& config) {
    LogConfig log_config;
    log_config.level = ParseLogLevel(config.GetString("logging.level", "info"));

    std::string file = config.GetString("logging.file");
    if (!file.empty()) {
        log_config.enable_file = true;
        log_config.file_path = file;
    }
    log_config.max_file_size = static_cast<size_t>(
        config.GetInt("logging.max_file_size", static_cast<int64_t>(log_config.max_file_size)));
    log_config.max_files = static_cast<size_t>(
        config.GetInt("logging.max_files", static_cast<int64_t>(log_config.max_files)));
    return log_config;
}

LogLevel ParseLogLevel(std::string_view name) {
    std::string lowered = absl::AsciiStrToLower(absl::string_view(name.data(), name.size()));
    if (lowered == "trace") return LogLevel::kTrace;
    if (lowered == "debug") return LogLevel::kDebug;
    if (lowered == "warn" || lowered == "warning") return LogLevel::kWarn;
    if (lowered == "error") return LogLevel::kError;
    if (lowered == "critical") return LogLevel::kCritical;
    if (lowered == "off") return LogLevel::kOff;
    return LogLevel::kInfo;
}

void InitLogging(const LogConfig& config) {
    std::call_once(g_init_flag, [&config]() {
        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(static_cast<spdlog::level::level_enum>(config.level));
        sinks.push_back(console_sink);

        if (config.enable_file) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path,
                config.max_file_size,
                config.max_files
            );
            file_sink->set_level(static_cast<spdlog::level::level_enum>(config.level));
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
        logger->set_level(static_cast<spdlog::level::level_enum>(config.level));
        logger->set_pattern(config.pattern);
        logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(logger);

        std::lock_guard<std::mutex> lock(g_logger_mutex);
        g_logger = std::move(logger);
    });
}

std::shared_ptr<spdlog::logger> GetLogger() {
    {
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        if (g_logger) {
            return g_logger;
        }
    }
    InitLogging();

    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger) {
        // Logging was shut down; messages logged afterwards are discarded.
        static auto discard = std::make_shared<spdlog::logger>("kpiwatch-discard");
        return discard;
    }
    return g_logger;
}

void SetLogLevel(LogLevel level) {
    GetLogger()->set_level(static_cast<spdlog::level::level_enum>(level));
}

void FlushLogs() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        g_logger->flush();
    }
}

void ShutdownLogging() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        g_logger->flush();
        spdlog::shutdown();
        g_logger.reset();
    }
}

}  // namespace kpiwatch
