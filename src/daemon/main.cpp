/// @file main.cpp
/// @brief kpiwatchd entry point
///
/// Reads samples from stdin, one per line:
///   <entity> <metric> <value> [timestamp_ms]
/// and writes alerts and trend changes to stdout as JSON lines.

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>

#include <CLI/CLI.hpp>

#include "common/logging.h"
#include "engine/metrics_engine.h"
#include "engine/serialization.h"

namespace {

constexpr const char* kVersion = "1.0.0";

std::atomic<bool> g_shutdown_requested{false};

void SignalHandler(int /*signal*/) {
    g_shutdown_requested.store(true);
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"kpiwatchd - performance metrics and alerting daemon"};

    std::string config_path;
    std::string log_level;
    int64_t update_interval_ms = 0;
    bool version_flag = false;

    app.add_option("-c,--config", config_path, "Path to YAML configuration file");
    app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error)");
    app.add_option("--update-interval-ms", update_interval_ms,
                   "Monitoring cycle interval in milliseconds");
    app.add_flag("-v,--version", version_flag, "Print version and exit");

    CLI11_PARSE(app, argc, argv);

    if (version_flag) {
        std::cout << "kpiwatchd v" << kVersion << std::endl;
        return 0;
    }

    auto config_or = kpiwatch::engine::EngineConfig::LoadWithEnv(config_path);
    if (!config_or.ok()) {
        std::cerr << "Failed to load config: " << config_or.status().message() << std::endl;
        return 1;
    }
    kpiwatch::engine::EngineConfig config = *std::move(config_or);

    // Command line beats file and environment
    if (!log_level.empty()) {
        config.logging.level = kpiwatch::ParseLogLevel(log_level);
    }
    if (update_interval_ms > 0) {
        config.update_interval = std::chrono::milliseconds(update_interval_ms);
    }

    config.logging.name = "kpiwatchd";
    kpiwatch::InitLogging(config.logging);
    KPIWATCH_LOG_INFO("kpiwatchd v{} starting", kVersion);
    if (!config_path.empty()) {
        KPIWATCH_LOG_INFO("Loaded configuration from {}", config_path);
    }
    KPIWATCH_LOG_INFO("  Entities: {}", config.entities.size());
    KPIWATCH_LOG_INFO("  Update interval: {} ms", config.update_interval.count());
    KPIWATCH_LOG_INFO("  Thresholds: info {:.2f} / warning {:.2f} / critical {:.2f}",
                      config.alert_thresholds.info, config.alert_thresholds.warning,
                      config.alert_thresholds.critical);

    kpiwatch::engine::MetricsEngine engine(std::move(config));
    auto status = engine.Initialize();
    if (!status.ok()) {
        KPIWATCH_LOG_ERROR("Failed to initialize engine: {}", std::string(status.message()));
        return 1;
    }

    // Handlers run on the single delivery thread, so lines never interleave
    engine.Subscribe(kpiwatch::engine::AlertHandler([](const kpiwatch::engine::Alert& alert) {
        auto j = kpiwatch::engine::ToJson(alert);
        j["type"] = "alert";
        std::cout << j.dump() << std::endl;
    }));
    engine.Subscribe(kpiwatch::engine::TrendHandler([](const kpiwatch::engine::TrendEvent& event) {
        std::cout << kpiwatch::engine::ToJson(event).dump() << std::endl;
    }));

    struct sigaction sa;
    sa.sa_handler = SignalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;  // No SA_RESTART: a signal interrupts the blocking read
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    status = engine.Start();
    if (!status.ok()) {
        KPIWATCH_LOG_ERROR("Failed to start engine: {}", std::string(status.message()));
        return 1;
    }
    KPIWATCH_LOG_INFO("Reading samples from stdin. Press Ctrl+C to stop.");

    std::string line;
    uint64_t line_number = 0;
    while (!g_shutdown_requested.load() && std::getline(std::cin, line)) {
        ++line_number;
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto sample = kpiwatch::engine::ParseSampleLine(line, std::chrono::system_clock::now());
        if (!sample.ok()) {
            KPIWATCH_LOG_WARN("Line {}: {}", line_number, std::string(sample.status().message()));
            continue;
        }
        status = engine.RecordSample(*sample);
        if (!status.ok()) {
            KPIWATCH_LOG_WARN("Line {}: {}", line_number, std::string(status.message()));
        }
    }

    KPIWATCH_LOG_INFO("Shutting down");
    engine.Stop();

    auto stats = engine.GetStats();
    KPIWATCH_LOG_INFO("Final Statistics:");
    KPIWATCH_LOG_INFO("  Samples recorded: {}", stats.samples_recorded);
    KPIWATCH_LOG_INFO("  Samples rejected: {}", stats.samples_rejected);
    KPIWATCH_LOG_INFO("  Alerts emitted: {}", stats.alerts_emitted);
    KPIWATCH_LOG_INFO("  Trend events: {}", stats.trend_events);
    KPIWATCH_LOG_INFO("  Events dropped: {}", stats.events_dropped);

    auto now = std::chrono::system_clock::now();
    for (const auto& entity : engine.ListEntities()) {
        auto trends = engine.AnalyzeMetricTrends(entity.id, now);
        if (!trends.ok()) {
            KPIWATCH_LOG_WARN("No metric trends for {}: {}", entity.id, std::string(trends.status().message()));
            continue;
        }
        auto j = kpiwatch::engine::ToJson(*trends);
        j["type"] = "metric_trends";
        std::cout << j.dump() << std::endl;
    }

    auto summary = kpiwatch::engine::ToJson(stats);
    summary["type"] = "stats";
    std::cout << summary.dump() << std::endl;

    kpiwatch::ShutdownLogging();
    return 0;
}
