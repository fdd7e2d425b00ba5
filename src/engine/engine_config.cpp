/// @file engine_config.cpp
/// @brief Engine configuration loading and validation

#include "engine/engine_config.h"

#include <optional>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "engine/entity_registry.h"

namespace kpiwatch::engine {

namespace {

std::chrono::milliseconds GetMillis(const Config& config,
                                    const std::string& key,
                                    std::chrono::milliseconds default_value) {
    return std::chrono::milliseconds(config.GetInt(key, default_value.count()));
}

absl::StatusOr<size_t> GetCount(const Config& config,
                                const std::string& key,
                                size_t default_value) {
    int64_t value = config.GetInt(key, static_cast<int64_t>(default_value));
    if (value < 0) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat(key, " must not be negative"));
    }
    return static_cast<size_t>(value);
}

absl::Status RequirePositive(const char* name, std::chrono::milliseconds value) {
    if (value.count() <= 0) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat(name, " must be positive, got ", value.count(), " ms"));
    }
    return absl::OkStatus();
}

}  // namespace

EngineConfig EngineConfig::Default() {
    return EngineConfig{};
}

absl::StatusOr<EngineConfig> EngineConfig::FromConfig(const Config& config) {
    EngineConfig result;

    result.update_interval = GetMillis(config, "engine.update_interval_ms", result.update_interval);
    result.trend_interval = GetMillis(config, "engine.trend_interval_ms", result.trend_interval);
    result.retention_sweep_interval = GetMillis(
        config, "engine.retention_sweep_interval_ms", result.retention_sweep_interval);
    KPIWATCH_ASSIGN_OR_RETURN(result.worker_threads,
                              GetCount(config, "engine.worker_threads", result.worker_threads));
    KPIWATCH_ASSIGN_OR_RETURN(
        result.dispatch_queue_capacity,
        GetCount(config, "engine.dispatch_queue_capacity", result.dispatch_queue_capacity));

    auto& retention = result.retention;
    retention.realtime = GetMillis(config, "retention.realtime_ms", retention.realtime);
    retention.hourly = GetMillis(config, "retention.hourly_ms", retention.hourly);
    retention.daily = GetMillis(config, "retention.daily_ms", retention.daily);
    retention.weekly = GetMillis(config, "retention.weekly_ms", retention.weekly);
    retention.alerts = GetMillis(config, "retention.alerts_ms", retention.alerts);

    auto& thresholds = result.alert_thresholds;
    thresholds.info = config.GetDouble("alert_thresholds.info", thresholds.info);
    thresholds.warning = config.GetDouble("alert_thresholds.warning", thresholds.warning);
    thresholds.critical = config.GetDouble("alert_thresholds.critical", thresholds.critical);

    KPIWATCH_ASSIGN_OR_RETURN(result.trend_window_size,
                              GetCount(config, "trend.window_size", result.trend_window_size));
    result.trend_emit_epsilon = config.GetDouble("trend.emit_epsilon", result.trend_emit_epsilon);

    KPIWATCH_ASSIGN_OR_RETURN(result.metrics, MetricCatalog::FromConfig(config));
    KPIWATCH_ASSIGN_OR_RETURN(result.entities, EntityRegistry::LoadEntities(config));

    result.logging = LogConfig::FromConfig(config);

    KPIWATCH_RETURN_IF_ERROR(result.Validate());
    return result;
}

absl::StatusOr<EngineConfig> EngineConfig::LoadFromFile(const std::string& path) {
    KPIWATCH_ASSIGN_OR_RETURN(Config config, Config::LoadFromFile(path));
    return FromConfig(config);
}

absl::StatusOr<EngineConfig> EngineConfig::LoadWithEnv(const std::string& path,
                                                       const std::string& env_prefix) {
    std::optional<std::filesystem::path> file;
    if (!path.empty()) {
        file = path;
    }
    KPIWATCH_ASSIGN_OR_RETURN(Config config, Config::LoadLayered(file, env_prefix));
    return FromConfig(config);
}

absl::Status EngineConfig::Validate() const {
    const auto& t = alert_thresholds;
    if (!(t.info > 0.0 && t.info <= t.warning && t.warning <= t.critical)) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("Alert thresholds must satisfy 0 < info <= warning <= "
                                      "critical, got ", t.info, "/", t.warning, "/",
                                      t.critical));
    }
    if (trend_window_size == 0) {
        return MakeError(ErrorCode::kConfigurationError, "trend.window_size must be positive");
    }
    if (trend_emit_epsilon < 0.0) {
        return MakeError(ErrorCode::kConfigurationError,
                         "trend.emit_epsilon must not be negative");
    }
    if (dispatch_queue_capacity == 0) {
        return MakeError(ErrorCode::kConfigurationError,
                         "engine.dispatch_queue_capacity must be positive");
    }

    KPIWATCH_RETURN_IF_ERROR(RequirePositive("engine.update_interval_ms", update_interval));
    KPIWATCH_RETURN_IF_ERROR(RequirePositive("engine.trend_interval_ms", trend_interval));
    KPIWATCH_RETURN_IF_ERROR(
        RequirePositive("engine.retention_sweep_interval_ms", retention_sweep_interval));
    KPIWATCH_RETURN_IF_ERROR(RequirePositive("retention.realtime_ms", retention.realtime));
    KPIWATCH_RETURN_IF_ERROR(RequirePositive("retention.hourly_ms", retention.hourly));
    KPIWATCH_RETURN_IF_ERROR(RequirePositive("retention.daily_ms", retention.daily));
    KPIWATCH_RETURN_IF_ERROR(RequirePositive("retention.weekly_ms", retention.weekly));
    KPIWATCH_RETURN_IF_ERROR(RequirePositive("retention.alerts_ms", retention.alerts));

    KPIWATCH_RETURN_IF_ERROR(metrics.Validate());

    for (const auto& entity : entities) {
        auto status = EntityRegistry::ValidateEntity(entity);
        if (!status.ok()) {
            return MakeError(ErrorCode::kConfigurationError,
                             std::string_view(status.message().data(), status.message().size()));
        }
    }
    return absl::OkStatus();
}

}  // namespace kpiwatch::engine
