/// @file baseline_manager.cpp
/// @brief Baseline manager implementation

#include "engine/baseline_manager.h"

#include <algorithm>

#include "common/logging.h"

namespace kpiwatch::engine {

std::shared_ptr<BaselineManager::EntityBaselines> BaselineManager::Find(
    const std::string& entity_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entities_.find(entity_id);
    return it == entities_.end() ? nullptr : it->second;
}

std::shared_ptr<BaselineManager::EntityBaselines> BaselineManager::FindOrCreate(
    const std::string& entity_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entities_[entity_id];
    if (!entry) {
        entry = std::make_shared<EntityBaselines>();
    }
    return entry;
}

Baseline BaselineManager::EstablishBaseline(const std::string& entity_id,
                                            const std::string& metric,
                                            double value,
                                            Timestamp established_at,
                                            bool force) {
    auto entity = FindOrCreate(entity_id);

    std::lock_guard<std::mutex> lock(entity->mutex);
    auto it = entity->by_metric.find(metric);
    if (it != entity->by_metric.end() && !force) {
        return it->second;
    }

    Baseline baseline{entity_id, metric, value, established_at};
    entity->by_metric[metric] = baseline;
    KPIWATCH_LOG_DEBUG("Baseline for {}/{} set to {}", entity_id, metric, value);
    return baseline;
}

std::optional<Baseline> BaselineManager::GetBaseline(const std::string& entity_id,
                                                     const std::string& metric) const {
    auto entity = Find(entity_id);
    if (!entity) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(entity->mutex);
    auto it = entity->by_metric.find(metric);
    if (it == entity->by_metric.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Baseline> BaselineManager::GetBaselines(const std::string& entity_id) const {
    std::vector<Baseline> result;
    auto entity = Find(entity_id);
    if (!entity) {
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(entity->mutex);
        for (const auto& [metric, baseline] : entity->by_metric) {
            result.push_back(baseline);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const auto& a, const auto& b) { return a.metric_name < b.metric_name; });
    return result;
}

bool BaselineManager::Reset(const std::string& entity_id, const std::string& metric) {
    auto entity = Find(entity_id);
    if (!entity) {
        return false;
    }
    std::lock_guard<std::mutex> lock(entity->mutex);
    return entity->by_metric.erase(metric) > 0;
}

void BaselineManager::Forget(const std::string& entity_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    entities_.erase(entity_id);
}

size_t BaselineManager::Count() const {
    std::vector<std::shared_ptr<EntityBaselines>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entity] : entities_) {
            snapshot.push_back(entity);
        }
    }

    size_t total = 0;
    for (const auto& entity : snapshot) {
        std::lock_guard<std::mutex> lock(entity->mutex);
        total += entity->by_metric.size();
    }
    return total;
}

}  // namespace kpiwatch::engine
