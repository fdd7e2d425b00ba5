/// @file entity_registry.cpp
/// @brief Entity registry implementation

#include "engine/entity_registry.h"

#include <algorithm>
#include <cmath>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace kpiwatch::engine {

absl::Status EntityRegistry::ValidateEntity(const MonitoredEntity& entity) {
    if (entity.id.empty()) {
        return absl::InvalidArgumentError("Entity id cannot be empty");
    }
    if (entity.weights.empty()) {
        return absl::InvalidArgumentError(
            absl::StrCat("Entity '", entity.id, "' has no weights"));
    }

    double sum = 0.0;
    for (const auto& [metric, weight] : entity.weights) {
        if (weight < 0.0 || !std::isfinite(weight)) {
            return absl::InvalidArgumentError(
                absl::StrCat("Entity '", entity.id, "' has invalid weight ",
                             weight, " for ", metric));
        }
        sum += weight;
    }
    if (std::abs(sum - 1.0) > kWeightSumTolerance) {
        return absl::InvalidArgumentError(
            absl::StrCat("Weights of entity '", entity.id, "' sum to ", sum,
                         ", expected 1"));
    }

    for (const auto& [metric, target] : entity.targets) {
        if (target <= 0.0) {
            return absl::InvalidArgumentError(
                absl::StrCat("Entity '", entity.id, "' has non-positive target for ",
                             metric));
        }
    }
    return absl::OkStatus();
}

absl::Status EntityRegistry::Register(MonitoredEntity entity) {
    KPIWATCH_RETURN_IF_ERROR(ValidateEntity(entity));

    std::lock_guard<std::mutex> lock(mutex_);
    if (entities_.count(entity.id) > 0) {
        return absl::AlreadyExistsError(
            absl::StrCat("Entity already registered: ", entity.id));
    }

    KPIWATCH_LOG_DEBUG("Registered {} '{}' with {} weighted metrics",
                       EntityKindToString(entity.kind), entity.id,
                       entity.weights.size());
    std::string id = entity.id;
    entities_.emplace(std::move(id), std::move(entity));
    return absl::OkStatus();
}

absl::Status EntityRegistry::Update(MonitoredEntity entity) {
    KPIWATCH_RETURN_IF_ERROR(ValidateEntity(entity));

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entities_.find(entity.id);
    if (it == entities_.end()) {
        return InvalidEntityError(entity.id);
    }
    it->second = std::move(entity);
    return absl::OkStatus();
}

absl::Status EntityRegistry::Deregister(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entities_.erase(id) == 0) {
        return InvalidEntityError(id);
    }
    return absl::OkStatus();
}

absl::StatusOr<MonitoredEntity> EntityRegistry::Get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entities_.find(id);
    if (it == entities_.end()) {
        return InvalidEntityError(id);
    }
    return it->second;
}

bool EntityRegistry::Contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entities_.count(id) > 0;
}

std::vector<MonitoredEntity> EntityRegistry::List() const {
    std::vector<MonitoredEntity> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(entities_.size());
        for (const auto& [id, entity] : entities_) {
            result.push_back(entity);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const auto& a, const auto& b) { return a.id < b.id; });
    return result;
}

size_t EntityRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entities_.size();
}

absl::StatusOr<std::vector<MonitoredEntity>> EntityRegistry::LoadEntities(
    const Config& config) {
    std::vector<MonitoredEntity> entities;

    for (const auto& id : config.GetChildKeys("entities")) {
        std::string prefix = absl::StrCat("entities.", id, ".");

        MonitoredEntity entity;
        entity.id = id;

        auto kind = StringToEntityKind(config.GetString(prefix + "kind", "team"));
        if (!kind.ok()) {
            return MakeError(ErrorCode::kConfigurationError,
                             absl::StrCat("entities.", id, ": ", kind.status().message()));
        }
        entity.kind = *kind;
        entity.weights = config.GetDoubleMap(prefix + "weights");
        entity.targets = config.GetDoubleMap(prefix + "targets");

        auto status = ValidateEntity(entity);
        if (!status.ok()) {
            return MakeError(ErrorCode::kConfigurationError,
                             std::string_view(status.message().data(), status.message().size()));
        }
        entities.push_back(std::move(entity));
    }

    std::sort(entities.begin(), entities.end(),
              [](const auto& a, const auto& b) { return a.id < b.id; });
    return entities;
}

}  // namespace kpiwatch::engine
