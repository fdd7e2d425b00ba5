#pragma once

/// @file entity_registry.h
/// @brief Registered teams and workflows with their weight vectors

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "common/config.h"
#include "engine/types.h"

namespace kpiwatch::engine {

/// Allowed distance of a weight vector's sum from 1
inline constexpr double kWeightSumTolerance = 0.001;

/// @brief Thread-safe registry of monitored entities
///
/// Entities are only removed by an explicit Deregister().
class EntityRegistry {
public:
    EntityRegistry() = default;

    EntityRegistry(const EntityRegistry&) = delete;
    EntityRegistry& operator=(const EntityRegistry&) = delete;

    /// @brief Register a new entity
    /// @return AlreadyExists for a duplicate id, InvalidArgument for bad weights
    absl::Status Register(MonitoredEntity entity);

    /// @brief Replace the weights and targets of a registered entity
    absl::Status Update(MonitoredEntity entity);

    /// @brief Remove an entity
    absl::Status Deregister(const std::string& id);

    absl::StatusOr<MonitoredEntity> Get(const std::string& id) const;

    bool Contains(const std::string& id) const;

    /// @brief All entities, ordered by id
    std::vector<MonitoredEntity> List() const;

    size_t Size() const;

    /// @brief Check id and weight vector of an entity definition
    static absl::Status ValidateEntity(const MonitoredEntity& entity);

    /// @brief Parse every `entities.<id>` section of a configuration
    static absl::StatusOr<std::vector<MonitoredEntity>> LoadEntities(const Config& config);

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, MonitoredEntity> entities_;
};

}  // namespace kpiwatch::engine
