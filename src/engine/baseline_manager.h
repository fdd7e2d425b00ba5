#pragma once

/// @file baseline_manager.h
/// @brief Reference values used for deviation detection

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "engine/types.h"

namespace kpiwatch::engine {

/// @brief Holds exactly one active baseline per (entity, metric)
///
/// Baselines are established from the first observed sample and stay fixed
/// until explicitly reset. Per-entity locking serializes writers of the same
/// entity without blocking readers of other entities.
class BaselineManager {
public:
    BaselineManager() = default;

    BaselineManager(const BaselineManager&) = delete;
    BaselineManager& operator=(const BaselineManager&) = delete;

    /// @brief Establish a baseline unless one already exists
    /// @param force Replace an existing baseline
    /// @return The active baseline after the call
    Baseline EstablishBaseline(const std::string& entity_id,
                               const std::string& metric,
                               double value,
                               Timestamp established_at,
                               bool force = false);

    /// @brief Active baseline, if one has been established
    std::optional<Baseline> GetBaseline(const std::string& entity_id,
                                        const std::string& metric) const;

    /// @brief All baselines of an entity, ordered by metric
    std::vector<Baseline> GetBaselines(const std::string& entity_id) const;

    /// @brief Remove one baseline so the next sample re-establishes it
    bool Reset(const std::string& entity_id, const std::string& metric);

    /// @brief Drop every baseline of an entity
    void Forget(const std::string& entity_id);

    size_t Count() const;

private:
    struct EntityBaselines {
        mutable std::mutex mutex;
        std::unordered_map<std::string, Baseline> by_metric;
    };

    std::shared_ptr<EntityBaselines> Find(const std::string& entity_id) const;
    std::shared_ptr<EntityBaselines> FindOrCreate(const std::string& entity_id);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<EntityBaselines>> entities_;
};

}  // namespace kpiwatch::engine
