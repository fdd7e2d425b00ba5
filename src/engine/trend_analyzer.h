#pragma once

/// @file trend_analyzer.h
/// @brief Rolling score history and least-squares trend detection

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "engine/types.h"

namespace kpiwatch::engine {

/// @brief Per-entity trend detection over a bounded score window
///
/// Scores are regressed against their index 0..n-1:
///
///   slope      = (n*sum(i*y) - sum(i)*sum(y)) / (n*sum(i^2) - sum(i)^2)
///   confidence = |slope| * sqrt(n)
///
/// A slope above +0.01 is improving, below -0.01 declining, otherwise
/// stable. Windows with fewer than three scores are always stable.
class TrendAnalyzer {
public:
    static constexpr double kDirectionThreshold = 0.01;
    static constexpr size_t kMinSamples = 3;

    explicit TrendAnalyzer(size_t window_size = 10, double emit_epsilon = 0.01);

    TrendAnalyzer(const TrendAnalyzer&) = delete;
    TrendAnalyzer& operator=(const TrendAnalyzer&) = delete;

    /// @brief Append a score, evicting the oldest when the window is full
    void RecordScore(const std::string& entity_id, double score, Timestamp ts);

    /// @brief Trend over the entity's current window
    TrendResult Analyze(const std::string& entity_id) const;

    /// @brief Analyze and decide whether a trend change should be published
    ///
    /// An event is produced when the direction differs from the last
    /// published one, or when confidence lies on the other side of the emit
    /// epsilon than the last published confidence. The initial published
    /// state is stable with zero confidence.
    std::optional<TrendEvent> Evaluate(const std::string& entity_id, Timestamp now);

    /// @brief Regression over a plain score sequence
    static TrendResult Regress(const std::vector<double>& scores);

    /// @brief Direction of a slope per kDirectionThreshold
    static TrendDirection DirectionOf(double slope);

    /// @brief Weight-averaged slope of several trends
    ///
    /// Trends with a non-positive weight or fewer than kMinSamples samples
    /// do not contribute. The sample count is the smallest among the
    /// contributors; without contributors the result is stable.
    static TrendResult Combine(const std::vector<std::pair<double, TrendResult>>& weighted);

    /// @brief Scores currently in the window, oldest first
    std::vector<ScoreSnapshot> History(const std::string& entity_id) const;

    /// @brief Result of the last Evaluate() call for an entity
    std::optional<TrendResult> LatestResult(const std::string& entity_id) const;

    /// @brief Drop all history of an entity
    void Forget(const std::string& entity_id);

    size_t WindowSize() const { return window_size_; }
    double EmitEpsilon() const { return emit_epsilon_; }

private:
    struct EntityTrend {
        mutable std::mutex mutex;
        std::deque<ScoreSnapshot> window;

        TrendDirection emitted_direction = TrendDirection::kStable;
        double emitted_confidence = 0.0;
        std::optional<TrendResult> latest;
    };

    std::shared_ptr<EntityTrend> Find(const std::string& entity_id) const;
    std::shared_ptr<EntityTrend> FindOrCreate(const std::string& entity_id);

    static TrendResult AnalyzeWindow(const std::string& entity_id,
                                     const std::deque<ScoreSnapshot>& window);

    const size_t window_size_;
    const double emit_epsilon_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<EntityTrend>> entities_;
};

}  // namespace kpiwatch::engine
