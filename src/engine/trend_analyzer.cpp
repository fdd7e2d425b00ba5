/// @file trend_analyzer.cpp
/// @brief Trend analyzer implementation

#include "engine/trend_analyzer.h"

#include <algorithm>
#include <cmath>

#include "common/logging.h"

namespace kpiwatch::engine {

TrendAnalyzer::TrendAnalyzer(size_t window_size, double emit_epsilon)
    : window_size_(window_size == 0 ? 1 : window_size),
      emit_epsilon_(emit_epsilon) {}

std::shared_ptr<TrendAnalyzer::EntityTrend> TrendAnalyzer::Find(
    const std::string& entity_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entities_.find(entity_id);
    return it == entities_.end() ? nullptr : it->second;
}

std::shared_ptr<TrendAnalyzer::EntityTrend> TrendAnalyzer::FindOrCreate(
    const std::string& entity_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entities_[entity_id];
    if (!entry) {
        entry = std::make_shared<EntityTrend>();
    }
    return entry;
}

void TrendAnalyzer::RecordScore(const std::string& entity_id, double score, Timestamp ts) {
    auto trend = FindOrCreate(entity_id);

    std::lock_guard<std::mutex> lock(trend->mutex);
    trend->window.push_back({entity_id, ts, score});
    while (trend->window.size() > window_size_) {
        trend->window.pop_front();
    }
}

TrendResult TrendAnalyzer::Regress(const std::vector<double>& scores) {
    TrendResult result;
    const size_t n = scores.size();
    result.sample_count = n;
    if (n < kMinSamples) {
        return result;
    }

    double sum_x = 0.0;
    double sum_y = 0.0;
    double sum_xy = 0.0;
    double sum_x2 = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double x = static_cast<double>(i);
        sum_x += x;
        sum_y += scores[i];
        sum_xy += x * scores[i];
        sum_x2 += x * x;
    }

    const double count = static_cast<double>(n);
    const double denominator = count * sum_x2 - sum_x * sum_x;
    if (denominator == 0.0) {
        return result;
    }

    result.slope = (count * sum_xy - sum_x * sum_y) / denominator;
    result.direction = DirectionOf(result.slope);
    result.confidence = std::abs(result.slope) * std::sqrt(count);
    return result;
}

TrendDirection TrendAnalyzer::DirectionOf(double slope) {
    if (slope > kDirectionThreshold) {
        return TrendDirection::kImproving;
    }
    if (slope < -kDirectionThreshold) {
        return TrendDirection::kDeclining;
    }
    return TrendDirection::kStable;
}

TrendResult TrendAnalyzer::Combine(
    const std::vector<std::pair<double, TrendResult>>& weighted) {
    TrendResult combined;
    double slope_sum = 0.0;
    double weight_total = 0.0;
    size_t min_samples = 0;

    for (const auto& [weight, trend] : weighted) {
        if (weight <= 0.0 || trend.sample_count < kMinSamples) {
            continue;
        }
        slope_sum += weight * trend.slope;
        weight_total += weight;
        min_samples = min_samples == 0 ? trend.sample_count
                                       : std::min(min_samples, trend.sample_count);
    }
    if (weight_total == 0.0) {
        return combined;
    }

    combined.slope = slope_sum / weight_total;
    combined.direction = DirectionOf(combined.slope);
    combined.sample_count = min_samples;
    combined.confidence =
        std::abs(combined.slope) * std::sqrt(static_cast<double>(min_samples));
    return combined;
}

TrendResult TrendAnalyzer::AnalyzeWindow(const std::string& entity_id,
                                         const std::deque<ScoreSnapshot>& window) {
    std::vector<double> scores;
    scores.reserve(window.size());
    for (const auto& snapshot : window) {
        scores.push_back(snapshot.score);
    }

    TrendResult result = Regress(scores);
    result.entity_id = entity_id;
    return result;
}

TrendResult TrendAnalyzer::Analyze(const std::string& entity_id) const {
    auto trend = Find(entity_id);
    if (!trend) {
        TrendResult result;
        result.entity_id = entity_id;
        return result;
    }

    std::lock_guard<std::mutex> lock(trend->mutex);
    return AnalyzeWindow(entity_id, trend->window);
}

std::optional<TrendEvent> TrendAnalyzer::Evaluate(const std::string& entity_id, Timestamp now) {
    auto trend = FindOrCreate(entity_id);

    std::lock_guard<std::mutex> lock(trend->mutex);
    TrendResult result = AnalyzeWindow(entity_id, trend->window);
    trend->latest = result;

    bool direction_changed = result.direction != trend->emitted_direction;
    bool confidence_crossed =
        (result.confidence >= emit_epsilon_) != (trend->emitted_confidence >= emit_epsilon_);
    if (!direction_changed && !confidence_crossed) {
        return std::nullopt;
    }

    TrendEvent event;
    event.entity_id = entity_id;
    event.previous_direction = trend->emitted_direction;
    event.result = result;
    event.timestamp = now;

    trend->emitted_direction = result.direction;
    trend->emitted_confidence = result.confidence;

    KPIWATCH_LOG_INFO("Trend for {} changed {} -> {} (slope {:.4f}, confidence {:.4f})",
                      entity_id, TrendDirectionToString(event.previous_direction),
                      TrendDirectionToString(result.direction), result.slope,
                      result.confidence);
    return event;
}

std::vector<ScoreSnapshot> TrendAnalyzer::History(const std::string& entity_id) const {
    auto trend = Find(entity_id);
    if (!trend) {
        return {};
    }
    std::lock_guard<std::mutex> lock(trend->mutex);
    return {trend->window.begin(), trend->window.end()};
}

std::optional<TrendResult> TrendAnalyzer::LatestResult(const std::string& entity_id) const {
    auto trend = Find(entity_id);
    if (!trend) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(trend->mutex);
    return trend->latest;
}

void TrendAnalyzer::Forget(const std::string& entity_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    entities_.erase(entity_id);
}

}  // namespace kpiwatch::engine
