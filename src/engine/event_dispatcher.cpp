/// @file event_dispatcher.cpp
/// @brief Event dispatcher implementation

#include "engine/event_dispatcher.h"

#include <algorithm>
#include <exception>

#include "common/logging.h"

namespace kpiwatch::engine {

EventDispatcher::EventDispatcher(size_t queue_capacity)
    : queue_capacity_(queue_capacity == 0 ? 1 : queue_capacity) {}

EventDispatcher::~EventDispatcher() {
    Stop();
}

absl::Status EventDispatcher::Start() {
    if (running_.exchange(true)) {
        return absl::OkStatus();
    }
    worker_ = std::thread(&EventDispatcher::DeliveryLoop, this);
    return absl::OkStatus();
}

void EventDispatcher::Stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_.load()) {
            return;
        }
        running_.store(false);
    }
    queue_cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
    idle_cv_.notify_all();
}

SubscriptionId EventDispatcher::Subscribe(AlertHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    SubscriptionId id = next_id_++;
    alert_handlers_.push_back({id, std::move(handler)});
    return id;
}

SubscriptionId EventDispatcher::Subscribe(TrendHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    SubscriptionId id = next_id_++;
    trend_handlers_.push_back({id, std::move(handler)});
    return id;
}

bool EventDispatcher::Unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    auto matches = [id](const auto& sub) { return sub.id == id; };

    auto alert_it = std::remove_if(alert_handlers_.begin(), alert_handlers_.end(), matches);
    bool removed = alert_it != alert_handlers_.end();
    alert_handlers_.erase(alert_it, alert_handlers_.end());

    auto trend_it = std::remove_if(trend_handlers_.begin(), trend_handlers_.end(), matches);
    removed = removed || trend_it != trend_handlers_.end();
    trend_handlers_.erase(trend_it, trend_handlers_.end());
    return removed;
}

bool EventDispatcher::Publish(const Alert& alert) {
    return Enqueue(alert);
}

bool EventDispatcher::Publish(const TrendEvent& event) {
    return Enqueue(event);
}

bool EventDispatcher::Enqueue(Event event) {
    published_.fetch_add(1);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_.load()) {
            dropped_.fetch_add(1);
            KPIWATCH_LOG_WARN("Event dropped: dispatcher is stopped");
            return false;
        }
        if (queue_.size() >= queue_capacity_) {
            dropped_.fetch_add(1);
            KPIWATCH_LOG_WARN("Event dropped: dispatch queue full ({} events)", queue_capacity_);
            return false;
        }
        queue_.push_back(std::move(event));
    }
    queue_cv_.notify_one();
    return true;
}

void EventDispatcher::DeliveryLoop() {
    while (true) {
        Event event;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !queue_.empty() || !running_.load(); });

            if (queue_.empty()) {
                // Stopped and drained
                return;
            }
            event = std::move(queue_.front());
            queue_.pop_front();
            delivering_ = true;
        }

        Deliver(event);

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            delivering_ = false;
        }
        idle_cv_.notify_all();
    }
}

void EventDispatcher::Deliver(const Event& event) {
    // Handlers are invoked on a copy so they may (un)subscribe re-entrantly
    if (const auto* alert = std::get_if<Alert>(&event)) {
        std::vector<Subscription<AlertHandler>> handlers;
        {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            handlers = alert_handlers_;
        }
        for (const auto& sub : handlers) {
            try {
                sub.handler(*alert);
                delivered_.fetch_add(1);
            } catch (const std::exception& e) {
                handler_failures_.fetch_add(1);
                KPIWATCH_LOG_WARN("Alert subscriber {} failed on {}: {}", sub.id, alert->id,
                                  e.what());
            } catch (...) {
                handler_failures_.fetch_add(1);
                KPIWATCH_LOG_WARN("Alert subscriber {} failed on {}: unknown exception",
                                  sub.id, alert->id);
            }
        }
        return;
    }

    const auto& trend = std::get<TrendEvent>(event);
    std::vector<Subscription<TrendHandler>> handlers;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handlers = trend_handlers_;
    }
    for (const auto& sub : handlers) {
        try {
            sub.handler(trend);
            delivered_.fetch_add(1);
        } catch (const std::exception& e) {
            handler_failures_.fetch_add(1);
            KPIWATCH_LOG_WARN("Trend subscriber {} failed on {}: {}", sub.id, trend.entity_id,
                              e.what());
        } catch (...) {
            handler_failures_.fetch_add(1);
            KPIWATCH_LOG_WARN("Trend subscriber {} failed on {}: unknown exception", sub.id,
                              trend.entity_id);
        }
    }
}

void EventDispatcher::Flush() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this] {
        return (queue_.empty() && !delivering_) || !running_.load();
    });
}

size_t EventDispatcher::SubscriberCount() const {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    return alert_handlers_.size() + trend_handlers_.size();
}

DispatcherStats EventDispatcher::GetStats() const {
    DispatcherStats stats;
    stats.published = published_.load();
    stats.delivered = delivered_.load();
    stats.dropped = dropped_.load();
    stats.handler_failures = handler_failures_.load();
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stats.queued = queue_.size();
    }
    stats.subscribers = SubscriberCount();
    return stats;
}

}  // namespace kpiwatch::engine
