#pragma once

/// @file event_dispatcher.h
/// @brief Buffered asynchronous delivery of alerts and trend events
///
/// Publishers never wait on subscribers: events go into a bounded FIFO
/// queue and a single delivery thread invokes the handlers in publish
/// order. A handler that throws is logged and counted; the remaining
/// handlers still receive the event.

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <variant>
#include <vector>

#include <absl/status/status.h>

#include "engine/types.h"

namespace kpiwatch::engine {

using AlertHandler = std::function<void(const Alert&)>;
using TrendHandler = std::function<void(const TrendEvent&)>;
using SubscriptionId = uint64_t;

/// @brief Dispatcher counters
struct DispatcherStats {
    uint64_t published = 0;
    uint64_t delivered = 0;         ///< Handler invocations that returned normally
    uint64_t dropped = 0;           ///< Events rejected by a full or stopped queue
    uint64_t handler_failures = 0;
    size_t queued = 0;
    size_t subscribers = 0;
};

/// @brief Single-threaded event fan-out
class EventDispatcher {
public:
    explicit EventDispatcher(size_t queue_capacity = 10000);
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    /// @brief Start the delivery thread; no-op if already running
    absl::Status Start();

    /// @brief Deliver everything still queued, then stop the delivery thread
    void Stop();

    bool IsRunning() const { return running_.load(); }

    SubscriptionId Subscribe(AlertHandler handler);
    SubscriptionId Subscribe(TrendHandler handler);

    /// @brief Remove a subscription
    /// @return false if the id is unknown
    bool Unsubscribe(SubscriptionId id);

    /// @brief Queue an event for delivery
    /// @return false if the event was dropped
    bool Publish(const Alert& alert);
    bool Publish(const TrendEvent& event);

    /// @brief Block until every queued event has been delivered
    void Flush();

    size_t SubscriberCount() const;

    DispatcherStats GetStats() const;

private:
    using Event = std::variant<Alert, TrendEvent>;

    template <typename Handler>
    struct Subscription {
        SubscriptionId id;
        Handler handler;
    };

    bool Enqueue(Event event);
    void DeliveryLoop();
    void Deliver(const Event& event);

    const size_t queue_capacity_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<Event> queue_;
    bool delivering_ = false;

    mutable std::mutex handlers_mutex_;
    std::vector<Subscription<AlertHandler>> alert_handlers_;
    std::vector<Subscription<TrendHandler>> trend_handlers_;
    SubscriptionId next_id_ = 1;

    std::atomic<bool> running_{false};
    std::thread worker_;

    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> handler_failures_{0};
};

}  // namespace kpiwatch::engine
