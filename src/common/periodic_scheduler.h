#pragma once

/// @file periodic_scheduler.h
/// @brief Timer threads with explicit start/stop and graceful shutdown

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <absl/status/status.h>

namespace kpiwatch {

/// @brief Runs named tasks on their own timers
///
/// Every task gets a dedicated thread so a slow task never delays another.
/// Stop() wakes all timers, lets a run that is already executing complete,
/// and joins the threads before returning.
///
/// Example:
/// @code
///   PeriodicScheduler scheduler;
///   scheduler.AddTask("sweep", std::chrono::minutes(5),
///                     [&](auto now) { store.Purge(now); });
///   scheduler.AddAlignedTask("hourly", NextHourBoundary,
///                            [&](auto now) { RollUp(now); });
///   scheduler.Start();
///   ...
///   scheduler.Stop();
/// @endcode
class PeriodicScheduler {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    /// Task body; receives the wall-clock time it fired at
    using TaskFn = std::function<void(TimePoint)>;

    /// Computes the next firing time strictly after `now`
    using NextFireFn = std::function<TimePoint(TimePoint now)>;

    /// Per-task counters
    struct TaskStats {
        std::string name;
        uint64_t runs = 0;
        uint64_t failures = 0;   ///< Runs that threw
        TimePoint last_run;
    };

    PeriodicScheduler() = default;
    ~PeriodicScheduler();

    PeriodicScheduler(const PeriodicScheduler&) = delete;
    PeriodicScheduler& operator=(const PeriodicScheduler&) = delete;

    /// @brief Add a task firing every `interval` after Start()
    absl::Status AddTask(std::string name, std::chrono::milliseconds interval, TaskFn fn);

    /// @brief Add a task whose firing times come from `next_fire`
    absl::Status AddAlignedTask(std::string name, NextFireFn next_fire, TaskFn fn);

    /// @brief Start all timers
    absl::Status Start();

    /// @brief Stop all timers and wait for in-flight runs
    void Stop();

    bool IsRunning() const { return running_.load(); }

    size_t TaskCount() const;

    std::vector<TaskStats> GetTaskStats() const;

private:
    struct Task {
        std::string name;
        NextFireFn next_fire;
        TaskFn fn;

        std::atomic<uint64_t> runs{0};
        std::atomic<uint64_t> failures{0};
        std::atomic<int64_t> last_run_ms{0};
    };

    void TimerLoop(Task* task);

    std::vector<std::unique_ptr<Task>> tasks_;
    std::vector<std::thread> threads_;
    mutable std::mutex tasks_mutex_;

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

}  // namespace kpiwatch
