#include "periodic_scheduler.h"

#include <exception>

#include <absl/strings/str_cat.h>

#include "logging.h"

namespace kpiwatch {

PeriodicScheduler::~PeriodicScheduler() {
    Stop();
}

absl::Status PeriodicScheduler::AddTask(std::string name,
                                        std::chrono::milliseconds interval,
                                        TaskFn fn) {
    if (interval.count() <= 0) {
        return absl::InvalidArgumentError(
            absl::StrCat("Task '", name, "' needs a positive interval"));
    }
    return AddAlignedTask(
        std::move(name),
        [interval](TimePoint now) { return now + interval; },
        std::move(fn));
}

absl::Status PeriodicScheduler::AddAlignedTask(std::string name,
                                               NextFireFn next_fire,
                                               TaskFn fn) {
    if (running_.load()) {
        return absl::FailedPreconditionError("Cannot add tasks while running");
    }
    if (!next_fire || !fn) {
        return absl::InvalidArgumentError(
            absl::StrCat("Task '", name, "' is missing a callable"));
    }

    auto task = std::make_unique<Task>();
    task->name = std::move(name);
    task->next_fire = std::move(next_fire);
    task->fn = std::move(fn);

    std::lock_guard<std::mutex> lock(tasks_mutex_);
    tasks_.push_back(std::move(task));
    return absl::OkStatus();
}

absl::Status PeriodicScheduler::Start() {
    if (running_.exchange(true)) {
        return absl::FailedPreconditionError("Scheduler already running");
    }
    stop_requested_ = false;

    std::lock_guard<std::mutex> lock(tasks_mutex_);
    for (auto& task : tasks_) {
        threads_.emplace_back(&PeriodicScheduler::TimerLoop, this, task.get());
    }

    KPIWATCH_LOG_DEBUG("Periodic scheduler started with {} tasks", tasks_.size());
    return absl::OkStatus();
}

void PeriodicScheduler::Stop() {
    if (!running_.load()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_requested_ = true;
    }
    wait_cv_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    running_ = false;

    KPIWATCH_LOG_DEBUG("Periodic scheduler stopped");
}

size_t PeriodicScheduler::TaskCount() const {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    return tasks_.size();
}

std::vector<PeriodicScheduler::TaskStats> PeriodicScheduler::GetTaskStats() const {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    std::vector<TaskStats> stats;
    stats.reserve(tasks_.size());
    for (const auto& task : tasks_) {
        TaskStats entry;
        entry.name = task->name;
        entry.runs = task->runs.load();
        entry.failures = task->failures.load();
        entry.last_run = TimePoint(std::chrono::milliseconds(task->last_run_ms.load()));
        stats.push_back(std::move(entry));
    }
    return stats;
}

void PeriodicScheduler::TimerLoop(Task* task) {
    while (true) {
        TimePoint deadline = task->next_fire(std::chrono::system_clock::now());

        {
            std::unique_lock<std::mutex> lock(wait_mutex_);
            if (wait_cv_.wait_until(lock, deadline, [this] { return stop_requested_.load(); })) {
                return;
            }
        }

        TimePoint fired_at = std::chrono::system_clock::now();
        try {
            task->fn(fired_at);
        } catch (const std::exception& e) {
            task->failures.fetch_add(1);
            KPIWATCH_LOG_ERROR("Scheduled task '{}' failed: {}", task->name, e.what());
        }

        task->runs.fetch_add(1);
        task->last_run_ms.store(std::chrono::duration_cast<std::chrono::milliseconds>(
            fired_at.time_since_epoch()).count());
    }
}

}  // namespace kpiwatch
