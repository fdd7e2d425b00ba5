#pragma once

/// @file thread_pool.h
/// @brief Fixed-size worker pool used to fan out per-entity work

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace kpiwatch {

/// @brief A simple thread pool for executing tasks in parallel
class ThreadPool {
public:
    /// @brief Create a thread pool with the specified number of threads
    /// @param num_threads Number of worker threads (0 = hardware concurrency)
    explicit ThreadPool(size_t num_threads = 0);

    /// @brief Destructor - finishes queued tasks, then joins the workers
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /// @brief Submit a task for execution
    /// @return Future containing the result (or the exception it threw)
    template <typename F, typename... Args>
    auto Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

    /// @brief Submit a task without waiting for result
    ///
    /// Exceptions escaping the task are logged and dropped.
    template <typename F, typename... Args>
    void Execute(F&& f, Args&&... args);

    size_t Size() const { return workers_.size(); }

    /// @brief Number of queued plus running tasks
    size_t PendingTasks() const;

    /// @brief Wait for all submitted tasks to complete
    void Wait();

    bool IsStopped() const { return stop_.load(std::memory_order_acquire); }

private:
    void WorkerLoop();
    void Enqueue(std::function<void()> task);

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable completion_condition_;

    std::atomic<bool> stop_{false};
    std::atomic<size_t> active_tasks_{0};
};

// Template implementations

template <typename F, typename... Args>
auto ThreadPool::Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using return_type = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();
    Enqueue([task]() { (*task)(); });
    return result;
}

template <typename F, typename... Args>
void ThreadPool::Execute(F&& f, Args&&... args) {
    Enqueue(std::bind(std::forward<F>(f), std::forward<Args>(args)...));
}

}  // namespace kpiwatch
