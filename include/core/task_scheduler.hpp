#pragma once

#include "core/types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace mcpgate {

using TaskId = uint64_t;

/**
 * @brief Scheduled-task abstraction with cancellation handles
 *
 * Used for queue timeouts, idle sweeps, rate-limit cleanup, and session
 * expiry. Task ids are never reused; cancel() of a fired or unknown id
 * returns false.
 */
class ITaskScheduler {
public:
    using Task = std::function<void()>;

    virtual ~ITaskScheduler() = default;

    virtual TaskId schedule_after(std::chrono::milliseconds delay, Task task) = 0;
    virtual TaskId schedule_every(std::chrono::milliseconds interval, Task task) = 0;
    virtual bool cancel(TaskId id) = 0;
};

/**
 * @brief Single background thread running tasks in due-time order
 *
 * Tasks run without the scheduler lock held, so a task may schedule or
 * cancel other tasks. A throwing task is logged and the thread continues.
 */
class ThreadTaskScheduler final : public ITaskScheduler {
public:
    ThreadTaskScheduler();
    ~ThreadTaskScheduler() override;

    ThreadTaskScheduler(const ThreadTaskScheduler&) = delete;
    ThreadTaskScheduler& operator=(const ThreadTaskScheduler&) = delete;

    TaskId schedule_after(std::chrono::milliseconds delay, Task task) override;
    TaskId schedule_every(std::chrono::milliseconds interval, Task task) override;
    bool cancel(TaskId id) override;

    /**
     * @brief Stop the worker thread; pending tasks are dropped (idempotent)
     */
    void stop();

    [[nodiscard]] size_t pending_count() const;

private:
    struct Entry {
        Task task;
        std::chrono::milliseconds interval{0};   // 0 = one-shot
    };

    using DueKey = std::pair<TimePoint, TaskId>;

    TaskId add(std::chrono::milliseconds delay, std::chrono::milliseconds interval, Task task);
    void run_loop();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<DueKey, TaskId> due_;
    std::unordered_map<TaskId, std::pair<Entry, TimePoint>> tasks_;
    TaskId next_id_ = 1;
    std::atomic<bool> running_{true};
    std::thread worker_;
};

} // namespace mcpgate
