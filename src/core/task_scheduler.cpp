#include "core/task_scheduler.hpp"
#include "core/utils.hpp"

#include <exception>
#include <format>

namespace mcpgate {

ThreadTaskScheduler::ThreadTaskScheduler()
    : worker_([this]() { run_loop(); }) {}

ThreadTaskScheduler::~ThreadTaskScheduler() {
    stop();
}

TaskId ThreadTaskScheduler::schedule_after(std::chrono::milliseconds delay, Task task) {
    return add(delay, std::chrono::milliseconds{0}, std::move(task));
}

TaskId ThreadTaskScheduler::schedule_every(std::chrono::milliseconds interval, Task task) {
    if (interval.count() <= 0) {
        interval = std::chrono::milliseconds{1};
    }
    return add(interval, interval, std::move(task));
}

TaskId ThreadTaskScheduler::add(std::chrono::milliseconds delay,
                                std::chrono::milliseconds interval,
                                Task task) {
    TaskId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        const auto due = Clock::now() + delay;
        due_.emplace(DueKey{due, id}, id);
        tasks_.emplace(id, std::make_pair(Entry{std::move(task), interval}, due));
    }
    cv_.notify_one();
    return id;
}

bool ThreadTaskScheduler::cancel(TaskId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return false;
    }
    due_.erase(DueKey{it->second.second, id});
    tasks_.erase(it);
    return true;
}

void ThreadTaskScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
        due_.clear();
        tasks_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

size_t ThreadTaskScheduler::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void ThreadTaskScheduler::run_loop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (running_.load(std::memory_order_acquire)) {
        if (due_.empty()) {
            cv_.wait(lock, [this]() {
                return !running_.load(std::memory_order_acquire) || !due_.empty();
            });
            continue;
        }

        const auto next = due_.begin();
        const auto due_at = next->first.first;
        if (Clock::now() < due_at) {
            cv_.wait_until(lock, due_at);
            continue;
        }

        const TaskId id = next->second;
        due_.erase(next);

        auto it = tasks_.find(id);
        if (it == tasks_.end()) {
            continue;
        }

        Task task;
        if (it->second.first.interval.count() > 0) {
            // Periodic: re-arm before running so cancel() from inside the task works
            const auto next_due = due_at + it->second.first.interval;
            it->second.second = next_due;
            due_.emplace(DueKey{next_due, id}, id);
            task = it->second.first.task;
        } else {
            task = std::move(it->second.first.task);
            tasks_.erase(it);
        }

        lock.unlock();
        try {
            task();
        } catch (const std::exception& e) {
            utils::log::error(std::format("Scheduled task {} failed: {}", id, e.what()));
        }
        lock.lock();
    }
}

} // namespace mcpgate
