#include <catch2/catch_test_macros.hpp>
#include "core/task_scheduler.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace mcpgate;
using namespace std::chrono_literals;

namespace {

// Poll until pred() or the deadline passes
template<typename Pred>
bool wait_for(Pred pred, std::chrono::milliseconds limit = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

} // namespace

TEST_CASE("TaskScheduler: one-shot tasks run in due order", "[scheduler]") {
    ThreadTaskScheduler scheduler;
    std::mutex mutex;
    std::vector<int> order;

    scheduler.schedule_after(40ms, [&] { std::lock_guard l(mutex); order.push_back(2); });
    scheduler.schedule_after(5ms, [&] { std::lock_guard l(mutex); order.push_back(1); });

    REQUIRE(wait_for([&] { std::lock_guard l(mutex); return order.size() == 2; }));
    std::lock_guard l(mutex);
    CHECK(order == std::vector<int>{1, 2});
    CHECK(scheduler.pending_count() == 0);
}

TEST_CASE("TaskScheduler: cancel prevents a pending task", "[scheduler]") {
    ThreadTaskScheduler scheduler;
    std::atomic<bool> ran{false};

    const auto id = scheduler.schedule_after(200ms, [&] { ran = true; });
    CHECK(scheduler.cancel(id));
    CHECK_FALSE(scheduler.cancel(id));
    CHECK_FALSE(scheduler.cancel(9999));

    std::this_thread::sleep_for(250ms);
    CHECK_FALSE(ran.load());
}

TEST_CASE("TaskScheduler: periodic task repeats until cancelled", "[scheduler]") {
    ThreadTaskScheduler scheduler;
    std::atomic<int> count{0};

    const auto id = scheduler.schedule_every(5ms, [&] { ++count; });
    REQUIRE(wait_for([&] { return count.load() >= 3; }));
    CHECK(scheduler.cancel(id));

    const int after_cancel = count.load();
    std::this_thread::sleep_for(30ms);
    // At most one run may have been in flight when cancel() landed
    CHECK(count.load() <= after_cancel + 1);
}

TEST_CASE("TaskScheduler: a throwing task does not stop the worker", "[scheduler]") {
    ThreadTaskScheduler scheduler;
    std::atomic<bool> ran{false};

    scheduler.schedule_after(1ms, [] { throw std::runtime_error("boom"); });
    scheduler.schedule_after(10ms, [&] { ran = true; });

    CHECK(wait_for([&] { return ran.load(); }));
}

TEST_CASE("TaskScheduler: a task may schedule another", "[scheduler]") {
    ThreadTaskScheduler scheduler;
    std::atomic<bool> inner{false};

    scheduler.schedule_after(1ms, [&] {
        scheduler.schedule_after(1ms, [&] { inner = true; });
    });

    CHECK(wait_for([&] { return inner.load(); }));
}

TEST_CASE("TaskScheduler: stop drops pending tasks", "[scheduler]") {
    ThreadTaskScheduler scheduler;
    std::atomic<bool> ran{false};

    scheduler.schedule_after(10s, [&] { ran = true; });
    CHECK(scheduler.pending_count() == 1);

    scheduler.stop();
    scheduler.stop();
    CHECK(scheduler.pending_count() == 0);
    CHECK_FALSE(ran.load());
}
