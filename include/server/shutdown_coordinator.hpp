#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace mcpgate {

/**
 * @brief Gates inbound HTTP requests during graceful shutdown
 *
 * Once shutdown starts no new request is admitted; wait_for_drain() lets
 * the in-flight ones finish before pools and sessions are torn down.
 */
class ShutdownCoordinator {
public:
    struct Config {
        std::chrono::milliseconds shutdown_timeout{30000};
    };

    ShutdownCoordinator();
    explicit ShutdownCoordinator(const Config& config);

    /// Called by the signal path to start draining
    void initiate_shutdown();

    /// Called at the start of each request. Returns false if shutting down.
    [[nodiscard]] bool try_enter_request();

    void leave_request();

    /// Blocks until in-flight requests finish or shutdown_timeout passes.
    /// Returns true if drained cleanly.
    [[nodiscard]] bool wait_for_drain();

    [[nodiscard]] bool is_shutting_down() const {
        return shutting_down_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint32_t in_flight_count() const {
        return in_flight_.load(std::memory_order_acquire);
    }

private:
    Config config_;
    std::atomic<bool> shutting_down_{false};
    std::atomic<uint32_t> in_flight_{0};
    std::mutex drain_mutex_;
    std::condition_variable drain_cv_;
};

/**
 * @brief Leaves the request on scope exit
 */
class RequestGuard {
public:
    explicit RequestGuard(ShutdownCoordinator* coordinator) : coordinator_(coordinator) {}
    ~RequestGuard() {
        if (coordinator_) {
            coordinator_->leave_request();
        }
    }

    RequestGuard(const RequestGuard&) = delete;
    RequestGuard& operator=(const RequestGuard&) = delete;

private:
    ShutdownCoordinator* coordinator_;
};

} // namespace mcpgate
