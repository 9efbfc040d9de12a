#pragma once

#include "core/clock.hpp"
#include "core/event_bus.hpp"
#include "core/task_scheduler.hpp"
#include "core/types.hpp"
#include "pool/circuit_breaker.hpp"
#include "pool/connection.hpp"
#include "pool/connection_pool.hpp"
#include "pool/itransport_factory.hpp"
#include "pool/wait_queue.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcpgate {

/**
 * @brief Per-backend pools, wait queues, and circuit breakers
 *
 * Admission order for acquire:
 *   circuit breaker → per-user ceiling → global ceiling → pool (reuse, create, or queue)
 *
 * Every backend has its own lock (pool + queue); the backend map itself is
 * read-mostly behind a shared_mutex. Callbacks, transport closes, breaker
 * updates, and event publishing all happen with no pool lock held.
 *
 * Thread-safety: all public methods are thread-safe.
 */
class PoolManager {
public:
    struct Config {
        uint32_t max_connections_per_backend = 50;
        uint32_t max_concurrent_requests_per_user = 10;
        uint32_t max_total_connections = 500;
        std::chrono::milliseconds connection_timeout{30000};
        std::chrono::milliseconds request_timeout{60000};
        std::chrono::milliseconds idle_timeout{300000};
        uint32_t queue_max_size = 1000;
        std::chrono::milliseconds cleanup_interval{60000};
        uint32_t circuit_breaker_threshold = 5;
        std::chrono::milliseconds circuit_breaker_timeout{60000};
    };

    struct BackendMetrics {
        uint64_t total_requests = 0;
        uint64_t successful_requests = 0;
        uint64_t failed_requests = 0;
        double success_rate = 1.0;
        double average_latency_ms = 0.0;
    };

    struct BackendPoolStatus {
        std::string name;
        size_t active_connections = 0;
        size_t idle_connections = 0;
        uint32_t max_connections = 0;
        size_t queue_size = 0;
        size_t queue_max_size = 0;
        CircuitState breaker_state = CircuitState::CLOSED;
        uint32_t breaker_failure_count = 0;
        uint64_t connections_created = 0;
        uint64_t connections_discarded = 0;
        BackendMetrics metrics;
    };

    struct Status {
        std::vector<BackendPoolStatus> backends;
        size_t total_active = 0;
        size_t queued_requests = 0;
        uint64_t successful_requests = 0;
        uint64_t failed_requests = 0;
        uint64_t queue_timeouts = 0;
        double average_response_ms = 0.0;
    };

    PoolManager(const Config& config,
                std::shared_ptr<ITransportFactory> factory,
                std::shared_ptr<IClock> clock,
                std::shared_ptr<ITaskScheduler> scheduler,
                std::shared_ptr<EventBus> events = nullptr);

    ~PoolManager();

    PoolManager(const PoolManager&) = delete;
    PoolManager& operator=(const PoolManager&) = delete;

    /**
     * @brief Create pool, queue, and breaker for a backend (idempotent)
     */
    void initialize_pool(const std::string& backend);

    [[nodiscard]] bool has_pool(const std::string& backend) const;

    /**
     * @brief Acquire a connection; `done` runs exactly once
     *
     * Runs synchronously on the calling thread when a connection is
     * available or the request is rejected. A queued request is resolved
     * later on the thread that releases a connection, or rejected with
     * QUEUE_TIMEOUT from the scheduler thread.
     */
    void acquire_async(const std::string& backend,
                       const std::string& user_id,
                       const std::string& request_id,
                       AcquireCallback done);

    /**
     * @brief Blocking acquire for worker threads
     */
    [[nodiscard]] AcquireResult acquire(const std::string& backend,
                                        const std::string& user_id,
                                        const std::string& request_id);

    /**
     * @brief Return a connection (best-effort, never fails)
     *
     * Releasing an unknown or already-released connection is a no-op.
     */
    void release(const std::shared_ptr<Connection>& conn, bool success);

    /**
     * @brief Reap stale idle connections and expired queue entries
     * @return Number of items removed
     */
    size_t sweep();

    /**
     * @brief Schedule sweep() every cleanup_interval
     */
    void start_cleanup();

    /**
     * @brief Reject all waiters, close all connections, stop sweeping
     */
    void shutdown();

    [[nodiscard]] bool is_shutting_down() const {
        return shutting_down_.load(std::memory_order_acquire);
    }

    [[nodiscard]] Status get_status() const;

    [[nodiscard]] size_t total_active() const {
        return total_active_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint32_t user_outstanding(const std::string& user_id) const;

    [[nodiscard]] std::shared_ptr<CircuitBreaker> get_breaker(const std::string& backend) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    struct BackendSlot {
        BackendSlot(const std::string& name, const Config& config, std::shared_ptr<IClock> clock);

        std::string name;
        std::mutex mutex;
        ConnectionPool pool;
        BoundedWaitQueue queue;
        std::shared_ptr<CircuitBreaker> breaker;
        BackendMetrics metrics;
    };

    using Retired = std::vector<std::shared_ptr<Connection>>;

    [[nodiscard]] std::shared_ptr<BackendSlot> find_slot(const std::string& backend) const;
    [[nodiscard]] std::vector<std::shared_ptr<BackendSlot>> all_slots() const;

    [[nodiscard]] bool try_reserve_global();
    void release_global();

    /**
     * @brief Check and count one outstanding acquire for the user in one step
     *
     * The count covers granted connections and queued waiters alike.
     */
    [[nodiscard]] bool try_reserve_user(const std::string& user_id);
    void untrack_user(const std::string& user_id);

    /**
     * @brief Open a transport for an already reserved pool + global slot
     */
    [[nodiscard]] AcquireResult create_connection(const std::shared_ptr<BackendSlot>& slot,
                                                  const std::string& user_id,
                                                  const std::string& request_id);

    /**
     * @brief Must hold slot->mutex; schedules the timeout and appends
     */
    [[nodiscard]] bool enqueue_locked(BackendSlot& slot,
                                      const std::string& user_id,
                                      const std::string& request_id,
                                      AcquireCallback& done);

    void process_queue(const std::shared_ptr<BackendSlot>& slot);
    void on_queue_timeout(const std::string& backend, uint64_t ticket);

    void record_completion(BackendSlot& slot, std::chrono::milliseconds latency, bool success);

    void close_retired(const Retired& retired);
    void cancel_timeout(const QueuedRequest& request);
    void publish(const GatewayEvent& event);

    Config config_;
    std::shared_ptr<ITransportFactory> factory_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<ITaskScheduler> scheduler_;
    std::shared_ptr<EventBus> events_;

    std::unordered_map<std::string, std::shared_ptr<BackendSlot>> slots_;
    mutable std::shared_mutex slots_mutex_;

    std::atomic<size_t> total_active_{0};

    std::unordered_map<std::string, uint32_t> user_outstanding_;
    mutable std::mutex users_mutex_;

    std::atomic<uint64_t> next_ticket_{1};
    std::atomic<bool> shutting_down_{false};
    std::optional<TaskId> cleanup_task_;
    std::mutex cleanup_task_mutex_;

    // Global metrics
    mutable std::mutex metrics_mutex_;
    uint64_t successful_requests_ = 0;
    uint64_t failed_requests_ = 0;
    double average_response_ms_ = 0.0;
    std::atomic<uint64_t> queue_timeouts_{0};
};

} // namespace mcpgate
