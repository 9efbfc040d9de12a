#pragma once

#include "core/clock.hpp"
#include "core/event_bus.hpp"
#include "core/task_scheduler.hpp"
#include "core/types.hpp"
#include "ratelimit/adaptive_throttle.hpp"
#include "ratelimit/irate_limiter.hpp"
#include "ratelimit/quota_counter.hpp"
#include "ratelimit/sliding_window.hpp"
#include "ratelimit/token_bucket.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace mcpgate {

/**
 * @brief Four-gate rate limiter (all must pass, evaluated in order)
 *
 * 1. Per-user quota       - keyed by user id
 * 2. Per-backend quota    - keyed by backend name
 * 3. Token bucket         - keyed by composite key (adaptive ceiling)
 * 4. Sliding window       - keyed by composite key
 *
 * The first gate that blocks decides the rejection reason and retry hint.
 * Capacity is consumed from all four only on full admission: the three
 * states touched by one call are locked together for the check-and-consume.
 *
 * State is created lazily per key and reaped after two of its own windows
 * without activity.
 *
 * Thread-safety: fully thread-safe.
 */
class RateLimiter : public IRateLimiter {
public:
    struct Config {
        bool enabled = true;

        // Token bucket + sliding window (composite key)
        uint32_t tokens_per_window = 100;
        std::chrono::milliseconds window_size{60000};
        uint32_t max_burst_size = 150;
        std::chrono::milliseconds sliding_window_size{0};     // 0 = window_size
        uint32_t sliding_window_segments = 60;

        // Fixed quotas
        uint32_t per_user_limit = 10;
        std::chrono::milliseconds per_user_window{60000};
        uint32_t per_backend_limit = 50;
        std::chrono::milliseconds per_backend_window{60000};

        // Adaptive throttling
        bool enable_adaptive = true;
        double adaptive_threshold = 0.8;
        double adaptive_reduction = 0.5;
        double adaptive_recovery_rate = 0.1;

        std::chrono::milliseconds cleanup_interval{300000};
    };

    struct Stats {
        uint64_t total_checks = 0;
        uint64_t allowed = 0;
        uint64_t rejected = 0;
        uint64_t user_rejects = 0;
        uint64_t backend_rejects = 0;
        uint64_t bucket_rejects = 0;
        uint64_t window_rejects = 0;
        uint64_t adaptive_adjustments = 0;
        uint64_t states_evicted = 0;
        size_t active_users = 0;
        size_t active_backends = 0;
        size_t active_keys = 0;
        size_t adaptive_keys = 0;
    };

    RateLimiter(const Config& config,
                std::shared_ptr<IClock> clock,
                std::shared_ptr<ITaskScheduler> scheduler = nullptr,
                std::shared_ptr<EventBus> events = nullptr);

    ~RateLimiter() override;

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    [[nodiscard]] RateLimitResult check(const std::string& key,
                                        const std::string& user_id,
                                        const std::string& backend,
                                        uint32_t weight = 1) override;

    void reset_key(const std::string& key);
    void reset_user(const std::string& user_id);
    void reset_backend(const std::string& backend);
    void reset_all() override;

    /**
     * @brief Evict state idle for more than two of its own windows
     * @return Number of states evicted
     */
    size_t cleanup();

    /**
     * @brief Run cleanup() every cleanup_interval on the scheduler
     */
    void start_cleanup();

    void stop_cleanup();

    [[nodiscard]] Stats get_stats() const;

    /**
     * @brief Current adaptive ceiling for a key (nullopt if none yet)
     */
    [[nodiscard]] std::optional<double> current_limit(const std::string& key) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    struct QuotaState {
        QuotaState(uint32_t limit, std::chrono::milliseconds window, TimePoint now)
            : counter(limit, window, now) {}

        std::mutex mutex;
        QuotaCounter counter;
    };

    struct KeyState {
        KeyState(const Config& config, TimePoint now);

        std::mutex mutex;
        TokenBucket bucket;
        SegmentedWindow window;
        std::optional<AdaptiveThrottle> adaptive;
        TimePoint last_activity;
    };

    using QuotaMap = std::unordered_map<std::string, std::shared_ptr<QuotaState>>;

    std::shared_ptr<QuotaState> get_quota(QuotaMap& map, std::shared_mutex& mutex,
                                          const std::string& id, uint32_t limit,
                                          std::chrono::milliseconds window, TimePoint now);
    std::shared_ptr<KeyState> get_key_state(const std::string& key, TimePoint now);

    [[nodiscard]] std::chrono::milliseconds sliding_window_size() const;

    void publish(const GatewayEvent& event);

    Config config_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<ITaskScheduler> scheduler_;
    std::shared_ptr<EventBus> events_;

    QuotaMap user_quotas_;
    mutable std::shared_mutex user_quotas_mutex_;

    QuotaMap backend_quotas_;
    mutable std::shared_mutex backend_quotas_mutex_;

    std::unordered_map<std::string, std::shared_ptr<KeyState>> key_states_;
    mutable std::shared_mutex key_states_mutex_;

    // Statistics
    std::atomic<uint64_t> total_checks_{0};
    std::atomic<uint64_t> allowed_{0};
    std::array<std::atomic<uint64_t>, 4> gate_rejects_{};
    std::atomic<uint64_t> adaptive_adjustments_{0};
    std::atomic<uint64_t> states_evicted_{0};

    std::optional<TaskId> cleanup_task_;
    std::mutex cleanup_task_mutex_;
};

} // namespace mcpgate
