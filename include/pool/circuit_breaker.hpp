#pragma once

#include "core/clock.hpp"
#include "core/types.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpgate {

/**
 * @brief Structured event emitted on circuit breaker state transitions
 */
struct StateChangeEvent {
    CircuitState from;
    CircuitState to;
    std::chrono::system_clock::time_point timestamp;
    std::string breaker_name;
};

/**
 * @brief Per-backend circuit breaker
 *
 * State transitions:
 * - CLOSED → OPEN:      failure_count >= threshold
 * - OPEN → HALF_OPEN:   first is_open() after timeout since the last failure
 *                       (that call returns false: the probe goes through)
 * - HALF_OPEN → CLOSED: any recorded success (failure_count resets to 0)
 * - HALF_OPEN → OPEN:   a recorded failure (count is still >= threshold)
 *
 * Failures only decay through an explicit success. While HALF_OPEN, further
 * is_open() calls return true until the probe outcome is recorded; if no
 * outcome arrives within another timeout, one more probe is let through.
 */
class CircuitBreaker {
public:
    struct Config {
        uint32_t failure_threshold;             // Failures to trip OPEN
        std::chrono::milliseconds timeout;      // OPEN time before a probe

        Config()
            : failure_threshold(5),
              timeout(60000) {}
    };

    CircuitBreaker(std::string name, const Config& config, std::shared_ptr<IClock> clock);

    /**
     * @brief Fail-fast check; may transition OPEN → HALF_OPEN
     * @return true if requests must be rejected
     */
    [[nodiscard]] bool is_open();

    void record_success();
    void record_failure();

    [[nodiscard]] CircuitState get_state() const {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint32_t failure_count() const;

    [[nodiscard]] CircuitBreakerStats get_stats() const;

    /**
     * @brief Force reset to CLOSED
     */
    void reset();

    [[nodiscard]] const std::string& name() const { return name_; }

    /**
     * @brief Register callback for state transitions (invoked without the breaker lock)
     */
    void set_on_state_change(std::function<void(const StateChangeEvent&)> cb);

    /**
     * @brief Recent state change events (most recent last)
     */
    [[nodiscard]] std::vector<StateChangeEvent> get_recent_events() const;

private:
    // Must hold mutex_; returns the transition to emit once unlocked
    std::optional<StateChangeEvent> transition_locked(CircuitState to);

    void emit_transition(const std::optional<StateChangeEvent>& event);

    std::string name_;
    Config config_;
    std::shared_ptr<IClock> clock_;

    std::atomic<CircuitState> state_{CircuitState::CLOSED};

    mutable std::mutex mutex_;
    uint32_t failure_count_ = 0;
    uint64_t success_count_ = 0;
    uint64_t times_opened_ = 0;
    std::optional<TimePoint> last_failure_;
    TimePoint probe_started_{};

    std::function<void(const StateChangeEvent&)> on_state_change_;
    std::deque<StateChangeEvent> recent_events_;
    mutable std::mutex events_mutex_;
    static constexpr size_t kMaxRecentEvents = 100;
};

} // namespace mcpgate
