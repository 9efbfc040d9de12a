#include "pool/circuit_breaker.hpp"

namespace mcpgate {

CircuitBreaker::CircuitBreaker(std::string name, const Config& config,
                               std::shared_ptr<IClock> clock)
    : name_(std::move(name)),
      config_(config),
      clock_(std::move(clock)) {}

bool CircuitBreaker::is_open() {
    std::optional<StateChangeEvent> event;
    bool open = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_->now();

        switch (state_.load(std::memory_order_acquire)) {
            case CircuitState::CLOSED:
                open = false;
                break;

            case CircuitState::OPEN: {
                const auto since = last_failure_.value_or(now);
                if (now - since >= config_.timeout) {
                    // Timeout elapsed - let exactly this call through as the probe
                    probe_started_ = now;
                    event = transition_locked(CircuitState::HALF_OPEN);
                    open = false;
                } else {
                    open = true;
                }
                break;
            }

            case CircuitState::HALF_OPEN:
                if (now - probe_started_ >= config_.timeout) {
                    // Probe never reported back; re-arm
                    probe_started_ = now;
                    open = false;
                } else {
                    open = true;
                }
                break;
        }
    }
    emit_transition(event);
    return open;
}

void CircuitBreaker::record_success() {
    std::optional<StateChangeEvent> event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++success_count_;
        failure_count_ = 0;
        if (state_.load(std::memory_order_acquire) != CircuitState::CLOSED) {
            event = transition_locked(CircuitState::CLOSED);
        }
    }
    emit_transition(event);
}

void CircuitBreaker::record_failure() {
    std::optional<StateChangeEvent> event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++failure_count_;
        last_failure_ = clock_->now();

        const auto current = state_.load(std::memory_order_acquire);
        if (current != CircuitState::OPEN && failure_count_ >= config_.failure_threshold) {
            event = transition_locked(CircuitState::OPEN);
        }
    }
    emit_transition(event);
}

uint32_t CircuitBreaker::failure_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_count_;
}

CircuitBreakerStats CircuitBreaker::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    CircuitBreakerStats stats;
    stats.state = state_.load(std::memory_order_acquire);
    stats.failure_count = failure_count_;
    stats.success_count = success_count_;
    stats.times_opened = times_opened_;
    stats.last_failure = last_failure_;
    return stats;
}

void CircuitBreaker::reset() {
    std::optional<StateChangeEvent> event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_count_ = 0;
        last_failure_.reset();
        if (state_.load(std::memory_order_acquire) != CircuitState::CLOSED) {
            event = transition_locked(CircuitState::CLOSED);
        }
    }
    emit_transition(event);
}

void CircuitBreaker::set_on_state_change(std::function<void(const StateChangeEvent&)> cb) {
    std::lock_guard<std::mutex> lock(events_mutex_);
    on_state_change_ = std::move(cb);
}

std::vector<StateChangeEvent> CircuitBreaker::get_recent_events() const {
    std::lock_guard<std::mutex> lock(events_mutex_);
    return {recent_events_.begin(), recent_events_.end()};
}

std::optional<StateChangeEvent> CircuitBreaker::transition_locked(CircuitState to) {
    const auto from = state_.exchange(to, std::memory_order_acq_rel);
    if (from == to) {
        return std::nullopt;
    }
    if (to == CircuitState::OPEN) {
        ++times_opened_;
    }
    return StateChangeEvent{from, to, std::chrono::system_clock::now(), name_};
}

void CircuitBreaker::emit_transition(const std::optional<StateChangeEvent>& event) {
    if (!event) {
        return;
    }

    std::function<void(const StateChangeEvent&)> cb;
    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        recent_events_.push_back(*event);
        if (recent_events_.size() > kMaxRecentEvents) {
            recent_events_.pop_front();
        }
        cb = on_state_change_;
    }

    if (cb) {
        cb(*event);
    }
}

} // namespace mcpgate
