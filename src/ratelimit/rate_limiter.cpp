#include "ratelimit/rate_limiter.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <format>
#include <vector>

namespace mcpgate {

namespace {

constexpr size_t gate_index(RateLimitGate gate) {
    return static_cast<size_t>(gate);
}

template <typename Map>
size_t evict_idle(Map& map, TimePoint now, uint64_t& evicted,
                  const auto& window_of, const auto& last_activity_of) {
    size_t removed = 0;
    for (auto it = map.begin(); it != map.end();) {
        bool stale = false;
        {
            std::lock_guard<std::mutex> lock(it->second->mutex);
            stale = now - last_activity_of(*it->second) > 2 * window_of(*it->second);
        }
        if (stale) {
            it = map.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    evicted += removed;
    return removed;
}

} // namespace

RateLimiter::KeyState::KeyState(const Config& config, TimePoint now)
    : bucket(config.tokens_per_window, config.window_size,
             static_cast<double>(config.max_burst_size), now),
      window(config.sliding_window_size.count() > 0 ? config.sliding_window_size
                                                    : config.window_size,
             config.sliding_window_segments, config.tokens_per_window, now),
      last_activity(now) {
    if (config.enable_adaptive) {
        AdaptiveThrottle::Config adaptive_config;
        adaptive_config.threshold = config.adaptive_threshold;
        adaptive_config.reduction = config.adaptive_reduction;
        adaptive_config.recovery_rate = config.adaptive_recovery_rate;
        adaptive_config.window = config.window_size;
        adaptive.emplace(adaptive_config, static_cast<double>(config.max_burst_size), now);
    }
}

RateLimiter::RateLimiter(const Config& config,
                         std::shared_ptr<IClock> clock,
                         std::shared_ptr<ITaskScheduler> scheduler,
                         std::shared_ptr<EventBus> events)
    : config_(config),
      clock_(std::move(clock)),
      scheduler_(std::move(scheduler)),
      events_(std::move(events)) {
    for (auto& counter : gate_rejects_) {
        counter.store(0, std::memory_order_relaxed);
    }
}

RateLimiter::~RateLimiter() {
    stop_cleanup();
}

// ============================================================================
// Admission
// ============================================================================

RateLimitResult RateLimiter::check(const std::string& key,
                                   const std::string& user_id,
                                   const std::string& backend,
                                   uint32_t weight) {
    total_checks_.fetch_add(1, std::memory_order_relaxed);

    if (!config_.enabled) {
        allowed_.fetch_add(1, std::memory_order_relaxed);
        return RateLimitResult::admit(config_.max_burst_size);
    }

    const TimePoint now = clock_->now();
    auto user = get_quota(user_quotas_, user_quotas_mutex_, user_id,
                          config_.per_user_limit, config_.per_user_window, now);
    auto server = get_quota(backend_quotas_, backend_quotas_mutex_, backend,
                            config_.per_backend_limit, config_.per_backend_window, now);
    auto state = get_key_state(key, now);

    RateLimitResult result;
    std::optional<AdaptiveThrottle::Adjustment> adjustment;
    {
        std::scoped_lock lock(user->mutex, server->mutex, state->mutex);

        user->counter.refresh(now);
        server->counter.refresh(now);
        state->bucket.refill(now);
        state->window.advance(now);
        state->last_activity = now;

        if (!user->counter.can_admit()) {
            result = RateLimitResult::reject(RateLimitGate::USER,
                std::format("User rate limit exceeded for '{}'", user_id),
                utils::ceil_seconds(config_.per_user_window));
        } else if (!server->counter.can_admit()) {
            result = RateLimitResult::reject(RateLimitGate::BACKEND,
                std::format("Backend rate limit exceeded for '{}'", backend),
                utils::ceil_seconds(config_.per_backend_window));
        } else if (!state->bucket.has(weight)) {
            result = RateLimitResult::reject(RateLimitGate::BUCKET,
                "Token bucket exhausted",
                utils::ceil_seconds(config_.window_size));
        } else if (!state->window.can_admit(weight)) {
            result = RateLimitResult::reject(RateLimitGate::WINDOW,
                "Sliding window limit exceeded",
                utils::ceil_seconds(state->window.window()));
        } else {
            user->counter.consume(now);
            server->counter.consume(now);
            state->bucket.consume(weight);
            state->window.add(weight);

            if (state->adaptive) {
                adjustment = state->adaptive->observe(state->bucket.load(), now);
                if (adjustment) {
                    state->bucket.set_max_tokens(adjustment->new_limit);
                }
            }

            result = RateLimitResult::admit(
                static_cast<uint32_t>(std::floor(state->bucket.tokens())));
        }
    }

    if (result.allowed) {
        allowed_.fetch_add(1, std::memory_order_relaxed);
    } else {
        const RateLimitGate gate = *result.gate;
        gate_rejects_[gate_index(gate)].fetch_add(1, std::memory_order_relaxed);

        const std::string& hit_key = gate == RateLimitGate::USER    ? user_id
                                   : gate == RateLimitGate::BACKEND ? backend
                                                                    : key;
        publish(RateLimitHit{gate, hit_key});
    }

    if (adjustment) {
        adaptive_adjustments_.fetch_add(1, std::memory_order_relaxed);
        publish(AdaptiveAdjustment{key, adjustment->direction,
                                   static_cast<uint32_t>(std::floor(adjustment->new_limit)),
                                   adjustment->avg_load});
    }

    return result;
}

// ============================================================================
// Resets
// ============================================================================

void RateLimiter::reset_key(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(key_states_mutex_);
    key_states_.erase(key);
}

void RateLimiter::reset_user(const std::string& user_id) {
    std::unique_lock<std::shared_mutex> lock(user_quotas_mutex_);
    user_quotas_.erase(user_id);
}

void RateLimiter::reset_backend(const std::string& backend) {
    std::unique_lock<std::shared_mutex> lock(backend_quotas_mutex_);
    backend_quotas_.erase(backend);
}

void RateLimiter::reset_all() {
    {
        std::unique_lock<std::shared_mutex> lock(user_quotas_mutex_);
        user_quotas_.clear();
    }
    {
        std::unique_lock<std::shared_mutex> lock(backend_quotas_mutex_);
        backend_quotas_.clear();
    }
    {
        std::unique_lock<std::shared_mutex> lock(key_states_mutex_);
        key_states_.clear();
    }
    utils::log::info("Rate limiter state reset");
}

// ============================================================================
// Cleanup
// ============================================================================

size_t RateLimiter::cleanup() {
    const TimePoint now = clock_->now();
    uint64_t evicted = 0;

    const auto quota_window = [](const QuotaState& s) { return s.counter.window(); };
    const auto quota_activity = [](const QuotaState& s) { return s.counter.last_activity(); };
    {
        std::unique_lock<std::shared_mutex> lock(user_quotas_mutex_);
        evict_idle(user_quotas_, now, evicted, quota_window, quota_activity);
    }
    {
        std::unique_lock<std::shared_mutex> lock(backend_quotas_mutex_);
        evict_idle(backend_quotas_, now, evicted, quota_window, quota_activity);
    }
    {
        // A composite key lives as long as the longer of its two windows
        const auto window = config_.window_size > sliding_window_size()
            ? config_.window_size : sliding_window_size();
        std::unique_lock<std::shared_mutex> lock(key_states_mutex_);
        evict_idle(key_states_, now, evicted,
                   [window](const KeyState&) { return window; },
                   [](const KeyState& s) { return s.last_activity; });
    }

    states_evicted_.fetch_add(evicted, std::memory_order_relaxed);
    if (evicted > 0) {
        utils::log::info(std::format("Rate limiter cleanup evicted {} idle states", evicted));
    }
    publish(CleanupCompleted{"rate_limiter", evicted});
    return static_cast<size_t>(evicted);
}

void RateLimiter::start_cleanup() {
    if (!scheduler_) {
        return;
    }
    std::lock_guard<std::mutex> lock(cleanup_task_mutex_);
    if (cleanup_task_) {
        return;
    }
    cleanup_task_ = scheduler_->schedule_every(config_.cleanup_interval, [this]() { cleanup(); });
}

void RateLimiter::stop_cleanup() {
    std::lock_guard<std::mutex> lock(cleanup_task_mutex_);
    if (cleanup_task_ && scheduler_) {
        scheduler_->cancel(*cleanup_task_);
    }
    cleanup_task_.reset();
}

// ============================================================================
// Stats
// ============================================================================

RateLimiter::Stats RateLimiter::get_stats() const {
    Stats stats;
    stats.total_checks = total_checks_.load(std::memory_order_relaxed);
    stats.allowed = allowed_.load(std::memory_order_relaxed);
    stats.user_rejects = gate_rejects_[gate_index(RateLimitGate::USER)].load(std::memory_order_relaxed);
    stats.backend_rejects = gate_rejects_[gate_index(RateLimitGate::BACKEND)].load(std::memory_order_relaxed);
    stats.bucket_rejects = gate_rejects_[gate_index(RateLimitGate::BUCKET)].load(std::memory_order_relaxed);
    stats.window_rejects = gate_rejects_[gate_index(RateLimitGate::WINDOW)].load(std::memory_order_relaxed);
    stats.rejected = stats.user_rejects + stats.backend_rejects +
                     stats.bucket_rejects + stats.window_rejects;
    stats.adaptive_adjustments = adaptive_adjustments_.load(std::memory_order_relaxed);
    stats.states_evicted = states_evicted_.load(std::memory_order_relaxed);

    {
        std::shared_lock<std::shared_mutex> lock(user_quotas_mutex_);
        stats.active_users = user_quotas_.size();
    }
    {
        std::shared_lock<std::shared_mutex> lock(backend_quotas_mutex_);
        stats.active_backends = backend_quotas_.size();
    }
    {
        std::shared_lock<std::shared_mutex> lock(key_states_mutex_);
        stats.active_keys = key_states_.size();
        for (const auto& [_, state] : key_states_) {
            if (state->adaptive) {
                ++stats.adaptive_keys;
            }
        }
    }
    return stats;
}

std::optional<double> RateLimiter::current_limit(const std::string& key) const {
    std::shared_ptr<KeyState> state;
    {
        std::shared_lock<std::shared_mutex> lock(key_states_mutex_);
        const auto it = key_states_.find(key);
        if (it == key_states_.end()) {
            return std::nullopt;
        }
        state = it->second;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->bucket.max_tokens();
}

// ============================================================================
// Helpers
// ============================================================================

std::shared_ptr<RateLimiter::QuotaState> RateLimiter::get_quota(
    QuotaMap& map, std::shared_mutex& mutex, const std::string& id,
    uint32_t limit, std::chrono::milliseconds window, TimePoint now) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex);
        const auto it = map.find(id);
        if (it != map.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex);
    auto [it, inserted] = map.try_emplace(id, nullptr);
    if (inserted) {
        it->second = std::make_shared<QuotaState>(limit, window, now);
    }
    return it->second;
}

std::shared_ptr<RateLimiter::KeyState> RateLimiter::get_key_state(const std::string& key,
                                                                  TimePoint now) {
    {
        std::shared_lock<std::shared_mutex> lock(key_states_mutex_);
        const auto it = key_states_.find(key);
        if (it != key_states_.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(key_states_mutex_);
    auto [it, inserted] = key_states_.try_emplace(key, nullptr);
    if (inserted) {
        it->second = std::make_shared<KeyState>(config_, now);
    }
    return it->second;
}

std::chrono::milliseconds RateLimiter::sliding_window_size() const {
    return config_.sliding_window_size.count() > 0 ? config_.sliding_window_size
                                                   : config_.window_size;
}

void RateLimiter::publish(const GatewayEvent& event) {
    if (events_) {
        events_->publish(event);
    }
}

} // namespace mcpgate
