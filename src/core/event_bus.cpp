#include "core/event_bus.hpp"
#include "core/utils.hpp"

#include <format>
#include <type_traits>

namespace mcpgate {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

const char* event_type_name(const GatewayEvent& event) {
    return std::visit(overloaded{
        [](const PoolInitialized&) { return "pool_initialized"; },
        [](const ConnectionReleased&) { return "connection_released"; },
        [](const RateLimitHit&) { return "rate_limit_hit"; },
        [](const AdaptiveAdjustment&) { return "adaptive_adjustment"; },
        [](const CleanupCompleted&) { return "cleanup_completed"; },
        [](const CircuitStateChanged&) { return "circuit_state_changed"; },
        [](const SessionOpened&) { return "session_opened"; },
        [](const SessionClosed&) { return "session_closed"; },
    }, event);
}

// ============================================================================
// EventBus
// ============================================================================

void EventBus::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void EventBus::publish(const GatewayEvent& event) {
    std::lock_guard<std::recursive_mutex> delivery(delivery_mutex_);

    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        recent_.push_back(RecordedEvent{event, std::chrono::system_clock::now()});
        if (recent_.size() > kMaxRecentEvents) {
            recent_.pop_front();
        }
        ++published_;
        listeners = listeners_;
    }

    for (const auto& listener : listeners) {
        listener(event);
    }
}

std::vector<EventBus::RecordedEvent> EventBus::recent_events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {recent_.begin(), recent_.end()};
}

uint64_t EventBus::published_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
}

// ============================================================================
// EventLogger
// ============================================================================

EventLogger::EventLogger(EventBus& bus) {
    bus.subscribe([](const GatewayEvent& event) { log_event(event); });
}

void EventLogger::log_event(const GatewayEvent& event) {
    std::visit(overloaded{
        [](const PoolInitialized& e) {
            utils::log::info(std::format("[POOL] Initialized pool for {} (max {})",
                e.backend, e.max_connections));
        },
        [](const ConnectionReleased& e) {
            if (!e.success) {
                utils::log::warn(std::format("[POOL] {} released failed connection {} after {}ms",
                    e.backend, e.connection_id, e.latency.count()));
            }
        },
        [](const RateLimitHit& e) {
            utils::log::warn(std::format("[RATE_LIMIT] {} limit hit for {}",
                rate_limit_gate_name(e.gate), e.key));
        },
        [](const AdaptiveAdjustment& e) {
            utils::log::info(std::format("[ADAPTIVE] {} limit for {} to {} (avg load {:.2f})",
                e.direction == AdjustmentDirection::REDUCE ? "Reduced" : "Increased",
                e.key, e.new_limit, e.avg_load));
        },
        [](const CleanupCompleted& e) {
            if (e.removed > 0) {
                utils::log::info(std::format("[CLEANUP] {} removed {} entries",
                    e.component, e.removed));
            }
        },
        [](const CircuitStateChanged& e) {
            utils::log::warn(std::format("[CIRCUIT] {}: {} -> {}",
                e.backend, circuit_state_name(e.from), circuit_state_name(e.to)));
        },
        [](const SessionOpened& e) {
            utils::log::info(std::format("[SESSION] Opened {} for {} on {}",
                e.session_id, e.user_id, e.backend));
        },
        [](const SessionClosed& e) {
            utils::log::info(std::format("[SESSION] Closed {} on {} ({})",
                e.session_id, e.backend, e.reason));
        },
    }, event);
}

} // namespace mcpgate
