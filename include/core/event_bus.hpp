#pragma once

#include "core/gateway_event.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

namespace mcpgate {

/**
 * @brief Synchronous typed event channel
 *
 * Events are delivered on the publishing thread, in publish order, to
 * listeners in subscription order. Callers must not hold component locks
 * while publishing.
 */
class EventBus {
public:
    using Listener = std::function<void(const GatewayEvent&)>;

    struct RecordedEvent {
        GatewayEvent event;
        std::chrono::system_clock::time_point timestamp;
    };

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    void subscribe(Listener listener);

    void publish(const GatewayEvent& event);

    /**
     * @brief Most recent events, oldest first (at most kMaxRecentEvents)
     */
    [[nodiscard]] std::vector<RecordedEvent> recent_events() const;

    [[nodiscard]] uint64_t published_count() const;

    static constexpr size_t kMaxRecentEvents = 100;

private:
    mutable std::mutex mutex_;
    std::vector<Listener> listeners_;
    std::deque<RecordedEvent> recent_;
    uint64_t published_ = 0;

    // Serializes delivery so publish order == delivery order across threads
    std::recursive_mutex delivery_mutex_;
};

/**
 * @brief Logs pool, limiter, and session events to the process log
 */
class EventLogger {
public:
    explicit EventLogger(EventBus& bus);

    static void log_event(const GatewayEvent& event);
};

} // namespace mcpgate
