#include <catch2/catch_test_macros.hpp>
#include "core/event_bus.hpp"

#include <string>
#include <variant>
#include <vector>

using namespace mcpgate;

TEST_CASE("EventBus: listeners see events in publish order", "[events]") {
    EventBus bus;
    std::vector<std::string> first;
    std::vector<std::string> second;

    bus.subscribe([&](const GatewayEvent& e) { first.emplace_back(event_type_name(e)); });
    bus.subscribe([&](const GatewayEvent& e) {
        // Second listener runs after the first for the same event
        REQUIRE(first.size() == second.size() + 1);
        second.emplace_back(event_type_name(e));
    });

    bus.publish(PoolInitialized{"echo", 4});
    bus.publish(RateLimitHit{RateLimitGate::USER, "alice"});
    bus.publish(SessionClosed{"s1", "echo", "client_delete"});

    const std::vector<std::string> expected{"pool_initialized", "rate_limit_hit", "session_closed"};
    CHECK(first == expected);
    CHECK(second == expected);
    CHECK(bus.published_count() == 3);
}

TEST_CASE("EventBus: recent events are capped", "[events]") {
    EventBus bus;
    for (uint32_t i = 0; i < EventBus::kMaxRecentEvents + 20; ++i) {
        bus.publish(PoolInitialized{"b" + std::to_string(i), i});
    }

    const auto recent = bus.recent_events();
    REQUIRE(recent.size() == EventBus::kMaxRecentEvents);
    const auto& oldest = std::get<PoolInitialized>(recent.front().event);
    const auto& newest = std::get<PoolInitialized>(recent.back().event);
    CHECK(oldest.backend == "b20");
    CHECK(newest.max_connections == EventBus::kMaxRecentEvents + 19);
    CHECK(bus.published_count() == EventBus::kMaxRecentEvents + 20);
}

TEST_CASE("EventBus: a listener may publish", "[events]") {
    EventBus bus;
    int closed = 0;
    bus.subscribe([&](const GatewayEvent& e) {
        if (std::holds_alternative<SessionOpened>(e)) {
            bus.publish(SessionClosed{"s1", "echo", "initialize_failed"});
        } else if (std::holds_alternative<SessionClosed>(e)) {
            ++closed;
        }
    });

    bus.publish(SessionOpened{"s1", "echo", "alice"});
    CHECK(closed == 1);
    CHECK(bus.published_count() == 2);
}

TEST_CASE("EventLogger: every event type can be logged", "[events]") {
    EventBus bus;
    EventLogger logger(bus);

    bus.publish(PoolInitialized{"echo", 2});
    bus.publish(ConnectionReleased{"echo", "c1", "alice", std::chrono::milliseconds(12), false});
    bus.publish(RateLimitHit{RateLimitGate::GLOBAL, "global"});
    bus.publish(AdaptiveAdjustment{"alice-echo", AdjustmentDirection::REDUCE, 75, 0.9});
    bus.publish(CleanupCompleted{"rate_limiter", 3});
    bus.publish(CircuitStateChanged{"echo", CircuitState::CLOSED, CircuitState::OPEN});
    bus.publish(SessionOpened{"s1", "echo", "alice"});
    bus.publish(SessionClosed{"s1", "echo", "expired"});

    CHECK(bus.published_count() == 8);
}
