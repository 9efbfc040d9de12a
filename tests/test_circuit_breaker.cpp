#include <catch2/catch_test_macros.hpp>
#include "pool/circuit_breaker.hpp"
#include "mocks/manual_clock.hpp"

using namespace mcpgate;
using mcpgate::testing::ManualClock;

namespace {

CircuitBreaker::Config make_config(uint32_t threshold, int timeout_ms) {
    CircuitBreaker::Config cfg;
    cfg.failure_threshold = threshold;
    cfg.timeout = std::chrono::milliseconds(timeout_ms);
    return cfg;
}

} // namespace

TEST_CASE("CircuitBreaker: opens after exactly threshold failures", "[circuit_breaker]") {
    auto clock = std::make_shared<ManualClock>();
    CircuitBreaker cb("s1", make_config(3, 1000), clock);

    cb.record_failure();
    cb.record_failure();
    CHECK_FALSE(cb.is_open());
    CHECK(cb.get_state() == CircuitState::CLOSED);

    cb.record_failure();
    CHECK(cb.is_open());
    CHECK(cb.get_state() == CircuitState::OPEN);
    CHECK(cb.failure_count() == 3);
}

TEST_CASE("CircuitBreaker: success resets failure count while closed", "[circuit_breaker]") {
    auto clock = std::make_shared<ManualClock>();
    CircuitBreaker cb("s1", make_config(3, 1000), clock);

    cb.record_failure();
    cb.record_failure();
    cb.record_success();
    cb.record_failure();
    cb.record_failure();

    CHECK_FALSE(cb.is_open());
    CHECK(cb.failure_count() == 2);
}

TEST_CASE("CircuitBreaker: probe allowed exactly once after timeout", "[circuit_breaker]") {
    auto clock = std::make_shared<ManualClock>();
    CircuitBreaker cb("s1", make_config(2, 1000), clock);

    cb.record_failure();
    cb.record_failure();
    REQUIRE(cb.is_open());

    clock->advance(std::chrono::milliseconds(999));
    CHECK(cb.is_open());

    clock->advance(std::chrono::milliseconds(1));
    CHECK_FALSE(cb.is_open());
    CHECK(cb.get_state() == CircuitState::HALF_OPEN);

    // Probe outstanding: everyone else still fails fast
    CHECK(cb.is_open());
    CHECK(cb.is_open());
}

TEST_CASE("CircuitBreaker: failed probe returns to OPEN", "[circuit_breaker]") {
    auto clock = std::make_shared<ManualClock>();
    CircuitBreaker cb("s1", make_config(2, 1000), clock);

    cb.record_failure();
    cb.record_failure();
    clock->advance(std::chrono::milliseconds(1000));
    REQUIRE_FALSE(cb.is_open());

    cb.record_failure();
    CHECK(cb.get_state() == CircuitState::OPEN);
    CHECK(cb.is_open());
    CHECK(cb.failure_count() == 3);

    // New timeout measured from the probe failure
    clock->advance(std::chrono::milliseconds(1000));
    CHECK_FALSE(cb.is_open());
}

TEST_CASE("CircuitBreaker: successful probe closes and resets", "[circuit_breaker]") {
    auto clock = std::make_shared<ManualClock>();
    CircuitBreaker cb("s1", make_config(2, 1000), clock);

    cb.record_failure();
    cb.record_failure();
    clock->advance(std::chrono::milliseconds(1500));
    REQUIRE_FALSE(cb.is_open());

    cb.record_success();
    CHECK(cb.get_state() == CircuitState::CLOSED);
    CHECK(cb.failure_count() == 0);
    CHECK_FALSE(cb.is_open());

    // A single failure no longer trips it
    cb.record_failure();
    CHECK_FALSE(cb.is_open());
}

TEST_CASE("CircuitBreaker: unreported probe is re-armed after another timeout", "[circuit_breaker]") {
    auto clock = std::make_shared<ManualClock>();
    CircuitBreaker cb("s1", make_config(1, 500), clock);

    cb.record_failure();
    clock->advance(std::chrono::milliseconds(500));
    REQUIRE_FALSE(cb.is_open());
    CHECK(cb.is_open());

    clock->advance(std::chrono::milliseconds(500));
    CHECK_FALSE(cb.is_open());
    CHECK(cb.is_open());
}

TEST_CASE("CircuitBreaker: state change events in order", "[circuit_breaker][events]") {
    auto clock = std::make_shared<ManualClock>();
    CircuitBreaker cb("cycle", make_config(2, 100), clock);

    std::vector<StateChangeEvent> captured;
    cb.set_on_state_change([&](const StateChangeEvent& e) {
        captured.push_back(e);
    });

    cb.record_failure();
    cb.record_failure();
    clock->advance(std::chrono::milliseconds(100));
    (void)cb.is_open();
    cb.record_success();

    REQUIRE(captured.size() == 3);
    CHECK(captured[0].from == CircuitState::CLOSED);
    CHECK(captured[0].to == CircuitState::OPEN);
    CHECK(captured[1].to == CircuitState::HALF_OPEN);
    CHECK(captured[2].from == CircuitState::HALF_OPEN);
    CHECK(captured[2].to == CircuitState::CLOSED);
    CHECK(captured[0].breaker_name == "cycle");

    CHECK(cb.get_recent_events().size() == 3);
    CHECK(cb.get_stats().times_opened == 1);
}

TEST_CASE("CircuitBreaker: event history capped at 100", "[circuit_breaker][events]") {
    auto clock = std::make_shared<ManualClock>();
    CircuitBreaker cb("cap", make_config(1, 1), clock);

    for (int i = 0; i < 50; ++i) {
        cb.record_failure();
        clock->advance(std::chrono::milliseconds(1));
        (void)cb.is_open();
        cb.record_success();
    }

    CHECK(cb.get_recent_events().size() == 100);
}

TEST_CASE("CircuitBreaker: reset forces CLOSED", "[circuit_breaker]") {
    auto clock = std::make_shared<ManualClock>();
    CircuitBreaker cb("s1", make_config(1, 60000), clock);

    cb.record_failure();
    REQUIRE(cb.is_open());

    cb.reset();
    CHECK_FALSE(cb.is_open());
    CHECK(cb.get_stats().failure_count == 0);
    CHECK_FALSE(cb.get_stats().last_failure.has_value());
}
