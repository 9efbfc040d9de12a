#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "ratelimit/adaptive_throttle.hpp"

using namespace mcpgate;
using Catch::Matchers::WithinAbs;
using std::chrono::milliseconds;

namespace {

AdaptiveThrottle::Config throttle_config() {
    AdaptiveThrottle::Config cfg;
    cfg.threshold = 0.8;
    cfg.reduction = 0.5;
    cfg.recovery_rate = 0.1;
    cfg.window = milliseconds(1000);
    return cfg;
}

} // namespace

TEST_CASE("AdaptiveThrottle: at most one adjustment per window", "[adaptive]") {
    const TimePoint t0{std::chrono::hours(1)};
    AdaptiveThrottle throttle(throttle_config(), 100.0, t0);

    CHECK_FALSE(throttle.observe(1.0, t0).has_value());
    CHECK_FALSE(throttle.observe(1.0, t0 + milliseconds(999)).has_value());

    auto adj = throttle.observe(1.0, t0 + milliseconds(1000));
    REQUIRE(adj.has_value());
    CHECK(adj->direction == AdjustmentDirection::REDUCE);
    CHECK_THAT(adj->new_limit, WithinAbs(50.0, 1e-9));

    CHECK_FALSE(throttle.observe(1.0, t0 + milliseconds(1500)).has_value());
}

TEST_CASE("AdaptiveThrottle: moderate load leaves the limit alone", "[adaptive]") {
    const TimePoint t0{std::chrono::hours(1)};
    AdaptiveThrottle throttle(throttle_config(), 100.0, t0);

    // Between threshold/2 and threshold: neither shrink nor grow
    for (int i = 1; i <= 5; ++i) {
        CHECK_FALSE(throttle.observe(0.6, t0 + milliseconds(1000 * i)).has_value());
    }
    CHECK_THAT(throttle.current_limit(), WithinAbs(100.0, 1e-9));
}

TEST_CASE("AdaptiveThrottle: limit stays within [10%, 100%] of original", "[adaptive]") {
    const TimePoint t0{std::chrono::hours(1)};
    AdaptiveThrottle throttle(throttle_config(), 100.0, t0);
    const double floor = 100.0 * AdaptiveThrottle::kFloorFraction;

    TimePoint now = t0;
    int reductions = 0;
    for (int i = 0; i < 50; ++i) {
        now += milliseconds(1000);
        if (auto adj = throttle.observe(1.0, now)) {
            ++reductions;
            CHECK(adj->direction == AdjustmentDirection::REDUCE);
        }
        CHECK(throttle.current_limit() >= floor);
        CHECK(throttle.current_limit() <= 100.0);
    }
    // 100 -> 50 -> 25 -> 12.5 -> 10
    CHECK(reductions == 4);
    CHECK_THAT(throttle.current_limit(), WithinAbs(floor, 1e-9));

    int increases = 0;
    for (int i = 0; i < 100; ++i) {
        now += milliseconds(1000);
        if (auto adj = throttle.observe(0.0, now)) {
            ++increases;
            CHECK(adj->direction == AdjustmentDirection::INCREASE);
        }
        CHECK(throttle.current_limit() >= floor);
        CHECK(throttle.current_limit() <= 100.0);
    }
    CHECK(increases > 0);
    CHECK_THAT(throttle.current_limit(), WithinAbs(100.0, 1e-9));
}

TEST_CASE("AdaptiveThrottle: samples older than a window are discarded", "[adaptive]") {
    const TimePoint t0{std::chrono::hours(1)};
    AdaptiveThrottle throttle(throttle_config(), 100.0, t0);

    (void)throttle.observe(1.0, t0 + milliseconds(100));
    (void)throttle.observe(1.0, t0 + milliseconds(200));
    CHECK(throttle.sample_count() == 2);

    // Earlier high-load samples fall out; only the low one counts
    auto adj = throttle.observe(0.0, t0 + milliseconds(1300));
    CHECK(throttle.sample_count() == 1);
    CHECK_FALSE(adj.has_value());
    CHECK_THAT(throttle.current_limit(), WithinAbs(100.0, 1e-9));
}
