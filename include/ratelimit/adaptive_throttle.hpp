#pragma once

#include "core/gateway_event.hpp"
#include "core/types.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>

namespace mcpgate {

/**
 * @brief Load-driven shrink/grow of one token bucket's ceiling
 *
 * Load samples (1 - tokens / max) are kept for one window. Once per
 * window the average decides:
 *   avg > threshold and limit > 10% of original   → limit *= (1 - reduction)
 *   avg < threshold / 2 and limit < original      → limit *= (1 + recovery)
 * The limit always stays within [0.1 × original, original].
 */
class AdaptiveThrottle {
public:
    struct Config {
        double threshold = 0.8;
        double reduction = 0.5;
        double recovery_rate = 0.1;
        std::chrono::milliseconds window{60000};
    };

    struct Adjustment {
        AdjustmentDirection direction;
        double new_limit;
        double avg_load;
    };

    static constexpr double kFloorFraction = 0.1;

    AdaptiveThrottle(const Config& config, double original_limit, TimePoint now);

    /**
     * @brief Record a load sample; returns an adjustment at most once per window
     */
    [[nodiscard]] std::optional<Adjustment> observe(double load, TimePoint now);

    [[nodiscard]] double current_limit() const { return current_limit_; }
    [[nodiscard]] double original_limit() const { return original_limit_; }
    [[nodiscard]] size_t sample_count() const { return history_.size(); }

private:
    struct Sample {
        double load;
        TimePoint at;
    };

    Config config_;
    double original_limit_;
    double current_limit_;
    TimePoint last_adjustment_;
    std::deque<Sample> history_;
};

} // namespace mcpgate
