#include "ratelimit/adaptive_throttle.hpp"

#include <algorithm>

namespace mcpgate {

AdaptiveThrottle::AdaptiveThrottle(const Config& config, double original_limit, TimePoint now)
    : config_(config),
      original_limit_(original_limit),
      current_limit_(original_limit),
      last_adjustment_(now) {}

std::optional<AdaptiveThrottle::Adjustment> AdaptiveThrottle::observe(double load, TimePoint now) {
    history_.push_back(Sample{load, now});
    while (!history_.empty() && now - history_.front().at >= config_.window) {
        history_.pop_front();
    }

    if (now - last_adjustment_ < config_.window) {
        return std::nullopt;
    }
    last_adjustment_ = now;

    if (history_.empty()) {
        return std::nullopt;
    }

    double sum = 0.0;
    for (const auto& s : history_) {
        sum += s.load;
    }
    const double avg = sum / static_cast<double>(history_.size());
    const double floor = original_limit_ * kFloorFraction;

    if (avg > config_.threshold && current_limit_ > floor) {
        current_limit_ = std::max(floor, current_limit_ * (1.0 - config_.reduction));
        current_limit_ = std::min(current_limit_, original_limit_);
        return Adjustment{AdjustmentDirection::REDUCE, current_limit_, avg};
    }

    if (avg < config_.threshold * 0.5 && current_limit_ < original_limit_) {
        current_limit_ = std::min(original_limit_, current_limit_ * (1.0 + config_.recovery_rate));
        current_limit_ = std::max(current_limit_, floor);
        return Adjustment{AdjustmentDirection::INCREASE, current_limit_, avg};
    }

    return std::nullopt;
}

} // namespace mcpgate
