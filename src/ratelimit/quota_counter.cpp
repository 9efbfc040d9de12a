#include "ratelimit/quota_counter.hpp"

#include <algorithm>

namespace mcpgate {

QuotaCounter::QuotaCounter(uint32_t limit, std::chrono::milliseconds window, TimePoint now)
    : limit_(limit),
      window_(window),
      tokens_(static_cast<double>(limit)),
      last_refill_(now),
      last_activity_(now) {}

void QuotaCounter::refresh(TimePoint now) {
    last_activity_ = now;

    if (now > last_refill_ && window_.count() > 0) {
        const double elapsed_ms = std::chrono::duration<double, std::milli>(now - last_refill_).count();
        const double refill = elapsed_ms / static_cast<double>(window_.count()) * limit_;
        tokens_ = std::min(static_cast<double>(limit_), tokens_ + refill);
        last_refill_ = now;
    }

    while (!request_times_.empty() && now - request_times_.front() >= window_) {
        request_times_.pop_front();
    }
}

bool QuotaCounter::can_admit() const {
    return tokens_ >= 1.0 && request_times_.size() < limit_;
}

void QuotaCounter::consume(TimePoint now) {
    tokens_ = std::max(0.0, tokens_ - 1.0);
    request_times_.push_back(now);
    // Log never holds more than limit entries
    while (request_times_.size() > limit_) {
        request_times_.pop_front();
    }
}

} // namespace mcpgate
