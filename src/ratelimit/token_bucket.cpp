#include "ratelimit/token_bucket.hpp"

#include <algorithm>

namespace mcpgate {

TokenBucket::TokenBucket(uint32_t tokens_per_window,
                         std::chrono::milliseconds window,
                         double max_tokens,
                         TimePoint now)
    : tokens_per_window_(tokens_per_window),
      window_(window),
      max_tokens_(max_tokens),
      tokens_(std::min(static_cast<double>(tokens_per_window), max_tokens)),
      last_refill_(now) {}

void TokenBucket::refill(TimePoint now) {
    if (now <= last_refill_ || window_.count() <= 0) {
        return;
    }
    const double elapsed_ms = std::chrono::duration<double, std::milli>(now - last_refill_).count();
    const double added = elapsed_ms / static_cast<double>(window_.count()) * tokens_per_window_;
    tokens_ = std::min(max_tokens_, tokens_ + added);
    last_refill_ = now;
}

void TokenBucket::consume(uint32_t weight) {
    tokens_ = std::max(0.0, tokens_ - static_cast<double>(weight));
}

void TokenBucket::set_max_tokens(double max_tokens) {
    max_tokens_ = std::max(0.0, max_tokens);
    tokens_ = std::min(tokens_, max_tokens_);
}

double TokenBucket::load() const {
    if (max_tokens_ <= 0.0) {
        return 1.0;
    }
    return 1.0 - tokens_ / max_tokens_;
}

} // namespace mcpgate
