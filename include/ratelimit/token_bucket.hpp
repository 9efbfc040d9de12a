#pragma once

#include "core/types.hpp"
#include <chrono>
#include <cstdint>

namespace mcpgate {

/**
 * @brief Token bucket with linear refill and an adjustable ceiling
 *
 * Refills tokens_per_window every window, capped at max_tokens. The
 * ceiling is what adaptive throttling moves; lowering it clamps the
 * current token count. Not thread-safe (owned by one key's state).
 */
class TokenBucket {
public:
    TokenBucket(uint32_t tokens_per_window,
                std::chrono::milliseconds window,
                double max_tokens,
                TimePoint now);

    void refill(TimePoint now);

    [[nodiscard]] bool has(uint32_t weight) const {
        return tokens_ >= static_cast<double>(weight);
    }

    void consume(uint32_t weight);

    void set_max_tokens(double max_tokens);

    [[nodiscard]] double tokens() const { return tokens_; }
    [[nodiscard]] double max_tokens() const { return max_tokens_; }

    /**
     * @brief Fraction of capacity in use: 1 - tokens / max_tokens
     */
    [[nodiscard]] double load() const;

private:
    uint32_t tokens_per_window_;
    std::chrono::milliseconds window_;
    double max_tokens_;
    double tokens_;
    TimePoint last_refill_;
};

} // namespace mcpgate
