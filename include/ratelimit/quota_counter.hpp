#pragma once

#include "core/types.hpp"
#include <chrono>
#include <cstdint>
#include <deque>

namespace mcpgate {

/**
 * @brief Fixed quota: linear refill plus a bounded log of recent requests
 *
 * A request is admitted only when at least one whole token is available
 * AND fewer than `limit` requests were logged inside the window.
 * Not thread-safe; the RateLimiter holds the owning state's lock.
 */
class QuotaCounter {
public:
    QuotaCounter(uint32_t limit, std::chrono::milliseconds window, TimePoint now);

    /**
     * @brief Refill tokens and drop log entries older than the window
     */
    void refresh(TimePoint now);

    [[nodiscard]] bool can_admit() const;

    void consume(TimePoint now);

    [[nodiscard]] double tokens() const { return tokens_; }
    [[nodiscard]] size_t logged() const { return request_times_.size(); }
    [[nodiscard]] std::chrono::milliseconds window() const { return window_; }
    [[nodiscard]] TimePoint last_activity() const { return last_activity_; }

private:
    uint32_t limit_;
    std::chrono::milliseconds window_;
    double tokens_;
    TimePoint last_refill_;
    TimePoint last_activity_;
    std::deque<TimePoint> request_times_;
};

} // namespace mcpgate
