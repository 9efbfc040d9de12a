#pragma once

#include "core/clock.hpp"
#include <chrono>
#include <mutex>

namespace mcpgate::testing {

/**
 * @brief Clock that only moves when a test advances it
 */
class ManualClock : public IClock {
public:
    ManualClock() : now_(TimePoint{} + std::chrono::hours(1)) {}

    [[nodiscard]] TimePoint now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(std::chrono::milliseconds d) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += d;
    }

    void set(TimePoint t) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = t;
    }

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

} // namespace mcpgate::testing
