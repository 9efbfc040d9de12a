#pragma once

#include "core/types.hpp"
#include <chrono>
#include <cstdint>
#include <vector>

namespace mcpgate {

/**
 * @brief Segmented sliding window counter
 *
 * The window is split into equal segments; advancing to a later segment
 * zeroes the segments skipped over, or the whole ring if a full window
 * or more has passed. Not thread-safe.
 */
class SegmentedWindow {
public:
    SegmentedWindow(std::chrono::milliseconds window,
                    uint32_t segments,
                    uint32_t limit,
                    TimePoint now);

    void advance(TimePoint now);

    [[nodiscard]] bool can_admit(uint32_t weight) const {
        return total() + weight <= limit_;
    }

    void add(uint32_t weight);

    [[nodiscard]] uint64_t total() const;
    [[nodiscard]] size_t current_segment() const;
    [[nodiscard]] std::chrono::milliseconds window() const { return window_; }

private:
    std::chrono::milliseconds window_;
    uint32_t limit_;
    TimePoint start_;
    int64_t current_index_ = 0;         // Absolute segment number since start_
    std::vector<uint32_t> counts_;
};

} // namespace mcpgate
