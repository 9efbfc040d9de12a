#include "ratelimit/sliding_window.hpp"

#include <algorithm>
#include <numeric>

namespace mcpgate {

SegmentedWindow::SegmentedWindow(std::chrono::milliseconds window,
                                 uint32_t segments,
                                 uint32_t limit,
                                 TimePoint now)
    : window_(window),
      limit_(limit),
      start_(now),
      counts_(std::max<uint32_t>(segments, 1), 0) {}

void SegmentedWindow::advance(TimePoint now) {
    if (now <= start_) {
        return;
    }

    const auto n = static_cast<int64_t>(counts_.size());
    const int64_t window_us = std::max<int64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(window_).count(), 1);
    const int64_t elapsed_us =
        std::chrono::duration_cast<std::chrono::microseconds>(now - start_).count();

    // Integer segment index: a full window always lands exactly n segments later
    const int64_t index = elapsed_us * n / window_us;
    const int64_t passed = index - current_index_;
    if (passed <= 0) {
        return;
    }

    if (passed >= n) {
        std::fill(counts_.begin(), counts_.end(), 0u);
    } else {
        for (int64_t i = 1; i <= passed; ++i) {
            counts_[static_cast<size_t>((current_index_ + i) % n)] = 0;
        }
    }
    current_index_ = index;
}

void SegmentedWindow::add(uint32_t weight) {
    counts_[current_segment()] += weight;
}

uint64_t SegmentedWindow::total() const {
    return std::accumulate(counts_.begin(), counts_.end(), uint64_t{0});
}

size_t SegmentedWindow::current_segment() const {
    return static_cast<size_t>(current_index_ % static_cast<int64_t>(counts_.size()));
}

} // namespace mcpgate
