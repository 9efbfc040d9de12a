#include "pool/wait_queue.hpp"

#include <algorithm>

namespace mcpgate {

bool BoundedWaitQueue::push(QueuedRequest request) {
    if (entries_.size() >= max_size_) {
        return false;
    }
    entries_.push_back(std::move(request));
    return true;
}

std::optional<QueuedRequest> BoundedWaitQueue::pop_front() {
    if (entries_.empty()) {
        return std::nullopt;
    }
    auto front = std::move(entries_.front());
    entries_.pop_front();
    return front;
}

std::optional<QueuedRequest> BoundedWaitQueue::remove(uint64_t ticket) {
    const auto it = std::find_if(entries_.begin(), entries_.end(),
        [ticket](const QueuedRequest& r) { return r.ticket == ticket; });
    if (it == entries_.end()) {
        return std::nullopt;
    }
    auto removed = std::move(*it);
    entries_.erase(it);
    return removed;
}

std::vector<QueuedRequest> BoundedWaitQueue::remove_expired(
    TimePoint now, std::chrono::milliseconds max_wait) {

    std::vector<QueuedRequest> expired;
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (now - it->enqueued_at >= max_wait) {
            expired.push_back(std::move(*it));
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    return expired;
}

std::vector<QueuedRequest> BoundedWaitQueue::drain() {
    std::vector<QueuedRequest> all;
    all.reserve(entries_.size());
    for (auto& entry : entries_) {
        all.push_back(std::move(entry));
    }
    entries_.clear();
    return all;
}

} // namespace mcpgate
