#pragma once

#include "core/error.hpp"
#include "core/task_scheduler.hpp"
#include "core/types.hpp"
#include "pool/connection.hpp"
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpgate {

using AcquireResult = Result<std::shared_ptr<Connection>>;
using AcquireCallback = std::function<void(AcquireResult)>;

/**
 * @brief One suspended acquire waiting for a connection
 */
struct QueuedRequest {
    uint64_t ticket = 0;            // Unique per enqueue (request ids may repeat)
    std::string request_id;
    std::string user_id;
    TimePoint enqueued_at;
    AcquireCallback resolve;
    std::optional<TaskId> timeout_task;
};

/**
 * @brief Bounded FIFO of waiting acquires for one backend
 *
 * Not thread-safe; the owning PoolManager serializes access with the
 * backend's slot lock. Entries are handed back to the caller on removal
 * so their callbacks can be invoked after the lock is dropped.
 */
class BoundedWaitQueue {
public:
    explicit BoundedWaitQueue(size_t max_size) : max_size_(max_size) {}

    /**
     * @brief Append an entry
     * @return false if the queue is already at max_size (entry not added)
     */
    [[nodiscard]] bool push(QueuedRequest request);

    /**
     * @brief Pop the oldest entry
     */
    [[nodiscard]] std::optional<QueuedRequest> pop_front();

    /**
     * @brief Oldest entry; the queue must not be empty
     */
    [[nodiscard]] const QueuedRequest& front() const { return entries_.front(); }

    /**
     * @brief Remove a specific entry (timeout or cancellation)
     */
    [[nodiscard]] std::optional<QueuedRequest> remove(uint64_t ticket);

    /**
     * @brief Remove every entry that has waited at least max_wait
     */
    [[nodiscard]] std::vector<QueuedRequest> remove_expired(TimePoint now,
                                                            std::chrono::milliseconds max_wait);

    /**
     * @brief Remove all entries (shutdown)
     */
    [[nodiscard]] std::vector<QueuedRequest> drain();

    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t max_size() const { return max_size_; }

private:
    size_t max_size_;
    std::deque<QueuedRequest> entries_;
};

} // namespace mcpgate
