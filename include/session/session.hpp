#pragma once

#include "core/types.hpp"
#include "pool/connection.hpp"
#include "session/credential_directory.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace mcpgate {

/**
 * @brief Status snapshot of one live session
 */
struct SessionInfo {
    std::string session_id;
    std::string user_id;
    std::string backend;
    std::string connection_id;
    TimePoint created_at;
    TimePoint last_active_at;
    uint64_t call_count = 0;
};

/**
 * @brief A client conversation bound to one pooled connection
 *
 * The connection stays checked out for the whole session. Calls on one
 * session are serialized through call_mutex(), and closing takes the same
 * lock so the connection is never returned while a call is on it.
 * Activity and outcome tracking is lock-free.
 */
class Session {
public:
    Session(std::string id,
            CredentialRecord credential,
            std::string backend,
            std::shared_ptr<Connection> connection,
            TimePoint now);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] const std::string& user_id() const { return credential_.user_id; }
    [[nodiscard]] const std::string& backend() const { return backend_; }
    [[nodiscard]] const CredentialRecord& credential() const { return credential_; }
    [[nodiscard]] const std::shared_ptr<Connection>& connection() const { return connection_; }
    [[nodiscard]] TimePoint created_at() const { return created_at_; }

    [[nodiscard]] TimePoint last_active_at() const {
        return TimePoint(TimePoint::duration(last_active_.load(std::memory_order_acquire)));
    }

    void touch(TimePoint now) {
        last_active_.store(now.time_since_epoch().count(), std::memory_order_release);
    }

    /**
     * @brief Record the outcome of one routed call
     */
    void record_call(bool success) {
        call_count_.fetch_add(1, std::memory_order_relaxed);
        last_call_failed_.store(!success, std::memory_order_release);
    }

    [[nodiscard]] bool last_call_failed() const {
        return last_call_failed_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint64_t call_count() const {
        return call_count_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::mutex& call_mutex() { return call_mutex_; }

    // Both require call_mutex()
    void mark_closed() { closed_ = true; }
    [[nodiscard]] bool is_closed() const { return closed_; }

    [[nodiscard]] SessionInfo info() const;

private:
    const std::string id_;
    const CredentialRecord credential_;
    const std::string backend_;
    const std::shared_ptr<Connection> connection_;
    const TimePoint created_at_;

    std::atomic<TimePoint::rep> last_active_;
    std::atomic<bool> last_call_failed_{false};
    std::atomic<uint64_t> call_count_{0};
    std::mutex call_mutex_;
    bool closed_ = false;
};

} // namespace mcpgate
