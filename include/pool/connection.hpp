#pragma once

#include "core/types.hpp"
#include "pool/ibackend_transport.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <variant>

namespace mcpgate {

// ============================================================================
// Connection States
// ============================================================================

struct ConnectionIdle {};

struct ConnectionActive {
    std::string request_id;
    std::string user_id;
    TimePoint acquired_at;
};

struct ConnectionDiscarded {};

using ConnectionState = std::variant<ConnectionIdle, ConnectionActive, ConnectionDiscarded>;

/**
 * @brief Logical pool slot wrapping one live backend transport
 *
 * State changes are made by the owning ConnectionPool only. Once
 * discarded a connection never becomes idle or active again.
 */
class Connection {
public:
    Connection(std::string id,
               std::string backend,
               std::shared_ptr<IBackendTransport> transport,
               TimePoint created_at);

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] const std::string& backend() const { return backend_; }
    [[nodiscard]] TimePoint created_at() const { return created_at_; }
    [[nodiscard]] TimePoint last_used_at() const;

    [[nodiscard]] ConnectionState state() const;
    [[nodiscard]] bool is_active() const;
    [[nodiscard]] bool is_discarded() const;

    /**
     * @brief Reusable: not discarded, idle for less than idle_timeout, transport live
     */
    [[nodiscard]] bool is_valid(TimePoint now, std::chrono::milliseconds idle_timeout) const;

    /**
     * @brief Transport handle (shared so a session can use it outside pool locks)
     */
    [[nodiscard]] std::shared_ptr<IBackendTransport> transport() const { return transport_; }

    // ---- Pool-side transitions ----

    void mark_active(std::string request_id, std::string user_id, TimePoint now);
    void mark_idle(TimePoint now);
    void mark_discarded();

    /**
     * @brief Close the transport; failures are logged, never thrown
     */
    void close_transport() noexcept;

    /**
     * @brief Reset the transport for the next holder
     * @return false if the reset failed and the connection must not be reused
     */
    [[nodiscard]] bool reset_transport() noexcept;

private:
    const std::string id_;
    const std::string backend_;
    const TimePoint created_at_;
    std::shared_ptr<IBackendTransport> transport_;

    mutable std::mutex mutex_;
    TimePoint last_used_at_;
    ConnectionState state_;
};

} // namespace mcpgate
