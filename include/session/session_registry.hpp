#pragma once

#include "core/clock.hpp"
#include "core/error.hpp"
#include "core/event_bus.hpp"
#include "core/task_scheduler.hpp"
#include "pool/pool_manager.hpp"
#include "session/session.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mcpgate {

using SessionResult = Result<std::shared_ptr<Session>>;

/**
 * @brief Maps session ids to live sessions and their pooled connections
 *
 * A session is removed exactly once, whichever of explicit termination,
 * backend close, idle expiry, or shutdown gets there first; only the
 * remover releases the connection back to the pool. Lookups never create
 * sessions.
 *
 * Thread-safety: all public methods are thread-safe. Pool release and
 * event publishing happen with no registry lock held.
 */
class SessionRegistry {
public:
    struct Config {
        std::chrono::milliseconds session_timeout{1800000};
        std::chrono::milliseconds sweep_interval{60000};
    };

    struct Stats {
        uint64_t sessions_created = 0;
        uint64_t sessions_terminated = 0;
        uint64_t sessions_expired = 0;
        uint64_t sessions_closed_by_backend = 0;
        uint64_t invalid_lookups = 0;
        size_t active_sessions = 0;
    };

    SessionRegistry(const Config& config,
                    std::shared_ptr<PoolManager> pool,
                    std::shared_ptr<IClock> clock,
                    std::shared_ptr<ITaskScheduler> scheduler,
                    std::shared_ptr<EventBus> events = nullptr);

    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @brief Acquire a connection and bind a new session to it
     *
     * Blocks while the acquire is queued. Pool rejections are returned as-is.
     */
    [[nodiscard]] SessionResult create_session(const CredentialRecord& credential,
                                               const std::string& backend,
                                               const std::string& request_id);

    /**
     * @brief Resolve a session for a continuing call and refresh its activity
     *
     * Fails with INVALID_SESSION when the id is unknown, bound to another
     * backend, or its connection is no longer usable (the session is then
     * terminated).
     */
    [[nodiscard]] SessionResult route_to_session(const std::string& session_id,
                                                 const std::string& backend);

    /**
     * @brief Lookup without touching activity or validating the connection
     */
    [[nodiscard]] std::shared_ptr<Session> peek(const std::string& session_id) const;

    /**
     * @brief Remove a session and release its connection (idempotent)
     * @return true if this call removed the session
     */
    bool terminate(const std::string& session_id, std::string_view reason = "terminated");

    /**
     * @brief Backend-driven close notification
     */
    void on_transport_closed(const std::string& session_id);

    /**
     * @brief Terminate sessions idle longer than session_timeout
     * @return Number of sessions expired
     */
    size_t sweep_idle();

    void start_sweep();

    /**
     * @brief Stop the sweep and terminate every session
     */
    void shutdown();

    [[nodiscard]] std::vector<SessionInfo> list_sessions() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] std::shared_ptr<Session> remove(const std::string& session_id);
    void close_session(const std::shared_ptr<Session>& session, std::string_view reason);
    void publish(const GatewayEvent& event);

    Config config_;
    std::shared_ptr<PoolManager> pool_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<ITaskScheduler> scheduler_;
    std::shared_ptr<EventBus> events_;

    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    mutable std::shared_mutex mutex_;

    std::atomic<uint64_t> created_{0};
    std::atomic<uint64_t> terminated_{0};
    std::atomic<uint64_t> expired_{0};
    std::atomic<uint64_t> closed_by_backend_{0};
    std::atomic<uint64_t> invalid_lookups_{0};

    std::optional<TaskId> sweep_task_;
    std::mutex sweep_task_mutex_;
    std::atomic<bool> shut_down_{false};
};

} // namespace mcpgate
