#include "session/session_registry.hpp"
#include "core/utils.hpp"

#include <format>

namespace mcpgate {

SessionRegistry::SessionRegistry(const Config& config,
                                 std::shared_ptr<PoolManager> pool,
                                 std::shared_ptr<IClock> clock,
                                 std::shared_ptr<ITaskScheduler> scheduler,
                                 std::shared_ptr<EventBus> events)
    : config_(config),
      pool_(std::move(pool)),
      clock_(std::move(clock)),
      scheduler_(std::move(scheduler)),
      events_(std::move(events)) {}

SessionRegistry::~SessionRegistry() {
    shutdown();
}

// ============================================================================
// Lifecycle
// ============================================================================

SessionResult SessionRegistry::create_session(const CredentialRecord& credential,
                                              const std::string& backend,
                                              const std::string& request_id) {
    if (shut_down_.load(std::memory_order_acquire)) {
        return SessionResult::error(ErrorCode::SHUTTING_DOWN, "Session registry is shutting down");
    }

    auto acquired = pool_->acquire(backend, credential.user_id, request_id);
    if (acquired.is_error()) {
        return SessionResult::error(acquired.error());
    }

    auto session = std::make_shared<Session>(utils::generate_uuid(), credential, backend,
                                             acquired.value(), clock_->now());
    bool inserted = false;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        inserted = sessions_.try_emplace(session->id(), session).second;
    }
    if (!inserted) {
        pool_->release(session->connection(), true);
        return SessionResult::error(ErrorCode::INTERNAL_ERROR, "Session id collision");
    }

    // Lost a race with shutdown(): undo
    if (shut_down_.load(std::memory_order_acquire)) {
        terminate(session->id(), "shutdown");
        return SessionResult::error(ErrorCode::SHUTTING_DOWN, "Session registry is shutting down");
    }

    created_.fetch_add(1, std::memory_order_relaxed);
    utils::log::info(std::format("Session {} opened: user='{}' backend='{}' connection={}",
                                 session->id(), session->user_id(), backend,
                                 session->connection()->id()));
    publish(SessionOpened{session->id(), backend, session->user_id()});
    return SessionResult::ok(std::move(session));
}

SessionResult SessionRegistry::route_to_session(const std::string& session_id,
                                                const std::string& backend) {
    auto session = peek(session_id);
    if (!session) {
        invalid_lookups_.fetch_add(1, std::memory_order_relaxed);
        return SessionResult::error(ErrorCode::INVALID_SESSION, "Invalid or missing session ID");
    }

    if (session->backend() != backend) {
        invalid_lookups_.fetch_add(1, std::memory_order_relaxed);
        return SessionResult::error(ErrorCode::INVALID_SESSION,
            std::format("Session belongs to backend '{}'", session->backend()));
    }

    const TimePoint now = clock_->now();
    if (!session->connection()->is_valid(now, pool_->config().idle_timeout)) {
        terminate(session_id, "connection_lost");
        invalid_lookups_.fetch_add(1, std::memory_order_relaxed);
        return SessionResult::error(ErrorCode::INVALID_SESSION,
            "Session connection is no longer valid; re-initialize");
    }

    session->touch(now);
    return SessionResult::ok(std::move(session));
}

std::shared_ptr<Session> SessionRegistry::peek(const std::string& session_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = sessions_.find(session_id);
    return it != sessions_.end() ? it->second : nullptr;
}

bool SessionRegistry::terminate(const std::string& session_id, std::string_view reason) {
    auto session = remove(session_id);
    if (!session) {
        return false;
    }
    close_session(session, reason);
    return true;
}

void SessionRegistry::on_transport_closed(const std::string& session_id) {
    if (terminate(session_id, "backend_closed")) {
        closed_by_backend_.fetch_add(1, std::memory_order_relaxed);
    }
}

size_t SessionRegistry::sweep_idle() {
    const TimePoint now = clock_->now();

    std::vector<std::shared_ptr<Session>> idle;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (now - it->second->last_active_at() > config_.session_timeout) {
                idle.push_back(std::move(it->second));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& session : idle) {
        close_session(session, "expired");
    }
    expired_.fetch_add(idle.size(), std::memory_order_relaxed);

    if (!idle.empty()) {
        utils::log::info(std::format("Session sweep expired {} idle sessions", idle.size()));
    }
    publish(CleanupCompleted{"sessions", idle.size()});
    return idle.size();
}

void SessionRegistry::start_sweep() {
    std::lock_guard<std::mutex> lock(sweep_task_mutex_);
    if (sweep_task_ || shut_down_.load(std::memory_order_acquire)) {
        return;
    }
    sweep_task_ = scheduler_->schedule_every(config_.sweep_interval, [this]() { sweep_idle(); });
}

void SessionRegistry::shutdown() {
    if (shut_down_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(sweep_task_mutex_);
        if (sweep_task_) {
            scheduler_->cancel(*sweep_task_);
            sweep_task_.reset();
        }
    }

    std::unordered_map<std::string, std::shared_ptr<Session>> remaining;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        remaining.swap(sessions_);
    }

    for (const auto& [_, session] : remaining) {
        close_session(session, "shutdown");
    }
    utils::log::info(std::format("SessionRegistry shut down: {} sessions closed", remaining.size()));
}

// ============================================================================
// Status
// ============================================================================

std::vector<SessionInfo> SessionRegistry::list_sessions() const {
    std::vector<SessionInfo> infos;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    infos.reserve(sessions_.size());
    for (const auto& [_, session] : sessions_) {
        infos.push_back(session->info());
    }
    return infos;
}

size_t SessionRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sessions_.size();
}

SessionRegistry::Stats SessionRegistry::get_stats() const {
    Stats stats;
    stats.sessions_created = created_.load(std::memory_order_relaxed);
    stats.sessions_terminated = terminated_.load(std::memory_order_relaxed);
    stats.sessions_expired = expired_.load(std::memory_order_relaxed);
    stats.sessions_closed_by_backend = closed_by_backend_.load(std::memory_order_relaxed);
    stats.invalid_lookups = invalid_lookups_.load(std::memory_order_relaxed);
    stats.active_sessions = size();
    return stats;
}

// ============================================================================
// Helpers
// ============================================================================

std::shared_ptr<Session> SessionRegistry::remove(const std::string& session_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    auto session = std::move(it->second);
    sessions_.erase(it);
    return session;
}

void SessionRegistry::close_session(const std::shared_ptr<Session>& session,
                                    std::string_view reason) {
    terminated_.fetch_add(1, std::memory_order_relaxed);
    {
        // Waits out a call still running on the connection
        std::lock_guard<std::mutex> lock(session->call_mutex());
        session->mark_closed();
    }
    pool_->release(session->connection(), !session->last_call_failed());

    utils::log::info(std::format("Session {} closed ({}): backend='{}' calls={}",
                                 session->id(), reason, session->backend(),
                                 session->call_count()));
    publish(SessionClosed{session->id(), session->backend(), std::string(reason)});
}

void SessionRegistry::publish(const GatewayEvent& event) {
    if (events_) {
        events_->publish(event);
    }
}

} // namespace mcpgate
