#include "pool/connection_pool.hpp"

namespace mcpgate {

ConnectionPool::ConnectionPool(std::string backend, const Config& config)
    : backend_(std::move(backend)),
      config_(config) {}

std::shared_ptr<Connection> ConnectionPool::take_idle(
    const std::string& request_id,
    const std::string& user_id,
    TimePoint now,
    std::vector<std::shared_ptr<Connection>>& retired) {

    while (!idle_.empty()) {
        auto conn = std::move(idle_.front());
        idle_.pop_front();

        if (!conn->is_valid(now, config_.idle_timeout)) {
            retire(conn, retired);
            continue;
        }

        conn->mark_active(request_id, user_id, now);
        active_.emplace(conn->id(), conn);
        return conn;
    }
    return nullptr;
}

bool ConnectionPool::reserve_slot() {
    if (!has_capacity()) {
        return false;
    }
    ++reserved_;
    return true;
}

void ConnectionPool::cancel_reservation() {
    if (reserved_ > 0) {
        --reserved_;
    }
}

void ConnectionPool::commit_created(const std::shared_ptr<Connection>& conn,
                                    const std::string& request_id,
                                    const std::string& user_id,
                                    TimePoint now) {
    cancel_reservation();
    conn->mark_active(request_id, user_id, now);
    active_.emplace(conn->id(), conn);
    ++connections_created_;
}

ConnectionPool::ReleaseOutcome ConnectionPool::begin_return(
    const std::shared_ptr<Connection>& conn,
    TimePoint now) {

    ReleaseOutcome outcome;

    const auto it = active_.find(conn->id());
    if (it == active_.end() || it->second != conn) {
        return outcome;
    }
    active_.erase(it);
    ++reserved_;
    outcome.was_active = true;

    if (const auto state = conn->state(); std::holds_alternative<ConnectionActive>(state)) {
        const auto& active = std::get<ConnectionActive>(state);
        outcome.user_id = active.user_id;
        outcome.request_id = active.request_id;
        outcome.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            now - active.acquired_at);
    }

    conn->mark_idle(now);
    return outcome;
}

bool ConnectionPool::complete_return(const std::shared_ptr<Connection>& conn,
                                     TimePoint now,
                                     bool reusable,
                                     std::vector<std::shared_ptr<Connection>>& retired) {
    cancel_reservation();
    if (reusable && conn->is_valid(now, config_.idle_timeout)) {
        idle_.push_back(conn);
        return true;
    }
    retire(conn, retired);
    return false;
}

size_t ConnectionPool::reap_idle(TimePoint now,
                                 std::vector<std::shared_ptr<Connection>>& retired) {
    size_t reaped = 0;
    for (auto it = idle_.begin(); it != idle_.end(); ) {
        if (!(*it)->is_valid(now, config_.idle_timeout)) {
            retire(*it, retired);
            it = idle_.erase(it);
            ++reaped;
        } else {
            ++it;
        }
    }
    return reaped;
}

std::vector<std::shared_ptr<Connection>> ConnectionPool::drain() {
    std::vector<std::shared_ptr<Connection>> retired;
    for (auto& conn : idle_) {
        retire(conn, retired);
    }
    idle_.clear();
    for (auto& [id, conn] : active_) {
        retire(conn, retired);
    }
    active_.clear();
    return retired;
}

void ConnectionPool::retire(const std::shared_ptr<Connection>& conn,
                            std::vector<std::shared_ptr<Connection>>& retired) {
    conn->mark_discarded();
    ++connections_discarded_;
    retired.push_back(conn);
}

} // namespace mcpgate
