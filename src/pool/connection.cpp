#include "pool/connection.hpp"
#include "core/utils.hpp"

#include <exception>
#include <format>

namespace mcpgate {

Connection::Connection(std::string id,
                       std::string backend,
                       std::shared_ptr<IBackendTransport> transport,
                       TimePoint created_at)
    : id_(std::move(id)),
      backend_(std::move(backend)),
      created_at_(created_at),
      transport_(std::move(transport)),
      last_used_at_(created_at),
      state_(ConnectionIdle{}) {}

TimePoint Connection::last_used_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_used_at_;
}

ConnectionState Connection::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool Connection::is_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::holds_alternative<ConnectionActive>(state_);
}

bool Connection::is_discarded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::holds_alternative<ConnectionDiscarded>(state_);
}

bool Connection::is_valid(TimePoint now, std::chrono::milliseconds idle_timeout) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (std::holds_alternative<ConnectionDiscarded>(state_)) {
            return false;
        }
        // Idle age only applies while parked; an active connection is held by its caller
        if (std::holds_alternative<ConnectionIdle>(state_) &&
            now - last_used_at_ >= idle_timeout) {
            return false;
        }
    }
    return transport_ != nullptr && transport_->is_open();
}

void Connection::mark_active(std::string request_id, std::string user_id, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::holds_alternative<ConnectionDiscarded>(state_)) {
        return;
    }
    last_used_at_ = now;
    state_ = ConnectionActive{std::move(request_id), std::move(user_id), now};
}

void Connection::mark_idle(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::holds_alternative<ConnectionDiscarded>(state_)) {
        return;
    }
    last_used_at_ = now;
    state_ = ConnectionIdle{};
}

void Connection::mark_discarded() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = ConnectionDiscarded{};
}

void Connection::close_transport() noexcept {
    if (!transport_) {
        return;
    }
    try {
        transport_->close();
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Error closing connection {} to '{}': {}",
            id_, backend_, e.what()));
    }
}

bool Connection::reset_transport() noexcept {
    if (!transport_) {
        return false;
    }
    try {
        transport_->reset();
        return true;
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Error resetting connection {} to '{}': {}",
            id_, backend_, e.what()));
        return false;
    }
}

} // namespace mcpgate
