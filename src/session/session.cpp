#include "session/session.hpp"

namespace mcpgate {

Session::Session(std::string id,
                 CredentialRecord credential,
                 std::string backend,
                 std::shared_ptr<Connection> connection,
                 TimePoint now)
    : id_(std::move(id)),
      credential_(std::move(credential)),
      backend_(std::move(backend)),
      connection_(std::move(connection)),
      created_at_(now),
      last_active_(now.time_since_epoch().count()) {}

SessionInfo Session::info() const {
    SessionInfo info;
    info.session_id = id_;
    info.user_id = credential_.user_id;
    info.backend = backend_;
    info.connection_id = connection_ ? connection_->id() : std::string{};
    info.created_at = created_at_;
    info.last_active_at = last_active_at();
    info.call_count = call_count();
    return info;
}

} // namespace mcpgate
