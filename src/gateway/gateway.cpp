#include "gateway/gateway.hpp"
#include "core/utils.hpp"

#include <format>

#include <nlohmann/json.hpp>

namespace mcpgate {

namespace {

bool is_initialize(const nlohmann::json& msg) {
    if (!msg.is_object()) {
        return false;
    }
    const auto it = msg.find("method");
    return it != msg.end() && it->is_string() && it->get<std::string>() == "initialize";
}

} // namespace

Gateway::Gateway(std::shared_ptr<BackendRegistry> backends,
                 std::shared_ptr<IRateLimiter> limiter,
                 std::shared_ptr<SessionAuthenticator> authenticator,
                 std::shared_ptr<SessionRegistry> sessions)
    : backends_(std::move(backends)),
      limiter_(std::move(limiter)),
      authenticator_(std::move(authenticator)),
      sessions_(std::move(sessions)) {}

bool Gateway::is_initialize_request(const std::string& body) {
    const auto msg = nlohmann::json::parse(body, nullptr, false);
    return !msg.is_discarded() && is_initialize(msg);
}

std::string Gateway::rate_limit_key(const std::string& user_id, const std::string& backend) {
    return std::format("{}-{}", user_id, backend);
}

GatewayResponse Gateway::handle(const GatewayRequest& request) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    // 1. Resolve backend
    auto resolved = backends_->resolve(request.backend);
    if (resolved.is_error()) {
        return reject(resolved.error());
    }

    if (request.method == GatewayMethod::DELETE) {
        return handle_delete(request);
    }

    const std::string request_id = request.request_id.empty()
        ? utils::generate_uuid() : request.request_id;
    return handle_post(request, request_id);
}

GatewayResponse Gateway::handle_post(const GatewayRequest& request, const std::string& request_id) {
    // 2. Classify
    const auto msg = nlohmann::json::parse(request.body, nullptr, false);
    if (msg.is_discarded()) {
        return reject({ErrorCode::BAD_REQUEST, "Request body is not valid JSON", std::nullopt});
    }

    if (request.session_id.empty()) {
        if (!is_initialize(msg)) {
            return reject({ErrorCode::BAD_REQUEST,
                           "Missing session id and not an initialize request", std::nullopt});
        }
        if (request.credentials.user_id.empty()) {
            return reject({ErrorCode::AUTH_INVALID, "Missing user id", std::nullopt});
        }

        // 3. Rate limit on the claimed identity
        if (auto limited = check_rate_limit(request.credentials.user_id, request.backend)) {
            return reject(std::move(*limited));
        }

        // 4. Authenticate and bind a new session
        auto auth = authenticator_->authenticate(request.credentials, request.backend);
        if (auth.is_error()) {
            utils::log::warn(std::format("Session init for user '{}' on '{}' denied: {}",
                                         request.credentials.user_id, request.backend,
                                         auth.error_message()));
            return reject(auth.error());
        }

        auto created = sessions_->create_session(auth.value(), request.backend, request_id);
        if (created.is_error()) {
            return reject(created.error());
        }
        sessions_initialized_.fetch_add(1, std::memory_order_relaxed);

        auto session = created.value();
        auto response = execute(session, request.body, request_id);
        if (!response.ok()) {
            // The client never learns this session id; give the connection back
            sessions_->terminate(session->id(), "initialize_failed");
        }
        return response;
    }

    auto existing = sessions_->peek(request.session_id);
    if (!existing || existing->backend() != request.backend) {
        // route_to_session counts the invalid lookup and produces the error
        auto routed = sessions_->route_to_session(request.session_id, request.backend);
        return reject(routed.is_error()
            ? routed.error()
            : GatewayError{ErrorCode::INVALID_SESSION, "Unknown session", std::nullopt});
    }

    // 3. Rate limit on the session's authenticated user
    if (auto limited = check_rate_limit(existing->user_id(), request.backend)) {
        return reject(std::move(*limited));
    }

    // 4. Route to the bound session
    auto routed = sessions_->route_to_session(request.session_id, request.backend);
    if (routed.is_error()) {
        return reject(routed.error());
    }
    return execute(routed.value(), request.body, request_id);
}

GatewayResponse Gateway::handle_delete(const GatewayRequest& request) {
    if (request.session_id.empty()) {
        return reject({ErrorCode::BAD_REQUEST, "Missing session id", std::nullopt});
    }

    auto session = sessions_->peek(request.session_id);
    if (!session || session->backend() != request.backend) {
        return reject({ErrorCode::INVALID_SESSION,
                       std::format("Unknown session: {}", request.session_id), std::nullopt});
    }

    sessions_->terminate(request.session_id, "client_terminated");

    GatewayResponse response;
    response.status = 204;
    response.session_id = request.session_id;
    return response;
}

std::optional<GatewayError> Gateway::check_rate_limit(const std::string& user_id,
                                                      const std::string& backend) {
    const auto result = limiter_->check(rate_limit_key(user_id, backend), user_id, backend);
    if (result.allowed) {
        return std::nullopt;
    }

    rate_limited_.fetch_add(1, std::memory_order_relaxed);
    const ErrorCode code = result.gate == RateLimitGate::USER
        ? ErrorCode::USER_RATE_LIMITED : ErrorCode::RATE_LIMITED;
    return GatewayError{code, result.reason, result.retry_after};
}

GatewayResponse Gateway::execute(const std::shared_ptr<Session>& session,
                                 const std::string& body,
                                 const std::string& request_id) {
    const std::string& backend = session->backend();
    RequestContext context{request_id, session->user_id(), session->id(), backend};

    // 5. Execute, one call at a time per session
    BackendReply reply;
    {
        std::lock_guard<std::mutex> lock(session->call_mutex());
        if (session->is_closed()) {
            // Terminated between routing and here; its connection is back in the pool
            return reject({ErrorCode::INVALID_SESSION, "Session was terminated", std::nullopt});
        }
        try {
            reply = session->connection()->transport()->send(body, context);
        } catch (const std::exception& e) {
            utils::log::error(std::format("Backend '{}' send failed for session {}: {}",
                                          backend, session->id(), e.what()));
            reply.success = false;
            reply.error_message = e.what();
        }
        session->record_call(reply.success);
    }

    // 6. Metrics and close handling
    backends_->record_request(backend, reply.success);

    if (reply.closed) {
        sessions_->on_transport_closed(session->id());
    }

    if (!reply.success) {
        backend_errors_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Backend '{}' call {} failed: {}",
                                     backend, request_id, reply.error_message));
        GatewayResponse response;
        response.error = GatewayError{ErrorCode::BACKEND_ERROR,
            reply.closed ? "Backend closed the session" : reply.error_message, std::nullopt};
        response.status = http_status_for(ErrorCode::BACKEND_ERROR);
        return response;
    }

    GatewayResponse response;
    response.session_id = session->id();
    if (reply.body.empty()) {
        response.status = 202;
    } else {
        response.status = 200;
        response.body = std::move(reply.body);
    }
    if (reply.closed) {
        // Delivered the last reply; the session is already gone
        response.session_id.clear();
    }
    return response;
}

GatewayResponse Gateway::reject(GatewayError error) {
    if (error.code != ErrorCode::USER_RATE_LIMITED && error.code != ErrorCode::RATE_LIMITED) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
    }
    GatewayResponse response;
    response.status = http_status_for(error.code);
    response.error = std::move(error);
    return response;
}

Gateway::Stats Gateway::get_stats() const {
    Stats stats;
    stats.total_requests = total_requests_.load(std::memory_order_relaxed);
    stats.sessions_initialized = sessions_initialized_.load(std::memory_order_relaxed);
    stats.rate_limited = rate_limited_.load(std::memory_order_relaxed);
    stats.rejected = rejected_.load(std::memory_order_relaxed);
    stats.backend_errors = backend_errors_.load(std::memory_order_relaxed);
    return stats;
}

} // namespace mcpgate
