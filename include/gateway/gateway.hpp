#pragma once

#include "core/error.hpp"
#include "gateway/backend_registry.hpp"
#include "ratelimit/irate_limiter.hpp"
#include "session/session_authenticator.hpp"
#include "session/session_registry.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace mcpgate {

enum class GatewayMethod {
    POST,       // Initialize a session or continue one
    DELETE      // Terminate a session
};

/**
 * @brief One inbound call, already stripped of HTTP framing
 */
struct GatewayRequest {
    GatewayMethod method = GatewayMethod::POST;
    std::string backend;
    std::string session_id;         // Empty when the client sent none
    std::string body;
    InitCredentials credentials;
    std::string request_id;         // Generated when empty
};

struct GatewayResponse {
    int status = 200;
    std::string body;               // Backend reply (JSON-RPC); empty on 202/204 and errors
    std::string session_id;         // Set on every successful call bound to a session
    std::optional<GatewayError> error;

    [[nodiscard]] bool ok() const { return !error.has_value(); }
};

/**
 * @brief Request pipeline: resolve -> classify -> rate-limit -> bind session -> execute
 *
 * Pipeline per call:
 * 1. Resolve backend (BACKEND_NOT_FOUND / BACKEND_CRASHED)
 * 2. Classify: a call without a session must be an `initialize` request;
 *    a presented session must exist and belong to the backend. Rejected
 *    here before any limiter or pool work.
 * 3. Rate limit with key "<user>-<backend>"
 * 4. Initialize: authenticate, then create a session (acquires a pooled
 *    connection). Continue: route to the existing session.
 * 5. Execute on the session's connection, serialized per session
 * 6. Record backend metrics; a backend-driven close ends the session
 *
 * Mid-session calls keep the connection checked out. Only DELETE, a
 * backend close, the idle sweep, or shutdown give it back.
 */
class Gateway {
public:
    struct Stats {
        uint64_t total_requests = 0;
        uint64_t sessions_initialized = 0;
        uint64_t rate_limited = 0;
        uint64_t rejected = 0;          // Every other rejection
        uint64_t backend_errors = 0;
    };

    Gateway(std::shared_ptr<BackendRegistry> backends,
            std::shared_ptr<IRateLimiter> limiter,
            std::shared_ptr<SessionAuthenticator> authenticator,
            std::shared_ptr<SessionRegistry> sessions);

    [[nodiscard]] GatewayResponse handle(const GatewayRequest& request);

    [[nodiscard]] Stats get_stats() const;

    /**
     * @brief Whether a JSON-RPC body is an `initialize` request
     */
    [[nodiscard]] static bool is_initialize_request(const std::string& body);

    /**
     * @brief Composite rate-limit key for a user on a backend
     */
    [[nodiscard]] static std::string rate_limit_key(const std::string& user_id,
                                                    const std::string& backend);

private:
    GatewayResponse handle_post(const GatewayRequest& request, const std::string& request_id);
    GatewayResponse handle_delete(const GatewayRequest& request);

    [[nodiscard]] std::optional<GatewayError> check_rate_limit(const std::string& user_id,
                                                               const std::string& backend);

    GatewayResponse execute(const std::shared_ptr<Session>& session,
                            const std::string& body,
                            const std::string& request_id);

    GatewayResponse reject(GatewayError error);

    std::shared_ptr<BackendRegistry> backends_;
    std::shared_ptr<IRateLimiter> limiter_;
    std::shared_ptr<SessionAuthenticator> authenticator_;
    std::shared_ptr<SessionRegistry> sessions_;

    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> sessions_initialized_{0};
    std::atomic<uint64_t> rate_limited_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> backend_errors_{0};
};

} // namespace mcpgate
