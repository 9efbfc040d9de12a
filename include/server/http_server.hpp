#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "gateway/gateway.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// Forward-declare httplib types (avoids pulling in the header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace mcpgate {

class BackendRegistry;
class EventBus;
class PoolManager;
class RateLimiter;
class SessionRegistry;
class ShutdownCoordinator;

/**
 * @brief Status, body, and headers for one HTTP reply
 */
struct RenderedResponse {
    int status = 200;
    std::string body;
    std::string content_type;
    std::vector<std::pair<std::string, std::string>> headers;
};

/**
 * @brief HTTP front end for the gateway
 *
 * Routes:
 *   POST   /<backend>/mcp   initialize or continue a session
 *   DELETE /<backend>/mcp   terminate a session
 *   GET    /health          backend health (503 when no backend is healthy)
 *   GET    /metrics         Prometheus text
 *   GET    /                service status with recent events
 *
 * Rejections use a JSON-RPC error envelope (code -32000) whose data carries
 * the error kind and retryAfter; a Retry-After header accompanies any hint.
 */
class HttpServer {
public:
    struct Components {
        std::shared_ptr<Gateway> gateway;
        std::shared_ptr<BackendRegistry> backends;
        std::shared_ptr<PoolManager> pool;
        std::shared_ptr<RateLimiter> limiter;
        std::shared_ptr<SessionRegistry> sessions;
        std::shared_ptr<EventBus> events;
        std::shared_ptr<ShutdownCoordinator> shutdown;
    };

    HttpServer(ServerConfig config, Components components);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind and serve until stop() (blocking)
     * @throws std::runtime_error if the server cannot listen
     */
    void start();

    void stop();

    /**
     * @brief Turn a gateway response into an HTTP reply
     * @param request_body Original JSON-RPC body (its id is echoed in error envelopes)
     */
    [[nodiscard]] static RenderedResponse render(const GatewayResponse& response,
                                                 const std::string& request_body);

    /**
     * @brief JSON-RPC error envelope for a gateway rejection
     */
    [[nodiscard]] static std::string error_envelope(const GatewayError& error,
                                                    const std::string& request_body);

    [[nodiscard]] RenderedResponse build_health() const;
    [[nodiscard]] std::string build_metrics_output() const;
    [[nodiscard]] std::string build_status_json() const;

private:
    void register_routes(httplib::Server& svr);

    void handle_mcp(const httplib::Request& req, httplib::Response& res, GatewayMethod method);
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_metrics(const httplib::Request& req, httplib::Response& res);
    void handle_status(const httplib::Request& req, httplib::Response& res);

    static void apply(const RenderedResponse& rendered, httplib::Response& res);

    const ServerConfig config_;
    Components components_;

    std::mutex server_mutex_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> stop_requested_{false};
};

} // namespace mcpgate
