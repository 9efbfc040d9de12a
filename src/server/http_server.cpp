#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "server/shutdown_coordinator.hpp"
#include "core/event_bus.hpp"
#include "core/utils.hpp"
#include "gateway/backend_registry.hpp"
#include "pool/pool_manager.hpp"
#include "ratelimit/rate_limiter.hpp"
#include "session/session_registry.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>
#include <stdexcept>
#include <string_view>

namespace mcpgate {

using json = nlohmann::json;

namespace {

constexpr const char* kServiceName = "mcp-gateway";
constexpr const char* kServiceVersion = "1.0.0";

/// JSON-RPC id of the request, or null when the body has none
json request_id_of(const std::string& body) {
    const auto msg = json::parse(body, nullptr, false);
    if (msg.is_discarded() || !msg.is_object()) {
        return nullptr;
    }
    const auto it = msg.find("id");
    return it != msg.end() ? *it : json(nullptr);
}

std::string bearer_token(const httplib::Request& req) {
    const std::string auth = req.get_header_value(http::kAuthorizationHeader);
    if (auth.size() <= http::kBearerPrefix.size() ||
        std::string_view(auth).substr(0, http::kBearerPrefix.size()) != http::kBearerPrefix) {
        return {};
    }
    return auth.substr(http::kBearerPrefix.size());
}

/// Event payload for the status endpoint
struct EventJson {
    json operator()(const PoolInitialized& e) const {
        return {{"backend", e.backend}, {"max_connections", e.max_connections}};
    }
    json operator()(const ConnectionReleased& e) const {
        return {{"backend", e.backend}, {"connection_id", e.connection_id},
                {"user_id", e.user_id}, {"latency_ms", e.latency.count()}, {"success", e.success}};
    }
    json operator()(const RateLimitHit& e) const {
        return {{"gate", rate_limit_gate_name(e.gate)}, {"key", e.key}};
    }
    json operator()(const AdaptiveAdjustment& e) const {
        return {{"key", e.key},
                {"direction", e.direction == AdjustmentDirection::REDUCE ? "reduce" : "increase"},
                {"new_limit", e.new_limit}, {"avg_load", e.avg_load}};
    }
    json operator()(const CleanupCompleted& e) const {
        return {{"component", e.component}, {"removed", e.removed}};
    }
    json operator()(const CircuitStateChanged& e) const {
        return {{"backend", e.backend}, {"from", circuit_state_name(e.from)},
                {"to", circuit_state_name(e.to)}};
    }
    json operator()(const SessionOpened& e) const {
        return {{"session_id", e.session_id}, {"backend", e.backend}, {"user_id", e.user_id}};
    }
    json operator()(const SessionClosed& e) const {
        return {{"session_id", e.session_id}, {"backend", e.backend}, {"reason", e.reason}};
    }
};

} // anonymous namespace

// ============================================================================
// Constructor
// ============================================================================

HttpServer::HttpServer(ServerConfig config, Components components)
    : config_(std::move(config)),
      components_(std::move(components)) {
    if (!components_.gateway || !components_.backends || !components_.pool ||
        !components_.limiter || !components_.sessions) {
        throw std::invalid_argument("HttpServer requires gateway, backends, pool, limiter, and sessions");
    }
}

HttpServer::~HttpServer() = default;

// ============================================================================
// start() / stop()
// ============================================================================

void HttpServer::start() {
    std::unique_ptr<httplib::Server> svr_ptr;
    if (config_.tls.enabled) {
        auto ssl_svr = std::make_unique<httplib::SSLServer>(
            config_.tls.cert_file.c_str(), config_.tls.key_file.c_str());
        if (!ssl_svr->is_valid()) {
            throw std::runtime_error(std::format("Failed to load TLS certificate {} / key {}",
                                                 config_.tls.cert_file, config_.tls.key_file));
        }
        utils::log::info(std::format("TLS enabled: cert={}, key={}",
                                     config_.tls.cert_file, config_.tls.key_file));
        svr_ptr = std::move(ssl_svr);
    } else {
        svr_ptr = std::make_unique<httplib::Server>();
    }
    auto& svr = *svr_ptr;

    const size_t pool_size = config_.thread_pool_size;
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };
    svr.set_payload_max_length(config_.max_request_bytes);

    register_routes(svr);

    {
        std::lock_guard<std::mutex> lock(server_mutex_);
        if (stop_requested_.load(std::memory_order_acquire)) {
            return;
        }
        server_ = std::move(svr_ptr);
    }

    utils::log::info(std::format("Starting MCP gateway on {}:{} ({}, {} threads)",
        config_.host, config_.port, config_.tls.enabled ? "HTTPS" : "HTTP",
        config_.thread_pool_size));

    if (!svr.listen(config_.host, config_.port)) {
        if (stop_requested_.load(std::memory_order_acquire)) {
            return;
        }
        throw std::runtime_error(std::format("Failed to listen on {}:{}", config_.host, config_.port));
    }
}

void HttpServer::stop() {
    stop_requested_.store(true, std::memory_order_release);
    std::lock_guard<std::mutex> lock(server_mutex_);
    if (server_) {
        server_->stop();
        utils::log::info("HTTP server stopped");
    }
}

// ============================================================================
// Routes
// ============================================================================

void HttpServer::register_routes(httplib::Server& svr) {
    svr.Post(R"(/([^/]+)/mcp)", [this](const httplib::Request& req, httplib::Response& res) {
        handle_mcp(req, res, GatewayMethod::POST);
    });
    svr.Delete(R"(/([^/]+)/mcp)", [this](const httplib::Request& req, httplib::Response& res) {
        handle_mcp(req, res, GatewayMethod::DELETE);
    });
    svr.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    svr.Get("/metrics", [this](const httplib::Request& req, httplib::Response& res) {
        handle_metrics(req, res);
    });
    svr.Get("/", [this](const httplib::Request& req, httplib::Response& res) {
        handle_status(req, res);
    });
}

// ============================================================================
// Handler: POST|DELETE /<backend>/mcp
// ============================================================================

void HttpServer::handle_mcp(const httplib::Request& req, httplib::Response& res,
                            GatewayMethod method) {
    auto* shutdown = components_.shutdown.get();
    if (shutdown && !shutdown->try_enter_request()) {
        apply(render(GatewayResponse{
            http_status_for(ErrorCode::SHUTTING_DOWN), {}, {},
            GatewayError{ErrorCode::SHUTTING_DOWN, "Server shutting down", std::nullopt}}, req.body), res);
        return;
    }
    RequestGuard guard(shutdown);

    try {
        if (method == GatewayMethod::POST &&
            req.get_header_value("Content-Type").find(http::kJsonContentType) == std::string::npos) {
            apply(render(GatewayResponse{
                http_status_for(ErrorCode::BAD_REQUEST), {}, {},
                GatewayError{ErrorCode::BAD_REQUEST, "Content-Type must be application/json",
                             std::nullopt}}, req.body), res);
            return;
        }

        GatewayRequest request;
        request.method = method;
        request.backend = req.matches[1].str();
        request.session_id = req.get_header_value(http::kSessionIdHeader);
        request.body = req.body;
        request.credentials.service_secret = bearer_token(req);
        request.credentials.user_id = req.get_header_value(http::kUserIdHeader);
        request.credentials.api_key = req.get_header_value(http::kApiKeyHeader);
        request.request_id = req.get_header_value(http::kRequestIdHeader);

        utils::Timer timer;
        const auto response = components_.gateway->handle(request);
        if (!response.ok()) {
            utils::log::warn(std::format("{} /{}/mcp -> {} {} ({}ms)",
                method == GatewayMethod::POST ? "POST" : "DELETE", request.backend,
                response.status, error_code_name(response.error->code), timer.elapsed_ms().count()));
        }
        apply(render(response, req.body), res);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Request handling error: {}", e.what()));
        apply(render(GatewayResponse{
            http_status_for(ErrorCode::INTERNAL_ERROR), {}, {},
            GatewayError{ErrorCode::INTERNAL_ERROR, "Internal server error", std::nullopt}}, req.body), res);
    }
}

RenderedResponse HttpServer::render(const GatewayResponse& response, const std::string& request_body) {
    RenderedResponse rendered;
    rendered.status = response.status;

    if (!response.ok()) {
        const auto& error = *response.error;
        rendered.body = error_envelope(error, request_body);
        rendered.content_type = http::kJsonContentType;
        if (error.retry_after) {
            const auto seconds = std::max<int64_t>(1, error.retry_after->count());
            rendered.headers.emplace_back(http::kRetryAfterHeader, std::to_string(seconds));
        }
        return rendered;
    }

    if (!response.session_id.empty()) {
        rendered.headers.emplace_back(http::kSessionIdHeader, response.session_id);
    }
    if (!response.body.empty()) {
        rendered.body = response.body;
        rendered.content_type = http::kJsonContentType;
    }
    return rendered;
}

std::string HttpServer::error_envelope(const GatewayError& error, const std::string& request_body) {
    json data = {{"kind", error_code_name(error.code)}};
    if (error.retry_after) {
        data["retryAfter"] = error.retry_after->count();
    }
    return json{
        {"jsonrpc", "2.0"},
        {"id", request_id_of(request_body)},
        {"error", {
            {"code", http::kGatewayErrorCode},
            {"message", error.message},
            {"data", std::move(data)}
        }}
    }.dump();
}

void HttpServer::apply(const RenderedResponse& rendered, httplib::Response& res) {
    res.status = rendered.status;
    for (const auto& [name, value] : rendered.headers) {
        res.set_header(name, value);
    }
    if (!rendered.body.empty()) {
        res.set_content(rendered.body, rendered.content_type);
    }
}

// ============================================================================
// Handler: GET /health
// ============================================================================

void HttpServer::handle_health(const httplib::Request&, httplib::Response& res) {
    apply(build_health(), res);
}

RenderedResponse HttpServer::build_health() const {
    json backends = json::array();
    for (const auto& info : components_.backends->list()) {
        json entry = {{"name", info.name}, {"type", info.type},
                      {"status", backend_status_name(info.status)}};
        if (info.status == BackendStatus::CRASHED) {
            entry["crash_reason"] = info.crash_reason;
        }
        backends.push_back(std::move(entry));
    }

    const size_t healthy = components_.backends->healthy_count();
    const bool shutting_down = components_.shutdown && components_.shutdown->is_shutting_down();
    const bool ok = healthy > 0 && !shutting_down;

    RenderedResponse rendered;
    rendered.status = ok ? 200 : 503;
    rendered.content_type = http::kJsonContentType;
    rendered.body = json{
        {"status", shutting_down ? "shutting_down" : (ok ? "healthy" : "unhealthy")},
        {"service", kServiceName},
        {"healthy_backends", healthy},
        {"active_sessions", components_.sessions->size()},
        {"backends", std::move(backends)}
    }.dump();
    return rendered;
}

// ============================================================================
// Handler: GET /metrics
// ============================================================================

void HttpServer::handle_metrics(const httplib::Request&, httplib::Response& res) {
    res.set_content(build_metrics_output(), "text/plain; version=0.0.4; charset=utf-8");
}

std::string HttpServer::build_metrics_output() const {
    std::string output;

    const auto gs = components_.gateway->get_stats();
    output += std::format(
        "# HELP mcpgate_requests_total Requests handled by the gateway\n"
        "# TYPE mcpgate_requests_total counter\n"
        "mcpgate_requests_total {}\n\n"
        "# HELP mcpgate_requests_rejected_total Requests rejected by kind\n"
        "# TYPE mcpgate_requests_rejected_total counter\n"
        "mcpgate_requests_rejected_total{{kind=\"rate_limited\"}} {}\n"
        "mcpgate_requests_rejected_total{{kind=\"other\"}} {}\n"
        "mcpgate_requests_rejected_total{{kind=\"backend_error\"}} {}\n\n",
        gs.total_requests, gs.rate_limited, gs.rejected, gs.backend_errors);

    const auto rl = components_.limiter->get_stats();
    output += std::format(
        "# HELP mcpgate_rate_limit_checks_total Rate limit checks performed\n"
        "# TYPE mcpgate_rate_limit_checks_total counter\n"
        "mcpgate_rate_limit_checks_total {}\n\n"
        "# HELP mcpgate_rate_limit_rejects_total Rate limit rejections by gate\n"
        "# TYPE mcpgate_rate_limit_rejects_total counter\n"
        "mcpgate_rate_limit_rejects_total{{gate=\"user\"}} {}\n"
        "mcpgate_rate_limit_rejects_total{{gate=\"backend\"}} {}\n"
        "mcpgate_rate_limit_rejects_total{{gate=\"bucket\"}} {}\n"
        "mcpgate_rate_limit_rejects_total{{gate=\"window\"}} {}\n\n"
        "# HELP mcpgate_rate_limit_adaptive_adjustments_total Adaptive capacity changes\n"
        "# TYPE mcpgate_rate_limit_adaptive_adjustments_total counter\n"
        "mcpgate_rate_limit_adaptive_adjustments_total {}\n\n"
        "# HELP mcpgate_rate_limit_keys Live composite rate-limit keys\n"
        "# TYPE mcpgate_rate_limit_keys gauge\n"
        "mcpgate_rate_limit_keys {}\n\n",
        rl.total_checks, rl.user_rejects, rl.backend_rejects, rl.bucket_rejects,
        rl.window_rejects, rl.adaptive_adjustments, rl.active_keys);

    const auto ps = components_.pool->get_status();
    output += std::format(
        "# HELP mcpgate_pool_active_connections Connections checked out, all backends\n"
        "# TYPE mcpgate_pool_active_connections gauge\n"
        "mcpgate_pool_active_connections {}\n\n"
        "# HELP mcpgate_pool_queued_requests Requests waiting for a connection\n"
        "# TYPE mcpgate_pool_queued_requests gauge\n"
        "mcpgate_pool_queued_requests {}\n\n"
        "# HELP mcpgate_pool_queue_timeouts_total Queued requests that timed out\n"
        "# TYPE mcpgate_pool_queue_timeouts_total counter\n"
        "mcpgate_pool_queue_timeouts_total {}\n\n",
        ps.total_active, ps.queued_requests, ps.queue_timeouts);

    output += "# HELP mcpgate_backend_connections Pooled connections by state\n"
              "# TYPE mcpgate_backend_connections gauge\n";
    for (const auto& b : ps.backends) {
        output += std::format(
            "mcpgate_backend_connections{{backend=\"{}\",state=\"active\"}} {}\n"
            "mcpgate_backend_connections{{backend=\"{}\",state=\"idle\"}} {}\n",
            b.name, b.active_connections, b.name, b.idle_connections);
    }
    output += "\n# HELP mcpgate_backend_requests_total Released requests by outcome\n"
              "# TYPE mcpgate_backend_requests_total counter\n";
    for (const auto& b : ps.backends) {
        output += std::format(
            "mcpgate_backend_requests_total{{backend=\"{}\",outcome=\"success\"}} {}\n"
            "mcpgate_backend_requests_total{{backend=\"{}\",outcome=\"failure\"}} {}\n",
            b.name, b.metrics.successful_requests, b.name, b.metrics.failed_requests);
    }
    output += "\n# HELP mcpgate_backend_latency_ms Rolling average latency\n"
              "# TYPE mcpgate_backend_latency_ms gauge\n";
    for (const auto& b : ps.backends) {
        output += std::format("mcpgate_backend_latency_ms{{backend=\"{}\"}} {:.2f}\n",
                              b.name, b.metrics.average_latency_ms);
    }
    output += "\n# HELP mcpgate_circuit_breaker_state 0=closed 1=open 2=half_open\n"
              "# TYPE mcpgate_circuit_breaker_state gauge\n";
    for (const auto& b : ps.backends) {
        output += std::format("mcpgate_circuit_breaker_state{{backend=\"{}\"}} {}\n",
                              b.name, static_cast<int>(b.breaker_state));
    }

    const auto ss = components_.sessions->get_stats();
    output += std::format(
        "\n# HELP mcpgate_sessions_active Live sessions\n"
        "# TYPE mcpgate_sessions_active gauge\n"
        "mcpgate_sessions_active {}\n\n"
        "# HELP mcpgate_sessions_total Session lifecycle counts\n"
        "# TYPE mcpgate_sessions_total counter\n"
        "mcpgate_sessions_total{{event=\"created\"}} {}\n"
        "mcpgate_sessions_total{{event=\"terminated\"}} {}\n"
        "mcpgate_sessions_total{{event=\"expired\"}} {}\n"
        "mcpgate_sessions_total{{event=\"closed_by_backend\"}} {}\n",
        ss.active_sessions, ss.sessions_created, ss.sessions_terminated,
        ss.sessions_expired, ss.sessions_closed_by_backend);

    return output;
}

// ============================================================================
// Handler: GET /
// ============================================================================

void HttpServer::handle_status(const httplib::Request&, httplib::Response& res) {
    res.set_content(build_status_json(), http::kJsonContentType);
}

std::string HttpServer::build_status_json() const {
    json backends = json::array();
    for (const auto& info : components_.backends->list()) {
        json entry = {
            {"name", info.name},
            {"type", info.type},
            {"status", backend_status_name(info.status)},
            {"endpoint", std::format("/{}/mcp", info.name)},
            {"request_count", info.request_count},
            {"error_count", info.error_count},
            {"registered_at", utils::format_timestamp(info.registered_at)}
        };
        if (info.last_activity) {
            entry["last_activity"] = utils::format_timestamp(*info.last_activity);
        }
        backends.push_back(std::move(entry));
    }

    json events = json::array();
    if (components_.events) {
        for (const auto& recorded : components_.events->recent_events()) {
            events.push_back({
                {"type", event_type_name(recorded.event)},
                {"timestamp", utils::format_timestamp(recorded.timestamp)},
                {"data", std::visit(EventJson{}, recorded.event)}
            });
        }
    }

    return json{
        {"service", kServiceName},
        {"version", kServiceVersion},
        {"backends", std::move(backends)},
        {"active_sessions", components_.sessions->size()},
        {"active_connections", components_.pool->total_active()},
        {"recent_events", std::move(events)}
    }.dump();
}

} // namespace mcpgate
