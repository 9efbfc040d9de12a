#include "gateway/http_backend.hpp"
#include "core/utils.hpp"
#include "server/http_constants.hpp"

#include <charconv>
#include <format>
#include <stdexcept>

#include <httplib.h>

namespace mcpgate {

// ============================================================================
// UpstreamEndpoint
// ============================================================================

std::string UpstreamEndpoint::scheme_host() const {
    return std::format("{}{}:{}", use_ssl ? "https://" : "http://", host, port);
}

UpstreamEndpoint UpstreamEndpoint::parse(const std::string& url) {
    UpstreamEndpoint ep;
    std::string rest;

    if (url.starts_with("https://")) {
        ep.use_ssl = true;
        ep.port = 443;
        rest = url.substr(8);
    } else if (url.starts_with("http://")) {
        rest = url.substr(7);
    } else {
        throw std::invalid_argument(std::format("Unsupported upstream URL scheme: '{}'", url));
    }

    const auto path_pos = rest.find('/');
    if (path_pos != std::string::npos) {
        ep.host = rest.substr(0, path_pos);
        ep.path = rest.substr(path_pos);
    } else {
        ep.host = rest;
    }

    const auto port_pos = ep.host.find(':');
    if (port_pos != std::string::npos) {
        const std::string port_str = ep.host.substr(port_pos + 1);
        int port = 0;
        const auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
        if (ec != std::errc{} || ptr != port_str.data() + port_str.size() || port <= 0 || port > 65535) {
            throw std::invalid_argument(std::format("Invalid port in upstream URL: '{}'", url));
        }
        ep.port = port;
        ep.host = ep.host.substr(0, port_pos);
    }

    if (ep.host.empty()) {
        throw std::invalid_argument(std::format("Missing host in upstream URL: '{}'", url));
    }
    return ep;
}

// ============================================================================
// HttpBackend
// ============================================================================

HttpBackend::HttpBackend(Config config)
    : config_(std::move(config)) {}

void HttpBackend::initialize() {
    endpoint_ = UpstreamEndpoint::parse(config_.url);
    if (!config_.path.empty()) {
        endpoint_.path = config_.path;
    }
    utils::log::info(std::format("HTTP backend '{}' -> {}{}",
                                 config_.name, endpoint_.scheme_host(), endpoint_.path));
}

std::shared_ptr<IBackendTransport> HttpBackend::create_transport() {
    return std::make_shared<HttpTransport>(endpoint_, config_.connect_timeout,
                                           config_.request_timeout);
}

// ============================================================================
// HttpTransport
// ============================================================================

HttpTransport::HttpTransport(const UpstreamEndpoint& endpoint,
                             std::chrono::milliseconds connect_timeout,
                             std::chrono::milliseconds request_timeout)
    : path_(endpoint.path),
      client_(std::make_unique<httplib::Client>(endpoint.scheme_host())) {
    client_->set_connection_timeout(connect_timeout);
    client_->set_read_timeout(request_timeout);
    client_->set_write_timeout(request_timeout);
    client_->set_keep_alive(true);
}

HttpTransport::~HttpTransport() = default;

BackendReply HttpTransport::send(const std::string& request, const RequestContext& context) {
    BackendReply reply;
    if (!is_open()) {
        reply.closed = true;
        reply.error_message = "transport closed";
        return reply;
    }

    httplib::Headers headers{
        {"Accept", "application/json, text/event-stream"},
        {http::kRequestIdHeader, context.request_id},
        {http::kUserIdHeader, context.user_id},
    };
    const std::string upstream_session = upstream_session_id();
    if (!upstream_session.empty()) {
        headers.emplace(http::kSessionIdHeader, upstream_session);
    }

    auto res = client_->Post(path_, headers, request, http::kJsonContentType);
    if (!res) {
        // Upstream unreachable: this transport is finished
        reply.error_message = httplib::to_string(res.error());
        reply.closed = true;
        open_.store(false, std::memory_order_release);
        return reply;
    }

    if (res->has_header(http::kSessionIdHeader)) {
        std::lock_guard<std::mutex> lock(mutex_);
        upstream_session_ = res->get_header_value(http::kSessionIdHeader);
    }

    // The upstream forgot our session
    if (res->status == 404 && !upstream_session.empty()) {
        reply.error_message = "upstream session expired";
        reply.closed = true;
        open_.store(false, std::memory_order_release);
        return reply;
    }

    reply.success = res->status >= 200 && res->status < 300;
    if (res->get_header_value("Content-Type").starts_with("text/event-stream")) {
        reply.body = extract_sse_payload(res->body);
    } else {
        reply.body = res->body;
    }
    if (!reply.success) {
        reply.error_message = std::format("upstream returned HTTP {}", res->status);
    }
    return reply;
}

void HttpTransport::reset() {
    std::string upstream_session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        upstream_session.swap(upstream_session_);
    }
    if (upstream_session.empty() || !is_open()) {
        return;
    }
    if (!end_upstream_session(upstream_session)) {
        open_.store(false, std::memory_order_release);
    }
}

void HttpTransport::close() {
    if (!open_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    const std::string upstream_session = upstream_session_id();
    if (!upstream_session.empty()) {
        (void)end_upstream_session(upstream_session);
    }
    client_->stop();
}

bool HttpTransport::end_upstream_session(const std::string& upstream_session) {
    httplib::Headers headers{{http::kSessionIdHeader, upstream_session}};
    auto res = client_->Delete(path_, headers);
    if (!res) {
        utils::log::warn(std::format("Upstream session {} DELETE failed: {}",
                                     upstream_session, httplib::to_string(res.error())));
        return false;
    }
    return true;
}

std::string HttpTransport::upstream_session_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return upstream_session_;
}

// ============================================================================
// SSE
// ============================================================================

std::string extract_sse_payload(std::string_view body) {
    std::string last_event;
    std::string current;
    bool has_data = false;

    size_t pos = 0;
    while (pos <= body.size()) {
        auto end = body.find('\n', pos);
        if (end == std::string_view::npos) {
            end = body.size();
        }
        std::string_view line = body.substr(pos, end - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        if (line.empty()) {
            if (has_data) {
                last_event = std::move(current);
                current.clear();
                has_data = false;
            }
        } else if (line.starts_with("data:")) {
            auto data = line.substr(5);
            if (!data.empty() && data.front() == ' ') {
                data.remove_prefix(1);
            }
            if (has_data) {
                current += '\n';
            }
            current += data;
            has_data = true;
        }

        if (end == body.size()) {
            break;
        }
        pos = end + 1;
    }

    // Stream ended without the terminating blank line
    if (has_data) {
        last_event = std::move(current);
    }
    return last_event;
}

} // namespace mcpgate
