#pragma once

#include "gateway/ibackend.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace httplib {
class Client;
}

namespace mcpgate {

/**
 * @brief Parsed upstream endpoint
 */
struct UpstreamEndpoint {
    bool use_ssl = false;
    std::string host;
    int port = 80;
    std::string path = "/";

    [[nodiscard]] std::string scheme_host() const;

    /**
     * @throws std::invalid_argument on an unsupported scheme, empty host, or bad port
     */
    [[nodiscard]] static UpstreamEndpoint parse(const std::string& url);
};

/**
 * @brief Backend that forwards JSON-RPC bodies to an upstream MCP server
 *
 * Every transport keeps its own HTTP client and the upstream
 * `mcp-session-id` it was assigned during the handshake, until the pool
 * resets it for the next session.
 */
class HttpBackend : public IBackend {
public:
    struct Config {
        std::string name;
        std::string url;                                 // http(s)://host[:port][/path]
        std::string path;                                // Overrides the URL path when set
        std::chrono::milliseconds connect_timeout{30000};
        std::chrono::milliseconds request_timeout{60000};
    };

    explicit HttpBackend(Config config);

    [[nodiscard]] const std::string& name() const override { return config_.name; }
    [[nodiscard]] std::string type() const override { return "http"; }

    /**
     * @brief Validate the upstream URL
     */
    void initialize() override;

    [[nodiscard]] std::shared_ptr<IBackendTransport> create_transport() override;

    [[nodiscard]] const UpstreamEndpoint& endpoint() const { return endpoint_; }

private:
    Config config_;
    UpstreamEndpoint endpoint_;
};

class HttpTransport : public IBackendTransport {
public:
    HttpTransport(const UpstreamEndpoint& endpoint,
                  std::chrono::milliseconds connect_timeout,
                  std::chrono::milliseconds request_timeout);
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    [[nodiscard]] BackendReply send(const std::string& request,
                                    const RequestContext& context) override;

    [[nodiscard]] bool is_open() const override {
        return open_.load(std::memory_order_acquire);
    }

    /**
     * @brief Ends the upstream session (best-effort DELETE) and forgets its id
     *
     * The next send() starts without an `mcp-session-id`, so the upstream
     * opens a fresh session. An unreachable upstream closes the transport.
     */
    void reset() override;

    /**
     * @brief Ends the upstream session (best-effort DELETE) and closes the client
     */
    void close() override;

    [[nodiscard]] std::string upstream_session_id() const;

private:
    /**
     * @return false if the upstream could not be reached
     */
    bool end_upstream_session(const std::string& upstream_session);

    std::string path_;
    std::unique_ptr<httplib::Client> client_;
    std::atomic<bool> open_{true};

    mutable std::mutex mutex_;
    std::string upstream_session_;
};

/**
 * @brief Pull the JSON-RPC payload out of a text/event-stream body
 *
 * Returns the data of the last event (multi-line data joined with '\n').
 */
[[nodiscard]] std::string extract_sse_payload(std::string_view body);

} // namespace mcpgate
