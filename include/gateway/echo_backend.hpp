#pragma once

#include "gateway/ibackend.hpp"
#include <atomic>
#include <string>

namespace mcpgate {

/**
 * @brief In-process diagnostic backend
 *
 * Speaks enough JSON-RPC to complete an MCP handshake: `initialize`,
 * `ping`, `tools/list`, and a single `echo` tool. Notifications (no id)
 * produce an empty reply.
 */
class EchoBackend : public IBackend {
public:
    explicit EchoBackend(std::string name);

    [[nodiscard]] const std::string& name() const override { return name_; }
    [[nodiscard]] std::string type() const override { return "echo"; }

    void initialize() override;

    [[nodiscard]] std::shared_ptr<IBackendTransport> create_transport() override;

    /**
     * @brief Handle one JSON-RPC request body; empty string for notifications
     */
    [[nodiscard]] static std::string handle(const std::string& server_name,
                                            const std::string& request,
                                            const RequestContext& context);

private:
    std::string name_;
};

class EchoTransport : public IBackendTransport {
public:
    explicit EchoTransport(std::string server_name) : server_name_(std::move(server_name)) {}

    [[nodiscard]] BackendReply send(const std::string& request,
                                    const RequestContext& context) override;

    [[nodiscard]] bool is_open() const override {
        return open_.load(std::memory_order_acquire);
    }

    // Replies depend only on the request
    void reset() override {}

    void close() override {
        open_.store(false, std::memory_order_release);
    }

private:
    std::string server_name_;
    std::atomic<bool> open_{true};
};

} // namespace mcpgate
