#pragma once

#include "pool/ibackend_transport.hpp"
#include <memory>
#include <string>

namespace mcpgate {

/**
 * @brief A tool-providing backend reachable through the gateway
 *
 * Each backend type ("http", "echo") provides a concrete implementation
 * that knows how to open transports to it.
 *
 * Usage:
 *   auto backend = std::make_shared<HttpBackend>(config);
 *   backend->initialize();                        // throws on failure
 *   auto transport = backend->create_transport(); // one per pooled connection
 */
class IBackend {
public:
    virtual ~IBackend() = default;

    /** @brief Routing name ("/<name>/mcp") */
    [[nodiscard]] virtual const std::string& name() const = 0;

    /** @brief Backend type tag */
    [[nodiscard]] virtual std::string type() const = 0;

    /**
     * @brief One-time startup check
     * @throws std::exception when the backend cannot serve requests
     */
    virtual void initialize() = 0;

    /**
     * @brief Open a new live transport (may return nullptr or throw on failure)
     */
    [[nodiscard]] virtual std::shared_ptr<IBackendTransport> create_transport() = 0;
};

} // namespace mcpgate
