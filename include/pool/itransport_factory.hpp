#pragma once

#include "pool/ibackend_transport.hpp"
#include <memory>
#include <string>

namespace mcpgate {

/**
 * @brief Abstract factory for backend transports
 *
 * The pool manager calls this whenever a backend has creatable capacity
 * and no reusable idle connection.
 */
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    /**
     * @brief Open a new transport to a backend
     * @param backend Backend name
     * @return New transport, or nullptr on failure (may also throw)
     */
    [[nodiscard]] virtual std::shared_ptr<IBackendTransport> create_transport(
        const std::string& backend) = 0;
};

} // namespace mcpgate
