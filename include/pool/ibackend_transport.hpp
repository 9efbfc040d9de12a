#pragma once

#include <string>

namespace mcpgate {

/**
 * @brief Per-call metadata handed to a backend transport
 */
struct RequestContext {
    std::string request_id;
    std::string user_id;
    std::string session_id;
    std::string backend;
};

/**
 * @brief Reply from one backend operation
 *
 * `closed` is the backend-driven close notification: the transport is
 * gone and the owning session must be torn down.
 */
struct BackendReply {
    bool success = false;
    std::string body;
    bool closed = false;
    std::string error_message;
};

/**
 * @brief Abstract live backend transport (one per pooled connection)
 *
 * Implementations are not thread-safe; a connection is used by one
 * caller at a time and the session serializes its calls.
 */
class IBackendTransport {
public:
    virtual ~IBackendTransport() = default;

    /**
     * @brief Execute one JSON-RPC request against the backend
     * @param request Raw request body
     * @param context Caller identity and session for this call
     */
    [[nodiscard]] virtual BackendReply send(const std::string& request,
                                            const RequestContext& context) = 0;

    /**
     * @brief Whether the transport is still live
     */
    [[nodiscard]] virtual bool is_open() const = 0;

    /**
     * @brief Forget all conversation state before the pool hands the
     * transport to another session
     *
     * Called while nobody holds the connection. A transport that cannot
     * be made clean should throw; the pool then discards it.
     */
    virtual void reset() = 0;

    /**
     * @brief Close the transport and release its resources
     */
    virtual void close() = 0;
};

} // namespace mcpgate
