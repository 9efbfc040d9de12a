#pragma once

#include "pool/pool_manager.hpp"
#include "ratelimit/rate_limiter.hpp"
#include "session/session_registry.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace mcpgate {

// ============================================================================
// Configuration Types
// ============================================================================

struct TlsConfig {
    bool enabled = false;
    std::string cert_file;            // Server certificate (PEM)
    std::string key_file;             // Server private key (PEM)
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    size_t thread_pool_size = 8;
    std::string service_secret;       // Empty = service-secret factor disabled
    size_t max_request_bytes = 1048576;
    std::chrono::milliseconds shutdown_timeout{30000};
    TlsConfig tls;
};

struct LoggingConfig {
    std::string level = "info";
};

struct SessionsConfig {
    SessionRegistry::Config registry;
    std::chrono::milliseconds credential_cache_ttl{300000};
};

/**
 * @brief One [[users]] entry
 *
 * Exactly one of api_key / api_key_sha256 is expected.
 */
struct UserConfig {
    std::string id;
    std::string api_key;
    std::string api_key_sha256;
    std::vector<std::string> backends;    // Empty = every backend
};

/**
 * @brief One [[backends]] entry
 */
struct BackendConfig {
    std::string name;
    std::string type = "http";            // "http" | "echo"
    std::string url;
    std::string path;
    bool enabled = true;
    std::chrono::milliseconds timeout{0}; // 0 = pool request_timeout
};

struct GatewayConfig {
    ServerConfig server;
    LoggingConfig logging;
    PoolManager::Config pool;
    RateLimiter::Config rate_limiting;
    SessionsConfig sessions;
    std::vector<UserConfig> users;
    std::vector<BackendConfig> backends;
};

} // namespace mcpgate
