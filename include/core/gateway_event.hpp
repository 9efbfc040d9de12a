#pragma once

#include "core/types.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <variant>

namespace mcpgate {

// ============================================================================
// Gateway Events (consumed by monitoring and the status endpoint)
// ============================================================================

struct PoolInitialized {
    std::string backend;
    uint32_t max_connections = 0;
};

struct ConnectionReleased {
    std::string backend;
    std::string connection_id;
    std::string user_id;
    std::chrono::milliseconds latency{0};
    bool success = true;
};

struct RateLimitHit {
    RateLimitGate gate = RateLimitGate::USER;
    std::string key;
};

enum class AdjustmentDirection { REDUCE, INCREASE };

struct AdaptiveAdjustment {
    std::string key;
    AdjustmentDirection direction = AdjustmentDirection::REDUCE;
    uint32_t new_limit = 0;
    double avg_load = 0.0;
};

struct CleanupCompleted {
    std::string component;
    uint64_t removed = 0;
};

struct CircuitStateChanged {
    std::string backend;
    CircuitState from = CircuitState::CLOSED;
    CircuitState to = CircuitState::CLOSED;
};

struct SessionOpened {
    std::string session_id;
    std::string backend;
    std::string user_id;
};

struct SessionClosed {
    std::string session_id;
    std::string backend;
    std::string reason;
};

using GatewayEvent = std::variant<
    PoolInitialized,
    ConnectionReleased,
    RateLimitHit,
    AdaptiveAdjustment,
    CleanupCompleted,
    CircuitStateChanged,
    SessionOpened,
    SessionClosed>;

/// Short type tag for an event ("pool_initialized", "rate_limit_hit", ...)
[[nodiscard]] const char* event_type_name(const GatewayEvent& event);

} // namespace mcpgate
