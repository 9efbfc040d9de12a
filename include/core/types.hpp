#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace mcpgate {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// ============================================================================
// Circuit Breaker Types
// ============================================================================

enum class CircuitState {
    CLOSED,         // Normal operation
    OPEN,           // Failing, reject requests
    HALF_OPEN       // Single probe allowed
};

[[nodiscard]] inline constexpr const char* circuit_state_name(CircuitState s) {
    switch (s) {
        case CircuitState::CLOSED:    return "CLOSED";
        case CircuitState::OPEN:      return "OPEN";
        case CircuitState::HALF_OPEN: return "HALF_OPEN";
    }
    return "UNKNOWN";
}

struct CircuitBreakerStats {
    CircuitState state;
    uint64_t failure_count;
    uint64_t success_count;
    uint64_t times_opened;
    std::optional<TimePoint> last_failure;

    CircuitBreakerStats()
        : state(CircuitState::CLOSED), failure_count(0), success_count(0), times_opened(0) {}
};

// ============================================================================
// Rate Limiting Types
// ============================================================================

/// Gates evaluated by the rate limiter, in evaluation order.
enum class RateLimitGate {
    USER,
    BACKEND,
    BUCKET,
    WINDOW
};

[[nodiscard]] inline constexpr const char* rate_limit_gate_name(RateLimitGate g) {
    switch (g) {
        case RateLimitGate::USER:    return "user";
        case RateLimitGate::BACKEND: return "backend";
        case RateLimitGate::BUCKET:  return "bucket";
        case RateLimitGate::WINDOW:  return "window";
    }
    return "unknown";
}

struct RateLimitResult {
    bool allowed;
    std::optional<RateLimitGate> gate;      // Set on rejection: first gate that blocked
    std::string reason;
    std::chrono::seconds retry_after;
    uint32_t remaining;                     // Remaining bucket tokens on admission

    RateLimitResult() : allowed(false), retry_after(0), remaining(0) {}

    static RateLimitResult admit(uint32_t remaining) {
        RateLimitResult r;
        r.allowed = true;
        r.remaining = remaining;
        return r;
    }

    static RateLimitResult reject(RateLimitGate gate, std::string reason,
                                  std::chrono::seconds retry_after) {
        RateLimitResult r;
        r.allowed = false;
        r.gate = gate;
        r.reason = std::move(reason);
        r.retry_after = retry_after;
        return r;
    }
};

// ============================================================================
// Backend Types
// ============================================================================

enum class BackendStatus {
    HEALTHY,
    CRASHED
};

[[nodiscard]] inline constexpr const char* backend_status_name(BackendStatus s) {
    return s == BackendStatus::HEALTHY ? "healthy" : "crashed";
}

} // namespace mcpgate
