#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace mcpgate {

/**
 * @brief Rejection and failure kinds surfaced by the gateway
 */
enum class ErrorCode {
    NONE,
    POOL_EXHAUSTED,
    QUEUE_FULL,
    QUEUE_TIMEOUT,
    CIRCUIT_OPEN,
    USER_RATE_LIMITED,
    RATE_LIMITED,
    INVALID_SESSION,
    AUTH_INVALID,
    BAD_REQUEST,
    BACKEND_NOT_FOUND,
    BACKEND_CRASHED,
    BACKEND_ERROR,
    SHUTTING_DOWN,
    INTERNAL_ERROR
};

[[nodiscard]] inline constexpr const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:              return "none";
        case ErrorCode::POOL_EXHAUSTED:    return "pool_exhausted";
        case ErrorCode::QUEUE_FULL:        return "queue_full";
        case ErrorCode::QUEUE_TIMEOUT:     return "queue_timeout";
        case ErrorCode::CIRCUIT_OPEN:      return "circuit_open";
        case ErrorCode::USER_RATE_LIMITED: return "user_rate_limited";
        case ErrorCode::RATE_LIMITED:      return "rate_limited";
        case ErrorCode::INVALID_SESSION:   return "invalid_session";
        case ErrorCode::AUTH_INVALID:      return "auth_invalid";
        case ErrorCode::BAD_REQUEST:       return "bad_request";
        case ErrorCode::BACKEND_NOT_FOUND: return "backend_not_found";
        case ErrorCode::BACKEND_CRASHED:   return "backend_crashed";
        case ErrorCode::BACKEND_ERROR:     return "backend_error";
        case ErrorCode::SHUTTING_DOWN:     return "shutting_down";
        case ErrorCode::INTERNAL_ERROR:    return "internal_error";
    }
    return "unknown";
}

/**
 * @brief HTTP status for an error kind (used by the HTTP front end)
 */
[[nodiscard]] inline constexpr int http_status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:              return 200;
        case ErrorCode::USER_RATE_LIMITED:
        case ErrorCode::RATE_LIMITED:      return 429;
        case ErrorCode::POOL_EXHAUSTED:
        case ErrorCode::QUEUE_FULL:
        case ErrorCode::QUEUE_TIMEOUT:
        case ErrorCode::CIRCUIT_OPEN:
        case ErrorCode::BACKEND_CRASHED:
        case ErrorCode::SHUTTING_DOWN:     return 503;
        case ErrorCode::INVALID_SESSION:
        case ErrorCode::BAD_REQUEST:       return 400;
        case ErrorCode::AUTH_INVALID:      return 401;
        case ErrorCode::BACKEND_NOT_FOUND: return 404;
        case ErrorCode::BACKEND_ERROR:     return 502;
        case ErrorCode::INTERNAL_ERROR:    return 500;
    }
    return 500;
}

/**
 * @brief Structured rejection: kind, message, optional backoff hint
 */
struct GatewayError {
    ErrorCode code = ErrorCode::NONE;
    std::string message;
    std::optional<std::chrono::seconds> retry_after;
};

/**
 * @brief Result type for operations that can be rejected
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCode code, std::string message,
                        std::optional<std::chrono::seconds> retry_after = std::nullopt) {
        Result r;
        r.error_ = GatewayError{code, std::move(message), retry_after};
        return r;
    }

    static Result error(GatewayError err) {
        Result r;
        r.error_ = std::move(err);
        return r;
    }

    bool is_ok() const { return value_.has_value(); }
    bool is_error() const { return !value_.has_value(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    const GatewayError& error() const { return error_; }
    ErrorCode error_code() const { return error_.code; }
    const std::string& error_message() const { return error_.message; }

private:
    std::optional<T> value_;
    GatewayError error_;
};

} // namespace mcpgate
