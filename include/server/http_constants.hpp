#pragma once

#include <string>
#include <string_view>

namespace mcpgate::http {

inline constexpr std::string_view kBearerPrefix = "Bearer ";
// std::string because cpp-httplib APIs require const std::string&
inline const std::string kAuthorizationHeader = "Authorization";
inline const std::string kSessionIdHeader = "mcp-session-id";
inline const std::string kUserIdHeader = "X-User-Id";
inline const std::string kApiKeyHeader = "X-Api-Key";
inline const std::string kRequestIdHeader = "X-Request-Id";
inline const std::string kRetryAfterHeader = "Retry-After";
inline constexpr const char* kJsonContentType = "application/json";

// JSON-RPC error code used for every gateway-level rejection
inline constexpr int kGatewayErrorCode = -32000;

} // namespace mcpgate::http
