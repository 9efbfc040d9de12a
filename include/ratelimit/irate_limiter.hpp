#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <string>

namespace mcpgate {

/**
 * @brief Abstract admission gate in front of the pool
 *
 * The gateway talks to this interface so a limiter can be swapped for a
 * no-op (rate limiting disabled) or a test double.
 */
class IRateLimiter {
public:
    virtual ~IRateLimiter() = default;

    /**
     * @brief Check and, on admission, consume capacity for one call
     * @param key Composite key (usually "<user>-<backend>")
     * @param user_id Caller identity
     * @param backend Target backend
     * @param weight Tokens this call costs
     */
    [[nodiscard]] virtual RateLimitResult check(const std::string& key,
                                                const std::string& user_id,
                                                const std::string& backend,
                                                uint32_t weight = 1) = 0;

    virtual void reset_all() = 0;
};

} // namespace mcpgate
