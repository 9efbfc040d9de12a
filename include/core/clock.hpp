#pragma once

#include "core/types.hpp"

namespace mcpgate {

/**
 * @brief Time source for every time-dependent component
 *
 * Production code uses SteadyClock; tests inject a manual clock so
 * timeouts, refills, and sweeps can be driven deterministically.
 */
class IClock {
public:
    virtual ~IClock() = default;

    [[nodiscard]] virtual TimePoint now() const = 0;
};

class SteadyClock final : public IClock {
public:
    [[nodiscard]] TimePoint now() const override {
        return Clock::now();
    }
};

} // namespace mcpgate
