#pragma once

#include <cstdint>
#include <string>

#include "coord/Coordinator.h"

/**
 * @brief Fixed-window request counter per identifier, for shedding load.
 *
 * Pure rate check: fails open when the coordinator is unreachable.
 * A limit of 0 disables the limiter.
 */
class RateLimiter {
public:
    RateLimiter(Coordinator &coordinator, std::string prefix, uint32_t limit, uint32_t windowMs);

    bool allow(const std::string &identifier);

private:
    static constexpr auto tag_{"RateLimiter"};

    Coordinator &coordinator_;
    std::string prefix_;
    uint32_t limit_;
    uint32_t windowMs_;
};
