#include "throttle/RateLimiter.h"

#include "core/Errors.h"
#include "logging/Logger.h"
#include "utils/TimeHelper.h"

RateLimiter::RateLimiter(Coordinator &coordinator, std::string prefix, const uint32_t limit,
                         const uint32_t windowMs)
    : coordinator_{coordinator}, prefix_{std::move(prefix)}, limit_{limit}, windowMs_{windowMs} {
}

bool RateLimiter::allow(const std::string &identifier) {
    if (limit_ == 0 || windowMs_ == 0) return true;

    const int64_t window = TimeHelper::nowMs() / windowMs_;
    const std::string key = prefix_ + ":" + identifier + ":" + std::to_string(window);
    try {
        const int64_t count = coordinator_.counterIncrementWindow(key, windowMs_);
        if (count > limit_) {
            Logger::warn(Logger::Source::Client, tag_, "%s over limit (%lld/%u)", identifier.c_str(),
                         static_cast<long long>(count), limit_);
            return false;
        }
        return true;
    } catch (const coordination_unavailable &e) {
        Logger::warn(Logger::Source::Client, tag_, "rate check skipped: %s", e.what());
        return true;
    }
}
