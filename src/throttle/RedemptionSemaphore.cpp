#include "throttle/RedemptionSemaphore.h"

#include <algorithm>

#include "core/Errors.h"
#include "logging/Logger.h"
#include "utils/TimeHelper.h"

namespace {
    constexpr auto SRC = Logger::Source::Client;
}

RedemptionSemaphore::Permit::Permit(Permit &&other) noexcept : owner_{other.owner_} {
    other.owner_ = nullptr;
}

RedemptionSemaphore::Permit::~Permit() {
    release();
}

void RedemptionSemaphore::Permit::release() {
    if (owner_ != nullptr) {
        owner_->release();
        owner_ = nullptr;
    }
}

RedemptionSemaphore::RedemptionSemaphore(Coordinator &coordinator, std::string name, const int64_t maxConcurrent,
                                         const uint32_t acquireTimeoutMs, const uint32_t ttlMs)
    : coordinator_{coordinator}, name_{std::move(name)}, maxConcurrent_{maxConcurrent},
      acquireTimeoutMs_{acquireTimeoutMs}, ttlMs_{ttlMs} {
}

RedemptionSemaphore::Permit RedemptionSemaphore::acquire() {
    const int64_t deadline = TimeHelper::monotonicMs() + acquireTimeoutMs_;
    uint32_t backoff = Constants::Throttle::SEMAPHORE_BACKOFF_MS;

    while (true) {
        try {
            if (coordinator_.semaphoreAcquire(name_, maxConcurrent_, ttlMs_)) {
                return Permit(this);
            }
        } catch (const coordination_unavailable &e) {
            Logger::warn(SRC, tag_, "coordinator unavailable, admitting without permit: %s", e.what());
            return Permit(nullptr);
        }

        const int64_t left = deadline - TimeHelper::monotonicMs();
        if (left <= 0) {
            throw throttled("no redemption permit within " + std::to_string(acquireTimeoutMs_) + " ms");
        }
        TimeHelper::sleepMs(static_cast<uint32_t>(std::min<int64_t>(backoff, left)));
        backoff = std::min(backoff * 2, Constants::Throttle::SEMAPHORE_MAX_BACKOFF_MS);
    }
}

int64_t RedemptionSemaphore::inFlight() {
    try {
        return coordinator_.semaphoreCount(name_);
    } catch (const coordination_unavailable &e) {
        Logger::warn(SRC, tag_, "in-flight count unavailable: %s", e.what());
        return 0;
    }
}

void RedemptionSemaphore::release() noexcept {
    try {
        coordinator_.semaphoreRelease(name_);
    } catch (const coordination_unavailable &e) {
        // The safety expiry reclaims the permit.
        Logger::warn(SRC, tag_, "release failed: %s", e.what());
    }
}
