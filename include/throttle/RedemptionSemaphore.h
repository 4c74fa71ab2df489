#pragma once

#include <cstdint>
#include <string>

#include "coord/Coordinator.h"
#include "core/Constants.h"

/**
 * @brief Global bound on concurrent in-flight redemptions, shared by every process.
 *
 * Backed by a coordinator semaphore with a safety expiry, so a crashed holder
 * cannot block it forever. Fails open: when the coordinator is unreachable
 * the caller proceeds without a permit.
 */
class RedemptionSemaphore {
public:
    /**
     * @brief RAII permit; releases on destruction.
     *
     * A permit obtained while failing open holds nothing and releases nothing.
     */
    class Permit {
    public:
        Permit(Permit &&other) noexcept;

        Permit(const Permit &) = delete;

        Permit &operator=(const Permit &) = delete;

        Permit &operator=(Permit &&) = delete;

        ~Permit();

        [[nodiscard]] bool held() const noexcept { return owner_ != nullptr; }

        void release();

    private:
        friend class RedemptionSemaphore;

        explicit Permit(RedemptionSemaphore *owner) : owner_{owner} {
        }

        RedemptionSemaphore *owner_;
    };

    RedemptionSemaphore(Coordinator &coordinator, std::string name, int64_t maxConcurrent, uint32_t acquireTimeoutMs,
                        uint32_t ttlMs = Constants::Throttle::SEMAPHORE_TTL_MS);

    /**
     * @brief Wait with bounded backoff for a permit.
     * @throws throttled If no permit frees up within the acquire timeout
     */
    Permit acquire();

    [[nodiscard]] int64_t inFlight();

private:
    static constexpr auto tag_{"RedeemSem"};

    void release() noexcept;

    Coordinator &coordinator_;
    std::string name_;
    int64_t maxConcurrent_;
    uint32_t acquireTimeoutMs_;
    uint32_t ttlMs_;
};
