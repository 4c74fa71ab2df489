#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "coord/Coordinator.h"
#include "core/Constants.h"
#include "seats/SeatStore.h"

/**
 * @brief Per-code remaining-uses counter held in the coordinator.
 *
 * Consumption is one atomic decrement-if-positive, so hot codes never contend
 * on the durable code row. The durable usage is written back by the quota
 * sync job, and the bucket is rebuilt from durable counts when the key is
 * missing (cache loss, expiry).
 *
 * Fails closed: if the coordinator cannot be reached, nothing is consumed.
 * Unlimited codes (max uses 0) never get a bucket.
 */
class TokenBucket {
public:
    enum class Outcome : uint8_t {
        UNLIMITED, ///< code has no use limit, nothing was consumed
        CONSUMED,
        EXHAUSTED,
        UNAVAILABLE ///< coordinator unreachable; treat as a refusal
    };

    static constexpr const char *toString(const Outcome outcome) {
        switch (outcome) {
            case Outcome::UNLIMITED: return "UNLIMITED";
            case Outcome::CONSUMED: return "CONSUMED";
            case Outcome::EXHAUSTED: return "EXHAUSTED";
            case Outcome::UNAVAILABLE: return "UNAVAILABLE";
        }
        return "UNKNOWN";
    }

    TokenBucket(Coordinator &coordinator, SeatStore &store, uint32_t ttlMs = Constants::Throttle::BUCKET_TTL_MS);

    static std::string keyFor(const std::string &code) { return "redeem:" + code + ":remaining"; }

    /**
     * @brief Take one use of the code.
     * @throws invalid_code If the code is not in the store
     */
    Outcome tryConsume(const std::string &code);

    /**
     * @brief Give one use back.
     * @return false if the bucket is absent or the coordinator is unreachable;
     *         the caller then adjusts the durable usage instead
     */
    bool refund(const std::string &code);

    [[nodiscard]] std::optional<int64_t> remaining(const std::string &code);

    /**
     * @brief Create the bucket from durable counts if it does not exist.
     * @return true if the bucket exists afterwards
     */
    bool ensure(const CodeRow &row);

    /** @brief Overwrite the bucket from durable counts. */
    void rebuild(const CodeRow &row);

    /**
     * @brief Write every live bucket back as used = max - remaining.
     * @return Number of codes synchronized
     * @throws coordination_unavailable
     */
    uint32_t syncToStore();

private:
    static constexpr auto tag_{"TokenBucket"};

    static int64_t durableRemaining(const CodeRow &row) {
        const int64_t left = static_cast<int64_t>(row.maxUses) - row.usedCount;
        return left > 0 ? left : 0;
    }

    Coordinator &coordinator_;
    SeatStore &store_;
    uint32_t ttlMs_;
};
