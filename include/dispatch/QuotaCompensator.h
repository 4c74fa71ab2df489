#pragma once

#include <ctime>
#include <string>

#include "dispatch/Task.h"
#include "seats/SeatStore.h"
#include "throttle/TokenBucket.h"

/**
 * @brief Compensating rollback for a request that failed for good.
 *
 * Gives back the code use the request consumed, fails its invite record
 * (releasing any seat) and closes its waiting entry. Idempotent per task id:
 * the compensation ledger in the store is checked and written first, so a
 * second call for the same task refunds nothing.
 */
class QuotaCompensator {
public:
    QuotaCompensator(SeatStore &store, TokenBucket &bucket);

    /** @return true if this call performed the compensation */
    bool compensate(const InviteRequest &request, const std::string &reason, time_t now);

private:
    static constexpr auto tag_{"Compensator"};

    SeatStore &store_;
    TokenBucket &bucket_;
};
