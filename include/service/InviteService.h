#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

#include "dispatch/MembershipClient.h"
#include "dispatch/TaskQueue.h"
#include "seats/CapacityLedger.h"
#include "seats/ReservationCoordinator.h"
#include "seats/SeatStore.h"
#include "throttle/RateLimiter.h"
#include "throttle/RedemptionSemaphore.h"
#include "throttle/TokenBucket.h"

/**
 * @brief Answer of the synchronous reservation call.
 */
struct ReserveResult {
    bool ok;
    uint32_t teamId; // 0 when not reserved
    uint32_t inviteId; // handle, also set when the request was wait-listed
    uint32_t waitingId; // non-zero when wait-listed
};

struct QueueDepth {
    StoreDepth store;
    uint32_t queued; // tasks in the transport
    uint32_t delayed; // tasks waiting out a retry backoff
};

/**
 * @brief Operations the request path and the administrative collaborators call.
 *
 * Every entry point normalizes the identity. Codes are checked against the
 * store (exists, active, not expired) and one use is taken from the token
 * bucket before any record is written.
 */
class InviteService {
public:
    InviteService(SeatStore &store, const CapacityLedger &ledger, ReservationCoordinator &reservation,
                  TaskQueue &queue, TokenBucket &bucket, RedemptionSemaphore &semaphore, RateLimiter &rateLimiter,
                  MembershipClient &client);

    /**
     * @brief Accept a request for asynchronous placement.
     * @return Invite handle
     * @throws invalid_code, throttled, queue_full, coordination_unavailable (bucket unreachable)
     */
    uint32_t enqueueInvite(const std::string &identity, const std::string &code, uint32_t groupId,
                           bool rebind = false);

    /**
     * @brief Claim a seat now; wait-list the request if none is free.
     * @throws invalid_code, throttled, queue_full, coordination_unavailable (bucket unreachable)
     */
    ReserveResult reserveSeat(const std::string &identity, const std::string &code, uint32_t groupId,
                              bool rebind = false);

    [[nodiscard]] CapacitySummary getCapacity(uint32_t groupId) const;

    [[nodiscard]] QueueDepth getQueueDepth() const;

    [[nodiscard]] std::optional<InviteRow> inviteStatus(uint32_t handle) const;

    /**
     * @brief Remove a member externally, then locally.
     * @throws membership_error If the external removal keeps failing
     */
    void removeMember(uint32_t teamId, const std::string &identity);

private:
    static constexpr auto tag_{"InviteService"};

    /** @return group to place into: the code's group wins over "any" */
    uint32_t resolveGroup(const CodeRow &row, uint32_t requested) const;

    CodeRow requireUsableCode(const std::string &code, time_t now) const;

    void takeUse(const std::string &code);

    void giveBack(const std::string &code);

    SeatStore &store_;
    const CapacityLedger &ledger_;
    ReservationCoordinator &reservation_;
    TaskQueue &queue_;
    TokenBucket &bucket_;
    RedemptionSemaphore &semaphore_;
    RateLimiter &rateLimiter_;
    MembershipClient &client_;
};
