#pragma once

#include <cstdint>
#include <ctime>
#include <string>

#include "coord/Coordinator.h"
#include "core/Constants.h"
#include "dispatch/QuotaCompensator.h"
#include "dispatch/Task.h"
#include "dispatch/TaskQueue.h"
#include "seats/CapacityLedger.h"
#include "seats/SeatStore.h"
#include "throttle/TokenBucket.h"

/**
 * @brief Outcome of one reconciliation pass.
 */
struct ReconcileReport {
    bool ran; // false when another replica held the lock
    uint32_t promoted;
    uint32_t invalidated;
    uint32_t reverted;
    uint32_t swept;
    uint32_t synced;
};

/**
 * @brief Periodic maintenance run by whichever worker receives the task.
 *
 * Every pass is single-flight across replicas through the coordinator TTL
 * mutex "reconcile:<kind>". If the coordinator cannot be reached the pass is
 * skipped; the next scheduled task tries again.
 */
class WaitingQueueReconciler {
public:
    struct Settings {
        uint32_t lockTtlMs{Constants::Reconcile::LOCK_TTL_MS};
        uint32_t staleReservedSec{Constants::Capacity::STALE_RESERVED_SEC};
    };

    WaitingQueueReconciler(SeatStore &store, const CapacityLedger &ledger, Coordinator &coordinator,
                           TaskQueue &queue, TokenBucket &bucket, QuotaCompensator &compensator, std::string owner,
                           Settings settings);

    ReconcileReport run(const ReconcileTask &task, time_t now);

    /**
     * @brief Re-admit waiting requests, oldest first per group, up to the
     * group's free capacity.
     */
    ReconcileReport promoteWaiting(uint32_t scanLimit, time_t now);

    /** @brief Fail and compensate reservations that never reached the external call. */
    ReconcileReport sweepStaleReserved(time_t now);

    /** @brief Write token buckets back to durable code usage. */
    ReconcileReport syncQuota();

private:
    static constexpr auto tag_{"Reconciler"};

    template<typename Fn>
    ReconcileReport singleFlight(ReconcileKind kind, Fn &&pass);

    SeatStore &store_;
    const CapacityLedger &ledger_;
    Coordinator &coordinator_;
    TaskQueue &queue_;
    TokenBucket &bucket_;
    QuotaCompensator &compensator_;
    std::string owner_;
    Settings settings_;
};
