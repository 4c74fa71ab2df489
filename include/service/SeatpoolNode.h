#pragma once

#include <memory>
#include <string>

#include "coord/IpcCoordinator.h"
#include "dispatch/MembershipClient.h"
#include "dispatch/QuotaCompensator.h"
#include "dispatch/TaskQueue.h"
#include "dispatch/TaskRetrier.h"
#include "ipc/IpcManager.h"
#include "reconcile/WaitingQueueReconciler.h"
#include "seats/CapacityLedger.h"
#include "seats/ReservationCoordinator.h"
#include "seats/SeatStore.h"
#include "service/InviteService.h"
#include "throttle/RateLimiter.h"
#include "throttle/RedemptionSemaphore.h"
#include "throttle/TokenBucket.h"

/**
 * @brief Every core component of one process, attached to a running instance.
 *
 * Built the same way by the supervisor, the workers, the control client and
 * the tests; the IPC resources must already exist (IpcManager). Members are
 * declared in dependency order.
 */
class SeatpoolNode {
public:
    /**
     * @param keys Instance to attach to
     * @param source Log source of the owning process
     * @param client Membership service; the simulated one from configuration when null
     * @throws ipc_exception If a resource is missing
     */
    SeatpoolNode(const IpcKeys &keys, Logger::Source source, std::unique_ptr<MembershipClient> client = nullptr);

    SeatpoolNode(const SeatpoolNode &) = delete;

    SeatpoolNode &operator=(const SeatpoolNode &) = delete;

    SharedSeatState *state() { return shm_.get(); }

    Semaphore &sem() { return sem_; }

    Coordinator &coordinator() { return coordinator_; }

    SeatStore &store() { return store_; }

    CapacityLedger &ledger() { return ledger_; }

    TaskQueue &queue() { return queue_; }

    TokenBucket &bucket() { return bucket_; }

    QuotaCompensator &compensator() { return compensator_; }

    TaskRetrier &retrier() { return retrier_; }

    ReservationCoordinator &reservation() { return reservation_; }

    MembershipClient &client() { return *client_; }

    WaitingQueueReconciler &reconciler() { return reconciler_; }

    InviteService &service() { return service_; }

private:
    SharedMemory<SharedSeatState> shm_;
    Semaphore sem_;
    MessageQueue<Task> taskMq_;
    IpcCoordinator coordinator_;
    std::unique_ptr<MembershipClient> client_;
    SeatStore store_;
    CapacityLedger ledger_;
    TaskQueue queue_;
    TokenBucket bucket_;
    QuotaCompensator compensator_;
    TaskRetrier retrier_;
    ReservationCoordinator reservation_;
    RedemptionSemaphore semaphore_;
    RateLimiter rateLimiter_;
    WaitingQueueReconciler reconciler_;
    InviteService service_;
};
