#pragma once

#include <sys/types.h>
#include <cstdint>
#include <ctime>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "dispatch/MembershipClient.h"
#include "dispatch/TaskQueue.h"
#include "dispatch/TaskRetrier.h"
#include "reconcile/WaitingQueueReconciler.h"
#include "seats/Allocator.h"
#include "seats/CapacityLedger.h"
#include "seats/ReservationCoordinator.h"

/**
 * @brief Tunables of one dispatch worker.
 */
struct WorkerSettings {
    uint32_t batchSize;
    uint32_t batchMaxWaitMs;
    uint32_t softLimitSec;
    uint32_t localRetries;
    uint32_t localRetryDelayMs;
    uint32_t lockRetries;
    AllocationStrategy strategy{AllocationStrategy::SEQUENTIAL_FILL};

    static WorkerSettings fromConfig();
};

/**
 * @brief What happened to the tasks of one batch.
 */
struct BatchReport {
    uint32_t invited;
    uint32_t waitlisted;
    uint32_t retried;
    uint32_t failed;
    uint32_t deferred;
    uint32_t dropped; // duplicate or already settled elsewhere
    uint32_t reconciled;
};

/**
 * @brief Drains the task queue in batches and places invites on teams.
 *
 * Dispatch tasks are grouped by team group. A group with no free seat goes
 * straight to the waiting queue; otherwise the Allocator splits it across
 * teams and every team's share is claimed under that team's row lock before
 * the external call. Reserve tasks already hold a seat and only need the
 * external call. Reconcile tasks run inline.
 */
class DispatchWorker {
public:
    DispatchWorker(SeatStore &store, const CapacityLedger &ledger, ReservationCoordinator &reservation,
                   TaskQueue &queue, MembershipClient &client, TaskRetrier &retrier,
                   WaitingQueueReconciler &reconciler, const WorkerSettings &settings);

    /**
     * @brief Receive one batch, publish it as in flight, run it.
     * @return false if interrupted before a task arrived
     */
    bool drainOnce(pid_t self);

    BatchReport runBatch(const std::vector<Task> &batch, time_t now);

private:
    static constexpr auto tag_{"Worker"};

    void dispatchGroup(uint32_t groupId, const std::vector<DispatchTask> &tasks);

    void deliverReserved(uint32_t teamId, const std::vector<ReserveTask> &tasks);

    /** @brief Claim a team's share, retrying row-lock conflicts. nullopt when contention persists. */
    std::optional<ClaimResult> claimWithRetries(uint32_t teamId, const std::vector<DispatchTask> &tasks);

    /** @brief External call for tasks holding a seat on teamId. */
    void deliver(uint32_t teamId, const std::vector<Task> &tasks);

    void retryLocally(uint32_t teamId, const Task &task);

    void markInvited(uint32_t teamId, const Task &task);

    void toWaiting(const DispatchTask &task, const std::string &note);

    void fail(const Task &task, FailureKind kind, const std::string &note);

    void defer(const Task &task, const std::string &note);

    /** @brief Fail every task of the list not yet settled in this batch. */
    void failUnsettled(const std::vector<Task> &tasks, const std::string &note);

    void settle(const Task &task) { settled_.insert(Tasks::requestOf(task)->taskId); }

    [[nodiscard]] bool isSettled(const Task &task) const {
        return settled_.count(Tasks::requestOf(task)->taskId) != 0;
    }

    [[nodiscard]] bool pastSoftLimit() const;

    SeatStore &store_;
    const CapacityLedger &ledger_;
    ReservationCoordinator &reservation_;
    TaskQueue &queue_;
    MembershipClient &client_;
    TaskRetrier &retrier_;
    WaitingQueueReconciler &reconciler_;
    WorkerSettings settings_;

    // Per-batch state
    int64_t batchStartMs_{0};
    time_t now_{0};
    BatchReport report_{};
    std::set<uint64_t> settled_;
};
