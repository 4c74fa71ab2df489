#include "reconcile/WaitingQueueReconciler.h"

#include <algorithm>

#include "core/Errors.h"
#include "logging/Logger.h"

namespace {
    constexpr auto SRC = Logger::Source::Reconciler;
}

WaitingQueueReconciler::WaitingQueueReconciler(SeatStore &store, const CapacityLedger &ledger,
                                               Coordinator &coordinator, TaskQueue &queue, TokenBucket &bucket,
                                               QuotaCompensator &compensator, std::string owner,
                                               const Settings settings)
    : store_{store}, ledger_{ledger}, coordinator_{coordinator}, queue_{queue}, bucket_{bucket},
      compensator_{compensator}, owner_{std::move(owner)}, settings_{settings} {
}

template<typename Fn>
ReconcileReport WaitingQueueReconciler::singleFlight(const ReconcileKind kind, Fn &&pass) {
    const std::string lockName = std::string("reconcile:") + toString(kind);
    try {
        if (!coordinator_.mutexTryLock(lockName, owner_, settings_.lockTtlMs)) {
            Logger::debug(SRC, tag_, "%s already running elsewhere", toString(kind));
            return ReconcileReport{};
        }
    } catch (const coordination_unavailable &e) {
        Logger::warn(SRC, tag_, "%s skipped, lock service down: %s", toString(kind), e.what());
        return ReconcileReport{};
    }

    struct Unlock {
        Coordinator &coordinator;
        const std::string &name;
        const std::string &owner;

        ~Unlock() {
            try {
                if (!coordinator.mutexUnlock(name, owner)) {
                    Logger::warn(SRC, "Reconciler", "%s lock expired before the pass finished", name.c_str());
                }
            } catch (const coordination_unavailable &e) {
                Logger::warn(SRC, "Reconciler", "unlock of %s failed: %s", name.c_str(), e.what());
            }
        }
    } unlock{coordinator_, lockName, owner_};

    ReconcileReport report = pass();
    report.ran = true;
    queue_.count(&DispatchCounters::reconcilePasses);
    return report;
}

ReconcileReport WaitingQueueReconciler::run(const ReconcileTask &task, const time_t now) {
    switch (task.kind) {
        case ReconcileKind::WAITING_QUEUE:
            return promoteWaiting(task.scanLimit > 0 ? task.scanLimit : Constants::Reconcile::SCAN_LIMIT, now);
        case ReconcileKind::STALE_RESERVED:
            return sweepStaleReserved(now);
        case ReconcileKind::QUOTA_SYNC:
            return syncQuota();
    }
    return ReconcileReport{};
}

ReconcileReport WaitingQueueReconciler::promoteWaiting(const uint32_t scanLimit, const time_t now) {
    return singleFlight(ReconcileKind::WAITING_QUEUE, [&] {
        ReconcileReport report{};
        uint32_t scanned = 0;

        for (const uint32_t groupId: store_.waitingGroups()) {
            if (scanned >= scanLimit) break;
            // Decremented locally as tasks are handed out so one pass never over-dispatches a group.
            uint32_t available = ledger_.summary(groupId, now).available;
            if (available == 0) continue;

            const auto rows = store_.oldestWaiting(groupId, std::min(available, scanLimit - scanned));
            for (const auto &row: rows) {
                ++scanned;
                const auto code = store_.code(row.code);
                if (!code || !code->isUsable(now)) {
                    store_.setWaitingStatus(row.id, WaitingStatus::FAILED, "code no longer valid", now, false);
                    store_.transitionInvite(row.inviteId, InviteStatus::PENDING, InviteStatus::FAILED, 0,
                                            "code no longer valid", now);
                    ++report.invalidated;
                    Logger::info(SRC, tag_, "waiting %u (%s): code %s no longer valid", row.id, row.identity,
                                 row.code);
                    continue;
                }

                bool consumedNow = false;
                if (!row.quotaConsumed) {
                    const auto outcome = bucket_.tryConsume(row.code);
                    if (outcome == TokenBucket::Outcome::UNAVAILABLE) {
                        Logger::warn(SRC, tag_, "bucket unreachable, waiting %u stays queued", row.id);
                        continue;
                    }
                    if (outcome == TokenBucket::Outcome::EXHAUSTED) {
                        store_.setWaitingStatus(row.id, WaitingStatus::FAILED, "code exhausted", now, false);
                        store_.transitionInvite(row.inviteId, InviteStatus::PENDING, InviteStatus::FAILED, 0,
                                                "code exhausted", now);
                        ++report.invalidated;
                        continue;
                    }
                    consumedNow = true;
                    store_.setWaitingQuotaConsumed(row.id, true);
                }

                const auto invite = store_.invite(row.inviteId);
                const uint64_t taskId = invite ? invite->taskId : queue_.nextTaskId();
                DispatchTask task{
                    Tasks::makeRequest(taskId, row.inviteId, row.identity, row.code, row.groupId, row.rebind, now)
                };
                task.request.waitingId = row.id;
                task.request.quotaConsumed = true;

                store_.setWaitingStatus(row.id, WaitingStatus::PROCESSING, "", now, true);
                if (!queue_.trySubmit(task)) {
                    store_.setWaitingStatus(row.id, WaitingStatus::WAITING, "resubmit failed", now, false);
                    if (consumedNow) {
                        if (!bucket_.refund(row.code)) store_.adjustCodeUsage(row.code, -1);
                        store_.setWaitingQuotaConsumed(row.id, false);
                    }
                    ++report.reverted;
                    Logger::warn(SRC, tag_, "queue full, waiting %u stays queued", row.id);
                    return report;
                }
                ++report.promoted;
                --available;
                Logger::debug(SRC, tag_, "promoted waiting %u (%s) group %u", row.id, row.identity, groupId);
            }
        }

        if (report.promoted > 0 || report.invalidated > 0) {
            Logger::info(SRC, tag_, "waiting queue: %u promoted, %u invalid, %u reverted", report.promoted,
                         report.invalidated, report.reverted);
        }
        return report;
    });
}

ReconcileReport WaitingQueueReconciler::sweepStaleReserved(const time_t now) {
    return singleFlight(ReconcileKind::STALE_RESERVED, [&] {
        ReconcileReport report{};
        const time_t cutoff = now - static_cast<time_t>(settings_.staleReservedSec);
        for (const auto &invite: store_.invitesOlderThan(InviteStatus::RESERVED, cutoff)) {
            InviteRequest request = Tasks::makeRequest(invite.taskId, invite.id, invite.identity, invite.code, 0,
                                                       invite.rebind, invite.createdAt);
            request.quotaConsumed = true;
            if (!compensator_.compensate(request, "stale reservation", now)) {
                store_.transitionInvite(invite.id, InviteStatus::RESERVED, InviteStatus::FAILED, 0,
                                        "stale reservation", now);
            }
            ++report.swept;
        }
        if (report.swept > 0) {
            Logger::warn(SRC, tag_, "released %u stale reservations", report.swept);
        }
        return report;
    });
}

ReconcileReport WaitingQueueReconciler::syncQuota() {
    return singleFlight(ReconcileKind::QUOTA_SYNC, [&] {
        ReconcileReport report{};
        try {
            report.synced = bucket_.syncToStore();
        } catch (const coordination_unavailable &e) {
            Logger::warn(SRC, tag_, "quota sync incomplete: %s", e.what());
        }
        return report;
    });
}
