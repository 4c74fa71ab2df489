#pragma once

#include <string>
#include <vector>

#include "reconcile/WaitingQueueReconciler.h"
#include "tests/TestConfig.hpp"
#include "tests/TestValidator.hpp"

namespace Test::Scenarios {

inline void waitingQueuePromotesOldestFirst(TestEnv &env) {
    TestValidator v(env.result);
    env.team(1, 2);
    env.confirm(1, 2);
    env.code("FIFO", 0);

    const std::vector<std::string> names{"first@example.com", "second@example.com", "third@example.com"};
    std::vector<uint32_t> handles;
    for (const auto &name: names) handles.push_back(env.node.service().enqueueInvite(name, "FIFO", 0));

    auto worker = env.worker();
    v.expectEq(worker.runBatch(env.drainQueue(), env.now()).waitlisted, 3u, "all three wait");

    env.node.store().removeMember(1, "member-1-0");
    env.node.store().removeMember(1, "member-1-1");

    const auto report = env.node.reconciler().promoteWaiting(100, env.now());
    v.expect(report.ran, "pass ran");
    v.expectEq(report.promoted, 2u, "two seats, two promotions");

    const auto promoted = env.drainQueue();
    if (!v.expectEq(promoted.size(), 2u, "two tasks resubmitted")) return;
    v.expectEq(std::string(Tasks::requestOf(promoted[0])->identity), names[0], "oldest first");
    v.expectEq(std::string(Tasks::requestOf(promoted[1])->identity), names[1], "second oldest next");

    const auto left = env.node.store().oldestWaiting(0, 10);
    if (v.expectEq(left.size(), 1u, "one still waiting")) {
        v.expectEq(std::string(left.front().identity), names[2], "newest keeps waiting");
    }

    const auto delivered = worker.runBatch(promoted, env.now());
    v.expectEq(delivered.invited, 2u, "promoted requests delivered");
    v.expectEq(env.inviteStatus(handles[0]), InviteStatus::SUCCESS, "first handle settled");
    v.expectEq(env.inviteStatus(handles[2]), InviteStatus::PENDING, "third handle still pending");
    const auto row = env.node.store().waitingTask(Tasks::requestOf(promoted[0])->waitingId);
    v.expect(row && row->status == WaitingStatus::SUCCESS, "waiting row closed");
}

inline void rejectedReservationWaitsWithoutQuota(TestEnv &env) {
    TestValidator v(env.result);
    env.team(1, 1);
    env.code("QUOTA", 3);
    env.client.rejected.insert("holder@example.com");

    const auto holder = env.node.service().reserveSeat("holder@example.com", "QUOTA", 0);
    const auto late = env.node.service().reserveSeat("late@example.com", "QUOTA", 0);
    v.expect(holder.ok, "first reservation");
    v.expect(!late.ok, "second reservation rejected");
    v.expect(late.waitingId != 0, "rejected request wait-listed");
    v.expectEq(env.inviteStatus(late.inviteId), InviteStatus::PENDING, "handle returned for the waiting request");
    v.expectEq(env.remaining("QUOTA"), 2, "rejected request gave its use back");
    v.expect(!env.node.store().waitingTask(late.waitingId)->quotaConsumed, "waiting row owes a use");

    // The holder is rejected externally, which frees the seat.
    auto worker = env.worker();
    worker.runBatch(env.drainQueue(), env.now());
    v.expectEq(env.inviteStatus(holder.inviteId), InviteStatus::FAILED, "holder failed");
    v.expectEq(env.remaining("QUOTA"), 3, "holder refunded");

    const auto report = env.node.reconciler().promoteWaiting(100, env.now());
    v.expectEq(report.promoted, 1u, "late request promoted");
    v.expectEq(env.remaining("QUOTA"), 2, "use taken on promotion");
    const auto row = env.node.store().waitingTask(late.waitingId);
    v.expect(row->quotaConsumed, "row marked consumed");
    v.expectEq(row->status, WaitingStatus::PROCESSING, "row processing");
    v.expectEq(row->retryCount, 1u, "promotion counted");

    v.expectEq(worker.runBatch(env.drainQueue(), env.now()).invited, 1u, "late request delivered");
    v.expectEq(env.inviteStatus(late.inviteId), InviteStatus::SUCCESS, "original handle settled");
}

inline void invalidCodesLeaveTheWaitingQueue(TestEnv &env) {
    TestValidator v(env.result);
    env.team(1, 1);
    env.code("OLD", 5);
    env.code("GONE", 1);

    const auto holder = env.node.service().reserveSeat("holder@example.com", "OLD", 0);
    const auto late = env.node.service().reserveSeat("late@example.com", "OLD", 0);
    const auto spent = env.node.service().reserveSeat("spent@example.com", "GONE", 0);
    v.expect(holder.ok && !late.ok && !spent.ok, "one seat, two waiting");

    env.node.store().upsertCode("OLD", 5, 0, 0, false);
    v.expect(env.node.bucket().tryConsume("GONE") == TokenBucket::Outcome::CONSUMED, "last use spent elsewhere");
    env.team(2, 5);

    const auto report = env.node.reconciler().promoteWaiting(100, env.now());
    v.expectEq(report.promoted, 0u, "nothing promoted");
    v.expectEq(report.invalidated, 2u, "both rows invalidated");
    v.expectEq(env.inviteStatus(late.inviteId), InviteStatus::FAILED, "deactivated code fails the request");
    v.expectEq(env.inviteStatus(spent.inviteId), InviteStatus::FAILED, "exhausted code fails the request");
    v.expectEq(env.node.store().waitingTask(late.waitingId)->status, WaitingStatus::FAILED, "row closed");
}

inline void reconcileIsSingleFlight(TestEnv &env) {
    TestValidator v(env.result);
    env.team(1, 1);
    env.confirm(1, 1);
    env.code("SOLO", 0);
    env.node.service().reserveSeat("solo@example.com", "SOLO", 0);
    env.node.store().removeMember(1, "member-1-0");

    v.expect(env.node.coordinator().mutexTryLock("reconcile:waiting_queue", "other-replica", 10'000),
             "another replica holds the pass");
    const auto skipped = env.node.reconciler().promoteWaiting(100, env.now());
    v.expect(!skipped.ran, "pass skipped while locked");
    v.expectEq(env.node.queue().depth(), 0u, "nothing resubmitted");
    env.node.coordinator().mutexUnlock("reconcile:waiting_queue", "other-replica");

    UnavailableCoordinator down;
    WaitingQueueReconciler blind(env.node.store(), env.node.ledger(), down, env.node.queue(), env.node.bucket(),
                                 env.node.compensator(), "test", WaitingQueueReconciler::Settings{});
    v.expect(!blind.promoteWaiting(100, env.now()).ran, "pass skipped while the lock service is down");

    const auto report = env.node.reconciler().run({ReconcileKind::WAITING_QUEUE, 100, env.now()}, env.now());
    v.expect(report.ran, "pass runs once the lock is free");
    v.expectEq(report.promoted, 1u, "waiting request promoted");
    v.expect(env.node.coordinator().mutexTryLock("reconcile:waiting_queue", "other-replica", 10'000),
             "lock released after the pass");
}

inline void staleReservationsAreReleased(TestEnv &env) {
    TestValidator v(env.result);
    env.team(1, 2);
    env.code("STALE", 2);

    const auto held = env.node.service().reserveSeat("stuck@example.com", "STALE", 0);
    v.expectEq(env.remaining("STALE"), 1, "use taken");

    const auto early = env.node.reconciler().sweepStaleReserved(env.now());
    v.expectEq(early.swept, 0u, "fresh reservation kept");

    const auto report = env.node.reconciler().sweepStaleReserved(env.now() + 3601);
    v.expectEq(report.swept, 1u, "stale reservation swept");
    v.expectEq(env.inviteStatus(held.inviteId), InviteStatus::FAILED, "reservation failed");
    v.expectEq(env.remaining("STALE"), 2, "use refunded");
    v.expectEq(env.node.ledger().capacity(1, env.now())->available, 2u, "seat released");

    v.expectEq(env.node.reconciler().sweepStaleReserved(env.now() + 3601).swept, 0u, "second sweep finds nothing");
    v.expectEq(env.remaining("STALE"), 2, "no second refund");
}

inline void sweepMeasuresFromTheClaim(TestEnv &env) {
    TestValidator v(env.result);
    env.team(1, 2);
    env.code("QUEUED", 0);
    const time_t now = env.now();

    const DispatchTask queued = env.pendingTask("queued@example.com", "QUEUED", 21, now - 2 * 3600);
    {
        auto tx = env.node.reservation().lockTeams({1});
        v.expectEq(env.node.reservation().claim(tx, 1, {queued}, now).claimed.size(), 1u, "claimed now");
        tx.commit();
    }

    v.expectEq(env.node.reconciler().sweepStaleReserved(now).swept, 0u, "fresh claim of an old request kept");
    v.expectEq(env.inviteStatus(queued.request.inviteId), InviteStatus::RESERVED, "still reserved for delivery");

    v.expectEq(env.node.reconciler().sweepStaleReserved(now + 3601).swept, 1u, "swept an hour after the claim");
    v.expectEq(env.inviteStatus(queued.request.inviteId), InviteStatus::FAILED, "abandoned claim failed");
}

inline void quotaSyncWritesUsage(TestEnv &env) {
    TestValidator v(env.result);
    env.code("SYNC", 10);
    env.code("FREE", 0);
    for (int i = 0; i < 3; ++i) env.node.bucket().tryConsume("SYNC");
    v.expectEq(env.node.store().code("SYNC")->usedCount, 0u, "bucket runs ahead of the store");

    const auto report = env.node.reconciler().syncQuota();
    v.expect(report.ran, "pass ran");
    v.expectEq(report.synced, 1u, "limited code synced, unlimited skipped");
    v.expectEq(env.node.store().code("SYNC")->usedCount, 3u, "used = max - remaining");
}

inline std::vector<TestScenario> reconcileScenarios() {
    return {
        {"Waiting queue FIFO", "Freed seats go to the oldest waiting requests", waitingQueuePromotesOldestFirst},
        {"Rejected reservation", "A rejected reservation waits and pays its use on promotion",
         rejectedReservationWaitsWithoutQuota},
        {"Invalid waiting codes", "Rows whose code lapsed are closed", invalidCodesLeaveTheWaitingQueue},
        {"Single-flight reconcile", "Passes skip while locked or unreachable", reconcileIsSingleFlight},
        {"Stale reservations", "Old reservations are failed and refunded once", staleReservationsAreReleased},
        {"Stale sweep age", "Reservation age is measured from the claim, not the enqueue",
         sweepMeasuresFromTheClaim},
        {"Quota sync", "Bucket counts are written back as durable usage", quotaSyncWritesUsage},
    };
}

} // namespace Test::Scenarios
