#pragma once

#include <string>
#include <vector>

#include "core/Constants.h"
#include "seats/Allocator.h"
#include "tests/TestConfig.hpp"
#include "tests/TestValidator.hpp"

namespace Test::Scenarios {

namespace detail {
    inline TeamCapacity room(const uint32_t teamId, const uint32_t available) {
        return {teamId, 0, TeamHealth::ACTIVE, available, 0, 0, available};
    }
}

inline void allocatorConservesTasks(TestEnv &env) {
    TestValidator v(env.result);
    const std::vector<int> tasks{1, 2, 3, 4, 5, 6, 7};
    const std::vector<TeamCapacity> teams{detail::room(3, 0), detail::room(2, 5), detail::room(1, 1)};

    for (const auto strategy: {AllocationStrategy::SEQUENTIAL_FILL, AllocationStrategy::GREEDY_SLICE}) {
        const std::string label = strategy == AllocationStrategy::GREEDY_SLICE ? "greedy" : "sequential";
        const auto result = Allocator::allocate(strategy, tasks, teams);

        v.expectEq(result.allocatedCount() + result.unallocated.size(), tasks.size(), label + " keeps every task");
        v.expectEq(result.totalAvailable, 6u, label + " total available");
        v.expect(result.allocated.count(3) == 0, label + " skips the full team");
        v.expect(result.allocated.count(1) && result.allocated.at(1) == std::vector<int>{1},
                 label + " fills the lowest team id first");
        v.expect(result.allocated.count(2) && result.allocated.at(2) == std::vector<int>({2, 3, 4, 5, 6}),
                 label + " keeps queue order on team 2");
        v.expect(result.unallocated == std::vector<int>{7}, label + " leaves the overflow unallocated");
    }
}

inline void allocatorSplitsAcrossPartialTeams(TestEnv &env) {
    TestValidator v(env.result);
    const std::vector<int> tasks{1, 2, 3};
    const auto result = Allocator::sequentialFill(tasks, {detail::room(1, 1), detail::room(2, 5)});

    v.expectEq(result.allocated.at(1).size(), 1u, "team 1 takes one");
    v.expectEq(result.allocated.at(2).size(), 2u, "team 2 takes the rest");
    v.expect(result.unallocated.empty(), "nothing left over");

    const auto empty = Allocator::greedySlice(tasks, {detail::room(1, 0)});
    v.expect(empty.allocated.empty(), "no capacity allocates nothing");
    v.expectEq(empty.unallocated.size(), 3u, "no capacity leaves all unallocated");
}

inline void ledgerCountsConfirmedAndPending(TestEnv &env) {
    TestValidator v(env.result);
    env.team(1, 5);
    env.team(2, 3);
    env.confirm(1, 2);
    env.code("LEDGER", 0);

    const auto reserved = env.node.service().reserveSeat("Pending@Example.com ", "LEDGER", 0);
    v.expect(reserved.ok, "seat reserved");
    v.expectEq(reserved.teamId, 1u, "lowest team with room is chosen");

    auto team1 = env.node.ledger().capacity(1, env.now());
    v.expectEq(team1->confirmed, 2u, "confirmed members");
    v.expectEq(team1->pending, 1u, "reserved invite holds a seat");
    v.expectEq(team1->available, 2u, "available = capacity - confirmed - pending");

    // Once the identity shows up as a member it is counted once, as confirmed.
    env.node.store().addMember(1, "pending@example.com");
    team1 = env.node.ledger().capacity(1, env.now());
    v.expectEq(team1->confirmed, 3u, "confirmed after join");
    v.expectEq(team1->pending, 0u, "no double count after join");

    const auto summary = env.node.ledger().summary(0, env.now());
    v.expectEq(summary.teams, 2u, "both teams counted");
    v.expectEq(summary.available, 5u, "summary available");

    env.node.store().setTeamHealth(2, TeamHealth::BANNED);
    v.expectEq(env.node.ledger().listCapacities(0, true, env.now()).size(), 1u, "unhealthy team excluded");
    v.expectEq(env.node.ledger().listCapacities(0, false, env.now()).size(), 2u, "unhealthy team listed on request");
    v.expect(!env.node.ledger().capacity(42, env.now()), "unknown team has no capacity");
}

inline void ledgerWindowExpiresOldHolds(TestEnv &env) {
    TestValidator v(env.result);
    env.team(1, 5);
    const time_t now = env.now();
    const time_t expired = now - static_cast<time_t>(Constants::Capacity::PENDING_WINDOW_SEC) - 1;
    const time_t inside = now - static_cast<time_t>(Constants::Capacity::PENDING_WINDOW_SEC) + 1;

    uint32_t oldSent = 0;
    uint32_t freshSent = 0;
    {
        auto tx = env.node.store().begin({1}, 1000);
        tx.insertReserved(1, "old-reserved@example.com", "", false, 1, expired);
        tx.insertReserved(1, "fresh-reserved@example.com", "", false, 2, inside);
        oldSent = tx.insertReserved(1, "old-sent@example.com", "", false, 3, expired);
        freshSent = tx.insertReserved(1, "fresh-sent@example.com", "", false, 4, inside);
        tx.commit();
    }
    env.node.store().transitionInvite(oldSent, InviteStatus::RESERVED, InviteStatus::SUCCESS, 1, "", now);
    env.node.store().transitionInvite(freshSent, InviteStatus::RESERVED, InviteStatus::SUCCESS, 1, "", now);

    const auto team1 = env.node.ledger().capacity(1, now);
    v.expectEq(team1->pending, 2u, "only holds inside the window count");
    v.expectEq(team1->available, 3u, "expired holds free their seats");
    v.expectEq(env.node.store().invite(freshSent)->heldSince(), inside, "sending keeps the hold start");
}

inline void agedPendingRequestHoldsItsSeat(TestEnv &env) {
    TestValidator v(env.result);
    env.team(1, 1);
    env.team(2, 1);
    env.code("AGED", 0);
    const time_t now = env.now();
    const time_t dayAgo = now - static_cast<time_t>(Constants::Capacity::PENDING_WINDOW_SEC) - 3600;

    const DispatchTask first = env.pendingTask("first@example.com", "AGED", 11, dayAgo);
    const DispatchTask second = env.pendingTask("second@example.com", "AGED", 12, dayAgo);
    const DispatchTask third = env.pendingTask("third@example.com", "AGED", 13, dayAgo);
    ReservationCoordinator &reservation = env.node.reservation();

    {
        auto tx = reservation.lockTeams({1});
        v.expectEq(reservation.claim(tx, 1, {first}, now).claimed.size(), 1u, "first request claims the seat");
        tx.commit();
    }
    const auto claimed = env.node.store().invite(first.request.inviteId);
    v.expectEq(claimed->heldSince(), now, "hold starts at the claim, not at enqueue");
    v.expectEq(env.node.ledger().capacity(1, now)->available, 0u, "claimed seat counts against capacity");

    {
        auto tx = reservation.lockTeams({1});
        const auto result = reservation.claim(tx, 1, {second}, now);
        v.expect(result.claimed.empty(), "full team refuses a second aged request");
        v.expectEq(result.overflow.size(), 1u, "second request overflows");
        tx.commit();
    }
    v.expectEq(env.inviteStatus(second.request.inviteId), InviteStatus::PENDING, "second request still pending");

    {
        auto tx = reservation.lockTeams({2});
        v.expectEq(reservation.claim(tx, 2, {third}, now).claimed.size(), 1u, "claimed inside the transaction");
        tx.rollback();
    }
    const auto undone = env.node.store().invite(third.request.inviteId);
    v.expectEq(undone->status, InviteStatus::PENDING, "rollback returns the request to PENDING");
    v.expectEq(undone->reservedAt, static_cast<time_t>(0), "rollback clears the hold start");
    v.expectEq(env.node.ledger().capacity(2, now)->available, 1u, "rolled back claim holds nothing");

    env.node.store().transitionInvite(first.request.inviteId, InviteStatus::RESERVED, InviteStatus::PENDING, 0,
                                      "backoff", now);
    v.expectEq(env.node.store().invite(first.request.inviteId)->reservedAt, static_cast<time_t>(0),
               "released seat clears the hold start");
    v.expectEq(env.node.ledger().capacity(1, now)->available, 1u, "released seat is free again");
}

inline void overflowGoesToEmptyTeam(TestEnv &env) {
    TestValidator v(env.result);
    env.team(1, 2);
    env.confirm(1, 2);
    env.team(2, 5);
    env.code("OPEN", 0);

    std::vector<uint32_t> handles;
    for (int i = 0; i < 3; ++i) {
        handles.push_back(env.node.service().enqueueInvite("user" + std::to_string(i) + "@example.com", "OPEN", 0));
    }

    auto worker = env.worker();
    const auto report = worker.runBatch(env.drainQueue(), env.now());

    v.expectEq(report.invited, 3u, "all three invited");
    v.expectEq(env.client.invitedOn(1), 0u, "full team never called");
    v.expectEq(env.client.invitedOn(2), 3u, "empty team takes all three");
    for (const uint32_t handle: handles) {
        v.expectEq(env.inviteStatus(handle), InviteStatus::SUCCESS, "invite " + std::to_string(handle));
        v.expectEq(env.node.store().invite(handle)->teamId, 2u, "invite on team 2");
    }
    v.expectEq(env.node.ledger().capacity(2, env.now())->available, 2u, "team 2 seats now pending");
    v.expectEq(env.node.store().code("OPEN")->usedCount, 3u, "unlimited code still counts uses");
}

inline void greedyAndSequentialAgreeOnCounts(TestEnv &env) {
    TestValidator v(env.result);
    env.team(1, 1);
    env.team(2, 1);
    env.team(3, 4);
    env.code("MIX", 0);

    for (int i = 0; i < 8; ++i) {
        env.node.service().enqueueInvite("mix" + std::to_string(i) + "@example.com", "MIX", 0);
    }

    auto settings = TestEnv::workerSettings();
    settings.strategy = AllocationStrategy::GREEDY_SLICE;
    auto worker = env.worker(settings);
    const auto report = worker.runBatch(env.drainQueue(), env.now());

    v.expectEq(report.invited, 6u, "six seats filled");
    v.expectEq(report.waitlisted, 2u, "two wait");
    v.expectEq(env.client.calls.size(), 3u, "one external call per team");
    v.expectEq(env.node.store().depth().waiting[static_cast<uint8_t>(WaitingStatus::WAITING)], 2u,
               "waiting rows created");
    v.expectEq(env.node.ledger().summary(0, env.now()).available, 0u, "pool full");
}

inline void concurrentReservationsNeverOversell(TestEnv &env) {
    TestValidator v(env.result);
    constexpr uint32_t capacity = 3;
    constexpr int contenders = 8;
    env.team(1, capacity);
    env.code("RUSH", 0);

    std::vector<pid_t> children;
    for (int i = 0; i < contenders; ++i) {
        children.push_back(env.fork([&env, i] {
            const auto result = env.node.service().reserveSeat("rush" + std::to_string(i) + "@example.com",
                                                               "RUSH", 0);
            return result.ok ? 0 : 1;
        }));
    }

    uint32_t reserved = 0;
    uint32_t waiting = 0;
    for (const pid_t pid: children) {
        const int code = TestEnv::join(pid);
        if (code == 0) ++reserved;
        else if (code == 1) ++waiting;
        else v.expect(false, "child " + std::to_string(pid) + " exited with " + std::to_string(code));
    }

    v.expectEq(reserved, capacity, "exactly capacity reservations");
    v.expectEq(waiting, contenders - capacity, "the rest wait");
    const auto depth = env.node.store().depth();
    v.expectEq(depth.invites[static_cast<uint8_t>(InviteStatus::RESERVED)], capacity, "RESERVED rows");
    v.expectEq(env.node.ledger().capacity(1, env.now())->available, 0u, "no seat left");
}

inline void lastSeatGoesToOneCaller(TestEnv &env) {
    TestValidator v(env.result);
    env.team(1, 2);
    env.confirm(1, 1);
    env.code("LAST", 0);

    const pid_t a = env.fork([&env] { return env.node.service().reserveSeat("a@example.com", "LAST", 0).ok ? 0 : 1; });
    const pid_t b = env.fork([&env] { return env.node.service().reserveSeat("b@example.com", "LAST", 0).ok ? 0 : 1; });
    const int codeA = TestEnv::join(a);
    const int codeB = TestEnv::join(b);

    v.expect((codeA == 0) != (codeB == 0), "exactly one caller gets the seat");
    v.expect(codeA <= 1 && codeB <= 1, "no caller crashed");
}

inline void overlappingTransactionsDoNotDeadlock(TestEnv &env) {
    TestValidator v(env.result);
    for (uint32_t id = 1; id <= 4; ++id) env.team(id, 100);

    // Each child asks for an overlapping set in a different order; the store locks ascending.
    const std::vector<std::vector<uint32_t>> sets{{1, 2, 3}, {3, 2, 1}, {4, 2}, {2, 4, 1}, {3, 4}, {4, 3, 2, 1}};
    std::vector<pid_t> children;
    for (size_t i = 0; i < sets.size(); ++i) {
        const auto ids = sets[i];
        children.push_back(env.fork([&env, ids, i] {
            for (int round = 0; round < 20; ++round) {
                auto tx = env.node.store().begin(ids, 5000);
                tx.insertReserved(ids.front(), "tx" + std::to_string(i) + "-" + std::to_string(round) + "@x",
                                  "", false, 0, time(nullptr));
                tx.commit();
            }
            return 0;
        }));
    }

    uint32_t clean = 0;
    for (const pid_t pid: children) {
        if (TestEnv::join(pid) == 0) ++clean;
    }
    v.expectEq(clean, static_cast<uint32_t>(sets.size()), "every transaction finished without a lock conflict");
    v.expectEq(env.node.store().depth().invites[static_cast<uint8_t>(InviteStatus::RESERVED)],
               static_cast<uint32_t>(sets.size() * 20), "every committed row kept");
}

inline void heldRowLockTimesOut(TestEnv &env) {
    TestValidator v(env.result);
    env.team(1, 5);
    env.team(2, 5);

    auto holder = env.node.store().begin({1}, 1000);
    v.expectThrows<lock_conflict>([&] { auto tx = env.node.store().begin({2, 1}, 100); }, "contended lock times out");
    v.expect(holder.holds(1), "holder keeps its lock");
    holder.commit();

    // The failed attempt must not leave team 2 locked.
    auto retry = env.node.store().begin({1, 2}, 100);
    v.expect(retry.holds(2), "team 2 released after the timeout");
    retry.commit();
}

inline void rollbackVoidsInsertedRows(TestEnv &env) {
    TestValidator v(env.result);
    env.team(1, 2);

    uint32_t inviteId = 0;
    {
        auto tx = env.node.store().begin({1}, 1000);
        inviteId = tx.insertReserved(1, "gone@example.com", "", false, 7, env.now());
        tx.rollback();
    }
    const auto row = env.node.store().invite(inviteId);
    v.expect(row && row->voided, "rolled back row is voided");
    v.expectEq(env.node.ledger().capacity(1, env.now())->pending, 0u, "voided row holds no seat");

    {
        // Destroyed while open: same as rollback.
        auto tx = env.node.store().begin({1}, 1000);
        inviteId = tx.insertReserved(1, "dropped@example.com", "", false, 8, env.now());
    }
    v.expect(env.node.store().invite(inviteId)->voided, "open transaction rolls back on destruction");
    v.expectEq(env.node.ledger().capacity(1, env.now())->available, 2u, "both seats free");
}

inline std::vector<TestScenario> seatScenarios() {
    return {
        {"Allocator conserves tasks", "Both strategies place or return every task in queue order",
         allocatorConservesTasks},
        {"Allocator splits partial teams", "1-seat and 5-seat teams take 1 and 2 of three tasks",
         allocatorSplitsAcrossPartialTeams},
        {"Ledger counts", "Confirmed members and live invites reduce availability once",
         ledgerCountsConfirmedAndPending},
        {"Ledger window", "Holds older than the lookback window stop counting", ledgerWindowExpiresOldHolds},
        {"Aged pending claim", "A request that waited past the window still holds the seat it claims",
         agedPendingRequestHoldsItsSeat},
        {"Overflow to empty team", "A full team is skipped and its peer takes all requests",
         overflowGoesToEmptyTeam},
        {"Greedy allocation", "Greedy slices fill the pool with one call per team", greedyAndSequentialAgreeOnCounts},
        {"Concurrent reservations", "Eight processes race for three seats", concurrentReservationsNeverOversell},
        {"Last seat", "Two processes race for the last seat", lastSeatGoesToOneCaller},
        {"Lock ordering", "Overlapping row-lock sets in mixed order never deadlock",
         overlappingTransactionsDoNotDeadlock},
        {"Lock timeout", "A held row lock makes a second transaction fail with lock_conflict", heldRowLockTimesOut},
        {"Rollback", "Rolled back reservations never hold a seat", rollbackVoidsInsertedRows},
    };
}

} // namespace Test::Scenarios
