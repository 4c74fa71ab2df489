#pragma once

#include <string>
#include <vector>

#include "core/Constants.h"
#include "core/Seed.h"
#include "tests/TestConfig.hpp"
#include "tests/TestValidator.hpp"

namespace Test::Scenarios {

inline void requestValidation(TestEnv &env) {
    TestValidator v(env.result);
    env.team(1, 5, 1);
    env.team(2, 5, 2);
    env.code("G1", 5, 1);
    env.code("ANY", 0);
    env.code("ONE", 1);
    InviteService &service = env.node.service();

    v.expectThrows<invalid_code>([&] { service.enqueueInvite("a@example.com", "NOPE", 0); }, "unknown code");
    v.expectThrows<invalid_code>([&] { service.enqueueInvite("a@example.com", "G1", 2); }, "code bound to group 1");
    v.expectEq(env.remaining("G1"), 5, "refused request took no use");
    v.expectThrows<std::invalid_argument>([&] { service.enqueueInvite("   ", "ANY", 0); }, "empty identity");

    const uint32_t bound = service.enqueueInvite("a@example.com", "G1", 0);
    const uint32_t open = service.enqueueInvite("b@example.com", "ANY", 2);
    const auto tasks = env.drainQueue();
    if (v.expectEq(tasks.size(), 2u, "both accepted")) {
        v.expectEq(Tasks::requestOf(tasks[0])->groupId, 1u, "code group wins");
        v.expectEq(Tasks::requestOf(tasks[1])->groupId, 2u, "caller group used for an unbound code");
    }
    v.expect(bound != open, "distinct handles");

    service.enqueueInvite("c@example.com", "ONE", 0);
    v.expectThrows<invalid_code>([&] { service.enqueueInvite("d@example.com", "ONE", 0); }, "exhausted code");

    env.node.store().upsertCode("ANY", 0, 0, env.now() - 10, true);
    v.expectThrows<invalid_code>([&] { service.enqueueInvite("e@example.com", "ANY", 0); }, "expired code");
}

inline void identitiesAreNormalized(TestEnv &env) {
    TestValidator v(env.result);
    env.team(1, 5);
    env.code("NORM", 0);

    const uint32_t handle = env.node.service().enqueueInvite("  Mixed.Case@Example.COM\t", "NORM", 0);
    const auto row = env.node.service().inviteStatus(handle);
    if (v.expect(row.has_value(), "handle resolves")) {
        v.expectEq(std::string(row->identity), std::string("mixed.case@example.com"), "trimmed and lower-cased");
        v.expectEq(row->status, InviteStatus::PENDING, "accepted as pending");
    }
    v.expect(!env.node.service().inviteStatus(9999), "unknown handle");
}

inline void fullQueueRefusesAndRefunds(TestEnv &env) {
    TestValidator v(env.result);
    env.code("BULK", 200);
    const uint32_t capacity = Constants::Queue::TASK_QUEUE_CAPACITY;

    uint32_t accepted = 0;
    bool refused = false;
    for (uint32_t i = 0; i <= capacity && !refused; ++i) {
        try {
            env.node.service().enqueueInvite("bulk" + std::to_string(i) + "@example.com", "BULK", 0);
            ++accepted;
        } catch (const queue_full &) {
            refused = true;
        }
    }

    v.expect(refused, "queue_full raised");
    v.expectEq(accepted, capacity, "queue holds its capacity");
    v.expectEq(env.remaining("BULK"), static_cast<int64_t>(200 - accepted), "refused request refunded");
    v.expectEq(env.node.store().depth().invites[static_cast<uint8_t>(InviteStatus::FAILED)], 1u,
               "refused handle marked failed");
    v.expectEq(env.node.service().getQueueDepth().queued, capacity, "depth reports the backlog");
    v.expectEq(env.drainQueue().size(), static_cast<size_t>(capacity), "drained");
}

inline void capacityAndDepthViews(TestEnv &env) {
    TestValidator v(env.result);
    env.team(1, 4, 1);
    env.team(2, 6, 2);
    env.confirm(1, 1);
    env.code("VIEW", 0);

    const auto all = env.node.service().getCapacity(0);
    v.expectEq(all.teams, 2u, "two teams");
    v.expectEq(all.capacity, 10u, "total capacity");
    v.expectEq(all.available, 9u, "total available");
    v.expectEq(env.node.service().getCapacity(1).available, 3u, "group 1 available");

    env.node.service().reserveSeat("v@example.com", "VIEW", 2);
    const auto depth = env.node.service().getQueueDepth();
    v.expectEq(depth.store.invites[static_cast<uint8_t>(InviteStatus::RESERVED)], 1u, "reserved count");
    v.expectEq(depth.queued, 1u, "reserve task queued");
    v.expectEq(depth.delayed, 0u, "nothing delayed");
    v.expectEq(env.node.service().getCapacity(2).pending, 1u, "reservation pending on group 2");
}

inline void memberRemovalRetriesTransientFailures(TestEnv &env) {
    TestValidator v(env.result);
    env.team(1, 3);
    env.confirm(1, 1);
    env.code("JOIN", 0);

    const uint32_t handle = env.node.service().enqueueInvite("joiner@example.com", "JOIN", 0);
    auto worker = env.worker();
    worker.runBatch(env.drainQueue(), env.now());
    env.node.store().addMember(1, "joiner@example.com");
    v.expectEq(env.node.store().memberCount(1), 2u, "joined");

    env.client.failRemovals = 1;
    env.node.service().removeMember(1, "Joiner@Example.com");
    v.expectEq(env.client.removals.size(), 1u, "removed after one transient failure");
    v.expectEq(env.node.store().memberCount(1), 1u, "member row gone");
    v.expectEq(env.inviteStatus(handle), InviteStatus::REMOVED, "invite marked removed");
    v.expectEq(env.node.ledger().capacity(1, env.now())->available, 2u, "seat returned");

    env.client.failRemovals = 1;
    env.client.removalStatus = 403;
    v.expectThrows<membership_error>([&] { env.node.service().removeMember(1, "member-1-0"); },
                                     "permanent failure surfaces");
    v.expectEq(env.node.store().memberCount(1), 1u, "member kept when the external call failed");
}

inline void seedParsing(TestEnv &env) {
    TestValidator v(env.result);

    const auto teams = Seed::parseTeams("1:5:0,2:3:1");
    if (v.expectEq(teams.size(), 2u, "two teams")) {
        v.expectEq(teams[1].id, 2u, "team id");
        v.expectEq(teams[1].capacity, 3u, "capacity");
        v.expectEq(teams[1].groupId, 1u, "group");
    }
    const auto codes = Seed::parseCodes("OPEN:0:0,VIP:3:2");
    if (v.expectEq(codes.size(), 2u, "two codes")) {
        v.expectEq(codes[0].maxUses, 0u, "unlimited");
        v.expectEq(codes[1].code, std::string("VIP"), "code value");
    }
    v.expect(Seed::parseTeams("").empty(), "empty seed");

    v.expectThrows<std::runtime_error>([] { Seed::parseTeams("1:5"); }, "missing field");
    v.expectThrows<std::runtime_error>([] { Seed::parseTeams("0:5:0"); }, "team id 0 reserved");
    v.expectThrows<std::runtime_error>([] { Seed::parseTeams("x:5:0"); }, "non-numeric id");
    v.expectThrows<std::runtime_error>([] { Seed::parseCodes("A:-1:0"); }, "negative uses");
}

inline std::vector<TestScenario> serviceScenarios() {
    return {
        {"Request validation", "Unknown, foreign, exhausted and expired codes are refused", requestValidation},
        {"Identity normalization", "Identities are trimmed and lower-cased", identitiesAreNormalized},
        {"Queue full", "A full task queue refuses the request and refunds its use", fullQueueRefusesAndRefunds},
        {"Capacity views", "Capacity and depth summaries per group", capacityAndDepthViews},
        {"Member removal", "Transient removal failures are retried, permanent ones surface",
         memberRemovalRetriesTransientFailures},
        {"Seed parsing", "Team and code seed lists", seedParsing},
    };
}

} // namespace Test::Scenarios
