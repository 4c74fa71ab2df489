#pragma once

#include <set>
#include <string>
#include <utility>
#include <vector>

#include "coord/Coordinator.h"
#include "core/Errors.h"
#include "dispatch/MembershipClient.h"

namespace Test {

/**
 * Membership service whose answers are set by the scenario.
 */
class ScriptedMembershipClient : public MembershipClient {
public:
    std::set<std::string> rejected;   // answered 400 on every attempt
    std::set<std::string> flaky;      // answered 503 on every attempt
    uint32_t failWholeCalls{0};       // next N invite calls throw 503
    uint32_t failRemovals{0};         // next N remove calls throw 503
    int32_t removalStatus{503};

    std::vector<std::pair<uint32_t, std::vector<std::string>>> calls;
    std::vector<std::pair<uint32_t, std::string>> removals;

    std::vector<InviteOutcome> invite(const uint32_t teamId, const std::vector<std::string> &identities) override {
        calls.emplace_back(teamId, identities);
        if (failWholeCalls > 0) {
            --failWholeCalls;
            throw membership_error(503, "service unavailable");
        }
        std::vector<InviteOutcome> outcomes;
        for (const auto &identity: identities) {
            if (rejected.count(identity)) {
                outcomes.push_back({identity, false, 400, "identity rejected"});
            } else if (flaky.count(identity)) {
                outcomes.push_back({identity, false, 503, "try later"});
            } else {
                outcomes.push_back({identity, true, 201, ""});
            }
        }
        return outcomes;
    }

    bool remove(const uint32_t teamId, const std::string &identity) override {
        if (failRemovals > 0) {
            --failRemovals;
            throw membership_error(removalStatus, "remove failed");
        }
        removals.emplace_back(teamId, identity);
        return true;
    }

    /** Identities invited on a team across all calls, successful or not. */
    [[nodiscard]] uint32_t invitedOn(const uint32_t teamId) const {
        uint32_t count = 0;
        for (const auto &call: calls) {
            if (call.first == teamId) count += static_cast<uint32_t>(call.second.size());
        }
        return count;
    }
};

/**
 * Coordinator whose backend is down: every call throws.
 */
class UnavailableCoordinator : public Coordinator {
public:
    bool semaphoreAcquire(const std::string &, int64_t, uint32_t) override { down(); }
    void semaphoreRelease(const std::string &) override { down(); }
    int64_t semaphoreCount(const std::string &) override { down(); }
    std::optional<int64_t> counterGet(const std::string &) override { down(); }
    bool counterInit(const std::string &, int64_t, uint32_t) override { down(); }
    void counterSet(const std::string &, int64_t, uint32_t) override { down(); }
    std::optional<int64_t> counterAdd(const std::string &, int64_t) override { down(); }
    int64_t counterIncrementWindow(const std::string &, uint32_t) override { down(); }
    std::optional<int64_t> counterTakeIfPositive(const std::string &) override { down(); }
    bool counterRemove(const std::string &) override { down(); }
    bool mutexTryLock(const std::string &, const std::string &, uint32_t) override { down(); }
    bool mutexUnlock(const std::string &, const std::string &) override { down(); }

private:
    [[noreturn]] static void down() { throw coordination_unavailable("coordinator unreachable (test)"); }
};

} // namespace Test
