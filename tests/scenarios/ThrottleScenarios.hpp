#pragma once

#include <string>
#include <vector>

#include "coord/LocalCoordinator.h"
#include "throttle/RateLimiter.h"
#include "throttle/RedemptionSemaphore.h"
#include "throttle/TokenBucket.h"
#include "tests/TestConfig.hpp"
#include "tests/TestValidator.hpp"
#include "utils/TimeHelper.h"

namespace Test::Scenarios {

inline void bucketEnforcesMaxUses(TestEnv &env) {
    TestValidator v(env.result);
    env.code("THREE", 3);
    TokenBucket &bucket = env.node.bucket();

    for (int i = 0; i < 3; ++i) {
        v.expect(bucket.tryConsume("THREE") == TokenBucket::Outcome::CONSUMED, "use " + std::to_string(i + 1));
    }
    v.expect(bucket.tryConsume("THREE") == TokenBucket::Outcome::EXHAUSTED, "fourth use refused");
    v.expectEq(env.remaining("THREE"), 0, "bucket never goes negative");

    v.expect(bucket.refund("THREE"), "refund applied");
    v.expectEq(env.remaining("THREE"), 1, "refund restores one use");
    v.expect(bucket.tryConsume("THREE") == TokenBucket::Outcome::CONSUMED, "refunded use can be taken again");

    v.expectThrows<invalid_code>([&] { bucket.tryConsume("MISSING"); }, "unknown code");
}

inline void bucketHoldsUnderConcurrency(TestEnv &env) {
    TestValidator v(env.result);
    constexpr uint32_t uses = 5;
    env.code("SHARED", uses);

    std::vector<pid_t> children;
    for (int i = 0; i < 12; ++i) {
        children.push_back(env.fork([&env] {
            return env.node.bucket().tryConsume("SHARED") == TokenBucket::Outcome::CONSUMED ? 0 : 1;
        }));
    }

    uint32_t consumed = 0;
    for (const pid_t pid: children) {
        if (TestEnv::join(pid) == 0) ++consumed;
    }
    v.expectEq(consumed, uses, "exactly max uses consumed across processes");
    v.expectEq(env.remaining("SHARED"), 0, "bucket drained to zero");
}

inline void bucketRebuildsFromStore(TestEnv &env) {
    TestValidator v(env.result);
    env.code("DURABLE", 10);
    env.node.store().setCodeUsage("DURABLE", 4);

    const auto row = env.node.store().code("DURABLE");
    v.expect(env.node.bucket().ensure(*row), "limited code has a bucket");
    v.expectEq(env.remaining("DURABLE"), 10, "ensure keeps a live bucket");
    env.node.bucket().rebuild(*row);
    v.expectEq(env.remaining("DURABLE"), 6, "rebuild uses max minus durable usage");

    env.node.coordinator().counterRemove(TokenBucket::keyFor("DURABLE"));
    v.expect(env.node.bucket().tryConsume("DURABLE") == TokenBucket::Outcome::CONSUMED,
             "lazy initialization on first use");
    v.expectEq(env.remaining("DURABLE"), 5, "initialized from the store then consumed");
}

inline void bucketFailsClosed(TestEnv &env) {
    TestValidator v(env.result);
    env.code("CLOSED", 3);

    UnavailableCoordinator down;
    TokenBucket bucket(down, env.node.store());
    v.expect(bucket.tryConsume("CLOSED") == TokenBucket::Outcome::UNAVAILABLE, "refused while unreachable");
    v.expect(!bucket.refund("CLOSED"), "refund reports it was not applied");
    v.expect(!bucket.remaining("CLOSED"), "remaining unknown");
    v.expectEq(env.node.store().code("CLOSED")->usedCount, 0u, "durable usage untouched");
}

inline void unlimitedCodesSkipTheBucket(TestEnv &env) {
    TestValidator v(env.result);
    env.code("FREE", 0);

    for (int i = 0; i < 4; ++i) {
        v.expect(env.node.bucket().tryConsume("FREE") == TokenBucket::Outcome::UNLIMITED, "unlimited use");
    }
    v.expectEq(env.node.store().code("FREE")->usedCount, 4u, "usage counted");
    v.expectEq(env.remaining("FREE"), -1, "no bucket kept");
}

inline void semaphoreBoundsInFlight(TestEnv &env) {
    TestValidator v(env.result);
    LocalCoordinator local;
    RedemptionSemaphore semaphore(local, "redeem:test", 2, 150);

    auto first = semaphore.acquire();
    auto second = semaphore.acquire();
    v.expect(first.held() && second.held(), "two permits granted");
    v.expectEq(semaphore.inFlight(), 2, "two in flight");

    const int64_t started = TimeHelper::monotonicMs();
    v.expectThrows<throttled>([&] { auto third = semaphore.acquire(); }, "third caller throttled");
    v.expect(TimeHelper::monotonicMs() - started >= 100, "caller waited for the timeout");

    first.release();
    v.expectEq(semaphore.inFlight(), 1, "release frees a slot");
    {
        auto third = semaphore.acquire();
        v.expect(third.held(), "freed slot reused");
    }
    v.expectEq(semaphore.inFlight(), 1, "permit returned on scope exit");
}

inline void semaphoreFailsOpen(TestEnv &env) {
    TestValidator v(env.result);
    UnavailableCoordinator down;
    RedemptionSemaphore semaphore(down, "redeem:down", 1, 50);

    auto permit = semaphore.acquire();
    v.expect(!permit.held(), "admitted without a permit");
    v.expectEq(semaphore.inFlight(), 0, "count unknown reads as zero");
}

inline void rateLimiterCountsPerWindow(TestEnv &env) {
    TestValidator v(env.result);
    LocalCoordinator local;
    RateLimiter limiter(local, "ratelimit:test", 3, 3'600'000);

    for (int i = 0; i < 3; ++i) v.expect(limiter.allow("caller"), "within limit");
    v.expect(!limiter.allow("caller"), "fourth call limited");
    v.expect(limiter.allow("someone-else"), "limits are per identifier");

    RateLimiter disabled(local, "ratelimit:off", 0, 60'000);
    for (int i = 0; i < 10; ++i) v.expect(disabled.allow("caller"), "zero limit disables");

    UnavailableCoordinator down;
    RateLimiter open(down, "ratelimit:down", 1, 60'000);
    v.expect(open.allow("caller") && open.allow("caller"), "fails open");
}

inline void coordinatorMutexAndCounters(TestEnv &env) {
    TestValidator v(env.result);
    LocalCoordinator local;

    v.expect(local.mutexTryLock("job", "a", 1000), "first owner locks");
    v.expect(!local.mutexTryLock("job", "b", 1000), "second owner refused");
    v.expect(!local.mutexUnlock("job", "b"), "only the owner unlocks");
    v.expect(local.mutexUnlock("job", "a"), "owner unlocks");
    v.expect(local.mutexTryLock("job", "b", 1000), "lock free again");

    v.expect(local.mutexTryLock("short", "a", 20), "short lock");
    TimeHelper::sleepMs(60);
    v.expect(local.mutexTryLock("short", "b", 1000), "expired lock taken over");

    v.expect(!local.counterGet("missing"), "missing counter");
    v.expect(local.counterInit("k", 2, 10'000), "counter created");
    v.expect(!local.counterInit("k", 9, 10'000), "existing counter kept");
    v.expectEq(local.counterTakeIfPositive("k").value_or(-9), 1, "take");
    v.expectEq(local.counterTakeIfPositive("k").value_or(-9), 0, "take last");
    v.expectEq(local.counterTakeIfPositive("k").value_or(-9), -1, "empty counter not decremented");
    v.expectEq(local.counterGet("k").value_or(-9), 0, "value stays at zero");
    v.expect(!local.counterAdd("none", 1), "add to a missing counter does not create it");
    v.expectEq(local.counterIncrementWindow("w", 10'000), 1, "window counter starts at one");
    v.expectEq(local.counterIncrementWindow("w", 10'000), 2, "window counter increments");
    v.expect(local.counterRemove("k"), "removed");
}

inline void sharedCoordinatorAcrossProcesses(TestEnv &env) {
    TestValidator v(env.result);
    Coordinator &shared = env.node.coordinator();

    v.expect(shared.mutexTryLock("reconcile:test", "parent", 10'000), "parent takes the mutex");
    v.expect(shared.counterInit("uses:test", 3, 60'000), "counter created");

    const pid_t child = env.fork([&env] {
        Coordinator &coordinator = env.node.coordinator();
        if (coordinator.mutexTryLock("reconcile:test", "child", 10'000)) return 1;
        if (coordinator.counterTakeIfPositive("uses:test").value_or(-9) != 2) return 2;
        return 0;
    });
    v.expectEq(TestEnv::join(child), 0, "child sees the parent's mutex and counter");
    v.expectEq(shared.counterGet("uses:test").value_or(-9), 2, "child decrement visible to the parent");

    v.expect(shared.mutexUnlock("reconcile:test", "parent"), "parent unlocks");
    v.expect(shared.semaphoreAcquire("redeem:test", 1, 10'000), "one permit");
    v.expect(!shared.semaphoreAcquire("redeem:test", 1, 10'000), "limit reached");
    shared.semaphoreRelease("redeem:test");
    v.expect(shared.semaphoreAcquire("redeem:test", 1, 10'000), "permit returned");
}

inline std::vector<TestScenario> throttleScenarios() {
    return {
        {"Token bucket limit", "K consumes succeed, K+1 is exhausted, refund restores", bucketEnforcesMaxUses},
        {"Token bucket concurrency", "Twelve processes share five uses", bucketHoldsUnderConcurrency},
        {"Token bucket rebuild", "Buckets are rebuilt from durable usage", bucketRebuildsFromStore},
        {"Token bucket fail-closed", "An unreachable coordinator refuses redemption", bucketFailsClosed},
        {"Unlimited codes", "Unlimited codes never touch a bucket", unlimitedCodesSkipTheBucket},
        {"Redemption semaphore", "In-flight redemptions stay bounded", semaphoreBoundsInFlight},
        {"Redemption semaphore fail-open", "An unreachable coordinator admits callers", semaphoreFailsOpen},
        {"Rate limiter", "Per-identifier fixed windows", rateLimiterCountsPerWindow},
        {"Coordinator primitives", "Owned mutex with expiry and atomic counters", coordinatorMutexAndCounters},
        {"Shared coordinator", "Mutex, counters and permits are shared across processes",
         sharedCoordinatorAcrossProcesses},
    };
}

} // namespace Test::Scenarios
