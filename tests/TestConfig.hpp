#pragma once

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <functional>
#include <string>
#include <vector>
#include <sys/wait.h>
#include <unistd.h>

#include "dispatch/DispatchWorker.h"
#include "ipc/IpcManager.h"
#include "service/SeatpoolNode.h"
#include "tests/TestDoubles.hpp"

namespace Test {

/**
 * Environment the test binary runs with. Set before Config::loadEnvFile(),
 * which never overrides existing variables.
 */
inline void applyTestEnvironment() {
    setenv("SEATPOOL_WORKERS", "1", 1);
    setenv("SEATPOOL_TICK_US", "10000", 1);
    setenv("SEATPOOL_BATCH_SIZE", "8", 1);
    setenv("SEATPOOL_BATCH_MAX_WAIT_MS", "20", 1);
    setenv("SEATPOOL_LOCK_RETRIES", "3", 1);
    setenv("SEATPOOL_MAX_RETRIES", "3", 1);
    setenv("SEATPOOL_RETRY_BASE_MS", "60000", 1);
    setenv("SEATPOOL_RETRY_MAX_MS", "600000", 1);
    setenv("SEATPOOL_RECONCILE_INTERVAL_SEC", "30", 1);
    setenv("SEATPOOL_STALE_SWEEP_INTERVAL_SEC", "300", 1);
    setenv("SEATPOOL_QUOTA_SYNC_INTERVAL_SEC", "60", 1);
    setenv("SEATPOOL_MAX_CONCURRENT_REDEEMS", "16", 1);
    setenv("SEATPOOL_ACQUIRE_TIMEOUT_MS", "2000", 1);
    setenv("SEATPOOL_RATE_LIMIT_PER_MIN", "0", 1);
    setenv("SEATPOOL_STALE_RESERVED_SEC", "3600", 1);
    setenv("SEATPOOL_SIM_TRANSIENT_PCT", "0", 1);
    setenv("SEATPOOL_SIM_TERMINAL_PCT", "0", 1);
    setenv("SEATPOOL_SIM_LATENCY_MS", "0", 1);
}

/**
 * Test result structure
 */
struct TestResult {
    std::string testName;
    bool passed;
    std::vector<std::string> failures;
    std::vector<std::string> warnings;

    // Metrics collected
    uint32_t checks;
    uint32_t childProcesses;
    uint32_t zombieProcesses;
    int64_t durationMs;

    TestResult() : passed{true}, checks{0}, childProcesses{0}, zombieProcesses{0}, durationMs{0} {}

    void addFailure(const std::string &msg) {
        failures.push_back(msg);
        passed = false;
    }

    void addWarning(const std::string &msg) {
        warnings.push_back(msg);
    }
};

/**
 * One isolated seatpool instance: fresh IPC resources under keys derived
 * from a private temporary directory, seeded by the scenario itself.
 */
struct TestEnv {
    IpcKeys keys;
    IpcManager &ipc;
    SeatpoolNode &node;
    ScriptedMembershipClient &client;
    TestResult &result;

    [[nodiscard]] time_t now() const { return time(nullptr); }

    void team(const uint32_t id, const uint32_t capacity, const uint32_t groupId = 0) const {
        node.store().upsertTeam(id, capacity, groupId, TeamHealth::ACTIVE, "team-" + std::to_string(id));
    }

    /** Fill a team with confirmed members named <prefix>-<n>. */
    void confirm(const uint32_t teamId, const uint32_t count, const std::string &prefix = "member") const {
        for (uint32_t i = 0; i < count; ++i) {
            node.store().addMember(teamId, prefix + "-" + std::to_string(teamId) + "-" + std::to_string(i));
        }
    }

    void code(const std::string &value, const uint32_t maxUses, const uint32_t groupId = 0) const {
        node.store().upsertCode(value, maxUses, groupId, 0, true);
        if (const auto row = node.store().code(value)) node.bucket().ensure(*row);
    }

    [[nodiscard]] static WorkerSettings workerSettings() {
        WorkerSettings settings{};
        settings.batchSize = 8;
        settings.batchMaxWaitMs = 20;
        settings.softLimitSec = 240;
        settings.localRetries = 2;
        settings.localRetryDelayMs = 1;
        settings.lockRetries = 3;
        settings.strategy = AllocationStrategy::SEQUENTIAL_FILL;
        return settings;
    }

    [[nodiscard]] DispatchWorker worker(const WorkerSettings &settings = workerSettings()) const {
        return DispatchWorker(node.store(), node.ledger(), node.reservation(), node.queue(), node.client(),
                              node.retrier(), node.reconciler(), settings);
    }

    /** Everything currently on the task queue, without blocking. */
    [[nodiscard]] std::vector<Task> drainQueue() const {
        std::vector<Task> tasks;
        while (auto task = node.queue().receive(false)) tasks.push_back(*task);
        return tasks;
    }

    /** A PENDING invite as enqueued at enqueuedAt, and the task that carries it. */
    [[nodiscard]] DispatchTask pendingTask(const std::string &identity, const std::string &codeValue,
                                           const uint64_t taskId, const time_t enqueuedAt) const {
        const uint32_t inviteId = node.store().createPendingInvite(identity, codeValue, false, taskId, enqueuedAt);
        return DispatchTask{Tasks::makeRequest(taskId, inviteId, identity, codeValue, 0, false, enqueuedAt)};
    }

    [[nodiscard]] InviteStatus inviteStatus(const uint32_t handle) const {
        const auto row = node.store().invite(handle);
        return row ? row->status : InviteStatus::REMOVED;
    }

    [[nodiscard]] int64_t remaining(const std::string &value) const {
        return node.bucket().remaining(value).value_or(-1);
    }

    /**
     * Run body in a forked child that shares this instance's IPC attachments.
     * The child leaves with _exit so the parent's atexit cleanup never runs there.
     */
    pid_t fork(const std::function<int()> &body) const {
        const pid_t pid = ::fork();
        if (pid == 0) {
            int code = 99;
            try {
                code = body();
            } catch (const std::exception &e) {
                fprintf(stderr, "[child %d] %s\n", getpid(), e.what());
                code = 98;
            }
            _exit(code);
        }
        if (pid > 0) ++result.childProcesses;
        return pid;
    }

    /** @return the child's exit code, -1 if it did not exit normally */
    static int join(const pid_t pid) {
        int status = 0;
        while (waitpid(pid, &status, 0) == -1) {
            if (errno != EINTR) return -1;
        }
        return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }
};

/**
 * Test scenario: a named check run against a fresh instance
 */
struct TestScenario {
    std::string name;
    std::string description;
    std::function<void(TestEnv &)> run;
};

} // namespace Test
