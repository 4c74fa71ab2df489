#pragma once

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <memory>
#include <vector>
#include <fcntl.h>
#include <unistd.h>

#include "core/Config.h"
#include "core/Seed.h"
#include "ipc/IpcManager.h"
#include "logging/Logger.h"
#include "service/SeatpoolNode.h"
#include "utils/ProcessSpawner.h"
#include "utils/SignalHelper.h"
#include "utils/TimeHelper.h"

/**
 * @brief Owner of the IPC resources and of every other process.
 *
 * Seeds the store, spawns the logger and the dispatch workers, then runs the
 * scheduler: promotes delayed retries, submits periodic reconcile tasks and
 * enforces the hard time limit on worker batches.
 */
class Supervisor {
public:
    void run() {
        Logger::separator('=');
        Logger::info(SRC, tag_, "seatpool supervisor (pid %d)", getpid());
        Logger::separator('=');

        SignalHelper::setup(signals_);

        try {
            setup();
            mainLoop();
        } catch (const std::exception &e) {
            Logger::error(SRC, tag_, "Exception: %s", e.what());
            failed_ = true;
        }

        shutdown();
    }

    [[nodiscard]] bool failed() const { return failed_; }

private:
    static constexpr auto tag_{"Supervisor"};
    static constexpr auto SRC{Logger::Source::Supervisor};
    static constexpr int64_t READY_TIMEOUT_MS{10'000};

    std::unique_ptr<IpcManager> ipc_;
    std::unique_ptr<SeatpoolNode> node_;
    SignalHelper::Flags signals_;
    bool failed_{false};

    pid_t loggerPid_{-1};
    std::vector<pid_t> workerPids_;

    time_t startTime_{0};
    time_t lastWaiting_{0};
    time_t lastStaleSweep_{0};
    time_t lastQuotaSync_{0};

    void setup() {
        const IpcKeys keys = IpcKeys::standard();
        Logger::info(SRC, tag_, "Creating IPC...");
        ipc_ = std::make_unique<IpcManager>(keys);
        ipc_->initSemaphores();

        startTime_ = time(nullptr);
        ipc_->initState(getpid(), startTime_);
        lastWaiting_ = lastStaleSweep_ = lastQuotaSync_ = startTime_;

        node_ = std::make_unique<SeatpoolNode>(keys, SRC);
        seed();

        spawnLogger();
        for (uint32_t i = 0; i < Config::Supervisor::WORKERS(); ++i) {
            spawnWorker();
        }
        waitForReady();
    }

    void seed() {
        for (const auto &team: Seed::parseTeams(Config::Supervisor::SEED_TEAMS())) {
            node_->store().upsertTeam(team.id, team.capacity, team.groupId, TeamHealth::ACTIVE,
                                      "team-" + std::to_string(team.id));
        }
        for (const auto &code: Seed::parseCodes(Config::Supervisor::SEED_CODES())) {
            node_->store().upsertCode(code.code, code.maxUses, code.groupId, 0, true);
            if (const auto row = node_->store().code(code.code)) {
                node_->bucket().ensure(*row);
            }
        }
        const auto summary = node_->ledger().summary(0, time(nullptr));
        Logger::info(SRC, tag_, "seeded %u teams, %u seats available", summary.teams, summary.available);
    }

    void spawnLogger() {
        loggerPid_ = ProcessSpawner::spawnWithKeys("logger_process", ipc_->keys());
        Logger::debug(SRC, tag_, "Logger spawned: %d", loggerPid_);

        // Bounded wait: without a logger the supervisor keeps logging directly
        if (ipc_->sem().waitFor(Semaphore::Index::LOGGER_READY, 1, false, 2'000)) {
            Logger::initCentralized(ipc_->keys().shm, ipc_->keys().sem, ipc_->keys().logQueue);
        } else {
            Logger::warn(SRC, tag_, "logger not ready, logging directly");
        }
    }

    pid_t spawnWorker() {
        const pid_t pid = ProcessSpawner::spawnWithKeys("dispatch_worker", ipc_->keys());
        if (pid > 0) {
            workerPids_.push_back(pid);
            Logger::info(SRC, tag_, "worker spawned: %d", pid);
        }
        return pid;
    }

    void waitForReady() {
        const auto expected = static_cast<int32_t>(workerPids_.size());
        const int64_t deadline = TimeHelper::monotonicMs() + READY_TIMEOUT_MS;
        int32_t ready = 0;
        while (ready < expected && !SignalHelper::shouldExit(signals_) && TimeHelper::monotonicMs() < deadline) {
            if (ipc_->sem().waitFor(Semaphore::Index::WORKERS_READY, 1, false, 500)) ++ready;
        }
        if (ready < expected) {
            Logger::warn(SRC, tag_, "%d of %d workers ready, continuing", ready, expected);
        } else {
            Logger::info(SRC, tag_, "All processes ready (%d workers)", ready);
        }
    }

    void mainLoop() {
        const uint32_t duration = Config::Supervisor::RUN_DURATION_SEC();
        while (!SignalHelper::shouldExit(signals_)) {
            const time_t now = time(nullptr);
            if (duration > 0 && now - startTime_ >= static_cast<time_t>(duration)) {
                Logger::info(SRC, tag_, "run duration of %u s reached", duration);
                break;
            }

            tick(now);

            if (signals_.report) {
                SignalHelper::clearFlag(signals_.report);
                logCounters();
            }
            usleep(Config::Supervisor::TICK_US());
        }
    }

    /** One scheduler step. Failures are logged and retried on the next tick. */
    void tick(const time_t now) {
        try {
            const uint32_t promoted = node_->queue().promoteDue(TimeHelper::nowMs());
            if (promoted > 0) Logger::debug(SRC, tag_, "promoted %u delayed tasks", promoted);

            schedule(ReconcileKind::WAITING_QUEUE, Config::Reconcile::WAITING_INTERVAL_SEC(), lastWaiting_, now);
            schedule(ReconcileKind::STALE_RESERVED, Config::Reconcile::STALE_SWEEP_INTERVAL_SEC(), lastStaleSweep_,
                     now);
            schedule(ReconcileKind::QUOTA_SYNC, Config::Reconcile::QUOTA_SYNC_INTERVAL_SEC(), lastQuotaSync_, now);

            enforceHardLimit(now);
            replaceExitedWorkers(now);
        } catch (const std::exception &e) {
            Logger::error(SRC, tag_, "tick failed: %s", e.what());
        }
    }

    void schedule(const ReconcileKind kind, const uint32_t intervalSec, time_t &last, const time_t now) {
        if (intervalSec == 0 || now - last < static_cast<time_t>(intervalSec)) return;
        last = now;
        const Task task{ReconcileTask{kind, Constants::Reconcile::SCAN_LIMIT, now}};
        if (!node_->queue().trySubmit(task)) {
            Logger::warn(SRC, tag_, "task queue full, %s pass skipped", toString(kind));
        }
    }

    void enforceHardLimit(const time_t now) {
        const uint32_t limitMs = Config::Dispatch::HARD_LIMIT_SEC() * 1000;
        for (const pid_t pid: node_->queue().overdueWorkers(TimeHelper::nowMs(), limitMs)) {
            Logger::error(SRC, tag_, "worker %d exceeded the hard limit of %u s, killing", pid,
                          Config::Dispatch::HARD_LIMIT_SEC());
            ProcessSpawner::kill9(pid);
            node_->queue().count(&DispatchCounters::hardKills);
            recoverWorker(pid, "hard time limit", now);
        }
    }

    /** Workers that died on their own: requeue their batch and replace them. */
    void replaceExitedWorkers(const time_t now) {
        while (const pid_t pid = ProcessSpawner::reapOne()) {
            if (pid == loggerPid_) {
                Logger::cleanupCentralized();
                Logger::warn(SRC, tag_, "logger exited, logging directly");
                loggerPid_ = -1;
                continue;
            }
            if (std::find(workerPids_.begin(), workerPids_.end(), pid) == workerPids_.end()) continue;
            Logger::warn(SRC, tag_, "worker %d exited unexpectedly", pid);
            recoverWorker(pid, "worker exited", now);
        }
    }

    void recoverWorker(const pid_t pid, const char *reason, const time_t now) {
        workerPids_.erase(std::remove(workerPids_.begin(), workerPids_.end(), pid), workerPids_.end());

        for (const auto &task: node_->queue().reclaimInFlight(pid)) {
            if (std::holds_alternative<ReconcileTask>(task)) continue; // the next scheduled pass covers it
            if (settled(task)) continue;
            try {
                node_->retrier().onFailure(task, FailureKind::TIMEOUT, reason, now);
            } catch (const std::exception &e) {
                Logger::error(SRC, tag_, "requeue of task %llu failed: %s",
                              static_cast<unsigned long long>(Tasks::requestOf(task)->taskId), e.what());
            }
        }

        if (spawnWorker() <= 0) {
            Logger::error(SRC, tag_, "replacement worker could not be spawned");
        }
    }

    /** True when the killed worker already finished the task's invite. */
    bool settled(const Task &task) const {
        const auto invite = node_->store().invite(Tasks::requestOf(task)->inviteId);
        return !invite || (invite->status != InviteStatus::PENDING && invite->status != InviteStatus::RESERVED);
    }

    void logCounters() const {
        const auto c = node_->queue().counters();
        Logger::info(SRC, tag_, "submitted=%llu invited=%llu waitlisted=%llu retried=%llu failed=%llu",
                     static_cast<unsigned long long>(c.submitted), static_cast<unsigned long long>(c.invited),
                     static_cast<unsigned long long>(c.waitlisted), static_cast<unsigned long long>(c.retried),
                     static_cast<unsigned long long>(c.failed));
    }

    void shutdown() {
        Logger::debug(SRC, tag_, "Shutting down...");

        if (ipc_) {
            Semaphore::ScopedLock lock(ipc_->sem(), Semaphore::Index::SHM_OPERATIONAL);
            ipc_->state()->operational.running = false;
        }

        for (const pid_t pid: workerPids_) {
            ProcessSpawner::terminate(pid, "DispatchWorker");
        }
        for (const pid_t pid: workerPids_) {
            ProcessSpawner::waitFor(pid);
        }

        if (node_) generateReport();

        // Stop using centralized logging before terminating logger
        Logger::cleanupCentralized();
        usleep(100000); // let the logger print what is queued
        ProcessSpawner::terminate(loggerPid_, "Logger");
        ProcessSpawner::waitFor(loggerPid_);

        node_.reset();
        ipc_.reset();
        Logger::debug(SRC, tag_, "Done");
    }

    /** Helper: write formatted string to file descriptor using POSIX write() */
    static void writeToFd(const int fd, const char *format, ...) {
        char buf[256];
        va_list args;
        va_start(args, format);
        const int len = vsnprintf(buf, sizeof(buf), format, args);
        va_end(args);
        if (len > 0) {
            write(fd, buf, std::min(len, static_cast<int>(sizeof(buf)) - 1));
        }
    }

    void generateReport() {
        Logger::info(SRC, tag_, "Generating report...");

        const int fd = open("seatpool_report.txt", O_WRONLY | O_CREAT | O_TRUNC, 0644);
        if (fd == -1) {
            Logger::perror(SRC, tag_, "open seatpool_report.txt");
            return;
        }

        const time_t now = time(nullptr);
        const auto counters = node_->queue().counters();
        const auto depth = node_->store().depth();

        char started[32];
        TimeHelper::formatTimestamp(startTime_, started, sizeof(started));

        writeToFd(fd, "SEATPOOL REPORT\n");
        writeToFd(fd, "===============\n");
        writeToFd(fd, "Started: %s, ran %ld s\n\n", started, static_cast<long>(now - startTime_));

        writeToFd(fd, "DISPATCH\n");
        writeToFd(fd, "  Submitted:        %llu\n", static_cast<unsigned long long>(counters.submitted));
        writeToFd(fd, "  Invited:          %llu\n", static_cast<unsigned long long>(counters.invited));
        writeToFd(fd, "  Waitlisted:       %llu\n", static_cast<unsigned long long>(counters.waitlisted));
        writeToFd(fd, "  Retried:          %llu\n", static_cast<unsigned long long>(counters.retried));
        writeToFd(fd, "  Failed:           %llu\n", static_cast<unsigned long long>(counters.failed));
        writeToFd(fd, "  Compensated:      %llu\n", static_cast<unsigned long long>(counters.compensated));
        writeToFd(fd, "  Hard-limit kills: %llu\n", static_cast<unsigned long long>(counters.hardKills));
        writeToFd(fd, "  Reconcile passes: %llu\n\n", static_cast<unsigned long long>(counters.reconcilePasses));

        writeToFd(fd, "INVITES\n");
        for (uint8_t s = 0; s < 5; ++s) {
            writeToFd(fd, "  %-10s %u\n", toString(static_cast<InviteStatus>(s)), depth.invites[s]);
        }
        writeToFd(fd, "\nWAITING\n");
        for (uint8_t s = 0; s < 4; ++s) {
            writeToFd(fd, "  %-10s %u\n", toString(static_cast<WaitingStatus>(s)), depth.waiting[s]);
        }

        writeToFd(fd, "\nTEAMS\n");
        writeToFd(fd, "%-6s %-6s %-14s %-9s %-10s %-8s %-9s\n",
                  "Team", "Group", "Health", "Capacity", "Confirmed", "Pending", "Available");
        writeToFd(fd, "--------------------------------------------------------------------\n");
        for (const auto &team: node_->ledger().listCapacities(0, false, now)) {
            writeToFd(fd, "%-6u %-6u %-14s %-9u %-10u %-8u %-9u\n",
                      team.teamId, team.groupId, toString(team.health), team.capacity, team.confirmed,
                      team.pending, team.available);
        }

        close(fd);
        Logger::info(SRC, tag_, "Report saved to seatpool_report.txt");
    }
};
