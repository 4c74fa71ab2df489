#pragma once

#include <sys/types.h>
#include <algorithm>
#include <cstdint>
#include <ctime>
#include <vector>

#include "core/Flags.h"
#include "dispatch/Task.h"

// ============================================================================
// OPERATIONAL STATE (protected by SHM_OPERATIONAL semaphore)
// ============================================================================

/**
 * In-flight work of one dispatch worker, inspected by the supervisor
 * to enforce the hard time limit.
 */
struct WorkerSlot {
    pid_t pid; // 0 = free
    bool busy;
    uint32_t taskCount;
    int64_t startedAtMs;
    Task tasks[Flags::Dispatch::MAX_BATCH];
};

/**
 * Task waiting out a retry backoff. The scheduler moves it to the queue when due.
 */
struct DelayedTask {
    bool used;
    int64_t dueAtMs;
    Task task;
};

/**
 * Lifetime counters for the shutdown report.
 */
struct DispatchCounters {
    uint64_t submitted;
    uint64_t invited;
    uint64_t waitlisted;
    uint64_t retried;
    uint64_t failed;
    uint64_t compensated;
    uint64_t hardKills;
    uint64_t reconcilePasses;
};

/**
 * Operational state of the system.
 *
 * OWNERSHIP: Supervisor initializes and owns delayed-task promotion and hard-limit
 * enforcement; workers claim their own slot and update counters.
 */
struct SharedOperationalState {
    bool running;
    pid_t supervisorPid;
    time_t startedAt;
    uint64_t logSequenceNum; // Global log sequence counter for ordering
    uint64_t nextTaskId;

    WorkerSlot workers[Flags::Dispatch::MAX_WORKERS];
    DelayedTask delayed[Flags::Dispatch::MAX_DELAYED];
    uint32_t delayedCount;

    DispatchCounters counters;

    uint64_t allocateTaskId() { return ++nextTaskId; }

    /** @brief Slot owned by pid, claiming a free one if needed. nullptr when all are taken. */
    WorkerSlot *slotFor(const pid_t pid) {
        WorkerSlot *freeSlot = nullptr;
        for (auto &slot: workers) {
            if (slot.pid == pid) return &slot;
            if (slot.pid == 0 && freeSlot == nullptr) freeSlot = &slot;
        }
        if (freeSlot != nullptr) {
            *freeSlot = WorkerSlot{};
            freeSlot->pid = pid;
        }
        return freeSlot;
    }

    /** @return false when the delayed table is full. */
    bool scheduleDelayed(const Task &task, const int64_t dueAtMs) {
        for (auto &entry: delayed) {
            if (!entry.used) {
                entry.used = true;
                entry.dueAtMs = dueAtMs;
                entry.task = task;
                ++delayedCount;
                return true;
            }
        }
        return false;
    }

    /** @brief Remove and return all delayed tasks due at nowMs, earliest first. */
    std::vector<Task> takeDueDelayed(const int64_t nowMs) {
        std::vector<DelayedTask *> due;
        for (auto &entry: delayed) {
            if (entry.used && entry.dueAtMs <= nowMs) due.push_back(&entry);
        }
        std::sort(due.begin(), due.end(),
                  [](const DelayedTask *a, const DelayedTask *b) { return a->dueAtMs < b->dueAtMs; });
        std::vector<Task> tasks;
        tasks.reserve(due.size());
        for (auto *entry: due) {
            tasks.push_back(entry->task);
            entry->used = false;
            --delayedCount;
        }
        return tasks;
    }
};
