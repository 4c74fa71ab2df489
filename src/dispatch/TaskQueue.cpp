#include "dispatch/TaskQueue.h"

#include <sys/msg.h>
#include <unistd.h>

#include "core/Errors.h"
#include "logging/Logger.h"
#include "utils/TimeHelper.h"

namespace {
    constexpr auto SRC = Logger::Source::Other;
}

TaskQueue::TaskQueue(const MessageQueue<Task> &queue, const Semaphore &sem, SharedOperationalState &ops)
    : queue_{queue}, sem_{sem}, ops_{ops} {
}

bool TaskQueue::trySubmit(const Task &task) {
    // Slots are returned by the receiver, not by the sender: no SEM_UNDO.
    if (!sem_.tryAcquire(Semaphore::Index::TASK_QUEUE_SLOTS, 1, false)) {
        return false;
    }
    if (!queue_.trySend(task, MSG_TYPE)) {
        sem_.post(Semaphore::Index::TASK_QUEUE_SLOTS, 1, false);
        return false;
    }
    {
        Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_OPERATIONAL);
        ++ops_.counters.submitted;
    }
    return true;
}

void TaskQueue::submit(const Task &task) {
    if (!trySubmit(task)) {
        Logger::warn(SRC, tag_, "queue full, %s task rejected", Tasks::kindName(task));
        throw queue_full("task queue full");
    }
}

std::optional<Task> TaskQueue::receive(const bool block) {
    auto task = queue_.receive(MSG_TYPE, block);
    if (task) {
        sem_.post(Semaphore::Index::TASK_QUEUE_SLOTS, 1, false);
    }
    return task;
}

std::vector<Task> TaskQueue::receiveBatch(const uint32_t maxSize, const uint32_t maxWaitMs) {
    std::vector<Task> batch;
    auto first = receive(true);
    if (!first) return batch;
    batch.push_back(*first);

    const int64_t deadline = TimeHelper::monotonicMs() + maxWaitMs;
    while (batch.size() < maxSize) {
        if (auto next = receive(false)) {
            batch.push_back(*next);
            continue;
        }
        if (TimeHelper::monotonicMs() >= deadline) break;
        usleep(POLL_US);
    }
    return batch;
}

bool TaskQueue::schedule(const Task &task, const int64_t dueAtMs) {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_OPERATIONAL);
    return ops_.scheduleDelayed(task, dueAtMs);
}

uint32_t TaskQueue::promoteDue(const int64_t nowMs) {
    std::vector<Task> due;
    {
        Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_OPERATIONAL);
        due = ops_.takeDueDelayed(nowMs);
    }

    uint32_t moved = 0;
    for (const auto &task: due) {
        if (trySubmit(task)) {
            ++moved;
        } else if (!schedule(task, nowMs + 1000)) {
            Logger::error(SRC, tag_, "delayed table full, dropping %s task", Tasks::kindName(task));
        }
    }
    if (moved > 0) {
        Logger::debug(SRC, tag_, "promoted %u delayed tasks", moved);
    }
    return moved;
}

uint64_t TaskQueue::nextTaskId() {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_OPERATIONAL);
    return ops_.allocateTaskId();
}

uint32_t TaskQueue::delayedCount() const {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_OPERATIONAL);
    return ops_.delayedCount;
}

void TaskQueue::count(uint64_t DispatchCounters::*counter, const uint64_t n) {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_OPERATIONAL);
    ops_.counters.*counter += n;
}

DispatchCounters TaskQueue::counters() const {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_OPERATIONAL);
    return ops_.counters;
}

bool TaskQueue::trackInFlight(const pid_t pid, const std::vector<Task> &batch, const int64_t startedAtMs) {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_OPERATIONAL);
    WorkerSlot *slot = ops_.slotFor(pid);
    if (slot == nullptr) return false;
    slot->busy = true;
    slot->startedAtMs = startedAtMs;
    slot->taskCount = 0;
    for (const auto &task: batch) {
        if (slot->taskCount >= Flags::Dispatch::MAX_BATCH) break;
        slot->tasks[slot->taskCount++] = task;
    }
    return true;
}

void TaskQueue::clearInFlight(const pid_t pid) {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_OPERATIONAL);
    for (auto &slot: ops_.workers) {
        if (slot.pid == pid) {
            slot.busy = false;
            slot.taskCount = 0;
            slot.startedAtMs = 0;
        }
    }
}

std::vector<Task> TaskQueue::reclaimInFlight(const pid_t pid) {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_OPERATIONAL);
    std::vector<Task> tasks;
    for (auto &slot: ops_.workers) {
        if (slot.pid != pid) continue;
        if (slot.busy) tasks.assign(slot.tasks, slot.tasks + slot.taskCount);
        slot = WorkerSlot{};
    }
    return tasks;
}

std::vector<pid_t> TaskQueue::overdueWorkers(const int64_t nowMs, const uint32_t limitMs) const {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_OPERATIONAL);
    std::vector<pid_t> overdue;
    for (const auto &slot: ops_.workers) {
        if (slot.pid != 0 && slot.busy && nowMs - slot.startedAtMs >= static_cast<int64_t>(limitMs)) {
            overdue.push_back(slot.pid);
        }
    }
    return overdue;
}
