#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "dispatch/Task.h"
#include "ipc/core/MessageQueue.h"
#include "ipc/core/Semaphore.h"
#include "ipc/model/SharedOperationalState.h"

/**
 * @brief Bounded at-least-once task transport shared by the supervisor,
 * the workers and the request path.
 *
 * A System V message queue carries the tasks; TASK_QUEUE_SLOTS counts free
 * slots so a full queue is detected before the kernel blocks a sender.
 * Tasks waiting out a retry backoff live in the delayed table of the
 * operational state until the scheduler promotes them.
 *
 * The queue object is created by whoever owns the process and passed by
 * reference to the components that submit or drain tasks.
 */
class TaskQueue {
public:
    TaskQueue(const MessageQueue<Task> &queue, const Semaphore &sem, SharedOperationalState &ops);

    /** @return false if the queue is full */
    bool trySubmit(const Task &task);

    /** @throws queue_full If the queue is full */
    void submit(const Task &task);

    /**
     * @brief Take one task.
     * @param block Wait for a task; an interrupting signal returns nullopt
     */
    std::optional<Task> receive(bool block);

    /**
     * @brief Collect up to maxSize tasks.
     *
     * Blocks for the first task, then keeps collecting until maxSize tasks
     * are in hand or maxWaitMs elapsed since the first one arrived.
     * Returns an empty batch when interrupted.
     */
    std::vector<Task> receiveBatch(uint32_t maxSize, uint32_t maxWaitMs);

    /**
     * @brief Park a task until dueAtMs.
     * @return false if the delayed table is full
     */
    bool schedule(const Task &task, int64_t dueAtMs);

    /**
     * @brief Move due delayed tasks onto the queue.
     *
     * A task that does not fit is parked again one second later.
     * @return Number of tasks moved
     */
    uint32_t promoteDue(int64_t nowMs);

    uint64_t nextTaskId();

    /** @brief Bump a lifetime counter. */
    void count(uint64_t DispatchCounters::*counter, uint64_t n = 1);

    [[nodiscard]] DispatchCounters counters() const;

    /**
     * @brief Publish the batch a worker is about to run, so the supervisor
     * can requeue it if the worker is killed at the hard limit.
     * @return false if no worker slot is free
     */
    bool trackInFlight(pid_t pid, const std::vector<Task> &batch, int64_t startedAtMs);

    void clearInFlight(pid_t pid);

    /** @brief Release the slot of a dead worker. @return its unfinished tasks */
    std::vector<Task> reclaimInFlight(pid_t pid);

    /** @brief Workers whose current batch started at least limitMs ago. */
    [[nodiscard]] std::vector<pid_t> overdueWorkers(int64_t nowMs, uint32_t limitMs) const;

    [[nodiscard]] uint32_t depth() const { return queue_.depth(); }

    [[nodiscard]] uint32_t delayedCount() const;

private:
    static constexpr auto tag_{"TaskQueue"};
    static constexpr long MSG_TYPE = 1;
    static constexpr uint32_t POLL_US = 10'000;

    const MessageQueue<Task> &queue_;
    const Semaphore &sem_;
    SharedOperationalState &ops_;
};
