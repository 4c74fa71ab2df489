#pragma once

#include <ctime>
#include <random>
#include <string>

#include "dispatch/QuotaCompensator.h"
#include "dispatch/RetryPolicy.h"
#include "dispatch/TaskQueue.h"
#include "seats/SeatStore.h"

/**
 * @brief Applies the outer retry policy to a failed reserve or dispatch task.
 *
 * Backoff parks the task in the delayed table with its retry counter
 * advanced; terminal failure runs the compensating rollback. A dispatch task
 * gives its seat back while it waits out the backoff; a reserve task keeps
 * the seat promised on the request path.
 */
class TaskRetrier {
public:
    TaskRetrier(SeatStore &store, TaskQueue &queue, QuotaCompensator &compensator, const RetryPolicy &policy,
                uint32_t seed);

    /** @return BACKOFF or FAILED */
    RetryState onFailure(const Task &task, FailureKind kind, const std::string &note, time_t now);

    /**
     * @brief Put a task back without consuming an attempt (soft limit reached).
     */
    void defer(const Task &task, const std::string &note, time_t now);

    [[nodiscard]] const RetryPolicy &policy() const noexcept { return policy_; }

private:
    static constexpr auto tag_{"Retrier"};
    static constexpr int64_t REQUEUE_DELAY_MS = 1000;

    void releaseSeat(const Task &task, const std::string &note, time_t now);

    SeatStore &store_;
    TaskQueue &queue_;
    QuotaCompensator &compensator_;
    RetryPolicy policy_;
    std::mt19937 rng_;
};
