#include "dispatch/TaskRetrier.h"

#include <stdexcept>

#include "logging/Logger.h"
#include "utils/TimeHelper.h"

namespace {
    constexpr auto SRC = Logger::Source::Worker;
}

TaskRetrier::TaskRetrier(SeatStore &store, TaskQueue &queue, QuotaCompensator &compensator,
                         const RetryPolicy &policy, const uint32_t seed)
    : store_{store}, queue_{queue}, compensator_{compensator}, policy_{policy}, rng_{seed} {
}

void TaskRetrier::releaseSeat(const Task &task, const std::string &note, const time_t now) {
    if (const auto *dispatch = std::get_if<DispatchTask>(&task)) {
        store_.transitionInvite(dispatch->request.inviteId, InviteStatus::RESERVED, InviteStatus::PENDING, 0, note,
                                now);
    }
}

RetryState TaskRetrier::onFailure(const Task &task, const FailureKind kind, const std::string &note,
                                  const time_t now) {
    const InviteRequest *request = Tasks::requestOf(task);
    if (request == nullptr) {
        throw std::invalid_argument("reconcile tasks are not retried");
    }

    RetryStateMachine machine(policy_, request->attempt, rng_());
    machine.start();
    const RetryDecision decision = machine.fail(kind);

    if (decision.state == RetryState::BACKOFF) {
        Task next = task;
        Tasks::requestOf(next)->attempt = machine.retriesUsed();
        releaseSeat(task, note, now);
        if (queue_.schedule(next, TimeHelper::nowMs() + decision.delayMs)) {
            queue_.count(&DispatchCounters::retried);
            Logger::info(SRC, tag_, "task %llu %s (%s), retry %u/%u in %u ms",
                         static_cast<unsigned long long>(request->taskId), toString(kind), note.c_str(),
                         machine.retriesUsed(), policy_.maxRetries, decision.delayMs);
            return RetryState::BACKOFF;
        }
        Logger::error(SRC, tag_, "delayed table full, task %llu fails now",
                      static_cast<unsigned long long>(request->taskId));
    }

    if (compensator_.compensate(*request, note, now)) {
        queue_.count(&DispatchCounters::compensated);
    }
    queue_.count(&DispatchCounters::failed);
    Logger::warn(SRC, tag_, "task %llu failed permanently after %u retries: %s",
                 static_cast<unsigned long long>(request->taskId), request->attempt, note.c_str());
    return RetryState::FAILED;
}

void TaskRetrier::defer(const Task &task, const std::string &note, const time_t now) {
    releaseSeat(task, note, now);
    if (queue_.trySubmit(task)) return;
    if (!queue_.schedule(task, TimeHelper::nowMs() + REQUEUE_DELAY_MS)) {
        onFailure(task, FailureKind::TRANSIENT, note + "; no room to defer", now);
    }
}
