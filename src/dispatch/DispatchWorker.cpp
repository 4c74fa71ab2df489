#include "dispatch/DispatchWorker.h"

#include <algorithm>

#include "core/Config.h"
#include "core/Errors.h"
#include "logging/Logger.h"
#include "utils/TimeHelper.h"

namespace {
    constexpr auto SRC = Logger::Source::Worker;

    template<typename T>
    std::vector<Task> asTasks(const std::vector<T> &typed) {
        return std::vector<Task>(typed.begin(), typed.end());
    }
}

WorkerSettings WorkerSettings::fromConfig() {
    WorkerSettings settings;
    settings.batchSize = std::min(Config::Dispatch::BATCH_SIZE(), Flags::Dispatch::MAX_BATCH);
    settings.batchMaxWaitMs = Config::Dispatch::BATCH_MAX_WAIT_MS();
    settings.softLimitSec = Config::Dispatch::SOFT_LIMIT_SEC();
    settings.localRetries = Config::Dispatch::LOCAL_RETRIES();
    settings.localRetryDelayMs = Config::Dispatch::LOCAL_RETRY_DELAY_MS();
    settings.lockRetries = Config::Dispatch::LOCK_RETRIES();
    settings.strategy = Config::Dispatch::ALLOCATION() == "greedy"
                            ? AllocationStrategy::GREEDY_SLICE
                            : AllocationStrategy::SEQUENTIAL_FILL;
    return settings;
}

DispatchWorker::DispatchWorker(SeatStore &store, const CapacityLedger &ledger, ReservationCoordinator &reservation,
                               TaskQueue &queue, MembershipClient &client, TaskRetrier &retrier,
                               WaitingQueueReconciler &reconciler, const WorkerSettings &settings)
    : store_{store}, ledger_{ledger}, reservation_{reservation}, queue_{queue}, client_{client},
      retrier_{retrier}, reconciler_{reconciler}, settings_{settings} {
}

bool DispatchWorker::drainOnce(const pid_t self) {
    const auto batch = queue_.receiveBatch(settings_.batchSize, settings_.batchMaxWaitMs);
    if (batch.empty()) return false;

    if (!queue_.trackInFlight(self, batch, TimeHelper::nowMs())) {
        Logger::warn(SRC, tag_, "no worker slot free, batch runs without hard-limit tracking");
    }
    const BatchReport report = runBatch(batch, time(nullptr));
    queue_.clearInFlight(self);

    Logger::info(SRC, tag_, "batch of %zu: invited=%u waitlisted=%u retried=%u failed=%u deferred=%u dropped=%u",
                 batch.size(), report.invited, report.waitlisted, report.retried, report.failed, report.deferred,
                 report.dropped);
    return true;
}

BatchReport DispatchWorker::runBatch(const std::vector<Task> &batch, const time_t now) {
    batchStartMs_ = TimeHelper::monotonicMs();
    now_ = now;
    report_ = BatchReport{};
    settled_.clear();

    std::map<uint32_t, std::vector<ReserveTask>> reserved; // by team
    std::map<uint32_t, std::vector<DispatchTask>> unplaced; // by group, queue order kept
    for (const auto &task: batch) {
        if (const auto *reconcile = std::get_if<ReconcileTask>(&task)) {
            try {
                reconciler_.run(*reconcile, now);
                ++report_.reconciled;
            } catch (const std::exception &e) {
                Logger::error(SRC, tag_, "%s pass failed: %s", toString(reconcile->kind), e.what());
            }
        } else if (const auto *reserve = std::get_if<ReserveTask>(&task)) {
            reserved[reserve->teamId].push_back(*reserve);
        } else {
            const auto &dispatch = std::get<DispatchTask>(task);
            unplaced[dispatch.request.groupId].push_back(dispatch);
        }
    }

    for (const auto &entry: reserved) {
        try {
            deliverReserved(entry.first, entry.second);
        } catch (const std::exception &e) {
            Logger::error(SRC, tag_, "team %u reserve tasks aborted: %s", entry.first, e.what());
            failUnsettled(asTasks(entry.second), e.what());
        }
    }

    for (const auto &entry: unplaced) {
        try {
            dispatchGroup(entry.first, entry.second);
        } catch (const std::exception &e) {
            Logger::error(SRC, tag_, "group %u dispatch aborted: %s", entry.first, e.what());
            failUnsettled(asTasks(entry.second), e.what());
        }
    }
    return report_;
}

void DispatchWorker::dispatchGroup(const uint32_t groupId, const std::vector<DispatchTask> &tasks) {
    // Plain snapshot: only chooses targets. Every seat is re-validated under the row lock below.
    const auto capacities = ledger_.listCapacities(groupId, true, now_);
    uint32_t totalAvailable = 0;
    for (const auto &team: capacities) totalAvailable += team.available;

    if (totalAvailable == 0) {
        Logger::info(SRC, tag_, "group %u has no free seat, %zu requests wait", groupId, tasks.size());
        for (const auto &task: tasks) toWaiting(task, "no capacity");
        return;
    }

    const auto allocation = Allocator::allocate(settings_.strategy, tasks, capacities);
    Logger::debug(SRC, tag_, "group %u: %zu allocated over %zu teams, %zu unallocated (%u free)", groupId,
                  allocation.allocatedCount(), allocation.allocated.size(), allocation.unallocated.size(),
                  allocation.totalAvailable);
    for (const auto &task: allocation.unallocated) toWaiting(task, "capacity exhausted");

    for (const auto &entry: allocation.allocated) {
        const uint32_t teamId = entry.first;
        const auto claim = claimWithRetries(teamId, entry.second);
        if (!claim) {
            Logger::warn(SRC, tag_, "team %u stayed locked, %zu requests wait", teamId, entry.second.size());
            for (const auto &task: entry.second) toWaiting(task, "lock conflict");
            continue;
        }
        for (const auto &task: claim->overflow) toWaiting(task, "capacity exhausted");
        for (const auto &task: claim->stale) {
            Logger::debug(SRC, tag_, "invite %u no longer pending, task %llu dropped", task.request.inviteId,
                          static_cast<unsigned long long>(task.request.taskId));
            settle(task);
            ++report_.dropped;
        }
        // Seats were rechecked and committed as RESERVED under the row lock, so the
        // external call runs without it; a crash from here on is settled by the stale sweep.
        deliver(teamId, asTasks(claim->claimed));
    }
}

std::optional<ClaimResult> DispatchWorker::claimWithRetries(const uint32_t teamId,
                                                            const std::vector<DispatchTask> &tasks) {
    for (uint32_t attempt = 0; attempt <= settings_.lockRetries; ++attempt) {
        try {
            auto tx = reservation_.lockTeams({teamId});
            ClaimResult result = reservation_.claim(tx, teamId, tasks, now_);
            tx.commit();
            return result;
        } catch (const lock_conflict &e) {
            Logger::debug(SRC, tag_, "lock conflict %u/%u: %s", attempt + 1, settings_.lockRetries + 1, e.what());
        }
    }
    return std::nullopt;
}

void DispatchWorker::deliverReserved(const uint32_t teamId, const std::vector<ReserveTask> &tasks) {
    std::vector<Task> live;
    bool locked = false;
    for (uint32_t attempt = 0; attempt <= settings_.lockRetries && !locked; ++attempt) {
        try {
            auto tx = reservation_.lockTeams({teamId});
            for (const auto &task: tasks) {
                const auto invite = store_.invite(task.request.inviteId);
                if (invite && !invite->voided && invite->status == InviteStatus::RESERVED &&
                    invite->teamId == teamId) {
                    live.emplace_back(task);
                } else {
                    settle(task);
                    ++report_.dropped;
                }
            }
            tx.commit();
            locked = true;
        } catch (const lock_conflict &e) {
            Logger::debug(SRC, tag_, "lock conflict on reserved team %u: %s", teamId, e.what());
        }
    }
    if (!locked) {
        for (const auto &task: tasks) fail(task, FailureKind::LOCK_CONFLICT, "row lock contention");
        return;
    }
    deliver(teamId, live);
}

void DispatchWorker::deliver(const uint32_t teamId, const std::vector<Task> &tasks) {
    if (tasks.empty()) return;
    if (pastSoftLimit()) {
        for (const auto &task: tasks) defer(task, "soft time limit");
        return;
    }

    std::vector<std::string> identities;
    identities.reserve(tasks.size());
    for (const auto &task: tasks) identities.emplace_back(Tasks::requestOf(task)->identity);

    std::vector<InviteOutcome> outcomes;
    try {
        outcomes = client_.invite(teamId, identities);
    } catch (const membership_error &e) {
        Logger::warn(SRC, tag_, "team %u batch invite of %zu failed (%d): %s, retrying one by one", teamId,
                     tasks.size(), e.status(), e.what());
        for (const auto &task: tasks) retryLocally(teamId, task);
        return;
    }

    for (const auto &task: tasks) {
        const std::string identity = Tasks::requestOf(task)->identity;
        const auto it = std::find_if(outcomes.begin(), outcomes.end(),
                                     [&](const InviteOutcome &o) { return o.identity == identity; });
        if (it == outcomes.end() || (!it->ok && it->isTransient())) {
            retryLocally(teamId, task);
        } else if (it->ok) {
            markInvited(teamId, task);
        } else {
            fail(task, FailureKind::TERMINAL, it->message);
        }
    }
}

void DispatchWorker::retryLocally(const uint32_t teamId, const Task &task) {
    const std::string identity = Tasks::requestOf(task)->identity;
    std::string lastError = "no result";

    for (uint32_t attempt = 1; attempt <= settings_.localRetries; ++attempt) {
        if (pastSoftLimit()) {
            defer(task, "soft time limit");
            return;
        }
        TimeHelper::sleepMs(settings_.localRetryDelayMs);
        try {
            const auto outcomes = client_.invite(teamId, {identity});
            if (!outcomes.empty() && outcomes.front().ok) {
                markInvited(teamId, task);
                return;
            }
            if (!outcomes.empty()) {
                lastError = outcomes.front().message;
                if (!outcomes.front().isTransient()) {
                    fail(task, FailureKind::TERMINAL, lastError);
                    return;
                }
            }
        } catch (const membership_error &e) {
            lastError = e.what();
            if (!e.isTransient()) {
                fail(task, FailureKind::TERMINAL, lastError);
                return;
            }
        }
        Logger::debug(SRC, tag_, "%s local retry %u/%u: %s", identity.c_str(), attempt, settings_.localRetries,
                      lastError.c_str());
    }
    fail(task, FailureKind::TRANSIENT, lastError);
}

void DispatchWorker::markInvited(const uint32_t teamId, const Task &task) {
    const InviteRequest &request = *Tasks::requestOf(task);
    if (!store_.transitionInvite(request.inviteId, InviteStatus::RESERVED, InviteStatus::SUCCESS, teamId, "",
                                 now_)) {
        Logger::warn(SRC, tag_, "invite %u left RESERVED during the call; sent but not recorded",
                     request.inviteId);
    }
    if (request.waitingId != 0) {
        store_.setWaitingStatus(request.waitingId, WaitingStatus::SUCCESS, "", now_, false);
    }
    queue_.count(&DispatchCounters::invited);
    settle(task);
    ++report_.invited;
    Logger::info(SRC, tag_, "invited %s to team %u", request.identity, teamId);
}

void DispatchWorker::toWaiting(const DispatchTask &task, const std::string &note) {
    const InviteRequest &request = task.request;
    if (request.waitingId != 0) {
        // Back to WAITING in place keeps its FIFO position.
        store_.setWaitingStatus(request.waitingId, WaitingStatus::WAITING, note, now_, false);
    } else {
        store_.addWaiting(request.inviteId, request.identity, request.code, request.groupId, request.rebind,
                          request.quotaConsumed, note, now_);
    }
    queue_.count(&DispatchCounters::waitlisted);
    settle(Task{task});
    ++report_.waitlisted;
}

void DispatchWorker::fail(const Task &task, const FailureKind kind, const std::string &note) {
    if (retrier_.onFailure(task, kind, note, now_) == RetryState::BACKOFF) {
        ++report_.retried;
    } else {
        ++report_.failed;
    }
    settle(task);
}

void DispatchWorker::defer(const Task &task, const std::string &note) {
    retrier_.defer(task, note, now_);
    settle(task);
    ++report_.deferred;
}

void DispatchWorker::failUnsettled(const std::vector<Task> &tasks, const std::string &note) {
    for (const auto &task: tasks) {
        if (!isSettled(task)) fail(task, FailureKind::TRANSIENT, note);
    }
}

bool DispatchWorker::pastSoftLimit() const {
    return settings_.softLimitSec > 0 &&
           TimeHelper::monotonicMs() - batchStartMs_ >= static_cast<int64_t>(settings_.softLimitSec) * 1000;
}
