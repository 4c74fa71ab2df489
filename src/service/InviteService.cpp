#include "service/InviteService.h"

#include <stdexcept>

#include "core/Config.h"
#include "core/Errors.h"
#include "logging/Logger.h"
#include "utils/TimeHelper.h"

namespace {
    constexpr auto SRC = Logger::Source::Client;

    std::string requireIdentity(const std::string &identity) {
        std::string normalized = Records::normalizeIdentity(identity);
        if (normalized.empty()) {
            throw std::invalid_argument("empty identity");
        }
        return normalized;
    }
}

InviteService::InviteService(SeatStore &store, const CapacityLedger &ledger, ReservationCoordinator &reservation,
                             TaskQueue &queue, TokenBucket &bucket, RedemptionSemaphore &semaphore,
                             RateLimiter &rateLimiter, MembershipClient &client)
    : store_{store}, ledger_{ledger}, reservation_{reservation}, queue_{queue}, bucket_{bucket},
      semaphore_{semaphore}, rateLimiter_{rateLimiter}, client_{client} {
}

uint32_t InviteService::resolveGroup(const CodeRow &row, const uint32_t requested) const {
    if (row.groupId == 0) return requested;
    if (requested != 0 && requested != row.groupId) {
        throw invalid_code(std::string("code ") + row.code + " is not valid for group " + std::to_string(requested));
    }
    return row.groupId;
}

CodeRow InviteService::requireUsableCode(const std::string &code, const time_t now) const {
    const auto row = store_.code(code);
    if (!row) {
        throw invalid_code("unknown code " + code);
    }
    if (!row->isUsable(now)) {
        throw invalid_code("code " + code + " is inactive or expired");
    }
    return *row;
}

void InviteService::takeUse(const std::string &code) {
    switch (bucket_.tryConsume(code)) {
        case TokenBucket::Outcome::UNLIMITED:
        case TokenBucket::Outcome::CONSUMED:
            return;
        case TokenBucket::Outcome::EXHAUSTED:
            throw invalid_code("code " + code + " is exhausted");
        case TokenBucket::Outcome::UNAVAILABLE:
            throw coordination_unavailable("redemption counter unreachable");
    }
}

void InviteService::giveBack(const std::string &code) {
    if (!bucket_.refund(code)) {
        store_.adjustCodeUsage(code, -1);
    }
}

uint32_t InviteService::enqueueInvite(const std::string &identity, const std::string &code, const uint32_t groupId,
                                      const bool rebind) {
    const std::string normalized = requireIdentity(identity);
    if (!rateLimiter_.allow(normalized)) {
        throw throttled("too many requests for " + normalized);
    }

    const time_t now = time(nullptr);
    const CodeRow row = requireUsableCode(code, now);
    const uint32_t group = resolveGroup(row, groupId);
    const uint64_t taskId = queue_.nextTaskId();
    // Built first so an oversized identity fails before a use is taken.
    DispatchTask task{Tasks::makeRequest(taskId, 0, normalized, code, group, rebind, now)};
    task.request.quotaConsumed = true;

    takeUse(code);
    const uint32_t inviteId = store_.createPendingInvite(normalized, code, rebind, taskId, now);
    task.request.inviteId = inviteId;

    if (!queue_.trySubmit(task)) {
        giveBack(code);
        store_.updateInvite(inviteId, InviteStatus::FAILED, 0, "queue full", now);
        Logger::warn(SRC, tag_, "queue full, %s not accepted", normalized.c_str());
        throw queue_full("task queue full, try again later");
    }

    Logger::info(SRC, tag_, "accepted %s with %s (group %u), handle %u", normalized.c_str(), code.c_str(), group,
                 inviteId);
    return inviteId;
}

ReserveResult InviteService::reserveSeat(const std::string &identity, const std::string &code,
                                         const uint32_t groupId, const bool rebind) {
    const std::string normalized = requireIdentity(identity);
    const auto permit = semaphore_.acquire();

    const time_t now = time(nullptr);
    const CodeRow row = requireUsableCode(code, now);
    const uint32_t group = resolveGroup(row, groupId);
    const uint64_t taskId = queue_.nextTaskId();
    ReserveTask task{Tasks::makeRequest(taskId, 0, normalized, code, group, rebind, now), 0};
    task.request.quotaConsumed = true;

    takeUse(code);

    Reservation reservation = Reservation::rejected();
    const uint32_t lockRetries = Config::Dispatch::LOCK_RETRIES();
    for (uint32_t attempt = 0; attempt <= lockRetries; ++attempt) {
        try {
            auto tx = reservation_.lockCandidates(group, now);
            reservation = reservation_.reserve(tx, normalized, code, rebind, taskId, now);
            if (reservation.ok) {
                tx.commit();
            } else {
                tx.rollback();
            }
            break;
        } catch (const lock_conflict &e) {
            Logger::debug(SRC, tag_, "reservation lock conflict %u/%u: %s", attempt + 1, lockRetries + 1,
                          e.what());
        } catch (const std::exception &) {
            giveBack(code);
            throw;
        }
    }

    if (!reservation.ok) {
        giveBack(code);
        const uint32_t inviteId = store_.createPendingInvite(normalized, code, rebind, taskId, now);
        const uint32_t waitingId = store_.addWaiting(inviteId, normalized, code, group, rebind, false,
                                                     "no free seat", now);
        Logger::info(SRC, tag_, "no seat for %s in group %u, waiting %u", normalized.c_str(), group, waitingId);
        return {false, 0, inviteId, waitingId};
    }

    task.request.inviteId = reservation.inviteId;
    task.teamId = reservation.teamId;
    if (!queue_.trySubmit(task) && !queue_.schedule(task, TimeHelper::nowMs())) {
        store_.transitionInvite(reservation.inviteId, InviteStatus::RESERVED, InviteStatus::FAILED, 0,
                                "queue full", now);
        giveBack(code);
        throw queue_full("task queue full, try again later");
    }

    Logger::info(SRC, tag_, "reserved team %u for %s, handle %u", reservation.teamId, normalized.c_str(),
                 reservation.inviteId);
    return {true, reservation.teamId, reservation.inviteId, 0};
}

CapacitySummary InviteService::getCapacity(const uint32_t groupId) const {
    return ledger_.summary(groupId, time(nullptr));
}

QueueDepth InviteService::getQueueDepth() const {
    return {store_.depth(), queue_.depth(), queue_.delayedCount()};
}

std::optional<InviteRow> InviteService::inviteStatus(const uint32_t handle) const {
    auto row = store_.invite(handle);
    if (row && row->voided) return std::nullopt;
    return row;
}

void InviteService::removeMember(const uint32_t teamId, const std::string &identity) {
    const std::string normalized = requireIdentity(identity);
    const uint32_t attempts = Constants::Retry::MEMBER_REMOVAL_ATTEMPTS;

    for (uint32_t attempt = 1;; ++attempt) {
        try {
            if (!client_.remove(teamId, normalized)) {
                Logger::info(SRC, tag_, "%s was not a member of team %u externally", normalized.c_str(), teamId);
            }
            break;
        } catch (const membership_error &e) {
            if (!e.isTransient() || attempt >= attempts) {
                Logger::error(SRC, tag_, "removing %s from team %u failed after %u attempts: %s",
                              normalized.c_str(), teamId, attempt, e.what());
                throw;
            }
            Logger::warn(SRC, tag_, "remove attempt %u/%u failed: %s", attempt, attempts, e.what());
            TimeHelper::sleepMs(Constants::Retry::LOCAL_RETRY_DELAY_MS * attempt);
        }
    }

    const time_t now = time(nullptr);
    store_.removeMember(teamId, normalized);
    const uint32_t marked = store_.markInvitesRemoved(teamId, normalized, now);
    Logger::info(SRC, tag_, "removed %s from team %u (%u invite records)", normalized.c_str(), teamId, marked);
}
