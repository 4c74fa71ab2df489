#include "dispatch/QuotaCompensator.h"

#include "logging/Logger.h"

QuotaCompensator::QuotaCompensator(SeatStore &store, TokenBucket &bucket) : store_{store}, bucket_{bucket} {
}

bool QuotaCompensator::compensate(const InviteRequest &request, const std::string &reason, const time_t now) {
    if (!store_.recordCompensation(request.taskId)) {
        Logger::debug(Logger::Source::Worker, tag_, "task %llu already compensated",
                      static_cast<unsigned long long>(request.taskId));
        return false;
    }

    if (request.quotaConsumed && request.code[0] != '\0') {
        if (!bucket_.refund(request.code)) {
            store_.adjustCodeUsage(request.code, -1);
        }
    }
    if (request.inviteId != 0 &&
        !store_.transitionInvite(request.inviteId, InviteStatus::RESERVED, InviteStatus::FAILED, 0, reason, now)) {
        store_.transitionInvite(request.inviteId, InviteStatus::PENDING, InviteStatus::FAILED, 0, reason, now);
    }
    if (request.waitingId != 0) {
        store_.setWaitingStatus(request.waitingId, WaitingStatus::FAILED, reason, now, false);
    }

    Logger::info(Logger::Source::Worker, tag_, "task %llu (%s) rolled back: %s",
                 static_cast<unsigned long long>(request.taskId), request.identity, reason.c_str());
    return true;
}
