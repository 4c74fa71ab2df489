#pragma once

#include <cstdint>
#include <ctime>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

#include "seats/Records.h"

/**
 * @brief One invite request as it travels through the task queue.
 *
 * Fixed-size so the whole task can be copied through a System V queue.
 */
struct InviteRequest {
    uint64_t taskId;
    uint32_t inviteId; // handle returned to the caller
    uint32_t groupId; // 0 = any team
    uint32_t waitingId; // non-zero when re-admitted from the waiting queue
    uint32_t attempt; // outer attempts already consumed
    bool rebind;
    bool quotaConsumed; // a token bucket unit was taken for this request
    time_t enqueuedAt;
    char identity[Records::IDENTITY_LEN];
    char code[Records::CODE_LEN];
};

/** @brief Seat already reserved on the request path; only the external call is left. */
struct ReserveTask {
    InviteRequest request;
    uint32_t teamId;
};

/** @brief Unplaced request; the worker allocates and claims a seat. */
struct DispatchTask {
    InviteRequest request;
};

enum class ReconcileKind : uint8_t {
    WAITING_QUEUE,
    STALE_RESERVED,
    QUOTA_SYNC
};

constexpr const char *toString(const ReconcileKind kind) {
    switch (kind) {
        case ReconcileKind::WAITING_QUEUE: return "waiting_queue";
        case ReconcileKind::STALE_RESERVED: return "stale_reserved";
        case ReconcileKind::QUOTA_SYNC: return "quota_sync";
        default: throw std::invalid_argument("Invalid ReconcileKind value");
    }
}

/** @brief Periodic maintenance job submitted by the supervisor's scheduler. */
struct ReconcileTask {
    ReconcileKind kind;
    uint32_t scanLimit;
    time_t scheduledAt;
};

using Task = std::variant<ReserveTask, DispatchTask, ReconcileTask>;

static_assert(std::is_trivially_copyable_v<Task>, "tasks are copied through message queues and shared memory");

namespace Tasks {
    /**
     * @brief Build a request with normalized identity.
     * @throws std::invalid_argument If identity or code do not fit the record fields
     */
    inline InviteRequest makeRequest(const uint64_t taskId, const uint32_t inviteId, const std::string &identity,
                                     const std::string &code, const uint32_t groupId, const bool rebind,
                                     const time_t now) {
        InviteRequest request{};
        request.taskId = taskId;
        request.inviteId = inviteId;
        request.groupId = groupId;
        request.rebind = rebind;
        request.enqueuedAt = now;
        Records::copyField(request.identity, Records::normalizeIdentity(identity));
        Records::copyField(request.code, code);
        return request;
    }

    /** @brief Request carried by a reserve or dispatch task, nullptr for reconcile tasks. */
    inline const InviteRequest *requestOf(const Task &task) {
        if (const auto *reserve = std::get_if<ReserveTask>(&task)) return &reserve->request;
        if (const auto *dispatch = std::get_if<DispatchTask>(&task)) return &dispatch->request;
        return nullptr;
    }

    inline InviteRequest *requestOf(Task &task) {
        if (auto *reserve = std::get_if<ReserveTask>(&task)) return &reserve->request;
        if (auto *dispatch = std::get_if<DispatchTask>(&task)) return &dispatch->request;
        return nullptr;
    }

    inline const char *kindName(const Task &task) {
        switch (task.index()) {
            case 0: return "reserve";
            case 1: return "dispatch";
            default: return "reconcile";
        }
    }
}
