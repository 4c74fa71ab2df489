#pragma once

#include <cstdint>

#include "core/Flags.h"
#include "seats/Records.h"

// ============================================================================
// DURABLE STORE TABLES (protected by SHM_STORE semaphore)
// ============================================================================

/**
 * Fixed-capacity tables of the durable store.
 *
 * Rows are appended and never deleted. Invites and waiting tasks carry
 * monotonically increasing ids equal to their index + 1, so lookup by id
 * is O(1). Member slots are reused once a member is removed.
 *
 * OWNERSHIP: accessed only through SeatStore, which enforces locking.
 */
struct SeatTables {
    TeamRow teams[Flags::Store::MAX_TEAMS];
    uint32_t teamCount;

    MemberRow members[Flags::Store::MAX_MEMBERS];
    uint32_t memberCount;

    InviteRow invites[Flags::Store::MAX_INVITES];
    uint32_t inviteCount;

    WaitingRow waiting[Flags::Store::MAX_WAITING];
    uint32_t waitingCount;

    CodeRow codes[Flags::Store::MAX_CODES];
    uint32_t codeCount;

    uint64_t compensatedTasks[Flags::Store::MAX_COMPENSATIONS]; // ledger of compensated task ids
    uint32_t compensationCount;

    /** @brief Slot index of a team, or -1. */
    [[nodiscard]] int32_t teamSlot(const uint32_t teamId) const {
        for (uint32_t i = 0; i < teamCount; ++i) {
            if (teams[i].id == teamId) return static_cast<int32_t>(i);
        }
        return -1;
    }

    /** @brief Invite by id, nullptr if unknown. */
    InviteRow *invite(const uint32_t id) {
        if (id == 0 || id > inviteCount) return nullptr;
        return &invites[id - 1];
    }

    WaitingRow *waitingTask(const uint32_t id) {
        if (id == 0 || id > waitingCount) return nullptr;
        return &waiting[id - 1];
    }

    CodeRow *code(const char *value) {
        for (uint32_t i = 0; i < codeCount; ++i) {
            if (strncmp(codes[i].code, value, Records::CODE_LEN) == 0) return &codes[i];
        }
        return nullptr;
    }
};
