#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <stdexcept>
#include <string>

// ============================================================================
// DURABLE RECORDS (stored in shared memory tables, protected by SHM_STORE)
// ============================================================================

namespace Records {
    constexpr size_t IDENTITY_LEN{64};
    constexpr size_t CODE_LEN{32};
    constexpr size_t NAME_LEN{32};
    constexpr size_t NOTE_LEN{64};

    /**
     * @brief Canonical form of an identity: surrounding whitespace trimmed, lowercased.
     */
    inline std::string normalizeIdentity(const std::string &raw) {
        const auto first = raw.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return {};
        const auto last = raw.find_last_not_of(" \t\r\n");
        std::string out = raw.substr(first, last - first + 1);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    /**
     * @brief Copy a string into a fixed-size record field, always NUL-terminated.
     * @throws std::invalid_argument If the value does not fit
     */
    template<size_t N>
    void copyField(char (&field)[N], const std::string &value) {
        if (value.size() >= N) {
            throw std::invalid_argument("field value too long: " + value);
        }
        memset(field, 0, N);
        memcpy(field, value.data(), value.size());
    }
}

/**
 * @brief Health of a team as reported by the administrative collaborator.
 */
enum class TeamHealth : uint8_t {
    ACTIVE,
    BANNED,
    TOKEN_INVALID,
    PAUSED
};

constexpr const char *toString(const TeamHealth health) {
    switch (health) {
        case TeamHealth::ACTIVE: return "active";
        case TeamHealth::BANNED: return "banned";
        case TeamHealth::TOKEN_INVALID: return "token_invalid";
        case TeamHealth::PAUSED: return "paused";
        default: throw std::invalid_argument("Invalid TeamHealth value");
    }
}

/**
 * @brief Invite record lifecycle.
 *
 * PENDING: accepted, not yet placed on a team (holds no seat)
 * RESERVED: seat claimed on a team, external call not yet confirmed
 * SUCCESS: external invite sent
 * FAILED: terminal failure
 * REMOVED: member was removed from the team
 */
enum class InviteStatus : uint8_t {
    PENDING,
    RESERVED,
    SUCCESS,
    FAILED,
    REMOVED
};

constexpr const char *toString(const InviteStatus status) {
    switch (status) {
        case InviteStatus::PENDING: return "pending";
        case InviteStatus::RESERVED: return "reserved";
        case InviteStatus::SUCCESS: return "success";
        case InviteStatus::FAILED: return "failed";
        case InviteStatus::REMOVED: return "removed";
        default: throw std::invalid_argument("Invalid InviteStatus value");
    }
}

/**
 * @brief Waiting task lifecycle.
 */
enum class WaitingStatus : uint8_t {
    WAITING,
    PROCESSING,
    SUCCESS,
    FAILED
};

constexpr const char *toString(const WaitingStatus status) {
    switch (status) {
        case WaitingStatus::WAITING: return "waiting";
        case WaitingStatus::PROCESSING: return "processing";
        case WaitingStatus::SUCCESS: return "success";
        case WaitingStatus::FAILED: return "failed";
        default: throw std::invalid_argument("Invalid WaitingStatus value");
    }
}

/**
 * @brief A capacity-bounded team. groupId 0 means no group affiliation.
 */
struct TeamRow {
    uint32_t id;
    uint32_t capacity;
    uint32_t groupId;
    TeamHealth health;
    char name[Records::NAME_LEN];

    [[nodiscard]] bool isHealthy() const noexcept { return health == TeamHealth::ACTIVE; }
};

/**
 * @brief Verified occupancy of one seat, refreshed by member sync.
 */
struct MemberRow {
    uint32_t teamId;
    bool live; // false once removed; slot may be reused
    char identity[Records::IDENTITY_LEN];
};

struct InviteRow {
    uint32_t id;
    uint32_t teamId; // 0 while PENDING
    InviteStatus status;
    bool rebind;
    bool voided; // rolled back before commit; ignored by every query
    uint64_t taskId;
    time_t createdAt;
    time_t updatedAt;
    time_t reservedAt; // when the seat was claimed; 0 while PENDING
    char identity[Records::IDENTITY_LEN];
    char code[Records::CODE_LEN];
    char note[Records::NOTE_LEN];

    /** @brief Start of the seat hold; a request may wait PENDING for long before it is placed. */
    [[nodiscard]] time_t heldSince() const noexcept { return reservedAt != 0 ? reservedAt : createdAt; }
};

/**
 * @brief Deferred request, FIFO within a group.
 */
struct WaitingRow {
    uint32_t id;
    uint32_t inviteId; // handle of the original request
    uint32_t groupId;
    WaitingStatus status;
    bool rebind;
    bool quotaConsumed;
    uint32_t retryCount;
    time_t createdAt;
    time_t processedAt;
    char identity[Records::IDENTITY_LEN];
    char code[Records::CODE_LEN];
    char note[Records::NOTE_LEN];
};

/**
 * @brief Limited-use redemption code. maxUses 0 means unlimited.
 */
struct CodeRow {
    bool active;
    uint32_t maxUses;
    uint32_t usedCount;
    uint32_t groupId;
    time_t expiresAt; // 0 = never
    char code[Records::CODE_LEN];

    [[nodiscard]] bool isUnlimited() const noexcept { return maxUses == 0; }

    [[nodiscard]] bool isUsable(const time_t now) const noexcept {
        return active && (expiresAt == 0 || expiresAt > now);
    }
};
