#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ipc/core/Semaphore.h"
#include "ipc/model/SeatTables.h"

/**
 * @brief Counts of durable records by status.
 */
struct StoreDepth {
    uint32_t invites[5]; // indexed by InviteStatus
    uint32_t waiting[4]; // indexed by WaitingStatus
};

/**
 * @brief Durable store: tables in shared memory plus row-level locking.
 *
 * Every public method takes SHM_STORE for its own duration. Seat-claiming
 * writes go through a Transaction, which additionally holds the row locks of
 * the candidate teams so that capacity can be re-checked and written atomically.
 *
 * Identities are normalized at every entry point.
 */
class SeatStore {
public:
    SeatStore(SeatTables &tables, const Semaphore &sem);

    /**
     * @brief Run fn with shared tables under SHM_STORE.
     *
     * For multi-row reads that must observe one consistent state
     * (capacity computation).
     */
    template<typename Fn>
    auto read(Fn &&fn) const {
        Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
        return fn(static_cast<const SeatTables &>(tables_));
    }

    // ==================== TEAMS (administrative collaborator) ====================

    /** @throws std::length_error If the team table is full */
    void upsertTeam(uint32_t id, uint32_t capacity, uint32_t groupId, TeamHealth health, const std::string &name);

    bool setTeamHealth(uint32_t id, TeamHealth health);

    [[nodiscard]] std::optional<TeamRow> team(uint32_t id) const;

    [[nodiscard]] std::vector<TeamRow> teams() const;

    // ==================== MEMBERS (sync collaborator) ====================

    /** @return false if the identity is already a member */
    bool addMember(uint32_t teamId, const std::string &identity);

    bool removeMember(uint32_t teamId, const std::string &identity);

    /** @brief Replace the confirmed member set of a team with a fresh snapshot. */
    void replaceMembers(uint32_t teamId, const std::vector<std::string> &identities);

    [[nodiscard]] uint32_t memberCount(uint32_t teamId) const;

    // ==================== CODES ====================

    void upsertCode(const std::string &code, uint32_t maxUses, uint32_t groupId, time_t expiresAt, bool active);

    [[nodiscard]] std::optional<CodeRow> code(const std::string &code) const;

    void setCodeUsage(const std::string &code, uint32_t usedCount);

    /** @brief Add delta to the durable usage, clamped to [0, maxUses]. */
    bool adjustCodeUsage(const std::string &code, int32_t delta);

    // ==================== INVITES ====================

    /** @brief Record an accepted request that holds no seat yet. @return invite id (handle) */
    uint32_t createPendingInvite(const std::string &identity, const std::string &code, bool rebind,
                                 uint64_t taskId, time_t now);

    [[nodiscard]] std::optional<InviteRow> invite(uint32_t id) const;

    /**
     * @brief Move an invite to a new status.
     * @param teamId Team to record (RESERVED/SUCCESS), or 0 to clear when returning to PENDING
     * @return false if the invite is unknown or voided
     */
    bool updateInvite(uint32_t id, InviteStatus status, uint32_t teamId, const std::string &note, time_t now);

    /**
     * @brief Compare-and-set status transition.
     * @param teamId As for updateInvite
     * @return false unless the invite is live and currently in `from`
     */
    bool transitionInvite(uint32_t id, InviteStatus from, InviteStatus to, uint32_t teamId, const std::string &note,
                          time_t now);

    /** @brief Live invites with the given status whose hold (InviteRow::heldSince) began before cutoff. */
    [[nodiscard]] std::vector<InviteRow> invitesOlderThan(InviteStatus status, time_t cutoff) const;

    /** @brief Mark every live invite of identity on team as REMOVED. @return rows changed */
    uint32_t markInvitesRemoved(uint32_t teamId, const std::string &identity, time_t now);

    // ==================== WAITING QUEUE ====================

    uint32_t addWaiting(uint32_t inviteId, const std::string &identity, const std::string &code, uint32_t groupId,
                        bool rebind, bool quotaConsumed, const std::string &note, time_t now);

    [[nodiscard]] std::optional<WaitingRow> waitingTask(uint32_t id) const;

    /** @brief WAITING rows of a group, oldest first. */
    [[nodiscard]] std::vector<WaitingRow> oldestWaiting(uint32_t groupId, uint32_t limit) const;

    /** @brief Distinct groups that currently have WAITING rows, ascending. */
    [[nodiscard]] std::vector<uint32_t> waitingGroups() const;

    bool setWaitingStatus(uint32_t id, WaitingStatus status, const std::string &note, time_t now,
                          bool incrementRetry);

    /** @brief Record that the waiting request now holds a code use. */
    bool setWaitingQuotaConsumed(uint32_t id, bool consumed);

    // ==================== COMPENSATION LEDGER ====================

    /**
     * @brief Record that a task's consumed quota was given back.
     * @return false if the task was already compensated
     * @throws std::length_error If the ledger is full
     */
    bool recordCompensation(uint64_t taskId);

    [[nodiscard]] bool isCompensated(uint64_t taskId) const;

    // ==================== STATISTICS ====================

    [[nodiscard]] StoreDepth depth() const;

    /**
     * @brief Unit of work holding team row locks.
     *
     * Locks are taken in ascending team id with a bounded wait. Rows written
     * through the transaction are visible immediately; rollback (explicit or
     * by destruction without commit) voids inserted rows and restores claimed
     * ones.
     */
    class Transaction {
    public:
        /** @throws lock_conflict If any row lock cannot be taken within timeoutMs */
        Transaction(SeatStore &store, std::vector<uint32_t> teamIds, uint32_t timeoutMs);

        ~Transaction();

        Transaction(Transaction &&other) noexcept;

        Transaction(const Transaction &) = delete;

        Transaction &operator=(const Transaction &) = delete;

        Transaction &operator=(Transaction &&) = delete;

        /** @brief Locked team ids, ascending. */
        [[nodiscard]] const std::vector<uint32_t> &teamIds() const noexcept { return teamIds_; }

        [[nodiscard]] bool holds(uint32_t teamId) const;

        /** @brief Insert a RESERVED invite on a locked team. @return invite id */
        uint32_t insertReserved(uint32_t teamId, const std::string &identity, const std::string &code,
                                bool rebind, uint64_t taskId, time_t now);

        /** @brief Move a PENDING invite onto a locked team as RESERVED. */
        bool claimPending(uint32_t inviteId, uint32_t teamId, time_t now);

        void commit();

        void rollback();

        [[nodiscard]] bool isOpen() const noexcept { return open_; }

    private:
        struct Undo {
            uint32_t inviteId;
            bool inserted;
            InviteStatus status;
            uint32_t teamId;
            time_t reservedAt;
        };

        void requireHeld(uint32_t teamId) const;

        void release() noexcept;

        SeatStore *store_;
        std::vector<uint32_t> teamIds_;
        std::vector<uint8_t> semIndexes_;
        std::vector<Undo> undo_;
        bool open_{true};
    };

    /** @brief Lock the given teams for a reservation. */
    Transaction begin(std::vector<uint32_t> teamIds, uint32_t timeoutMs);

private:
    static constexpr auto tag_{"SeatStore"};

    uint32_t appendInvite(uint32_t teamId, InviteStatus status, const std::string &identity, const std::string &code,
                          bool rebind, uint64_t taskId, time_t now);

    SeatTables &tables_;
    const Semaphore &sem_;
};
