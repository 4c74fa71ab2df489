#pragma once

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

#include "core/Constants.h"
#include "dispatch/Task.h"
#include "logging/Logger.h"
#include "seats/CapacityLedger.h"
#include "seats/SeatStore.h"

/**
 * @brief Result of one synchronous claim.
 */
struct Reservation {
    bool ok;
    uint32_t teamId;
    uint32_t inviteId;

    static Reservation rejected() { return {false, 0, 0}; }
};

/**
 * @brief Result of claiming seats for a team's share of a batch.
 */
struct ClaimResult {
    std::vector<DispatchTask> claimed; // now RESERVED on the team
    std::vector<DispatchTask> overflow; // no seat left on the team
    std::vector<DispatchTask> stale; // invite no longer PENDING (failed or claimed elsewhere)
};

/**
 * @brief Atomic "claim one seat" under row-level locking.
 *
 * Phases: CANDIDATE_LOCK -> CAPACITY_RECHECK -> RESERVE | REJECT.
 * Capacity is always recomputed while the candidate row locks are held;
 * snapshots taken before the lock are only used to choose which rows to lock.
 * The caller owns the transaction and decides commit or rollback.
 */
class ReservationCoordinator {
public:
    enum class Phase : uint8_t {
        CANDIDATE_LOCK,
        CAPACITY_RECHECK,
        RESERVE,
        REJECT
    };

    static constexpr const char *toString(const Phase phase) {
        switch (phase) {
            case Phase::CANDIDATE_LOCK: return "CANDIDATE_LOCK";
            case Phase::CAPACITY_RECHECK: return "CAPACITY_RECHECK";
            case Phase::RESERVE: return "RESERVE";
            case Phase::REJECT: return "REJECT";
        }
        return "UNKNOWN";
    }

    ReservationCoordinator(SeatStore &store, const CapacityLedger &ledger,
                           Logger::Source source = Logger::Source::Other,
                           uint32_t lockTimeoutMs = Constants::Lock::ROW_LOCK_TIMEOUT_MS);

    /**
     * @brief Lock every healthy team of the group in ascending id order.
     * @throws lock_conflict If a row lock is not obtained in time
     */
    SeatStore::Transaction lockCandidates(uint32_t groupId, time_t now);

    /** @brief Lock exactly the given teams. */
    SeatStore::Transaction lockTeams(const std::vector<uint32_t> &teamIds);

    /**
     * @brief Recheck capacity of the locked teams and insert a RESERVED invite
     * on the first (lowest id) team with a free seat.
     * @return Reservation::rejected() when no locked team has a free seat
     */
    Reservation reserve(SeatStore::Transaction &tx, const std::string &identity, const std::string &code,
                        bool rebind, uint64_t taskId, time_t now);

    /**
     * @brief Recheck a locked team and move up to its free seats' worth of
     * PENDING invites onto it.
     */
    ClaimResult claim(SeatStore::Transaction &tx, uint32_t teamId, const std::vector<DispatchTask> &tasks,
                      time_t now);

    [[nodiscard]] Phase lastPhase() const noexcept { return phase_; }

private:
    static constexpr auto tag_{"Reservation"};

    void enter(Phase next);

    SeatStore &store_;
    const CapacityLedger &ledger_;
    Logger::Source source_;
    uint32_t lockTimeoutMs_;
    Phase phase_{Phase::CANDIDATE_LOCK};
};
