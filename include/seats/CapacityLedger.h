#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <vector>

#include "core/Constants.h"
#include "seats/SeatStore.h"

/**
 * @brief Seat accounting of one team at one instant.
 */
struct TeamCapacity {
    uint32_t teamId;
    uint32_t groupId;
    TeamHealth health;
    uint32_t capacity;
    uint32_t confirmed; // live confirmed members
    uint32_t pending; // distinct identities with a recent SUCCESS/RESERVED invite, not yet confirmed
    uint32_t available; // max(0, capacity - confirmed - pending)
};

/**
 * @brief Aggregate over a set of teams.
 */
struct CapacitySummary {
    uint32_t teams;
    uint32_t capacity;
    uint32_t confirmed;
    uint32_t pending;
    uint32_t available;
};

/**
 * @brief Computes per-team and aggregate available capacity from the durable store.
 *
 * Pending invites hold a seat only while younger than the lookback window;
 * older ones stay as history but stop starving capacity.
 *
 * Group 0 means no group filter.
 */
class CapacityLedger {
public:
    explicit CapacityLedger(const SeatStore &store, uint32_t pendingWindowSec = Constants::Capacity::PENDING_WINDOW_SEC);

    /**
     * @brief Capacity of one team from already-locked tables.
     *
     * The caller holds SHM_STORE (via SeatStore::read). Used inside row locks
     * for the reservation re-check.
     */
    [[nodiscard]] TeamCapacity measure(const SeatTables &tables, const TeamRow &team, time_t now) const;

    /**
     * @brief Capacities of matching teams from already-locked tables,
     * sorted ascending by (available <= 0, team id).
     */
    [[nodiscard]] std::vector<TeamCapacity> measureAll(const SeatTables &tables, uint32_t groupId, bool healthyOnly,
                                                       time_t now) const;

    [[nodiscard]] std::optional<TeamCapacity> capacity(uint32_t teamId, time_t now) const;

    /** @brief Snapshot of matching teams, fill-preference order. */
    [[nodiscard]] std::vector<TeamCapacity> listCapacities(uint32_t groupId, bool healthyOnly, time_t now) const;

    /** @brief Aggregate over healthy teams of the group. */
    [[nodiscard]] CapacitySummary summary(uint32_t groupId, time_t now) const;

    /** @brief Sort key used everywhere a fill order is needed. */
    static void sortForFill(std::vector<TeamCapacity> &capacities);

    static bool inGroup(const TeamRow &team, uint32_t groupId) noexcept {
        return groupId == 0 || team.groupId == groupId;
    }

private:
    const SeatStore &store_;
    uint32_t pendingWindowSec_;
};
