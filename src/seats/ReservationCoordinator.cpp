#include "seats/ReservationCoordinator.h"

#include <stdexcept>

ReservationCoordinator::ReservationCoordinator(SeatStore &store, const CapacityLedger &ledger,
                                               const Logger::Source source, const uint32_t lockTimeoutMs)
    : store_{store}, ledger_{ledger}, source_{source}, lockTimeoutMs_{lockTimeoutMs} {
}

void ReservationCoordinator::enter(const Phase next) {
    if (next != phase_) {
        Logger::stateChange(source_, tag_, toString(phase_), toString(next));
    }
    phase_ = next;
}

SeatStore::Transaction ReservationCoordinator::lockCandidates(const uint32_t groupId, const time_t now) {
    enter(Phase::CANDIDATE_LOCK);
    std::vector<uint32_t> ids;
    for (const auto &team: ledger_.listCapacities(groupId, true, now)) {
        ids.push_back(team.teamId);
    }
    return store_.begin(std::move(ids), lockTimeoutMs_);
}

SeatStore::Transaction ReservationCoordinator::lockTeams(const std::vector<uint32_t> &teamIds) {
    enter(Phase::CANDIDATE_LOCK);
    return store_.begin(teamIds, lockTimeoutMs_);
}

Reservation ReservationCoordinator::reserve(SeatStore::Transaction &tx, const std::string &identity,
                                            const std::string &code, const bool rebind, const uint64_t taskId,
                                            const time_t now) {
    enter(Phase::CAPACITY_RECHECK);
    // teamIds() is ascending, so the first match is the lowest-id team with room.
    const uint32_t chosen = store_.read([&](const SeatTables &tables) -> uint32_t {
        for (const uint32_t id: tx.teamIds()) {
            const int32_t slot = tables.teamSlot(id);
            if (slot < 0 || !tables.teams[slot].isHealthy()) continue;
            if (ledger_.measure(tables, tables.teams[slot], now).available > 0) return id;
        }
        return 0;
    });

    if (chosen == 0) {
        enter(Phase::REJECT);
        Logger::debug(source_, tag_, "no seat among %zu locked teams for %s", tx.teamIds().size(),
                      identity.c_str());
        return Reservation::rejected();
    }

    enter(Phase::RESERVE);
    const uint32_t inviteId = tx.insertReserved(chosen, identity, code, rebind, taskId, now);
    Logger::debug(source_, tag_, "reserved team %u invite %u for %s", chosen, inviteId, identity.c_str());
    return {true, chosen, inviteId};
}

ClaimResult ReservationCoordinator::claim(SeatStore::Transaction &tx, const uint32_t teamId,
                                          const std::vector<DispatchTask> &tasks, const time_t now) {
    if (!tx.holds(teamId)) {
        throw std::logic_error("claim on a team not locked by the transaction");
    }
    enter(Phase::CAPACITY_RECHECK);
    uint32_t available = store_.read([&](const SeatTables &tables) -> uint32_t {
        const int32_t slot = tables.teamSlot(teamId);
        if (slot < 0 || !tables.teams[slot].isHealthy()) return 0;
        return ledger_.measure(tables, tables.teams[slot], now).available;
    });

    ClaimResult result;
    for (const auto &task: tasks) {
        if (available == 0) {
            result.overflow.push_back(task);
            continue;
        }
        if (tx.claimPending(task.request.inviteId, teamId, now)) {
            result.claimed.push_back(task);
            --available;
        } else {
            result.stale.push_back(task);
        }
    }

    enter(result.claimed.empty() ? Phase::REJECT : Phase::RESERVE);
    if (!result.overflow.empty()) {
        Logger::info(source_, tag_, "team %u drifted: claimed %zu, %zu over capacity", teamId,
                     result.claimed.size(), result.overflow.size());
    }
    return result;
}
