#include "seats/CapacityLedger.h"

#include <algorithm>
#include <set>
#include <string>

CapacityLedger::CapacityLedger(const SeatStore &store, const uint32_t pendingWindowSec)
    : store_{store}, pendingWindowSec_{pendingWindowSec} {
}

TeamCapacity CapacityLedger::measure(const SeatTables &tables, const TeamRow &team, const time_t now) const {
    std::set<std::string> confirmed;
    for (uint32_t i = 0; i < tables.memberCount; ++i) {
        const MemberRow &member = tables.members[i];
        if (member.live && member.teamId == team.id) confirmed.emplace(member.identity);
    }

    const time_t cutoff = now - static_cast<time_t>(pendingWindowSec_);
    std::set<std::string> pending;
    for (uint32_t i = 0; i < tables.inviteCount; ++i) {
        const InviteRow &invite = tables.invites[i];
        if (invite.voided || invite.teamId != team.id) continue;
        if (invite.status != InviteStatus::SUCCESS && invite.status != InviteStatus::RESERVED) continue;
        if (invite.heldSince() < cutoff) continue;
        if (confirmed.count(invite.identity) != 0) continue;
        pending.emplace(invite.identity);
    }

    TeamCapacity result{};
    result.teamId = team.id;
    result.groupId = team.groupId;
    result.health = team.health;
    result.capacity = team.capacity;
    result.confirmed = static_cast<uint32_t>(confirmed.size());
    result.pending = static_cast<uint32_t>(pending.size());
    const int64_t free = static_cast<int64_t>(team.capacity) - result.confirmed - result.pending;
    result.available = free > 0 ? static_cast<uint32_t>(free) : 0;
    return result;
}

std::vector<TeamCapacity> CapacityLedger::measureAll(const SeatTables &tables, const uint32_t groupId,
                                                     const bool healthyOnly, const time_t now) const {
    std::vector<TeamCapacity> result;
    for (uint32_t i = 0; i < tables.teamCount; ++i) {
        const TeamRow &team = tables.teams[i];
        if (!inGroup(team, groupId)) continue;
        if (healthyOnly && !team.isHealthy()) continue;
        result.push_back(measure(tables, team, now));
    }
    sortForFill(result);
    return result;
}

std::optional<TeamCapacity> CapacityLedger::capacity(const uint32_t teamId, const time_t now) const {
    return store_.read([&](const SeatTables &tables) -> std::optional<TeamCapacity> {
        const int32_t slot = tables.teamSlot(teamId);
        if (slot < 0) return std::nullopt;
        return measure(tables, tables.teams[slot], now);
    });
}

std::vector<TeamCapacity> CapacityLedger::listCapacities(const uint32_t groupId, const bool healthyOnly,
                                                         const time_t now) const {
    return store_.read([&](const SeatTables &tables) {
        return measureAll(tables, groupId, healthyOnly, now);
    });
}

CapacitySummary CapacityLedger::summary(const uint32_t groupId, const time_t now) const {
    CapacitySummary summary{};
    for (const auto &team: listCapacities(groupId, true, now)) {
        ++summary.teams;
        summary.capacity += team.capacity;
        summary.confirmed += team.confirmed;
        summary.pending += team.pending;
        summary.available += team.available;
    }
    return summary;
}

void CapacityLedger::sortForFill(std::vector<TeamCapacity> &capacities) {
    // Low ids first keeps placement predictable; full teams sink to the end.
    std::sort(capacities.begin(), capacities.end(), [](const TeamCapacity &a, const TeamCapacity &b) {
        const bool aFull = a.available == 0;
        const bool bFull = b.available == 0;
        if (aFull != bFull) return !aFull;
        return a.teamId < b.teamId;
    });
}
