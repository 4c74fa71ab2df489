#include "seats/SeatStore.h"

#include <algorithm>
#include <stdexcept>

#include "core/Errors.h"
#include "logging/Logger.h"

namespace {
    constexpr auto SRC = Logger::Source::Other;

    bool sameIdentity(const char *field, const std::string &identity) {
        return identity.compare(field) == 0;
    }
}

SeatStore::SeatStore(SeatTables &tables, const Semaphore &sem) : tables_{tables}, sem_{sem} {
}

// ==================== TEAMS ====================

void SeatStore::upsertTeam(const uint32_t id, const uint32_t capacity, const uint32_t groupId,
                           const TeamHealth health, const std::string &name) {
    if (id == 0) {
        throw std::invalid_argument("team id 0 is reserved");
    }
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    int32_t slot = tables_.teamSlot(id);
    if (slot < 0) {
        if (tables_.teamCount >= Flags::Store::MAX_TEAMS) {
            throw std::length_error("team table full");
        }
        slot = static_cast<int32_t>(tables_.teamCount++);
    }
    TeamRow &row = tables_.teams[slot];
    row.id = id;
    row.capacity = capacity;
    row.groupId = groupId;
    row.health = health;
    Records::copyField(row.name, name);
    Logger::debug(SRC, tag_, "team %u capacity=%u group=%u health=%s", id, capacity, groupId, toString(health));
}

bool SeatStore::setTeamHealth(const uint32_t id, const TeamHealth health) {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    const int32_t slot = tables_.teamSlot(id);
    if (slot < 0) return false;
    tables_.teams[slot].health = health;
    return true;
}

std::optional<TeamRow> SeatStore::team(const uint32_t id) const {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    const int32_t slot = tables_.teamSlot(id);
    if (slot < 0) return std::nullopt;
    return tables_.teams[slot];
}

std::vector<TeamRow> SeatStore::teams() const {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    return std::vector<TeamRow>(tables_.teams, tables_.teams + tables_.teamCount);
}

// ==================== MEMBERS ====================

bool SeatStore::addMember(const uint32_t teamId, const std::string &identity) {
    const std::string normalized = Records::normalizeIdentity(identity);
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    MemberRow *freeRow = nullptr;
    for (uint32_t i = 0; i < tables_.memberCount; ++i) {
        MemberRow &row = tables_.members[i];
        if (!row.live) {
            if (freeRow == nullptr) freeRow = &row;
            continue;
        }
        if (row.teamId == teamId && sameIdentity(row.identity, normalized)) return false;
    }
    if (freeRow == nullptr) {
        if (tables_.memberCount >= Flags::Store::MAX_MEMBERS) {
            throw std::length_error("member table full");
        }
        freeRow = &tables_.members[tables_.memberCount++];
    }
    freeRow->teamId = teamId;
    freeRow->live = true;
    Records::copyField(freeRow->identity, normalized);
    return true;
}

bool SeatStore::removeMember(const uint32_t teamId, const std::string &identity) {
    const std::string normalized = Records::normalizeIdentity(identity);
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    for (uint32_t i = 0; i < tables_.memberCount; ++i) {
        MemberRow &row = tables_.members[i];
        if (row.live && row.teamId == teamId && sameIdentity(row.identity, normalized)) {
            row.live = false;
            return true;
        }
    }
    return false;
}

void SeatStore::replaceMembers(const uint32_t teamId, const std::vector<std::string> &identities) {
    {
        Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
        for (uint32_t i = 0; i < tables_.memberCount; ++i) {
            if (tables_.members[i].teamId == teamId) tables_.members[i].live = false;
        }
    }
    for (const auto &identity: identities) {
        addMember(teamId, identity);
    }
}

uint32_t SeatStore::memberCount(const uint32_t teamId) const {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    uint32_t count = 0;
    for (uint32_t i = 0; i < tables_.memberCount; ++i) {
        if (tables_.members[i].live && tables_.members[i].teamId == teamId) ++count;
    }
    return count;
}

// ==================== CODES ====================

void SeatStore::upsertCode(const std::string &code, const uint32_t maxUses, const uint32_t groupId,
                           const time_t expiresAt, const bool active) {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    CodeRow *row = tables_.code(code.c_str());
    if (row == nullptr) {
        if (tables_.codeCount >= Flags::Store::MAX_CODES) {
            throw std::length_error("code table full");
        }
        row = &tables_.codes[tables_.codeCount++];
        *row = CodeRow{};
        Records::copyField(row->code, code);
    }
    row->maxUses = maxUses;
    row->groupId = groupId;
    row->expiresAt = expiresAt;
    row->active = active;
}

std::optional<CodeRow> SeatStore::code(const std::string &code) const {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    const CodeRow *row = tables_.code(code.c_str());
    if (row == nullptr) return std::nullopt;
    return *row;
}

void SeatStore::setCodeUsage(const std::string &code, const uint32_t usedCount) {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    if (CodeRow *row = tables_.code(code.c_str())) {
        row->usedCount = usedCount;
    }
}

bool SeatStore::adjustCodeUsage(const std::string &code, const int32_t delta) {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    CodeRow *row = tables_.code(code.c_str());
    if (row == nullptr) return false;
    int64_t used = static_cast<int64_t>(row->usedCount) + delta;
    if (used < 0) used = 0;
    if (!row->isUnlimited() && used > row->maxUses) used = row->maxUses;
    row->usedCount = static_cast<uint32_t>(used);
    return true;
}

// ==================== INVITES ====================

uint32_t SeatStore::appendInvite(const uint32_t teamId, const InviteStatus status, const std::string &identity,
                                 const std::string &code, const bool rebind, const uint64_t taskId, const time_t now) {
    if (tables_.inviteCount >= Flags::Store::MAX_INVITES) {
        throw std::length_error("invite table full");
    }
    InviteRow &row = tables_.invites[tables_.inviteCount];
    row = InviteRow{};
    row.id = ++tables_.inviteCount;
    row.teamId = teamId;
    row.status = status;
    row.rebind = rebind;
    row.taskId = taskId;
    row.createdAt = now;
    row.updatedAt = now;
    row.reservedAt = status == InviteStatus::PENDING ? 0 : now;
    Records::copyField(row.identity, Records::normalizeIdentity(identity));
    Records::copyField(row.code, code);
    return row.id;
}

uint32_t SeatStore::createPendingInvite(const std::string &identity, const std::string &code, const bool rebind,
                                        const uint64_t taskId, const time_t now) {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    return appendInvite(0, InviteStatus::PENDING, identity, code, rebind, taskId, now);
}

std::optional<InviteRow> SeatStore::invite(const uint32_t id) const {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    if (id == 0 || id > tables_.inviteCount) return std::nullopt;
    return tables_.invites[id - 1];
}

bool SeatStore::updateInvite(const uint32_t id, const InviteStatus status, const uint32_t teamId,
                             const std::string &note, const time_t now) {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    InviteRow *row = tables_.invite(id);
    if (row == nullptr || row->voided) return false;
    Logger::debug(SRC, tag_, "invite %u %s -> %s", id, toString(row->status), toString(status));
    if (status == InviteStatus::PENDING) row->reservedAt = 0;
    else if (status == InviteStatus::RESERVED && row->status != InviteStatus::RESERVED) row->reservedAt = now;
    row->status = status;
    if (teamId != 0 || status == InviteStatus::PENDING) row->teamId = teamId;
    row->updatedAt = now;
    Records::copyField(row->note, note.substr(0, Records::NOTE_LEN - 1));
    return true;
}

bool SeatStore::transitionInvite(const uint32_t id, const InviteStatus from, const InviteStatus to,
                                 const uint32_t teamId, const std::string &note, const time_t now) {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    InviteRow *row = tables_.invite(id);
    if (row == nullptr || row->voided || row->status != from) return false;
    Logger::debug(SRC, tag_, "invite %u %s -> %s", id, toString(from), toString(to));
    if (to == InviteStatus::PENDING) row->reservedAt = 0;
    else if (to == InviteStatus::RESERVED && from != InviteStatus::RESERVED) row->reservedAt = now;
    row->status = to;
    if (teamId != 0 || to == InviteStatus::PENDING) row->teamId = teamId;
    row->updatedAt = now;
    Records::copyField(row->note, note.substr(0, Records::NOTE_LEN - 1));
    return true;
}

std::vector<InviteRow> SeatStore::invitesOlderThan(const InviteStatus status, const time_t cutoff) const {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    std::vector<InviteRow> rows;
    for (uint32_t i = 0; i < tables_.inviteCount; ++i) {
        const InviteRow &row = tables_.invites[i];
        if (!row.voided && row.status == status && row.heldSince() < cutoff) rows.push_back(row);
    }
    return rows;
}

uint32_t SeatStore::markInvitesRemoved(const uint32_t teamId, const std::string &identity, const time_t now) {
    const std::string normalized = Records::normalizeIdentity(identity);
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    uint32_t changed = 0;
    for (uint32_t i = 0; i < tables_.inviteCount; ++i) {
        InviteRow &row = tables_.invites[i];
        if (row.voided || row.teamId != teamId || !sameIdentity(row.identity, normalized)) continue;
        if (row.status == InviteStatus::SUCCESS || row.status == InviteStatus::RESERVED) {
            row.status = InviteStatus::REMOVED;
            row.updatedAt = now;
            ++changed;
        }
    }
    return changed;
}

// ==================== WAITING QUEUE ====================

uint32_t SeatStore::addWaiting(const uint32_t inviteId, const std::string &identity, const std::string &code,
                               const uint32_t groupId, const bool rebind, const bool quotaConsumed,
                               const std::string &note, const time_t now) {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    if (tables_.waitingCount >= Flags::Store::MAX_WAITING) {
        throw std::length_error("waiting table full");
    }
    WaitingRow &row = tables_.waiting[tables_.waitingCount];
    row = WaitingRow{};
    row.id = ++tables_.waitingCount;
    row.inviteId = inviteId;
    row.groupId = groupId;
    row.status = WaitingStatus::WAITING;
    row.rebind = rebind;
    row.quotaConsumed = quotaConsumed;
    row.createdAt = now;
    Records::copyField(row.identity, Records::normalizeIdentity(identity));
    Records::copyField(row.code, code);
    Records::copyField(row.note, note.substr(0, Records::NOTE_LEN - 1));
    return row.id;
}

std::optional<WaitingRow> SeatStore::waitingTask(const uint32_t id) const {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    if (id == 0 || id > tables_.waitingCount) return std::nullopt;
    return tables_.waiting[id - 1];
}

std::vector<WaitingRow> SeatStore::oldestWaiting(const uint32_t groupId, const uint32_t limit) const {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    std::vector<WaitingRow> rows;
    // Rows are appended in creation order, so index order is FIFO.
    for (uint32_t i = 0; i < tables_.waitingCount && rows.size() < limit; ++i) {
        const WaitingRow &row = tables_.waiting[i];
        if (row.status == WaitingStatus::WAITING && row.groupId == groupId) rows.push_back(row);
    }
    return rows;
}

std::vector<uint32_t> SeatStore::waitingGroups() const {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    std::vector<uint32_t> groups;
    for (uint32_t i = 0; i < tables_.waitingCount; ++i) {
        const WaitingRow &row = tables_.waiting[i];
        if (row.status == WaitingStatus::WAITING &&
            std::find(groups.begin(), groups.end(), row.groupId) == groups.end()) {
            groups.push_back(row.groupId);
        }
    }
    std::sort(groups.begin(), groups.end());
    return groups;
}

bool SeatStore::setWaitingStatus(const uint32_t id, const WaitingStatus status, const std::string &note,
                                 const time_t now, const bool incrementRetry) {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    WaitingRow *row = tables_.waitingTask(id);
    if (row == nullptr) return false;
    row->status = status;
    row->processedAt = now;
    if (incrementRetry) ++row->retryCount;
    if (!note.empty()) Records::copyField(row->note, note.substr(0, Records::NOTE_LEN - 1));
    return true;
}

bool SeatStore::setWaitingQuotaConsumed(const uint32_t id, const bool consumed) {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    WaitingRow *row = tables_.waitingTask(id);
    if (row == nullptr) return false;
    row->quotaConsumed = consumed;
    return true;
}

// ==================== COMPENSATION LEDGER ====================

bool SeatStore::recordCompensation(const uint64_t taskId) {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    for (uint32_t i = 0; i < tables_.compensationCount; ++i) {
        if (tables_.compensatedTasks[i] == taskId) return false;
    }
    if (tables_.compensationCount >= Flags::Store::MAX_COMPENSATIONS) {
        throw std::length_error("compensation ledger full");
    }
    tables_.compensatedTasks[tables_.compensationCount++] = taskId;
    return true;
}

bool SeatStore::isCompensated(const uint64_t taskId) const {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    for (uint32_t i = 0; i < tables_.compensationCount; ++i) {
        if (tables_.compensatedTasks[i] == taskId) return true;
    }
    return false;
}

// ==================== STATISTICS ====================

StoreDepth SeatStore::depth() const {
    Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_STORE);
    StoreDepth depth{};
    for (uint32_t i = 0; i < tables_.inviteCount; ++i) {
        if (!tables_.invites[i].voided) ++depth.invites[static_cast<uint8_t>(tables_.invites[i].status)];
    }
    for (uint32_t i = 0; i < tables_.waitingCount; ++i) {
        ++depth.waiting[static_cast<uint8_t>(tables_.waiting[i].status)];
    }
    return depth;
}

// ==================== TRANSACTION ====================

SeatStore::Transaction SeatStore::begin(std::vector<uint32_t> teamIds, const uint32_t timeoutMs) {
    return Transaction(*this, std::move(teamIds), timeoutMs);
}

SeatStore::Transaction::Transaction(SeatStore &store, std::vector<uint32_t> teamIds, const uint32_t timeoutMs)
    : store_{&store}, teamIds_{std::move(teamIds)} {
    // Ascending id order is the global lock order; it rules out deadlock between reservers.
    std::sort(teamIds_.begin(), teamIds_.end());
    teamIds_.erase(std::unique(teamIds_.begin(), teamIds_.end()), teamIds_.end());

    std::vector<uint8_t> wanted;
    {
        Semaphore::ScopedLock lock(store_->sem_, Semaphore::Index::SHM_STORE);
        for (const uint32_t id: teamIds_) {
            const int32_t slot = store_->tables_.teamSlot(id);
            if (slot < 0) {
                throw std::invalid_argument("unknown team " + std::to_string(id));
            }
            wanted.push_back(static_cast<uint8_t>(Semaphore::Index::TEAM_ROW_BASE + slot));
        }
    }

    for (size_t i = 0; i < wanted.size(); ++i) {
        if (!store_->sem_.waitFor(wanted[i], 1, true, timeoutMs)) {
            release();
            throw lock_conflict("row lock timeout on team " + std::to_string(teamIds_[i]));
        }
        semIndexes_.push_back(wanted[i]);
    }
}

SeatStore::Transaction::Transaction(Transaction &&other) noexcept
    : store_{other.store_}, teamIds_{std::move(other.teamIds_)}, semIndexes_{std::move(other.semIndexes_)},
      undo_{std::move(other.undo_)}, open_{other.open_} {
    other.open_ = false;
    other.semIndexes_.clear();
}

SeatStore::Transaction::~Transaction() {
    if (open_) {
        try {
            rollback();
        } catch (const std::exception &e) {
            Logger::error(SRC, tag_, "rollback in destructor failed: %s", e.what());
            release();
        }
    }
}

bool SeatStore::Transaction::holds(const uint32_t teamId) const {
    return open_ && std::binary_search(teamIds_.begin(), teamIds_.end(), teamId);
}

void SeatStore::Transaction::requireHeld(const uint32_t teamId) const {
    if (!holds(teamId)) {
        throw std::logic_error("team " + std::to_string(teamId) + " is not locked by this transaction");
    }
}

uint32_t SeatStore::Transaction::insertReserved(const uint32_t teamId, const std::string &identity,
                                                const std::string &code, const bool rebind, const uint64_t taskId,
                                                const time_t now) {
    requireHeld(teamId);
    Semaphore::ScopedLock lock(store_->sem_, Semaphore::Index::SHM_STORE);
    const uint32_t id = store_->appendInvite(teamId, InviteStatus::RESERVED, identity, code, rebind, taskId, now);
    undo_.push_back({id, true, InviteStatus::RESERVED, teamId, now});
    return id;
}

bool SeatStore::Transaction::claimPending(const uint32_t inviteId, const uint32_t teamId, const time_t now) {
    requireHeld(teamId);
    Semaphore::ScopedLock lock(store_->sem_, Semaphore::Index::SHM_STORE);
    InviteRow *row = store_->tables_.invite(inviteId);
    if (row == nullptr || row->voided || row->status != InviteStatus::PENDING) return false;
    undo_.push_back({inviteId, false, row->status, row->teamId, row->reservedAt});
    row->status = InviteStatus::RESERVED;
    row->teamId = teamId;
    row->reservedAt = now;
    row->updatedAt = now;
    return true;
}

void SeatStore::Transaction::commit() {
    if (!open_) return;
    undo_.clear();
    open_ = false;
    release();
}

void SeatStore::Transaction::rollback() {
    if (!open_) return;
    {
        Semaphore::ScopedLock lock(store_->sem_, Semaphore::Index::SHM_STORE);
        for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
            InviteRow *row = store_->tables_.invite(it->inviteId);
            if (row == nullptr) continue;
            if (it->inserted) {
                row->voided = true;
            } else {
                row->status = it->status;
                row->teamId = it->teamId;
                row->reservedAt = it->reservedAt;
            }
        }
    }
    undo_.clear();
    open_ = false;
    release();
}

void SeatStore::Transaction::release() noexcept {
    for (auto it = semIndexes_.rbegin(); it != semIndexes_.rend(); ++it) {
        try {
            store_->sem_.post(*it, 1, true);
        } catch (const ipc_exception &e) {
            Logger::error(SRC, tag_, "row unlock failed: %s", e.what());
        }
    }
    semIndexes_.clear();
}
