#include "coord/TableCoordinator.h"

#include "core/Errors.h"

namespace {
    [[noreturn]] void tableFull(const std::string &key) {
        throw coordination_unavailable("coordination table full, cannot store " + key);
    }
}

bool TableCoordinator::semaphoreAcquire(const std::string &name, const int64_t limit, const uint32_t ttlMs) {
    std::optional<bool> acquired;
    withTable([&](SharedCoordinatorState &table, const int64_t nowMs) {
        acquired = table.semaphoreAcquire(name, limit, ttlMs, nowMs);
    });
    if (!acquired) tableFull(name);
    return *acquired;
}

void TableCoordinator::semaphoreRelease(const std::string &name) {
    withTable([&](SharedCoordinatorState &table, const int64_t nowMs) {
        table.semaphoreRelease(name, nowMs);
    });
}

int64_t TableCoordinator::semaphoreCount(const std::string &name) {
    int64_t count = 0;
    withTable([&](SharedCoordinatorState &table, const int64_t nowMs) {
        count = table.counterGet(name, nowMs).value_or(0);
    });
    return count;
}

std::optional<int64_t> TableCoordinator::counterGet(const std::string &key) {
    std::optional<int64_t> value;
    withTable([&](SharedCoordinatorState &table, const int64_t nowMs) {
        value = table.counterGet(key, nowMs);
    });
    return value;
}

bool TableCoordinator::counterInit(const std::string &key, const int64_t value, const uint32_t ttlMs) {
    bool created = false;
    bool full = false;
    withTable([&](SharedCoordinatorState &table, const int64_t nowMs) {
        if (table.find(key, nowMs) != nullptr) return;
        full = table.counterSet(key, value, ttlMs, nowMs) == nullptr;
        created = !full;
    });
    if (full) tableFull(key);
    return created;
}

void TableCoordinator::counterSet(const std::string &key, const int64_t value, const uint32_t ttlMs) {
    bool full = false;
    withTable([&](SharedCoordinatorState &table, const int64_t nowMs) {
        full = table.counterSet(key, value, ttlMs, nowMs) == nullptr;
    });
    if (full) tableFull(key);
}

std::optional<int64_t> TableCoordinator::counterAdd(const std::string &key, const int64_t delta) {
    std::optional<int64_t> value;
    withTable([&](SharedCoordinatorState &table, const int64_t nowMs) {
        value = table.counterAdd(key, delta, nowMs);
    });
    return value;
}

int64_t TableCoordinator::counterIncrementWindow(const std::string &key, const uint32_t ttlMs) {
    std::optional<int64_t> value;
    withTable([&](SharedCoordinatorState &table, const int64_t nowMs) {
        value = table.counterAdd(key, 1, nowMs);
        if (!value) {
            CoordEntry *entry = table.counterSet(key, 1, ttlMs, nowMs);
            if (entry != nullptr) value = entry->value;
        }
    });
    if (!value) tableFull(key);
    return *value;
}

std::optional<int64_t> TableCoordinator::counterTakeIfPositive(const std::string &key) {
    std::optional<int64_t> value;
    withTable([&](SharedCoordinatorState &table, const int64_t nowMs) {
        value = table.counterTakeIfPositive(key, nowMs);
    });
    return value;
}

bool TableCoordinator::counterRemove(const std::string &key) {
    bool removed = false;
    withTable([&](SharedCoordinatorState &table, const int64_t nowMs) {
        removed = table.remove(key, nowMs);
    });
    return removed;
}

bool TableCoordinator::mutexTryLock(const std::string &name, const std::string &owner, const uint32_t ttlMs) {
    std::optional<bool> locked;
    withTable([&](SharedCoordinatorState &table, const int64_t nowMs) {
        locked = table.mutexTryLock(name, owner, ttlMs, nowMs);
    });
    if (!locked) tableFull(name);
    return *locked;
}

bool TableCoordinator::mutexUnlock(const std::string &name, const std::string &owner) {
    bool unlocked = false;
    withTable([&](SharedCoordinatorState &table, const int64_t nowMs) {
        unlocked = table.mutexUnlock(name, owner, nowMs);
    });
    return unlocked;
}
