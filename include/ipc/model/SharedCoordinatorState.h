#pragma once

#include <cstdint>
#include <cstring>
#include <optional>
#include <string>

#include "core/Flags.h"
#include "seats/Records.h"

// ============================================================================
// COORDINATION TABLE (protected by SHM_COORDINATOR, or a std::mutex in-process)
// ============================================================================

enum class CoordEntryKind : uint8_t {
    FREE,
    COUNTER,
    SEMAPHORE,
    MUTEX
};

struct CoordEntry {
    CoordEntryKind kind;
    int64_t value;
    int64_t expiresAtMs; // 0 = no expiry
    char key[64];
    char owner[32];
};

/**
 * Key-value table with per-entry expiry backing every Coordinator implementation.
 *
 * All methods expect the caller to hold the table lock. Expired entries are
 * reclaimed lazily on lookup. Methods returning a pointer return nullptr when
 * the table is full; callers translate that to coordination_unavailable.
 */
struct SharedCoordinatorState {
    CoordEntry entries[Flags::Coordinator::MAX_ENTRIES];

    CoordEntry *find(const std::string &key, const int64_t nowMs) {
        for (auto &entry: entries) {
            if (entry.kind == CoordEntryKind::FREE) continue;
            if (entry.expiresAtMs != 0 && entry.expiresAtMs <= nowMs) {
                entry.kind = CoordEntryKind::FREE;
                continue;
            }
            if (key.compare(entry.key) == 0) return &entry;
        }
        return nullptr;
    }

    CoordEntry *insert(const std::string &key, const CoordEntryKind kind, const int64_t nowMs,
                       const uint32_t ttlMs) {
        for (auto &entry: entries) {
            if (entry.kind != CoordEntryKind::FREE &&
                !(entry.expiresAtMs != 0 && entry.expiresAtMs <= nowMs)) {
                continue;
            }
            entry = CoordEntry{};
            entry.kind = kind;
            entry.expiresAtMs = ttlMs == 0 ? 0 : nowMs + ttlMs;
            Records::copyField(entry.key, key);
            return &entry;
        }
        return nullptr;
    }

    // ==================== COUNTING SEMAPHORE ====================

    /** @return nullopt if the table is full, otherwise whether a permit was taken */
    std::optional<bool> semaphoreAcquire(const std::string &name, const int64_t limit, const uint32_t ttlMs,
                                         const int64_t nowMs) {
        CoordEntry *entry = find(name, nowMs);
        if (entry == nullptr) {
            entry = insert(name, CoordEntryKind::SEMAPHORE, nowMs, ttlMs);
            if (entry == nullptr) return std::nullopt;
        }
        if (entry->value >= limit) return false;
        ++entry->value;
        entry->expiresAtMs = nowMs + ttlMs; // safety expiry refreshed by every holder
        return true;
    }

    void semaphoreRelease(const std::string &name, const int64_t nowMs) {
        CoordEntry *entry = find(name, nowMs);
        if (entry == nullptr) return;
        if (entry->value > 0) --entry->value;
        if (entry->value == 0) entry->kind = CoordEntryKind::FREE;
    }

    // ==================== COUNTERS ====================

    std::optional<int64_t> counterGet(const std::string &key, const int64_t nowMs) {
        const CoordEntry *entry = find(key, nowMs);
        if (entry == nullptr) return std::nullopt;
        return entry->value;
    }

    /** @brief Sets the counter with expiry; returns nullptr only when the table is full. */
    CoordEntry *counterSet(const std::string &key, const int64_t value, const uint32_t ttlMs, const int64_t nowMs) {
        CoordEntry *entry = find(key, nowMs);
        if (entry == nullptr) {
            entry = insert(key, CoordEntryKind::COUNTER, nowMs, ttlMs);
            if (entry == nullptr) return nullptr;
        }
        entry->value = value;
        entry->expiresAtMs = ttlMs == 0 ? 0 : nowMs + ttlMs;
        return entry;
    }

    std::optional<int64_t> counterAdd(const std::string &key, const int64_t delta, const int64_t nowMs) {
        CoordEntry *entry = find(key, nowMs);
        if (entry == nullptr) return std::nullopt;
        entry->value += delta;
        return entry->value;
    }

    /** @return remaining value after the take, -1 if the counter was at zero, nullopt if missing */
    std::optional<int64_t> counterTakeIfPositive(const std::string &key, const int64_t nowMs) {
        CoordEntry *entry = find(key, nowMs);
        if (entry == nullptr) return std::nullopt;
        if (entry->value <= 0) return -1;
        --entry->value;
        return entry->value;
    }

    bool remove(const std::string &key, const int64_t nowMs) {
        CoordEntry *entry = find(key, nowMs);
        if (entry == nullptr) return false;
        entry->kind = CoordEntryKind::FREE;
        return true;
    }

    // ==================== TTL MUTEX ====================

    /** @return nullopt if the table is full, otherwise whether the lock was taken */
    std::optional<bool> mutexTryLock(const std::string &name, const std::string &owner, const uint32_t ttlMs,
                                     const int64_t nowMs) {
        if (find(name, nowMs) != nullptr) return false;
        CoordEntry *entry = insert(name, CoordEntryKind::MUTEX, nowMs, ttlMs);
        if (entry == nullptr) return std::nullopt;
        Records::copyField(entry->owner, owner);
        return true;
    }

    bool mutexUnlock(const std::string &name, const std::string &owner, const int64_t nowMs) {
        CoordEntry *entry = find(name, nowMs);
        if (entry == nullptr || entry->kind != CoordEntryKind::MUTEX || owner.compare(entry->owner) != 0) {
            return false;
        }
        entry->kind = CoordEntryKind::FREE;
        return true;
    }
};
