#pragma once

#include <cstdint>
#include <optional>
#include <string>

/**
 * @brief Coordination service seen by the throttle and the reconciler.
 *
 * Three primitive families: counting semaphore with safety expiry, atomic
 * counters, and TTL mutex. Every method may throw coordination_unavailable;
 * each caller applies its own fail-open or fail-closed policy.
 *
 * Implementations: LocalCoordinator (single process), IpcCoordinator (all
 * processes attached to the same shared-memory table).
 */
class Coordinator {
public:
    virtual ~Coordinator() = default;

    // ==================== SEMAPHORE ====================

    /**
     * @brief Take a permit if fewer than limit are held.
     * @param name Semaphore name
     * @param limit Maximum concurrent holders
     * @param ttlMs Safety expiry, refreshed on every acquire
     * @return true if a permit was taken
     */
    virtual bool semaphoreAcquire(const std::string &name, int64_t limit, uint32_t ttlMs) = 0;

    virtual void semaphoreRelease(const std::string &name) = 0;

    [[nodiscard]] virtual int64_t semaphoreCount(const std::string &name) = 0;

    // ==================== COUNTERS ====================

    [[nodiscard]] virtual std::optional<int64_t> counterGet(const std::string &key) = 0;

    /** @brief Set only if the key is absent. @return true if this call created it */
    virtual bool counterInit(const std::string &key, int64_t value, uint32_t ttlMs) = 0;

    virtual void counterSet(const std::string &key, int64_t value, uint32_t ttlMs) = 0;

    /** @brief Add to an existing counter. @return new value, nullopt if absent */
    virtual std::optional<int64_t> counterAdd(const std::string &key, int64_t delta) = 0;

    /** @brief Increment, creating the key at 0 with the given expiry if absent (window counters). */
    virtual int64_t counterIncrementWindow(const std::string &key, uint32_t ttlMs) = 0;

    /**
     * @brief Atomic decrement-if-positive.
     * @return remaining value after the take, -1 if already at zero, nullopt if absent
     */
    virtual std::optional<int64_t> counterTakeIfPositive(const std::string &key) = 0;

    virtual bool counterRemove(const std::string &key) = 0;

    // ==================== TTL MUTEX ====================

    virtual bool mutexTryLock(const std::string &name, const std::string &owner, uint32_t ttlMs) = 0;

    /** @return false if the lock is not held by owner (expired or taken over) */
    virtual bool mutexUnlock(const std::string &name, const std::string &owner) = 0;
};
