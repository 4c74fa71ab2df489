#pragma once

#include <functional>

#include "coord/Coordinator.h"
#include "ipc/model/SharedCoordinatorState.h"

/**
 * @brief Coordinator operations over a SharedCoordinatorState table.
 *
 * Subclasses decide where the table lives and how it is locked.
 */
class TableCoordinator : public Coordinator {
public:
    bool semaphoreAcquire(const std::string &name, int64_t limit, uint32_t ttlMs) override;

    void semaphoreRelease(const std::string &name) override;

    [[nodiscard]] int64_t semaphoreCount(const std::string &name) override;

    [[nodiscard]] std::optional<int64_t> counterGet(const std::string &key) override;

    bool counterInit(const std::string &key, int64_t value, uint32_t ttlMs) override;

    void counterSet(const std::string &key, int64_t value, uint32_t ttlMs) override;

    std::optional<int64_t> counterAdd(const std::string &key, int64_t delta) override;

    int64_t counterIncrementWindow(const std::string &key, uint32_t ttlMs) override;

    std::optional<int64_t> counterTakeIfPositive(const std::string &key) override;

    bool counterRemove(const std::string &key) override;

    bool mutexTryLock(const std::string &name, const std::string &owner, uint32_t ttlMs) override;

    bool mutexUnlock(const std::string &name, const std::string &owner) override;

protected:
    using TableFn = std::function<void(SharedCoordinatorState &table, int64_t nowMs)>;

    /**
     * @brief Run fn with exclusive access to the table.
     * @throws coordination_unavailable If the table cannot be reached
     */
    virtual void withTable(const TableFn &fn) = 0;
};
