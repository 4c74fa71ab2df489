#pragma once

#include "coord/TableCoordinator.h"
#include "ipc/core/SharedMemory.h"
#include "ipc/core/Semaphore.h"

/**
 * @brief Multi-process coordinator backed by a shared-memory table.
 *
 * Every process attaches to the segment created by IpcManager. Table access
 * is serialized with the SHM_COORDINATOR semaphore. A removed segment or a
 * failing semaphore surfaces as coordination_unavailable.
 */
class IpcCoordinator : public TableCoordinator {
public:
    /**
     * @brief Attach to the coordination segment.
     * @param coordKey Shared memory key of the coordination table
     * @param sem Semaphore set holding SHM_COORDINATOR
     * @throws coordination_unavailable If the segment cannot be attached
     */
    IpcCoordinator(key_t coordKey, const Semaphore &sem);

protected:
    void withTable(const TableFn &fn) override;

private:
    static SharedMemory<SharedCoordinatorState> attachTable(key_t coordKey);

    static constexpr auto tag_{"IpcCoordinator"};
    SharedMemory<SharedCoordinatorState> shm_;
    const Semaphore &sem_;
};
