#include "coord/IpcCoordinator.h"

#include "core/Errors.h"
#include "logging/Logger.h"
#include "utils/TimeHelper.h"

IpcCoordinator::IpcCoordinator(const key_t coordKey, const Semaphore &sem)
    : shm_{attachTable(coordKey)}, sem_{sem} {
}

SharedMemory<SharedCoordinatorState> IpcCoordinator::attachTable(const key_t coordKey) {
    try {
        return SharedMemory<SharedCoordinatorState>::attach(coordKey);
    } catch (const ipc_exception &e) {
        throw coordination_unavailable(std::string("coordination segment missing: ") + e.what());
    }
}

void IpcCoordinator::withTable(const TableFn &fn) {
    if (!shm_.isLive()) {
        throw coordination_unavailable("coordination segment removed");
    }
    try {
        Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_COORDINATOR);
        fn(*shm_.get(), TimeHelper::nowMs());
    } catch (const ipc_exception &e) {
        Logger::warn(Logger::Source::Other, tag_, "coordination lock failed: %s", e.what());
        throw coordination_unavailable(e.what());
    }
}
