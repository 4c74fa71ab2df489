#pragma once

#include <sys/ipc.h>
#include <cstdlib>

#include "core/Config.h"
#include "core/Errors.h"
#include "dispatch/Task.h"
#include "ipc/core/MessageQueue.h"
#include "ipc/core/Semaphore.h"
#include "ipc/core/SharedMemory.h"
#include "ipc/model/SharedCoordinatorState.h"
#include "ipc/model/SharedSeatState.h"
#include "logging/LogMessage.h"
#include "logging/Logger.h"

/**
 * @brief System V keys of one seatpool instance.
 *
 * Derived with ftok from a directory, so every process started against the
 * same directory finds the same resources.
 */
struct IpcKeys {
    key_t shm;
    key_t coord;
    key_t sem;
    key_t taskQueue;
    key_t logQueue;

    /** @throws ipc_exception If ftok fails */
    static IpcKeys fromPath(const char *path) {
        const IpcKeys keys{ftok(path, 'S'), ftok(path, 'C'), ftok(path, 'M'), ftok(path, 'Q'), ftok(path, 'L')};
        if (keys.shm == -1 || keys.coord == -1 || keys.sem == -1 || keys.taskQueue == -1 || keys.logQueue == -1) {
            perror("ftok");
            throw ipc_exception("ftok failed");
        }
        return keys;
    }

    static IpcKeys standard() { return fromPath(SEATPOOL_PROJECT_DIR); }
};

class IpcManager;

/**
 * @brief Cleanup handler namespace for IpcManager.
 *
 * Registers an atexit handler to ensure IPC resources are cleaned up
 * even on abnormal termination.
 */
namespace IpcCleanup {
    inline IpcManager *g_instance = nullptr;

    void atexitHandler();
}

/**
 * @brief Central manager for all IPC resources.
 *
 * Creates the seat state segment (store and operational state), the
 * coordination segment, the semaphore set and both message queues.
 * Provides RAII cleanup of all resources.
 *
 * Only the supervisor (and tests) create an IpcManager. Other processes
 * attach to resources using individual wrappers.
 */
class IpcManager {
public:
    /**
     * @brief Create all IPC resources.
     * @throws ipc_exception If any IPC creation fails
     */
    explicit IpcManager(const IpcKeys &keys)
        : keys_{keys},
          shm_{SharedMemory<SharedSeatState>::create(keys.shm)},
          coordShm_{SharedMemory<SharedCoordinatorState>::create(keys.coord)},
          sem_{keys.sem},
          taskQueue_{keys.taskQueue, "TaskQueue"},
          logQueue_{keys.logQueue, "LogMessageQueue"} {
        IpcCleanup::g_instance = this;
        std::atexit(IpcCleanup::atexitHandler);

        Logger::debug(Logger::Source::Other, tag_, "created");
    }

    ~IpcManager() {
        cleanup();
        if (IpcCleanup::g_instance == this) IpcCleanup::g_instance = nullptr;
    }

    IpcManager(const IpcManager &) = delete;

    IpcManager &operator=(const IpcManager &) = delete;

    IpcManager(IpcManager &&) = delete;

    IpcManager &operator=(IpcManager &&) = delete;

    SharedSeatState *state() { return shm_.get(); }

    SharedSeatState *operator->() { return shm_.get(); }

    SharedCoordinatorState *coordState() { return coordShm_.get(); }

    Semaphore &sem() { return sem_; }

    MessageQueue<Task> &taskQueue() { return taskQueue_; }

    MessageQueue<LogMessage> &logQueue() { return logQueue_; }

    [[nodiscard]] const IpcKeys &keys() const { return keys_; }

    /**
     * @brief Initialize all semaphores to their starting values.
     *
     * Must be called after construction and before spawning any process.
     */
    void initSemaphores() const {
        // Startup synchronization
        sem_.initialize(Semaphore::Index::LOGGER_READY, 0);
        sem_.initialize(Semaphore::Index::WORKERS_READY, 0);

        // Flow control
        sem_.initialize(Semaphore::Index::TASK_QUEUE_SLOTS, Constants::Queue::TASK_QUEUE_CAPACITY);

        // Shared memory locks
        sem_.initialize(Semaphore::Index::SHM_STORE, 1);
        sem_.initialize(Semaphore::Index::SHM_OPERATIONAL, 1);
        sem_.initialize(Semaphore::Index::SHM_COORDINATOR, 1);

        // Logging
        sem_.initialize(Semaphore::Index::LOG_SEQUENCE, 1);
        sem_.initialize(Semaphore::Index::LOG_QUEUE_SLOTS, Constants::Queue::LOG_QUEUE_CAPACITY);

        // Row locks, one per team slot
        for (uint32_t slot = 0; slot < Flags::Store::MAX_TEAMS; ++slot) {
            sem_.initialize(static_cast<uint8_t>(Semaphore::Index::TEAM_ROW_BASE + slot), 1);
        }
    }

    void initState(const pid_t supervisorPid, const time_t startedAt) {
        state()->operational.running = true;
        state()->operational.supervisorPid = supervisorPid;
        state()->operational.startedAt = startedAt;
    }

    /**
     * @brief Clean up all IPC resources.
     *
     * Safe to call multiple times. Called automatically by destructor.
     */
    void cleanup() noexcept {
        if (cleanedUp_) return;
        cleanedUp_ = true;

        destroyQuietly("seat state", [this] { shm_.destroy(); });
        destroyQuietly("coordination state", [this] { coordShm_.destroy(); });
        destroyQuietly("semaphores", [this] { sem_.destroy(); });
        destroyQuietly("task queue", [this] { taskQueue_.destroy(); });
        destroyQuietly("log queue", [this] { logQueue_.destroy(); });
        Logger::debug(Logger::Source::Other, tag_, "cleanup done");
    }

private:
    static constexpr auto tag_{"IpcManager"};

    template<typename Fn>
    static void destroyQuietly(const char *what, Fn &&destroy) noexcept {
        try {
            destroy();
        } catch (const ipc_exception &e) {
            Logger::warn(Logger::Source::Other, tag_, "%s: %s", what, e.what());
        }
    }

    IpcKeys keys_;
    SharedMemory<SharedSeatState> shm_;
    SharedMemory<SharedCoordinatorState> coordShm_;
    Semaphore sem_;
    MessageQueue<Task> taskQueue_;
    MessageQueue<LogMessage> logQueue_;
    bool cleanedUp_{false};
};

namespace IpcCleanup {
    inline void atexitHandler() {
        if (g_instance) {
            g_instance->cleanup();
        }
    }
}
