#pragma once

#include <sys/ipc.h>
#include <sys/shm.h>
#include <cerrno>
#include <cstdio>
#include <new>
#include <type_traits>

#include "core/Errors.h"
#include "logging/Logger.h"

/**
 * @brief One System V segment holding a single table of type T.
 * @tparam T Fixed-size table, placement-constructed by the creator
 *
 * The supervisor creates segments and removes them through destroy();
 * every other process attaches and only detaches on destruction.
 */
template<typename T>
class SharedMemory {
    static_assert(std::is_trivially_destructible_v<T>, "shared tables are detached, never destructed");

public:
    /**
     * @brief Create the segment, replacing one left behind by a crashed run.
     * @throws ipc_exception If the segment cannot be created or mapped
     */
    static SharedMemory create(const key_t key) {
        int id = shmget(key, sizeof(T), IPC_CREAT | IPC_EXCL | PERMISSIONS);
        if (id == -1 && errno == EEXIST) {
            Logger::warn(Logger::Source::Other, tag_, "removing stale segment 0x%x", static_cast<unsigned>(key));
            shmctl(shmget(key, 0, 0), IPC_RMID, nullptr);
            id = shmget(key, sizeof(T), IPC_CREAT | IPC_EXCL | PERMISSIONS);
        }
        if (id == -1) {
            perror("shmget create");
            throw ipc_exception("cannot create shared segment");
        }
        SharedMemory segment(id);
        new(segment.table_) T();
        return segment;
    }

    /**
     * @brief Map a segment the supervisor created.
     * @throws ipc_exception If it is missing or smaller than T (built from another layout)
     */
    static SharedMemory attach(const key_t key) {
        const int id = shmget(key, 0, 0);
        if (id == -1) {
            perror("shmget attach");
            throw ipc_exception("shared segment not found, is the supervisor running?");
        }
        shmid_ds info{};
        if (shmctl(id, IPC_STAT, &info) == -1 || info.shm_segsz < sizeof(T)) {
            throw ipc_exception("shared segment layout does not match this build");
        }
        return SharedMemory(id);
    }

    SharedMemory(SharedMemory &&other) noexcept : id_{other.id_}, table_{other.table_} {
        other.table_ = nullptr;
    }

    SharedMemory(const SharedMemory &) = delete;

    SharedMemory &operator=(const SharedMemory &) = delete;

    SharedMemory &operator=(SharedMemory &&) = delete;

    ~SharedMemory() {
        if (table_ != nullptr) shmdt(table_);
    }

    T *get() noexcept { return table_; }
    const T *get() const noexcept { return table_; }

    T *operator->() noexcept { return table_; }
    const T *operator->() const noexcept { return table_; }

    /** @brief False once the segment was removed, even while still mapped here. */
    [[nodiscard]] bool isLive() const noexcept {
        shmid_ds info{};
        return shmctl(id_, IPC_STAT, &info) != -1 && (info.shm_perm.mode & SHM_DEST) == 0;
    }

    /**
     * @brief Mark the segment for removal; it disappears after the last detach.
     * @throws ipc_exception If the kernel refuses
     */
    void destroy() const {
        if (shmctl(id_, IPC_RMID, nullptr) == -1) {
            perror("shmctl IPC_RMID");
            throw ipc_exception("cannot remove shared segment");
        }
        Logger::debug(Logger::Source::Other, tag_, "segment %d removed", id_);
    }

private:
    static constexpr auto tag_ = "SharedMemory";
    static constexpr int PERMISSIONS = 0600;

    explicit SharedMemory(const int id) : id_{id} {
        void *mapped = shmat(id_, nullptr, 0);
        if (mapped == reinterpret_cast<void *>(-1)) {
            perror("shmat");
            throw ipc_exception("cannot map shared segment");
        }
        table_ = static_cast<T *>(mapped);
    }

    int id_;
    T *table_{nullptr};
};
