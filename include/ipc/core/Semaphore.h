#pragma once

#include <cstdint>
#include <ctime>
#include <sys/types.h>
#include <sys/ipc.h>
#include <sys/sem.h>

#include "core/Errors.h"
#include "core/Flags.h"

#ifdef _SEM_SEMUN_UNDEFINED
/**
 * @brief Union for semaphore control operations.
 *
 * Required on some systems where semun is not defined.
 */
union semun {
    int val;
    struct semid_ds *buf;
    unsigned short *array;
    struct seminfo *__buf;
};
#endif

/**
 * @brief One System V semaphore set shared by every seatpool process.
 *
 * Counting semaphores carry flow control (queue slots, readiness); binary
 * ones guard the shared tables and the per-team row locks. Locks are taken
 * with SEM_UNDO so the kernel releases them when a holder dies, which is
 * what lets the supervisor SIGKILL a stuck worker safely.
 */
class Semaphore {
public:
    /**
     * Lock order: TEAM_ROW_BASE + slot (ascending team id) -> SHM_STORE -> SHM_OPERATIONAL.
     * SHM_COORDINATOR is a leaf lock and is never held together with the others.
     */
    struct Index {
        enum : uint8_t {
            LOGGER_READY = 0, // logger posts once its queue is drained by a live reader
            WORKERS_READY, // each dispatch worker posts once attached

            TASK_QUEUE_SLOTS, // free slots in the bounded task queue

            SHM_STORE, // durable store tables
            SHM_OPERATIONAL, // worker slots, delayed tasks, counters, id sequences
            SHM_COORDINATOR, // coordination table

            LOG_SEQUENCE, // log sequence number
            LOG_QUEUE_SLOTS, // free slots in the log queue

            TEAM_ROW_BASE, // one binary semaphore per team slot follows

            TOTAL_SEMAPHORES = TEAM_ROW_BASE + Flags::Store::MAX_TEAMS
        };

        static const char *toString(uint8_t index);
    };

    static_assert(Flags::Store::MAX_TEAMS + Index::TEAM_ROW_BASE <= 255, "row locks must fit in a uint8_t index");

    /** @throws ipc_exception If the set can be neither created nor joined */
    explicit Semaphore(key_t key);

    Semaphore(const Semaphore &) = delete;

    Semaphore &operator=(const Semaphore &) = delete;

    void initialize(uint8_t index, int32_t value) const;

    /**
     * @brief Decrement by n, blocking.
     * @return false if a signal interrupted the wait
     */
    bool wait(uint8_t index, int32_t n, bool undo) const;

    /**
     * @brief Decrement by n, blocking at most timeoutMs across signal restarts.
     * @return false on timeout
     */
    bool waitFor(uint8_t index, int32_t n, bool undo, uint32_t timeoutMs) const;

    /** @return false if the decrement would block */
    bool tryAcquire(uint8_t index, int32_t n, bool undo) const;

    void post(uint8_t index, int32_t n, bool undo) const;

    [[nodiscard]] int32_t value(uint8_t index) const;

    /** @throws ipc_exception If the kernel refuses the removal */
    void destroy() const;

    /**
     * @brief Holds one binary semaphore for the enclosing scope.
     */
    class ScopedLock {
    public:
        ScopedLock(const Semaphore &sem, uint8_t index);

        ~ScopedLock();

        ScopedLock(const ScopedLock &) = delete;

        ScopedLock &operator=(const ScopedLock &) = delete;

    private:
        const Semaphore &sem_;
        uint8_t index_;
    };

private:
    static constexpr auto tag_{"Semaphore"};
    static constexpr int PERMISSIONS = 0600;

    /** @return 0 on success, otherwise the errno semop/semtimedop left */
    int apply(uint8_t index, int32_t delta, short flags, const timespec *timeout) const;

    int id_;
};
