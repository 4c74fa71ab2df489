#include "ipc/core/Semaphore.h"

#include <cerrno>
#include <cstdio>
#include <string>

#include "logging/Logger.h"

namespace {
    constexpr long NS_PER_SEC = 1'000'000'000L;

    timespec monotonicPlus(const uint32_t ms) {
        timespec t{};
        clock_gettime(CLOCK_MONOTONIC, &t);
        t.tv_sec += ms / 1000;
        t.tv_nsec += static_cast<long>(ms % 1000) * 1'000'000L;
        if (t.tv_nsec >= NS_PER_SEC) {
            ++t.tv_sec;
            t.tv_nsec -= NS_PER_SEC;
        }
        return t;
    }

    /** @return false once the deadline has passed */
    bool timeLeft(const timespec &deadline, timespec &left) {
        timespec now{};
        clock_gettime(CLOCK_MONOTONIC, &now);
        left.tv_sec = deadline.tv_sec - now.tv_sec;
        left.tv_nsec = deadline.tv_nsec - now.tv_nsec;
        if (left.tv_nsec < 0) {
            --left.tv_sec;
            left.tv_nsec += NS_PER_SEC;
        }
        return left.tv_sec >= 0;
    }
}

const char *Semaphore::Index::toString(const uint8_t index) {
    switch (index) {
        case LOGGER_READY: return "LOGGER_READY";
        case WORKERS_READY: return "WORKERS_READY";
        case TASK_QUEUE_SLOTS: return "TASK_QUEUE_SLOTS";
        case SHM_STORE: return "SHM_STORE";
        case SHM_OPERATIONAL: return "SHM_OPERATIONAL";
        case SHM_COORDINATOR: return "SHM_COORDINATOR";
        case LOG_SEQUENCE: return "LOG_SEQUENCE";
        case LOG_QUEUE_SLOTS: return "LOG_QUEUE_SLOTS";
        default:
            return index >= TEAM_ROW_BASE && index < TOTAL_SEMAPHORES ? "TEAM_ROW" : "UNKNOWN_SEMAPHORE";
    }
}

Semaphore::Semaphore(const key_t key) : id_{semget(key, Index::TOTAL_SEMAPHORES, IPC_CREAT | PERMISSIONS)} {
    if (id_ == -1) {
        perror("semget");
        throw ipc_exception("cannot open semaphore set");
    }
}

int Semaphore::apply(const uint8_t index, const int32_t delta, const short flags, const timespec *timeout) const {
    sembuf op{};
    op.sem_num = index;
    op.sem_op = static_cast<short>(delta);
    op.sem_flg = flags;
    const int rc = timeout != nullptr ? semtimedop(id_, &op, 1, timeout) : semop(id_, &op, 1);
    return rc == 0 ? 0 : errno;
}

void Semaphore::initialize(const uint8_t index, const int32_t value) const {
    semun arg{};
    arg.val = value;
    if (semctl(id_, index, SETVAL, arg) == -1) {
        perror("semctl SETVAL");
        throw ipc_exception(std::string("cannot initialize ") + Index::toString(index));
    }
    Logger::debug(Logger::Source::Other, tag_, "%s[%u] = %d", Index::toString(index), index, value);
}

bool Semaphore::wait(const uint8_t index, const int32_t n, const bool undo) const {
    if (n <= 0) return true;
    const int err = apply(index, -n, undo ? SEM_UNDO : 0, nullptr);
    if (err == 0) return true;
    if (err == EINTR) return false;
    errno = err;
    perror("semop wait");
    throw ipc_exception(std::string("wait failed on ") + Index::toString(index));
}

bool Semaphore::waitFor(const uint8_t index, const int32_t n, const bool undo, const uint32_t timeoutMs) const {
    if (n <= 0) return true;
    const timespec deadline = monotonicPlus(timeoutMs);
    timespec left{};
    while (timeLeft(deadline, left)) {
        const int err = apply(index, -n, undo ? SEM_UNDO : 0, &left);
        if (err == 0) return true;
        if (err == EAGAIN) return false;
        if (err != EINTR) {
            errno = err;
            perror("semtimedop");
            throw ipc_exception(std::string("timed wait failed on ") + Index::toString(index));
        }
    }
    return false;
}

bool Semaphore::tryAcquire(const uint8_t index, const int32_t n, const bool undo) const {
    if (n <= 0) return true;
    const int err = apply(index, -n, static_cast<short>(IPC_NOWAIT | (undo ? SEM_UNDO : 0)), nullptr);
    if (err == 0) return true;
    if (err == EAGAIN || err == EINTR) return false;
    errno = err;
    perror("semop tryAcquire");
    throw ipc_exception(std::string("tryAcquire failed on ") + Index::toString(index));
}

void Semaphore::post(const uint8_t index, const int32_t n, const bool undo) const {
    if (n <= 0) return;
    int err;
    while ((err = apply(index, n, undo ? SEM_UNDO : 0, nullptr)) == EINTR) {
    }
    if (err != 0) {
        errno = err;
        perror("semop post");
        throw ipc_exception(std::string("post failed on ") + Index::toString(index));
    }
}

int32_t Semaphore::value(const uint8_t index) const {
    const int32_t v = semctl(id_, index, GETVAL);
    if (v == -1) {
        perror("semctl GETVAL");
        throw ipc_exception(std::string("cannot read ") + Index::toString(index));
    }
    return v;
}

void Semaphore::destroy() const {
    if (semctl(id_, 0, IPC_RMID) == -1) {
        perror("semctl IPC_RMID");
        throw ipc_exception("cannot remove semaphore set");
    }
    Logger::debug(Logger::Source::Other, tag_, "set %d removed", id_);
}

Semaphore::ScopedLock::ScopedLock(const Semaphore &sem, const uint8_t index) : sem_{sem}, index_{index} {
    // A lock holder must never give up on a signal: retry until acquired.
    while (!sem_.wait(index_, 1, true)) {
    }
}

Semaphore::ScopedLock::~ScopedLock() {
    sem_.post(index_, 1, true);
}
