#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * @brief Exception type for IPC-related errors.
 *
 * Thrown when System V IPC operations fail (shmget, semget, msgget, etc.).
 */
class ipc_exception : public std::runtime_error {
public:
    explicit ipc_exception(const char *message) : std::runtime_error(message) {
    }

    explicit ipc_exception(const std::string &message) : std::runtime_error(message) {
    }
};

/**
 * @brief Row-lock wait timed out (reservation contention).
 *
 * Callers retry a bounded number of times before deferring the work.
 */
class lock_conflict : public std::runtime_error {
public:
    explicit lock_conflict(const std::string &message) : std::runtime_error(message) {
    }
};

/**
 * @brief Coordination backend (locks, counters, semaphores) is unusable.
 *
 * Each caller decides whether to fail open or closed.
 */
class coordination_unavailable : public std::runtime_error {
public:
    explicit coordination_unavailable(const std::string &message) : std::runtime_error(message) {
    }
};

/**
 * @brief Error returned by the external membership service.
 *
 * Status follows HTTP semantics; 0 means the call never got a response.
 */
class membership_error : public std::runtime_error {
public:
    membership_error(const int32_t status, const std::string &message)
        : std::runtime_error(message), status_{status} {
    }

    [[nodiscard]] int32_t status() const noexcept { return status_; }

    /** @brief Network errors, rate limits and server errors are worth retrying. */
    [[nodiscard]] bool isTransient() const noexcept {
        return status_ == 0 || status_ == 429 || status_ >= 500;
    }

private:
    int32_t status_;
};

/**
 * @brief The bounded task transport has no free slot.
 */
class queue_full : public std::runtime_error {
public:
    explicit queue_full(const std::string &message) : std::runtime_error(message) {
    }
};

/**
 * @brief Redemption code is unknown, inactive, expired or exhausted.
 */
class invalid_code : public std::runtime_error {
public:
    explicit invalid_code(const std::string &message) : std::runtime_error(message) {
    }
};

/**
 * @brief No redemption permit became free within the acquire timeout.
 */
class throttled : public std::runtime_error {
public:
    explicit throttled(const std::string &message) : std::runtime_error(message) {
    }
};
