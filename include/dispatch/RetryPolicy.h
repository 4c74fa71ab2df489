#pragma once

#include <cstdint>
#include <random>

#include "core/Constants.h"

/**
 * @brief Bounds of the outer per-task retry.
 *
 * A task gets one initial attempt plus maxRetries retries. Retry n waits a
 * uniformly random delay in [0, min(maxDelayMs, baseDelayMs * 2^n)] (full jitter).
 */
struct RetryPolicy {
    uint32_t maxRetries{Constants::Retry::MAX_RETRIES};
    uint32_t baseDelayMs{Constants::Retry::BASE_DELAY_MS};
    uint32_t maxDelayMs{Constants::Retry::MAX_DELAY_MS};

    /** @brief Policy from the runtime configuration. */
    static RetryPolicy fromConfig();

    /** @brief Upper bound of the jittered delay before retry number `retry` (0-based). */
    [[nodiscard]] uint32_t backoffCeilingMs(uint32_t retry) const;
};

enum class RetryState : uint8_t {
    READY,
    RUNNING,
    BACKOFF,
    SUCCEEDED,
    FAILED
};

constexpr const char *toString(const RetryState state) {
    switch (state) {
        case RetryState::READY: return "READY";
        case RetryState::RUNNING: return "RUNNING";
        case RetryState::BACKOFF: return "BACKOFF";
        case RetryState::SUCCEEDED: return "SUCCEEDED";
        case RetryState::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

enum class FailureKind : uint8_t {
    TRANSIENT, ///< network, rate limit, server error
    TERMINAL, ///< identity permanently rejected
    LOCK_CONFLICT, ///< row locks stayed contended
    TIMEOUT ///< hard time limit exceeded, the worker was killed
};

constexpr const char *toString(const FailureKind kind) {
    switch (kind) {
        case FailureKind::TRANSIENT: return "TRANSIENT";
        case FailureKind::TERMINAL: return "TERMINAL";
        case FailureKind::LOCK_CONFLICT: return "LOCK_CONFLICT";
        case FailureKind::TIMEOUT: return "TIMEOUT";
    }
    return "UNKNOWN";
}

/**
 * @brief What to do after a failed attempt.
 */
struct RetryDecision {
    RetryState state; // BACKOFF or FAILED
    uint32_t delayMs; // wait before the next attempt (BACKOFF only)
    bool compensate; // give back consumed quota (FAILED only, exactly once per machine)
};

/**
 * @brief Retry lifecycle of one task, independent of the transport.
 *
 *   READY -> RUNNING -> SUCCEEDED
 *                    -> BACKOFF -> RUNNING ...
 *                    -> FAILED (terminal failure or retries exhausted)
 *
 * The machine is rebuilt from the attempt counter carried in the task, so
 * it survives being shipped through the queue between attempts.
 */
class RetryStateMachine {
public:
    /**
     * @param policy Retry bounds
     * @param retriesUsed Retries already consumed by earlier attempts
     * @param seed Jitter seed
     */
    RetryStateMachine(const RetryPolicy &policy, uint32_t retriesUsed, uint32_t seed);

    /** @throws std::logic_error Unless READY or BACKOFF */
    void start();

    /** @throws std::logic_error Unless RUNNING */
    void succeed();

    /** @throws std::logic_error Unless RUNNING */
    RetryDecision fail(FailureKind kind);

    [[nodiscard]] RetryState state() const noexcept { return state_; }

    /** @brief Retries consumed so far; the value to carry in the rescheduled task. */
    [[nodiscard]] uint32_t retriesUsed() const noexcept { return retriesUsed_; }

    [[nodiscard]] bool isTerminal() const noexcept {
        return state_ == RetryState::SUCCEEDED || state_ == RetryState::FAILED;
    }

private:
    void transition(RetryState next);

    RetryPolicy policy_;
    uint32_t retriesUsed_;
    RetryState state_{RetryState::READY};
    bool compensated_{false};
    std::mt19937 rng_;
};
