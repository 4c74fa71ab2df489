#pragma once

#include <cstdint>
#include <ctime>
#include <unistd.h>

/**
 * Wall-clock helpers shared by every process.
 * Expiry and deadlines stored in shared memory use CLOCK_REALTIME milliseconds
 * so that every process reads the same clock.
 */
namespace TimeHelper {
    /** Current wall-clock time in milliseconds since the epoch. */
    inline int64_t nowMs() {
        timespec ts{};
        clock_gettime(CLOCK_REALTIME, &ts);
        return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1'000'000;
    }

    /** Monotonic milliseconds for in-process elapsed time measurement. */
    inline int64_t monotonicMs() {
        timespec ts{};
        clock_gettime(CLOCK_MONOTONIC, &ts);
        return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1'000'000;
    }

    /** Sleep for milliseconds, resuming after signal interruption. */
    inline void sleepMs(const uint32_t ms) {
        timespec req{static_cast<time_t>(ms / 1000), static_cast<long>(ms % 1000) * 1'000'000L};
        timespec rem{};
        while (nanosleep(&req, &rem) == -1) {
            req = rem;
        }
    }

    /** Format epoch seconds as YYYY-MM-DD HH:MM:SS. */
    inline void formatTimestamp(const time_t t, char *buffer, const size_t size) {
        struct tm local{};
        localtime_r(&t, &local);
        strftime(buffer, size, "%Y-%m-%d %H:%M:%S", &local);
    }
}
