#pragma once

#include <sys/types.h>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>

#include "core/Flags.h"

/**
 * @brief printf-style logging for every seatpool process.
 *
 * Messages go straight to stdout until initCentralized() attaches the log
 * queue; from then on they are sequenced and printed in order by the
 * logger process. Any failure on the queue path falls back to stdout, so
 * logging never blocks a lock holder and never throws.
 */
namespace Logger {
    enum class Level : uint8_t {
        DEBUG, ///< Lock phases, per-task detail
        INFO, ///< Allocation and lifecycle events
        WARN, ///< Degraded operation (fail-open paths, retries)
        ERROR ///< Lost work or broken invariants
    };

    enum class Source : uint8_t {
        Supervisor, ///< Process supervisor and scheduler
        Worker, ///< Dispatch worker pool
        Reconciler, ///< Periodic reconciliation jobs
        Client, ///< Request path (ctl, service callers)
        Other ///< IPC plumbing and utilities
    };

    namespace detail {
        constexpr size_t TEXT_LEN = 256;

        /** Route one formatted line to the logger process or to stdout. */
        void deliver(Source source, Level level, const char *tag, const char *text);

        /** Write one line to stdout with local wall-clock time. */
        void writeDirect(Source source, Level level, const char *tag, const char *text);

        template<typename... Args>
        void emit(const Source source, const Level level, const char *tag, const char *format, Args... args) {
            char text[TEXT_LEN];
            if constexpr (sizeof...(args) == 0) {
                snprintf(text, sizeof(text), "%s", format);
            } else {
                snprintf(text, sizeof(text), format, args...);
            }
            deliver(source, level, tag, text);
        }
    }

    /**
     * @brief Send this process's logs through the log queue.
     *
     * Stays on direct output if the segment, semaphore set or queue cannot
     * be opened.
     */
    void initCentralized(key_t shmKey, key_t semKey, key_t logQueueKey);

    /** @brief Detach from the log queue and go back to direct output. */
    void cleanupCentralized();

    template<typename... Args>
    void debug(const Source source, const char *tag, const char *format, Args... args) {
        if constexpr (Flags::Logging::IS_DEBUG_ENABLED) detail::emit(source, Level::DEBUG, tag, format, args...);
    }

    template<typename... Args>
    void info(const Source source, const char *tag, const char *format, Args... args) {
        if constexpr (Flags::Logging::IS_INFO_ENABLED) detail::emit(source, Level::INFO, tag, format, args...);
    }

    template<typename... Args>
    void warn(const Source source, const char *tag, const char *format, Args... args) {
        if constexpr (Flags::Logging::IS_WARN_ENABLED) detail::emit(source, Level::WARN, tag, format, args...);
    }

    template<typename... Args>
    void error(const Source source, const char *tag, const char *format, Args... args) {
        if constexpr (Flags::Logging::IS_ERROR_ENABLED) detail::emit(source, Level::ERROR, tag, format, args...);
    }

    /** @brief Error line with the current errno text appended. */
    inline void perror(const Source source, const char *tag, const char *context) {
        const int saved = errno;
        error(source, tag, "%s: %s", context, strerror(saved));
    }

    inline void stateChange(const Source source, const char *tag, const char *from, const char *to) {
        debug(source, tag, "%s -> %s", from, to);
    }

    /** @brief Horizontal rule on stdout, never queued. */
    void separator(char ch = '-', int width = 60);
}
