#include "logging/Logger.h"

#include <sys/time.h>
#include <unistd.h>
#include <memory>
#include <string>

#include "core/Errors.h"
#include "ipc/core/MessageQueue.h"
#include "ipc/core/Semaphore.h"
#include "ipc/core/SharedMemory.h"
#include "ipc/model/SharedSeatState.h"
#include "logging/LogMessage.h"

namespace Logger {
    namespace {
        constexpr const char *LEVEL_NAMES[] = {"DEBUG", "INFO ", "WARN ", "ERROR"};

        const char *colorOf(const Source source, const Level level) {
            if (level == Level::ERROR) return "\033[31m";
            if (level == Level::WARN) return "\033[33m";
            switch (source) {
                case Source::Supervisor: return "\033[35m";
                case Source::Worker: return "\033[36m";
                case Source::Reconciler: return "\033[34m";
                case Source::Client: return "\033[32m";
                default: return "\033[37m";
            }
        }

        /** Everything a process needs to hand lines to the logger process. */
        struct Channel {
            SharedMemory<SharedSeatState> shm;
            Semaphore sem;
            MessageQueue<LogMessage> queue;

            Channel(const key_t shmKey, const key_t semKey, const key_t queueKey)
                : shm{SharedMemory<SharedSeatState>::attach(shmKey)}, sem{semKey}, queue{queueKey, "LogQueue"} {
            }

            /** @return false when the line must be printed directly instead */
            bool send(const Source source, const Level level, const char *tag, const char *text) {
                // Slots are returned by the logger process, so no SEM_UNDO, and never wait for one.
                if (!sem.tryAcquire(Semaphore::Index::LOG_QUEUE_SLOTS, 1, false)) return false;

                LogMessage msg;
                msg.level = static_cast<uint8_t>(level);
                msg.source = static_cast<uint8_t>(source);
                msg.pid = getpid();
                snprintf(msg.tag, sizeof(msg.tag), "%s", tag);
                snprintf(msg.text, sizeof(msg.text), "%s", text);
                gettimeofday(&msg.timestamp, nullptr);
                {
                    Semaphore::ScopedLock lock(sem, Semaphore::Index::LOG_SEQUENCE);
                    msg.sequenceNum = ++shm->operational.logSequenceNum; // doubles as mtype, must be > 0
                }

                if (queue.trySend(msg, static_cast<long>(msg.sequenceNum))) return true;
                sem.post(Semaphore::Index::LOG_QUEUE_SLOTS, 1, false);
                return false;
            }
        };

        std::unique_ptr<Channel> g_channel;
    }

    namespace detail {
        void writeDirect(const Source source, const Level level, const char *tag, const char *text) {
            timeval now{};
            gettimeofday(&now, nullptr);
            tm local{};
            localtime_r(&now.tv_sec, &local);

            char line[TEXT_LEN + 96];
            int n = snprintf(line, sizeof(line), "\033[90m[%02d:%02d:%02d.%03ld]\033[0m %s[%s] [%s]\033[0m %s\n",
                             local.tm_hour, local.tm_min, local.tm_sec, static_cast<long>(now.tv_usec / 1000),
                             colorOf(source, level), LEVEL_NAMES[static_cast<int>(level)], tag, text);
            if (n < 0) return;
            if (n >= static_cast<int>(sizeof(line))) {
                n = sizeof(line) - 1;
                line[n - 1] = '\n';
            }
            // Best effort: there is nowhere left to report a failed write to stdout.
            const ssize_t written = write(STDOUT_FILENO, line, static_cast<size_t>(n));
            (void) written;
        }

        void deliver(const Source source, const Level level, const char *tag, const char *text) {
            if (g_channel) {
                try {
                    if (g_channel->send(source, level, tag, text)) return;
                } catch (const ipc_exception &) {
                    // Queue or semaphore set gone (supervisor shutting down): print instead.
                }
            }
            writeDirect(source, level, tag, text);
        }
    }

    void initCentralized(const key_t shmKey, const key_t semKey, const key_t logQueueKey) {
        try {
            g_channel = std::make_unique<Channel>(shmKey, semKey, logQueueKey);
        } catch (const ipc_exception &e) {
            g_channel.reset();
            detail::writeDirect(Source::Other, Level::WARN, "Logger",
                                (std::string("centralized logging unavailable: ") + e.what()).c_str());
        }
    }

    void cleanupCentralized() {
        g_channel.reset();
    }

    void separator(const char ch, const int width) {
        char line[128];
        const int n = width < 127 ? width : 127;
        memset(line, ch, static_cast<size_t>(n));
        line[n] = '\n';
        const ssize_t written = write(STDOUT_FILENO, line, static_cast<size_t>(n) + 1);
        (void) written;
    }
}
