#include <unistd.h>
#include <climits>
#include <cstdio>
#include <cstring>
#include <vector>
#include <algorithm>

#include "core/Config.h"
#include "ipc/core/MessageQueue.h"
#include "ipc/core/Semaphore.h"
#include "ipc/core/SharedMemory.h"
#include "ipc/model/SharedSeatState.h"
#include "logging/LogMessage.h"
#include "utils/ArgumentParser.h"
#include "utils/SignalHelper.h"

namespace {
    SignalHelper::Flags g_signals;
    constexpr const char *TAG = "Logger";

    constexpr const char *colors[] = {"\033[90m", "\033[36m", "\033[33m", "\033[31m"};
    constexpr const char *names[] = {"DEBUG", "INFO ", "WARN ", "ERROR"};
}

/**
 * @brief Prints log messages of all processes in sequence order.
 *
 * Each received message frees one LOG_QUEUE_SLOTS permit taken by the sender.
 */
class LoggerProcess {
public:
    explicit LoggerProcess(const IpcKeys &keys)
        : shm_{SharedMemory<SharedSeatState>::attach(keys.shm)},
          sem_{keys.sem},
          logQueue_{keys.logQueue, "LogQueue"} {
        {
            Semaphore::ScopedLock lock(sem_, Semaphore::Index::SHM_OPERATIONAL);
            startedAt_ = shm_->operational.startedAt;
        }
        sem_.post(Semaphore::Index::LOGGER_READY, 1, false);
        fprintf(stderr, "[%s] Started (PID: %d)\n", TAG, getpid());
    }

    void run() {
        while (!SignalHelper::shouldExit(g_signals)) {
            // Negative mtype: lowest sequence number first
            auto msg = logQueue_.tryReceive(-LONG_MAX);
            if (!msg) {
                usleep(1000);
                continue;
            }
            sem_.post(Semaphore::Index::LOG_QUEUE_SLOTS, 1, false);
            printLog(*msg);
        }
        drainQueue();
    }

private:
    void printLog(const LogMessage &msg) const {
        char elapsed[24];
        formatElapsed(msg.timestamp, elapsed, sizeof(elapsed));

        const uint8_t level = msg.level < 4 ? msg.level : 3;
        char buf[512];
        int n = snprintf(buf, sizeof(buf), "\033[90m%s\033[0m %s[%s] [%s]\033[0m (%d) %s\n",
                         elapsed, colors[level], names[level], msg.tag, msg.pid, msg.text);
        if (n > static_cast<int>(sizeof(buf)) - 1) n = sizeof(buf) - 1;
        write(STDOUT_FILENO, buf, n);
    }

    /** Seconds since the supervisor started, [+SSSSS.mmm] */
    void formatElapsed(const struct timeval &timestamp, char *buffer, const size_t size) const {
        int64_t elapsedMs = (timestamp.tv_sec - startedAt_) * 1000LL + timestamp.tv_usec / 1000;
        if (startedAt_ == 0 || elapsedMs < 0) elapsedMs = 0;
        snprintf(buffer, size, "[+%05lld.%03lld]", static_cast<long long>(elapsedMs / 1000),
                 static_cast<long long>(elapsedMs % 1000));
    }

    void drainQueue() {
        std::vector<LogMessage> remaining;
        while (auto msg = logQueue_.tryReceive(0)) {
            sem_.post(Semaphore::Index::LOG_QUEUE_SLOTS, 1, false);
            remaining.push_back(*msg);
        }
        std::sort(remaining.begin(), remaining.end(),
                  [](const LogMessage &a, const LogMessage &b) { return a.sequenceNum < b.sequenceNum; });
        for (const auto &msg: remaining) {
            printLog(msg);
        }
    }

    SharedMemory<SharedSeatState> shm_;
    Semaphore sem_;
    MessageQueue<LogMessage> logQueue_;
    time_t startedAt_{0};
};

int main(int argc, char *argv[]) {
    IpcKeys keys{};
    if (!ArgumentParser::parseIpcArgs(argc, argv, keys)) {
        return 1;
    }

    SignalHelper::setupChildProcess(g_signals);

    try {
        Config::loadEnvFile();
        LoggerProcess logger(keys);
        logger.run();
    } catch (const std::exception &e) {
        fprintf(stderr, "[%s] Exception: %s\n", TAG, e.what());
        return 1;
    }
    return 0;
}
