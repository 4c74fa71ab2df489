#include <cstdio>
#include <unistd.h>

#include "core/Config.h"
#include "dispatch/DispatchWorker.h"
#include "logging/Logger.h"
#include "service/SeatpoolNode.h"
#include "utils/ArgumentParser.h"
#include "utils/SignalHelper.h"

namespace {
    SignalHelper::Flags g_signals;
    constexpr auto TAG = "DispatchWorker";
    constexpr auto SRC = Logger::Source::Worker;
}

/**
 * Drains the task queue until SIGTERM. A batch in progress is finished before
 * exiting; the blocking receive returns early on the signal.
 */
int main(int argc, char *argv[]) {
    IpcKeys keys{};
    if (!ArgumentParser::parseIpcArgs(argc, argv, keys)) {
        return 1;
    }

    SignalHelper::setupChildProcess(g_signals);

    try {
        Config::loadEnvFile();
        Logger::initCentralized(keys.shm, keys.sem, keys.logQueue);

        SeatpoolNode node(keys, SRC);
        DispatchWorker worker(node.store(), node.ledger(), node.reservation(), node.queue(), node.client(),
                              node.retrier(), node.reconciler(), WorkerSettings::fromConfig());

        node.sem().post(Semaphore::Index::WORKERS_READY, 1, false);
        Logger::info(SRC, TAG, "ready (pid %d)", getpid());

        const pid_t self = getpid();
        while (!SignalHelper::shouldExit(g_signals)) {
            worker.drainOnce(self);
        }

        Logger::info(SRC, TAG, "stopping (pid %d)", self);
        Logger::cleanupCentralized();
    } catch (const std::exception &e) {
        Logger::error(SRC, TAG, "Exception: %s", e.what());
        Logger::cleanupCentralized();
        return 1;
    }
    return 0;
}
