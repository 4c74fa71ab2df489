#pragma once

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <csignal>
#include <string>
#include <vector>

#include "ipc/IpcManager.h"
#include "logging/Logger.h"
#include "utils/ArgumentParser.h"

/**
 * @brief fork/exec of the sibling executables and reaping of their pids.
 */
namespace ProcessSpawner {
    inline constexpr auto tag = "ProcessSpawner";

    /** @brief Path of an executable installed next to the running one. */
    inline std::string siblingPath(const char *processName) {
        std::string self(1024, '\0');
        const ssize_t len = readlink("/proc/self/exe", self.data(), self.size() - 1);
        if (len <= 0) return std::string("./") + processName;
        self.resize(static_cast<size_t>(len));
        return self.substr(0, self.find_last_of('/') + 1) + processName;
    }

    /**
     * @brief Start processName with the given arguments.
     * @return Child pid, or -1 if fork failed
     *
     * argv is built before forking; the child only calls execv.
     */
    inline pid_t spawn(const char *processName, const std::vector<std::string> &args) {
        const std::string path = siblingPath(processName);
        std::vector<char *> argv;
        argv.reserve(args.size() + 2);
        argv.push_back(const_cast<char *>(processName));
        for (const std::string &arg: args) argv.push_back(const_cast<char *>(arg.c_str()));
        argv.push_back(nullptr);

        const pid_t pid = fork();
        if (pid == 0) {
            execv(path.c_str(), argv.data());
            perror("execv");
            _exit(127);
        }
        if (pid == -1) Logger::perror(Logger::Source::Supervisor, tag, "fork");
        return pid;
    }

    /** @brief Start a child that attaches to the instance named by keys. */
    inline pid_t spawnWithKeys(const char *processName, const IpcKeys &keys) {
        std::vector<std::string> args;
        for (const ArgumentParser::KeyArg &arg: ArgumentParser::KEY_ARGS) {
            args.push_back(std::to_string(keys.*arg.field));
        }
        return spawn(processName, args);
    }

    /** @brief SIGTERM; the child finishes its current batch first. */
    inline void terminate(const pid_t pid, const char *name = nullptr) {
        if (pid <= 0) return;
        if (name) Logger::info(Logger::Source::Supervisor, tag, "terminating %s (pid %d)", name, pid);
        if (kill(pid, SIGTERM) == -1 && errno != ESRCH) {
            Logger::perror(Logger::Source::Supervisor, tag, "kill SIGTERM");
        }
    }

    /**
     * @brief Block until pid is reaped.
     *
     * ECHILD means someone already reaped it.
     */
    inline void waitFor(const pid_t pid) {
        if (pid <= 0) return;
        int status;
        for (;;) {
            if (waitpid(pid, &status, 0) != -1 || errno == ECHILD) return;
            if (errno != EINTR) {
                Logger::perror(Logger::Source::Supervisor, tag, "waitpid");
                return;
            }
        }
    }

    /** @brief SIGKILL and reap. */
    inline void kill9(const pid_t pid) {
        if (pid <= 0 || kill(pid, SIGKILL) == -1) return;
        waitFor(pid);
    }

    /** @return Pid of one exited child, 0 if none is waiting to be reaped */
    inline pid_t reapOne() {
        int status;
        const pid_t pid = waitpid(-1, &status, WNOHANG);
        return pid > 0 ? pid : 0;
    }
}
