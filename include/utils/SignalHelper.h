#pragma once

#include <signal.h>
#include <initializer_list>

#include "logging/Logger.h"

/**
 * @brief Flag-only signal handlers.
 *
 * Installed without SA_RESTART so blocking msgrcv and semop calls return
 * EINTR and the caller's loop sees the flag.
 */
namespace SignalHelper {
    inline constexpr auto tag = "SignalHelper";

    struct Flags {
        volatile sig_atomic_t exit{0}; ///< SIGTERM or SIGINT
        volatile sig_atomic_t report{0}; ///< SIGUSR1, print counters
    };

    namespace detail {
        inline Flags *g_flags = nullptr;

        inline void onSignal(const int sig) {
            if (g_flags == nullptr) return;
            if (sig == SIGUSR1) g_flags->report = 1;
            else g_flags->exit = 1;
        }

        inline void installAll(Flags &flags, const std::initializer_list<int> signals) {
            g_flags = &flags;
            struct sigaction action{};
            action.sa_handler = onSignal;
            sigemptyset(&action.sa_mask);
            for (const int sig: signals) {
                if (sigaction(sig, &action, nullptr) == -1) Logger::perror(Logger::Source::Other, tag, "sigaction");
            }
        }
    }

    /** @brief Supervisor: SIGTERM and SIGINT stop, SIGUSR1 reports. */
    inline void setup(Flags &flags) {
        detail::installAll(flags, {SIGTERM, SIGINT, SIGUSR1});
    }

    /**
     * @brief Children stop on SIGTERM only.
     *
     * Ctrl+C reaches the whole process group; the supervisor then stops
     * children itself, workers before the logger.
     */
    inline void setupChildProcess(Flags &flags) {
        signal(SIGINT, SIG_IGN);
        detail::installAll(flags, {SIGTERM});
    }

    inline bool shouldExit(const Flags &flags) { return flags.exit != 0; }

    inline void clearFlag(volatile sig_atomic_t &flag) { flag = 0; }
}
