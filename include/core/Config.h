#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <string>

#include "core/Constants.h"

#ifndef SEATPOOL_PROJECT_DIR
#define SEATPOOL_PROJECT_DIR "."
#endif

/**
 * @brief Runtime configuration from environment variables.
 *
 * Call Config::loadEnvFile() before using config values.
 * For protocol constants, see Constants.h.
 * For compile-time limits, see Flags.h.
 */
namespace Config {
    namespace Runtime {
        /**
         * @brief Get uint32 environment variable with default fallback.
         * @param envName Name of the environment variable
         * @param defaultValue Value to return if variable is not set
         * @return Parsed uint32 value or default
         */
        inline uint32_t getEnvOr(const char *envName, uint32_t defaultValue) {
            const char *env = std::getenv(envName);
            if (!env) {
                return defaultValue;
            }
            return static_cast<uint32_t>(std::stoul(env));
        }

        /**
         * @brief Get string environment variable with default fallback.
         * @param envName Name of the environment variable
         * @param defaultValue Value to return if variable is not set
         */
        inline std::string getEnvStringOr(const char *envName, const char *defaultValue) {
            const char *env = std::getenv(envName);
            return env ? std::string(env) : std::string(defaultValue);
        }

        /**
         * @brief Get required uint32 environment variable.
         * @param envName Name of the environment variable
         * @return Parsed uint32 value
         * @throws std::runtime_error If variable is not set
         */
        inline uint32_t getEnv(const char *envName) {
            const char *env = std::getenv(envName);
            if (!env) {
                throw std::runtime_error(std::string("Missing env: ") + envName);
            }
            return static_cast<uint32_t>(std::stoul(env));
        }
    }

    /**
     * @brief Export KEY=VALUE lines of the env file into the environment.
     *
     * The file is $SEATPOOL_ENV_FILE if set, else seatpool.env in the project
     * directory. Blank lines, comments and an "export " prefix are accepted.
     * Variables already in the environment win, so children that load the
     * same file see the values the supervisor saw.
     *
     * @throws std::runtime_error If the env file cannot be opened
     */
    inline void loadEnvFile() {
        const char *chosen = getenv("SEATPOOL_ENV_FILE");
        const std::string path = chosen && *chosen ? chosen : std::string(SEATPOOL_PROJECT_DIR) + "/seatpool.env";
        std::ifstream file(path);
        if (!file) throw std::runtime_error("Cannot open: " + path);

        constexpr const char *blanks = " \t\r";
        std::string line;
        while (std::getline(file, line)) {
            const size_t first = line.find_first_not_of(blanks);
            if (first == std::string::npos || line[first] == '#') continue;
            line = line.substr(first, line.find_last_not_of(blanks) - first + 1);
            if (line.rfind("export ", 0) == 0) line.erase(0, 7);

            const size_t eq = line.find('=');
            if (eq == std::string::npos || eq == 0) continue;
            setenv(line.substr(0, eq).c_str(), line.c_str() + eq + 1, 0);
        }
    }

    /**
     * @brief Supervisor and process topology.
     */
    namespace Supervisor {
        /** @brief Number of dispatch worker processes */
        inline uint32_t WORKERS() {
            static const uint32_t v = Runtime::getEnv("SEATPOOL_WORKERS");
            return v;
        }

        /** @brief Scheduler tick in microseconds */
        inline uint32_t TICK_US() {
            static const uint32_t v = Runtime::getEnv("SEATPOOL_TICK_US");
            return v;
        }

        /** @brief Run duration in seconds, 0 runs until signalled */
        inline uint32_t RUN_DURATION_SEC() {
            static const uint32_t v = Runtime::getEnvOr("SEATPOOL_RUN_DURATION_SEC", 0);
            return v;
        }

        /** @brief Teams created at startup, "id:capacity:group,..." */
        inline const std::string &SEED_TEAMS() {
            static const std::string v = Runtime::getEnvStringOr("SEATPOOL_SEED_TEAMS", "");
            return v;
        }

        /** @brief Codes created at startup, "code:max_uses:group,..." */
        inline const std::string &SEED_CODES() {
            static const std::string v = Runtime::getEnvStringOr("SEATPOOL_SEED_CODES", "");
            return v;
        }
    }

    /**
     * @brief Dispatch batching and time limits.
     */
    namespace Dispatch {
        /** @brief Max tasks per batch (capped by Flags::Dispatch::MAX_BATCH) */
        inline uint32_t BATCH_SIZE() {
            static const uint32_t v = Runtime::getEnv("SEATPOOL_BATCH_SIZE");
            return v;
        }

        /** @brief Max time spent assembling a batch */
        inline uint32_t BATCH_MAX_WAIT_MS() {
            static const uint32_t v = Runtime::getEnv("SEATPOOL_BATCH_MAX_WAIT_MS");
            return v;
        }

        inline uint32_t SOFT_LIMIT_SEC() {
            static const uint32_t v = Runtime::getEnvOr("SEATPOOL_TASK_SOFT_LIMIT_SEC",
                                                        Constants::Task::SOFT_LIMIT_SEC);
            return v;
        }

        inline uint32_t HARD_LIMIT_SEC() {
            static const uint32_t v = Runtime::getEnvOr("SEATPOOL_TASK_HARD_LIMIT_SEC",
                                                        Constants::Task::HARD_LIMIT_SEC);
            return v;
        }

        inline uint32_t LOCAL_RETRIES() {
            static const uint32_t v = Runtime::getEnvOr("SEATPOOL_LOCAL_RETRIES", Constants::Retry::LOCAL_RETRIES);
            return v;
        }

        inline uint32_t LOCAL_RETRY_DELAY_MS() {
            static const uint32_t v = Runtime::getEnvOr("SEATPOOL_LOCAL_RETRY_DELAY_MS",
                                                        Constants::Retry::LOCAL_RETRY_DELAY_MS);
            return v;
        }

        inline uint32_t LOCK_RETRIES() {
            static const uint32_t v = Runtime::getEnvOr("SEATPOOL_LOCK_RETRIES", Constants::Retry::LOCK_RETRIES);
            return v;
        }

        /** @brief "sequential" (default) or "greedy" */
        inline const std::string &ALLOCATION() {
            static const std::string v = Runtime::getEnvStringOr("SEATPOOL_ALLOCATION", "sequential");
            return v;
        }
    }

    /**
     * @brief Outer retry policy.
     */
    namespace Retry {
        inline uint32_t MAX_RETRIES() {
            static const uint32_t v = Runtime::getEnvOr("SEATPOOL_MAX_RETRIES", Constants::Retry::MAX_RETRIES);
            return v;
        }

        inline uint32_t BASE_DELAY_MS() {
            static const uint32_t v = Runtime::getEnvOr("SEATPOOL_RETRY_BASE_MS", Constants::Retry::BASE_DELAY_MS);
            return v;
        }

        inline uint32_t MAX_DELAY_MS() {
            static const uint32_t v = Runtime::getEnvOr("SEATPOOL_RETRY_MAX_MS", Constants::Retry::MAX_DELAY_MS);
            return v;
        }
    }

    /**
     * @brief Periodic reconciliation jobs.
     */
    namespace Reconcile {
        inline uint32_t WAITING_INTERVAL_SEC() {
            static const uint32_t v = Runtime::getEnv("SEATPOOL_RECONCILE_INTERVAL_SEC");
            return v;
        }

        inline uint32_t STALE_SWEEP_INTERVAL_SEC() {
            static const uint32_t v = Runtime::getEnv("SEATPOOL_STALE_SWEEP_INTERVAL_SEC");
            return v;
        }

        inline uint32_t QUOTA_SYNC_INTERVAL_SEC() {
            static const uint32_t v = Runtime::getEnv("SEATPOOL_QUOTA_SYNC_INTERVAL_SEC");
            return v;
        }

        inline uint32_t STALE_RESERVED_SEC() {
            static const uint32_t v = Runtime::getEnvOr("SEATPOOL_STALE_RESERVED_SEC",
                                                        Constants::Capacity::STALE_RESERVED_SEC);
            return v;
        }
    }

    /**
     * @brief Redemption throttle limits.
     */
    namespace Throttle {
        /** @brief Global concurrent redemptions in flight */
        inline uint32_t MAX_CONCURRENT_REDEEMS() {
            static const uint32_t v = Runtime::getEnv("SEATPOOL_MAX_CONCURRENT_REDEEMS");
            return v;
        }

        /** @brief Wait budget for a redemption permit */
        inline uint32_t ACQUIRE_TIMEOUT_MS() {
            static const uint32_t v = Runtime::getEnv("SEATPOOL_ACQUIRE_TIMEOUT_MS");
            return v;
        }

        /** @brief Requests per identity per minute, 0 disables the limiter */
        inline uint32_t RATE_LIMIT_PER_MIN() {
            static const uint32_t v = Runtime::getEnvOr("SEATPOOL_RATE_LIMIT_PER_MIN", 0);
            return v;
        }
    }

    /**
     * @brief Simulated membership service used by the worker processes.
     */
    namespace Membership {
        /** @brief Percentage of invite calls failing transiently */
        inline uint32_t TRANSIENT_FAILURE_PCT() {
            static const uint32_t v = Runtime::getEnvOr("SEATPOOL_SIM_TRANSIENT_PCT", 0);
            return v;
        }

        /** @brief Percentage of identities permanently rejected */
        inline uint32_t TERMINAL_FAILURE_PCT() {
            static const uint32_t v = Runtime::getEnvOr("SEATPOOL_SIM_TERMINAL_PCT", 0);
            return v;
        }

        /** @brief Simulated call latency */
        inline uint32_t LATENCY_MS() {
            static const uint32_t v = Runtime::getEnvOr("SEATPOOL_SIM_LATENCY_MS", 0);
            return v;
        }
    }

    /**
     * @brief Validate all required configuration values.
     *
     * @throws std::runtime_error If any required configuration is missing
     */
    inline void validate() {
        Supervisor::WORKERS();
        Supervisor::TICK_US();
        Dispatch::BATCH_SIZE();
        Dispatch::BATCH_MAX_WAIT_MS();
        Reconcile::WAITING_INTERVAL_SEC();
        Reconcile::STALE_SWEEP_INTERVAL_SEC();
        Reconcile::QUOTA_SYNC_INTERVAL_SEC();
        Throttle::MAX_CONCURRENT_REDEEMS();
        Throttle::ACQUIRE_TIMEOUT_MS();
        // Optional values fall back to Constants, no validation needed
    }
}
