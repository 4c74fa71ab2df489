#pragma once

#include <sys/types.h>
#include <unistd.h>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include "ipc/IpcManager.h"

/**
 * @brief Command-line parsing shared by the child processes and seatpool_ctl.
 *
 * Children get the instance keys as positional arguments, in KEY_ARGS order.
 */
namespace ArgumentParser {
    struct KeyArg {
        const char *name;
        key_t IpcKeys::*field;
    };

    inline constexpr KeyArg KEY_ARGS[] = {
        {"shmKey", &IpcKeys::shm},
        {"coordKey", &IpcKeys::coord},
        {"semKey", &IpcKeys::sem},
        {"taskQueueKey", &IpcKeys::taskQueue},
        {"logQueueKey", &IpcKeys::logQueue},
    };
    inline constexpr int KEY_ARG_COUNT = sizeof(KEY_ARGS) / sizeof(KEY_ARGS[0]);

    /** @return true if the whole string is a decimal number that fits in 32 bits */
    inline bool parseUint32(const char *str, uint32_t &out) {
        if (*str < '0' || *str > '9') return false;
        errno = 0;
        char *end;
        const unsigned long value = strtoul(str, &end, 10);
        if (*end != '\0' || errno == ERANGE || value > UINT32_MAX) return false;
        out = static_cast<uint32_t>(value);
        return true;
    }

    inline bool parseKey(const char *str, key_t &out) {
        errno = 0;
        char *end;
        const long value = strtol(str, &end, 10);
        if (*str == '\0' || *end != '\0' || errno == ERANGE) return false;
        out = static_cast<key_t>(value);
        return true;
    }

    /**
     * @brief Fill keys from argv[1..KEY_ARG_COUNT].
     * @return false after printing usage or the offending argument to stderr
     */
    inline bool parseIpcArgs(const int argc, char *argv[], IpcKeys &keys) {
        if (argc != KEY_ARG_COUNT + 1) {
            fprintf(stderr, "Usage: %s", argv[0]);
            for (const KeyArg &arg: KEY_ARGS) fprintf(stderr, " <%s>", arg.name);
            fputc('\n', stderr);
            return false;
        }
        for (int i = 0; i < KEY_ARG_COUNT; ++i) {
            if (!parseKey(argv[i + 1], keys.*KEY_ARGS[i].field)) {
                fprintf(stderr, "Error: invalid %s '%s'\n", KEY_ARGS[i].name, argv[i + 1]);
                return false;
            }
        }
        return true;
    }
}
