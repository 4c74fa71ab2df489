#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>

#include "core/Config.h"
#include "core/Supervisor.h"

namespace {
    void printUsage(const char *program) {
        printf("Usage: %s [env-file]\n\n", program);
        printf("Starts the supervisor, the logger and SEATPOOL_WORKERS dispatch workers.\n");
        printf("Without env-file, $SEATPOOL_ENV_FILE or seatpool.env in the project directory is read.\n");
        printf("SIGUSR1 prints counters, SIGINT or SIGTERM shuts down.\n");
    }
}

int main(int argc, char *argv[]) {
    if (argc > 2 || (argc == 2 && (strcmp(argv[1], "-h") == 0 || strcmp(argv[1], "--help") == 0))) {
        printUsage(argv[0]);
        return argc > 2 ? 1 : 0;
    }
    // Exported so dispatch workers and the logger load the same file.
    if (argc == 2) setenv("SEATPOOL_ENV_FILE", argv[1], 1);

    try {
        Config::loadEnvFile();
        Config::validate();
    } catch (const std::exception &e) {
        fprintf(stderr, "Config error: %s\n", e.what());
        return 1;
    }

    Supervisor supervisor;
    supervisor.run();
    return supervisor.failed() ? EXIT_FAILURE : EXIT_SUCCESS;
}
