#pragma once

#include <cstdint>

/**
 * @brief Build-time limits and switches.
 *
 * The Store, Dispatch and Coordinator limits size the fixed tables in shared
 * memory, so every process of one instance must be built with the same values.
 * Disabled log levels compile out entirely.
 */
namespace Flags {

    namespace Store {
        constexpr uint32_t MAX_TEAMS{64};
        constexpr uint32_t MAX_MEMBERS{4096};
        constexpr uint32_t MAX_INVITES{4096};
        constexpr uint32_t MAX_WAITING{2048};
        constexpr uint32_t MAX_CODES{256};
        constexpr uint32_t MAX_COMPENSATIONS{2048};
    }

    namespace Dispatch {
        constexpr uint32_t MAX_WORKERS{16};
        constexpr uint32_t MAX_BATCH{16}; // also the in-flight slot size per worker
        constexpr uint32_t MAX_DELAYED{512}; // tasks in backoff, across all workers
    }

    namespace Coordinator {
        constexpr uint32_t MAX_ENTRIES{512};
    }

    namespace Logging {
        constexpr bool IS_DEBUG_ENABLED{false};
        constexpr bool IS_INFO_ENABLED{true};
        constexpr bool IS_WARN_ENABLED{true};
        constexpr bool IS_ERROR_ENABLED{true};
    }

}
