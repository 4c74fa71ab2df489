#pragma once

#include <cstdint>

/**
 * @brief Fixed protocol constants.
 * Changing these changes observable allocation and retry behaviour.
 */
namespace Constants {
    namespace Capacity {
        constexpr uint32_t PENDING_WINDOW_SEC{24 * 3600}; // invites older than this stop holding a seat
        constexpr uint32_t STALE_RESERVED_SEC{3600}; // reserved without dispatch for this long is abandoned
    }

    namespace Retry {
        constexpr uint32_t MAX_RETRIES{3};
        constexpr uint32_t BASE_DELAY_MS{60'000};
        constexpr uint32_t MAX_DELAY_MS{600'000};
        constexpr uint32_t LOCAL_RETRIES{2}; // serial per-identity attempts after a batch failure
        constexpr uint32_t LOCAL_RETRY_DELAY_MS{500};
        constexpr uint32_t LOCK_RETRIES{3}; // immediate retries on row-lock contention
        constexpr uint32_t MEMBER_REMOVAL_ATTEMPTS{5};
    }

    namespace Task {
        constexpr uint32_t SOFT_LIMIT_SEC{240};
        constexpr uint32_t HARD_LIMIT_SEC{300};
        constexpr long MSG_TYPE_TASK{1};
    }

    namespace Reconcile {
        constexpr uint32_t LOCK_TTL_MS{300'000};
        constexpr uint32_t SCAN_LIMIT{100};
    }

    namespace Throttle {
        constexpr uint32_t BUCKET_TTL_MS{86'400'000};
        constexpr uint32_t SEMAPHORE_TTL_MS{30'000}; // safety expiry for crashed holders
        constexpr uint32_t SEMAPHORE_BACKOFF_MS{100};
        constexpr uint32_t SEMAPHORE_MAX_BACKOFF_MS{800};
    }

    namespace Lock {
        constexpr uint32_t ROW_LOCK_TIMEOUT_MS{2'000};
    }

    namespace Queue {
        constexpr uint32_t TASK_QUEUE_CAPACITY{64}; // stays under the default msgmnb for sizeof(Task)
        constexpr uint32_t LOG_QUEUE_CAPACITY{5000};
    }
}
