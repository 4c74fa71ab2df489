#pragma once

#include <sys/time.h>
#include <cstdint>
#include <type_traits>

/**
 * @brief One log line in flight from a seatpool process to the logger process.
 *
 * sequenceNum is also the message type on the queue, so it starts at 1.
 */
struct LogMessage {
    uint64_t sequenceNum{0};
    timeval timestamp{};
    uint8_t level{1};
    uint8_t source{0};
    int32_t pid{0};
    char tag[32]{};
    char text[256]{};
};

static_assert(std::is_trivially_copyable_v<LogMessage>, "log lines are copied through msgsnd");
