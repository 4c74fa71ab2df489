#pragma once

#include <sys/ipc.h>
#include <sys/msg.h>
#include <cerrno>
#include <cstdio>
#include <optional>
#include <string>
#include <type_traits>

#include "core/Errors.h"
#include "logging/Logger.h"

/**
 * @brief Typed view of a System V message queue.
 * @tparam T Payload copied byte-wise through the kernel
 *
 * The first process to open a key creates the queue, later ones join it.
 * Only the creator calls destroy(). Send is never blocking: callers own
 * their own back-pressure (semaphore slots, delayed tables).
 */
template<typename T>
class MessageQueue {
    static_assert(std::is_trivially_copyable_v<T>, "payloads cross process boundaries as raw bytes");

public:
    /**
     * @param key System V IPC key
     * @param tag Name used in log lines
     * @throws ipc_exception If the queue can be neither created nor joined
     */
    MessageQueue(const key_t key, const char *tag) : tag_{tag}, id_{msgget(key, IPC_CREAT | PERMISSIONS)} {
        if (id_ == -1) {
            perror("msgget");
            throw ipc_exception(std::string("cannot open message queue ") + tag);
        }
        Logger::debug(Logger::Source::Other, tag_, "queue %d open", id_);
    }

    MessageQueue(const MessageQueue &) = delete;

    MessageQueue &operator=(const MessageQueue &) = delete;

    /** @return false when the kernel queue has no room (IPC_NOWAIT) */
    bool trySend(const T &payload, const long type) const {
        Envelope envelope{type, payload};
        while (msgsnd(id_, &envelope, sizeof(T), IPC_NOWAIT) == -1) {
            if (errno != EINTR) return false;
        }
        return true;
    }

    /**
     * @brief Take the next message of the given type.
     * @param type 0 = any, >0 = exact, <0 = lowest type up to |type|
     * @param block Wait for a message; a signal still interrupts the wait
     * @return nullopt when interrupted or empty, so the caller can check its exit flag
     */
    std::optional<T> receive(const long type, const bool block) const {
        Envelope envelope{};
        if (msgrcv(id_, &envelope, sizeof(T), type, block ? 0 : IPC_NOWAIT) == -1) {
            return std::nullopt;
        }
        return envelope.payload;
    }

    std::optional<T> tryReceive(const long type) const { return receive(type, false); }

    /** @brief Messages currently queued in the kernel. */
    [[nodiscard]] uint32_t depth() const {
        msqid_ds info{};
        if (msgctl(id_, IPC_STAT, &info) == -1) {
            perror("msgctl IPC_STAT");
            throw ipc_exception(std::string("cannot stat message queue ") + tag_);
        }
        return static_cast<uint32_t>(info.msg_qnum);
    }

    /** @throws ipc_exception If the kernel refuses the removal */
    void destroy() const {
        if (msgctl(id_, IPC_RMID, nullptr) == -1) {
            perror("msgctl IPC_RMID");
            throw ipc_exception(std::string("cannot remove message queue ") + tag_);
        }
        Logger::debug(Logger::Source::Other, tag_, "queue %d removed", id_);
    }

private:
    static constexpr int PERMISSIONS = 0600;

    struct Envelope {
        long mtype;
        T payload;
    };

    const char *tag_;
    int id_;
};
