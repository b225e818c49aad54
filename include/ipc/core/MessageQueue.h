#pragma once

#include <sys/ipc.h>
#include <sys/msg.h>
#include <cerrno>
#include <optional>

#include "logging/Logger.h"
#include "IpcException.h"

/**
 * @brief RAII wrapper for System V message queues.
 * @tparam T Type of message payload (trivially copyable)
 *
 * Provides type-safe sending and receiving of messages with automatic
 * EINTR handling for signal safety.
 */
template<typename T>
class MessageQueue {
public:
    /**
     * @brief Create or connect to a message queue.
     * @param key System V IPC key
     * @param tag Identifier for logging
     *
     * Creates queue if it doesn't exist, otherwise connects to existing.
     */
    explicit MessageQueue(const key_t key, const char *tag) : tag_{tag} {
        msgId_ = msgget(key, IPC_CREAT | IPC_EXCL | permissions);
        if (msgId_ == -1) {
            if (errno == EEXIST) {
                msgId_ = msgget(key, permissions);
                if (msgId_ == -1) {
                    throw ipc_exception("Failed to connect to existing message queue");
                }
                Logger::debug(tag_, "Message queue connected");
            } else {
                throw ipc_exception("Failed to create message queue");
            }
        } else {
            Logger::debug(tag_, "Message queue created");
        }
    }

    ~MessageQueue() = default;

    MessageQueue(const MessageQueue &) = delete;

    MessageQueue &operator=(const MessageQueue &) = delete;

    /**
     * @brief Try to send a message (non-blocking).
     * @param message Message payload to send
     * @param type Message type (must be > 0)
     * @return true if sent successfully, false if queue is full
     */
    bool trySend(const T &message, const long type) {
        Wrapper wrapper{};
        wrapper.mtype = type;
        wrapper.message = message;
        while (msgsnd(msgId_, &wrapper, sizeof(T), IPC_NOWAIT) == -1) {
            if (errno == EINTR) continue;
            return false;
        }
        return true;
    }

    /**
     * @brief Receive a message (blocking).
     * @param type Message type to receive (0 = any, >0 = exact, <0 = lowest type first)
     * @param flags Additional msgrcv flags
     * @return Message if received, nullopt on EINTR or empty queue with IPC_NOWAIT
     * @throws ipc_exception On any other msgrcv failure
     *
     * Caller should check exit signals when nullopt is returned.
     */
    std::optional<T> receive(const long type, const int32_t flags = 0) {
        Wrapper wrapper{};
        if (msgrcv(msgId_, &wrapper, sizeof(T), type, flags) != -1) {
            return wrapper.message;
        }
        if (errno == EINTR || errno == ENOMSG) {
            return std::nullopt;
        }
        throw ipc_exception("Failed to receive message");
    }

    /**
     * @brief Try to receive a message (non-blocking).
     * @param type Message type to receive
     * @return Message if available, nullopt if queue is empty
     */
    std::optional<T> tryReceive(const long type) {
        return receive(type, IPC_NOWAIT);
    }

    /**
     * @brief Destroy the message queue.
     * @throws ipc_exception If destruction fails
     */
    void destroy() const {
        if (msgctl(msgId_, IPC_RMID, nullptr) == -1) {
            throw ipc_exception("Failed to destroy message queue");
        }
        Logger::debug(tag_, "destroyed");
    }

private:
    const char *tag_;
    int msgId_;
    static constexpr int32_t permissions = 0600;

    struct Wrapper {
        long mtype;
        T message;
    };
};
