#pragma once

#include <sys/ipc.h>
#include <sys/shm.h>
#include <cerrno>
#include <new>

#include "IpcException.h"
#include "logging/Logger.h"

/**
 * @brief RAII wrapper for System V shared memory segments.
 * @tparam T Type of data stored in shared memory (must be trivially relocatable, no pointers)
 *
 * Provides safe creation, attachment, and cleanup of shared memory.
 * The creator process (owner) is responsible for destruction.
 */
template<typename T>
class SharedMemory {
public:
    /**
     * @brief Create a new shared memory segment.
     * @param key System V IPC key
     * @return SharedMemory wrapper with ownership
     * @throws ipc_exception If creation fails
     *
     * A stale segment left under the same key by a crashed run is removed
     * and recreated. The object is value-initialized in place.
     */
    static SharedMemory create(const key_t key) {
        int id = shmget(key, sizeof(T), IPC_CREAT | IPC_EXCL | kPermissions);
        if (id == -1 && errno == EEXIST) {
            const int stale = shmget(key, 0, 0);
            if (stale != -1) {
                shmctl(stale, IPC_RMID, nullptr);
            }
            id = shmget(key, sizeof(T), IPC_CREAT | IPC_EXCL | kPermissions);
        }
        if (id == -1) {
            throw ipc_exception("shmget create failed");
        }
        return SharedMemory(id, true);
    }

    /**
     * @brief Attach to an existing shared memory segment.
     * @param key System V IPC key
     * @return SharedMemory wrapper without ownership
     * @throws ipc_exception If attachment fails
     *
     * Used by child processes; the caller is not responsible for cleanup.
     */
    static SharedMemory attach(const key_t key) {
        const int id = shmget(key, 0, 0);
        if (id == -1) {
            throw ipc_exception("shmget attach failed");
        }
        return SharedMemory(id, false);
    }

    ~SharedMemory() {
        if (data_ != nullptr) {
            shmdt(data_);
        }
        if (isOwner_ && shmId_ != -1) {
            shmctl(shmId_, IPC_RMID, nullptr);
        }
    }

    SharedMemory(const SharedMemory &) = delete;

    SharedMemory &operator=(const SharedMemory &) = delete;

    SharedMemory(SharedMemory &&other) noexcept
        : shmId_{other.shmId_},
          data_{other.data_}, isOwner_{other.isOwner_} {
        other.data_ = nullptr;
        other.isOwner_ = false;
    }

    SharedMemory &operator=(SharedMemory &&other) noexcept {
        if (this != &other) {
            if (data_ != nullptr) shmdt(data_);
            if (isOwner_ && shmId_ != -1) shmctl(shmId_, IPC_RMID, nullptr);

            shmId_ = other.shmId_;
            data_ = other.data_;
            isOwner_ = other.isOwner_;

            other.data_ = nullptr;
            other.isOwner_ = false;
        }
        return *this;
    }

    T *get() noexcept { return data_; }
    const T *get() const noexcept { return data_; }

    T *operator->() noexcept { return data_; }
    const T *operator->() const noexcept { return data_; }

    T &operator*() noexcept { return *data_; }
    const T &operator*() const noexcept { return *data_; }

    /**
     * @brief Destroy the shared memory segment.
     * @throws ipc_exception If destruction fails
     *
     * The segment disappears once the last process detaches.
     */
    void destroy() {
        if (shmctl(shmId_, IPC_RMID, nullptr) == -1) {
            throw ipc_exception("failed to destroy shared memory");
        }
        isOwner_ = false;
        Logger::debug(tag_, "destroyed");
    }

private:
    static constexpr auto tag_ = "SharedMemory";
    int shmId_;
    T *data_ = nullptr;
    bool isOwner_;
    static constexpr int kPermissions = 0600;

    SharedMemory(const int id, const bool owner)
        : shmId_{id}, isOwner_{owner} {
        void *ptr = shmat(shmId_, nullptr, 0);
        if (ptr == reinterpret_cast<void *>(-1)) {
            throw ipc_exception("shmat failed");
        }
        data_ = static_cast<T *>(ptr);

        if (isOwner_) {
            new(data_) T();
        }
    }
};
