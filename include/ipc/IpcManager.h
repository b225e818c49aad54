#pragma once

#include <cstdlib>
#include <string>

#include "ipc/core/SharedMemory.h"
#include "ipc/core/Semaphore.h"
#include "ipc/core/MessageQueue.h"
#include "ipc/core/IpcException.h"
#include "ipc/model/SharedReservationState.h"
#include "logging/LogMessage.h"
#include "core/Config.h"
#include "logging/Logger.h"

class IpcManager;

/**
 * @brief Cleanup handler namespace for IpcManager.
 *
 * Registers an atexit handler to ensure IPC resources are cleaned up
 * even when the process leaves through exit().
 */
namespace IpcCleanup {
    inline IpcManager *g_instance = nullptr;

    /**
     * @brief atexit handler for IPC cleanup.
     */
    void atexitHandler();
}

/**
 * @brief Central manager for all IPC resources of the reservation store.
 *
 * Creates and manages the shared memory segment, the semaphore set (latches
 * and row locks) and the log queue. Provides RAII cleanup of all resources.
 *
 * Only the process that owns the store (orchestrator or test runner) should
 * create an IpcManager. Other processes attach using the individual wrappers.
 */
class IpcManager {
public:
    /**
     * @brief Create all IPC resources.
     * @param keyPath Existing file used to derive the System V keys (ftok)
     * @throws ipc_exception If any IPC creation fails
     */
    explicit IpcManager(const std::string &keyPath)
        : shmKey_{ftok(keyPath.c_str(), 'S')},
          semKey_{ftok(keyPath.c_str(), 'M')},
          logMsgKey_{ftok(keyPath.c_str(), 'L')},
          shm_{SharedMemory<SharedReservationState>::create(checkedKey(shmKey_))},
          sem_{checkedKey(semKey_)},
          logQueue_{checkedKey(logMsgKey_), "LogMessageQueue"} {
        IpcCleanup::g_instance = this;
        std::atexit(IpcCleanup::atexitHandler);

        Logger::debug(tag_, "created (shm=%d sem=%d log=%d)", shmKey_, semKey_, logMsgKey_);
    }

    ~IpcManager() {
        cleanup();
        IpcCleanup::g_instance = nullptr;
    }

    IpcManager(const IpcManager &) = delete;

    IpcManager &operator=(const IpcManager &) = delete;

    IpcManager(IpcManager &&) = delete;

    IpcManager &operator=(IpcManager &&) = delete;

    /** @brief Get pointer to the shared reservation state. */
    SharedReservationState *state() { return shm_.get(); }
    /** @brief Access shared state via pointer operator. */
    SharedReservationState *operator->() { return shm_.get(); }

    /** @brief Get reference to semaphore set wrapper. */
    Semaphore &sem() { return sem_; }
    /** @brief Get reference to log message queue. */
    MessageQueue<LogMessage> &logQueue() { return logQueue_; }

    key_t shmKey() const { return shmKey_; }
    key_t semKey() const { return semKey_; }
    key_t logMsgKey() const { return logMsgKey_; }

    /**
     * @brief Initialize all semaphores to their starting values.
     *
     * Must be called after construction and before any process uses the store.
     */
    void initSemaphores() const {
        // Startup synchronization
        sem_.initialize(Semaphore::Index::LOGGER_READY, 0);
        sem_.initialize(Semaphore::Index::MEMBERS_GO, 0);

        // Table latches
        sem_.initialize(Semaphore::Index::CATALOG_APPEND, 1);
        sem_.initialize(Semaphore::Index::LEDGER_APPEND, 1);

        // Logging
        sem_.initialize(Semaphore::Index::LOG_SEQUENCE, 1);
        sem_.initialize(Semaphore::Index::LOG_QUEUE_SLOTS, Constants::Queue::LOG_QUEUE_CAPACITY);

        // One binary lock per catalog row
        for (uint32_t classId = 1; classId <= Flags::Store::MAX_CLASSES; ++classId) {
            sem_.initialize(Semaphore::rowLock(classId), 1);
        }
    }

    /**
     * @brief Initialize shared state.
     * @param openTime Real time when the store opens
     * @param closeTime Real time when the load run should end
     * @param ledgerCapacity Usable ledger rows (clamped to Flags::Store::MAX_BOOKINGS)
     */
    void initState(const time_t openTime, const time_t closeTime, const uint32_t ledgerCapacity) {
        state()->operational.acceptingRequests = true;
        state()->operational.openingTime = openTime;
        state()->operational.closingTime = closeTime;
        state()->ledger.capacity = ledgerCapacity < Flags::Store::MAX_BOOKINGS
                                       ? ledgerCapacity
                                       : Flags::Store::MAX_BOOKINGS;
    }

    /**
     * @brief Clean up all IPC resources.
     *
     * Safe to call multiple times. Failures are logged, never thrown.
     */
    void cleanup() noexcept {
        if (cleanedUp_) return;
        cleanedUp_ = true;

        try { shm_.destroy(); } catch (const ipc_exception &e) {
            Logger::warn(tag_, "shared memory cleanup: %s", e.what());
        }
        try { sem_.destroy(); } catch (const ipc_exception &e) {
            Logger::warn(tag_, "semaphore cleanup: %s", e.what());
        }
        try { logQueue_.destroy(); } catch (const ipc_exception &e) {
            Logger::warn(tag_, "log queue cleanup: %s", e.what());
        }
        Logger::debug(tag_, "cleanup done");
    }

private:
    static constexpr auto tag_{"IpcManager"};

    static key_t checkedKey(const key_t key) {
        if (key == -1) {
            throw ipc_exception("ftok failed");
        }
        return key;
    }

    key_t shmKey_;
    key_t semKey_;
    key_t logMsgKey_;

    SharedMemory<SharedReservationState> shm_;
    Semaphore sem_;
    MessageQueue<LogMessage> logQueue_;
    bool cleanedUp_{false};
};

namespace IpcCleanup {
    inline void atexitHandler() {
        if (g_instance) {
            g_instance->cleanup();
        }
    }
}
