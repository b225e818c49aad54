#pragma once

#include <cstdint>
#include <sys/types.h>
#include <sys/ipc.h>
#include <sys/sem.h>

#include "IpcException.h"
#include "core/Flags.h"

#ifdef _SEM_SEMUN_UNDEFINED
/**
 * @brief Union for semaphore control operations.
 *
 * Required on some systems where semun is not defined.
 */
union semun {
    int val;
    struct semid_ds *buf;
    unsigned short *array;
    struct seminfo *__buf;
};
#endif

/**
 * @class Semaphore
 * @brief RAII wrapper for System V semaphore sets.
 *
 * Provides a safe C++ interface to System V semaphores for inter-process
 * synchronization. Creates a semaphore set with TOTAL_SEMAPHORES members:
 * a few named latches followed by one binary row lock per catalog row.
 *
 * @note All blocking operations are signal-safe (handle EINTR).
 * @note Locks use SEM_UNDO so the kernel releases them if the holder dies.
 */
class Semaphore {
public:
    /**
     * @brief Semaphore indices for the reservation store.
     */
    struct Index {
        enum : uint16_t {
            // === STARTUP ===
            LOGGER_READY = 0, // Logger signals readiness to the orchestrator
            MEMBERS_GO, // Released by the orchestrator once all members are spawned

            // === TABLE PUBLICATION LATCHES ===
            // Held only while a new row is written and the table count is published.
            // Never acquired while waiting on a row lock.
            CATALOG_APPEND, // Protects catalog.classCount / catalog.nextClassId
            LEDGER_APPEND, // Protects ledger.bookingCount

            // === LOGGING ===
            LOG_SEQUENCE, // Protects log sequence number increment
            LOG_QUEUE_SLOTS, // Available slots in log queue (prevents overflow)

            // === ROW LOCKS ===
            // ROW_LOCK_BASE + (classId - 1), one per catalog row
            ROW_LOCK_BASE,

            TOTAL_SEMAPHORES = ROW_LOCK_BASE + Flags::Store::MAX_CLASSES
        };

        /**
         * @brief Get human-readable name of a semaphore index.
         * @param index Semaphore index value
         * @return String name of the semaphore
         */
        static const char *toString(uint16_t index);
    };

    /**
     * @brief Row lock index of a class.
     * @param classId Catalog id (1-based)
     * @return Semaphore index guarding that class row
     */
    static constexpr uint16_t rowLock(const uint32_t classId) {
        return static_cast<uint16_t>(Index::ROW_LOCK_BASE + classId - 1);
    }

    /**
     * @brief Construct semaphore set wrapper.
     * @param key System V IPC key for the semaphore set
     * @throws ipc_exception If semget fails
     */
    explicit Semaphore(key_t key);

    ~Semaphore() = default;

    Semaphore(const Semaphore &) = delete;

    Semaphore &operator=(const Semaphore &) = delete;

    /**
     * @brief Initialize a semaphore to a specific value.
     * @param semIndex Index of the semaphore in the set
     * @param value Initial value to set
     */
    void initialize(uint16_t semIndex, int32_t value) const;

    /**
     * @brief Wait (decrement) on a semaphore.
     * @param semIndex Index of the semaphore in the set
     * @param useUndo If true, uses SEM_UNDO for automatic cleanup on process termination
     * @return true if successful, false if interrupted by signal
     *
     * Blocks until the semaphore value is >= 1, then decrements by 1.
     */
    bool wait(uint16_t semIndex, bool useUndo = true) const;

    /**
     * @brief Wait (decrement) on a semaphore with a deadline.
     * @param semIndex Index of the semaphore in the set
     * @param timeoutMs Maximum time to block in milliseconds
     * @param useUndo If true, uses SEM_UNDO for automatic cleanup
     * @return true if acquired, false if the timeout expired
     *
     * Restarts after EINTR with the remaining time.
     */
    bool waitFor(uint16_t semIndex, uint32_t timeoutMs, bool useUndo = true) const;

    /**
     * @brief Try to acquire a semaphore without blocking.
     * @param semIndex Index of the semaphore in the set
     * @param useUndo If true, uses SEM_UNDO for automatic cleanup
     * @return true if acquired, false if would block
     */
    bool tryAcquire(uint16_t semIndex, bool useUndo = true) const;

    /**
     * @brief Post (increment) a semaphore.
     * @param semIndex Index of the semaphore in the set
     * @param useUndo If true, uses SEM_UNDO (must match the acquiring call)
     */
    void post(uint16_t semIndex, bool useUndo = true) const;

    /**
     * @brief Post (increment) a semaphore by n.
     * @param semIndex Index of the semaphore in the set
     * @param n Amount to increment
     * @param useUndo If true, uses SEM_UNDO
     */
    void post(uint16_t semIndex, int32_t n, bool useUndo) const;

    /**
     * @brief Get current value of a semaphore.
     * @param semIndex Index of the semaphore in the set
     * @return Current semaphore value
     */
    [[nodiscard]] int32_t getValue(uint16_t semIndex) const;

    /**
     * @brief Destroy the semaphore set.
     * @throws ipc_exception If semctl IPC_RMID fails
     */
    void destroy() const;

    /**
     * @brief RAII lock guard for latches.
     *
     * Acquires the semaphore on construction (retrying after signals) and
     * releases on destruction. Uses SEM_UNDO for safety.
     */
    class ScopedLock {
    public:
        /**
         * @brief Acquire the semaphore.
         * @param sem Reference to the Semaphore wrapper
         * @param semIndex Index of the semaphore to lock
         */
        explicit ScopedLock(const Semaphore &sem, uint16_t semIndex);

        /** @brief Release the semaphore. */
        ~ScopedLock();

        ScopedLock(const ScopedLock &) = delete;

        ScopedLock &operator=(const ScopedLock &) = delete;

    private:
        const Semaphore &sem_;
        uint16_t semIndex_;
    };

private:
    static constexpr auto tag_{"Semaphore"};
    int32_t semId_;
    static constexpr int32_t permissions = 0600;
};
