#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <vector>

#include "catalog/ClassRowLock.h"
#include "catalog/ClassSession.h"
#include "ipc/core/Semaphore.h"
#include "ipc/model/SharedReservationState.h"

/**
 * @brief Selection for class listings.
 */
struct ClassFilter {
    std::optional<ClassCategory> category;
    std::optional<time_t> day; // Any time on the wanted local calendar day
    bool upcomingOnly{true}; // Hide classes that already started
    bool includeRemoved{false};
};

/**
 * @class ClassCatalog
 * @brief Class definitions and their row locks.
 *
 * Creates classes and hands out exclusive row locks to the reservation
 * engine. Reads copy rows under a short row lock; their answers may be stale
 * by the time the caller acts on them, which is harmless since every
 * mutation re-validates under its own lock.
 *
 * Writes nothing but new rows: availableSlots, removal and descriptive edits
 * belong to the reservation engine.
 */
class ClassCatalog {
public:
    /**
     * @param state Attached shared reservation state
     * @param sem Semaphore set of the store
     * @param lockTimeoutMs Longest wait for a row lock before LockTimeout
     */
    ClassCatalog(SharedReservationState &state, const Semaphore &sem, uint32_t lockTimeoutMs);

    /**
     * @brief Persist a new class with availableSlots = totalSlots.
     * @param definition Operator input
     * @return The created row
     * @throws reservation_exception InvalidDefinition for bad input,
     *         StorageError when the catalog table is full
     */
    ClassSession create(const ClassDefinition &definition);

    /**
     * @brief Lock a live class row for a mutating transaction.
     * @param classId Class to lock
     * @return Held row lock
     * @throws reservation_exception ClassNotFound if the id is unknown or removed,
     *         LockTimeout if the row stays locked longer than the timeout
     *
     * Blocks while another transaction holds the same row; never blocks on
     * other rows.
     */
    ClassRowLock getForUpdate(uint32_t classId);

    /**
     * @brief Lock a row even if the class was removed.
     *
     * Used when an existing booking must be inspected under its class lock.
     * @throws reservation_exception ClassNotFound if the id was never issued, LockTimeout
     */
    ClassRowLock lockRow(uint32_t classId);

    /**
     * @brief Copy of one live class, or nullopt if unknown or removed.
     *
     * Not a lock-free read: the row lock is held for the copy so a row is
     * never seen mid-commit. A row held past the lock timeout fails the read.
     * @throws reservation_exception LockTimeout
     */
    std::optional<ClassSession> get(uint32_t classId) const;

    /**
     * @brief Classes matching the filter, ordered by start time.
     *
     * Each row is copied under its own row lock, taken one at a time, so
     * the listing is consistent per row but not across rows.
     * @throws reservation_exception LockTimeout
     */
    std::vector<ClassSession> list(const ClassFilter &filter) const;

    /** @brief Number of class ids issued so far. */
    uint32_t size() const;

    /**
     * @brief Check an operator definition.
     * @param definition Input to check
     * @param now Reference time for the future-start rule
     * @throws reservation_exception InvalidDefinition describing the first problem
     */
    static void validate(const ClassDefinition &definition, time_t now);

private:
    static constexpr auto tag_{"Catalog"};

    ClassRowLock acquire(uint32_t classId) const;

    SharedReservationState &state_;
    const Semaphore &sem_;
    uint32_t lockTimeoutMs_;
};
