#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <vector>

#include "catalog/ClassCatalog.h"
#include "catalog/ClassRowLock.h"
#include "reservation/BookingLedger.h"

/**
 * @class Transaction
 * @brief All-or-nothing change set on one class row and its bookings.
 *
 * Holds the class row lock for its whole lifetime. Changes are staged first
 * and written by commit(); a transaction that is destroyed without commit
 * writes nothing.
 *
 * Commit protocol:
 * 1. Set the row's CommitJournal (intent visible to the next lock holder)
 * 2. Append the staged booking (the only step that can fail; failure clears
 *    the journal and leaves the store unchanged)
 * 3. Apply status changes and the slot delta in place
 * 4. Clear the journal, release the lock
 *
 * Opening a transaction on a row whose journal is still active (its holder
 * died between 1 and 4) first repairs the row: an interrupted removal is
 * finished (remaining Confirmed bookings cancelled, row removed), then
 * availableSlots is recounted from the ledger.
 */
class Transaction {
public:
    /**
     * @brief Lock a class row and open a transaction on it.
     * @param catalog Class catalog
     * @param ledger Booking ledger
     * @param classId Class to lock
     * @param allowRemoved Also open on removed classes (cancelling old bookings)
     * @throws reservation_exception ClassNotFound (also when the repair
     *         finishes a removal), LockTimeout
     */
    Transaction(ClassCatalog &catalog, BookingLedger &ledger, uint32_t classId, bool allowRemoved = false);

    ~Transaction();

    Transaction(const Transaction &) = delete;

    Transaction &operator=(const Transaction &) = delete;

    /** @brief Locked view of the class row. */
    const ClassSession &session() const { return lock_.session(); }

    /** @brief Stage one new Confirmed booking of userId. */
    void stageBooking(uint32_t userId, time_t bookedAt);

    /** @brief Stage cancellation of a Confirmed booking of this class. */
    void stageCancellation(uint32_t bookingId);

    /** @brief Stage new descriptive fields and capacity. */
    void stageDefinition(const ClassDefinition &definition);

    /** @brief Stage removal of the class; cancellations must be staged separately. */
    void stageRemoval();

    /**
     * @brief Apply all staged changes and release the row.
     * @return Id of the booking created by the commit, if one was staged
     * @throws reservation_exception StorageError if the ledger append fails
     */
    std::optional<uint32_t> commit();

    /** @brief Discard staged changes and release the row. Idempotent. */
    void rollback() noexcept;

    bool isOpen() const { return lock_.isHeld(); }

    /** @brief Row as written by the last successful commit(). */
    const ClassSession &committedSession() const { return committed_; }

private:
    static constexpr auto tag_{"Transaction"};

    void repairIfInterrupted();

    JournalOp journalOp() const;

    ClassRowLock lock_;
    BookingLedger &ledger_;

    struct PendingBooking {
        uint32_t userId;
        time_t bookedAt;
    };

    std::optional<PendingBooking> insert_;
    std::vector<uint32_t> cancellations_;
    std::optional<ClassDefinition> definition_;
    bool remove_{false};
    ClassSession committed_;
};
