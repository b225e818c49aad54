#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "catalog/ClassCatalog.h"
#include "identity/Principal.h"
#include "reservation/Booking.h"
#include "reservation/BookingLedger.h"
#include "reservation/Statistics.h"

/**
 * @brief Selection for booking listings. Empty fields match everything.
 */
struct BookingFilter {
    std::optional<uint32_t> userId;
    std::optional<uint32_t> classId;
    std::optional<BookingStatus> status;
};

/**
 * @class ReservationEngine
 * @brief Books and cancels class slots without overselling.
 *
 * Every mutation runs as one Transaction on the class row: check and update
 * happen under the same row lock, so concurrent requests for one class are
 * serialized while requests for different classes proceed in parallel.
 *
 * Guarantees, at every commit point:
 * - availableSlots == totalSlots - (Confirmed bookings of the class)
 * - at most one Confirmed booking per (user, class)
 *
 * Sole writer of Booking.status and ClassSession.availableSlots.
 * All failures are reported as reservation_exception.
 */
class ReservationEngine {
public:
    ReservationEngine(ClassCatalog &catalog, BookingLedger &ledger);

    /**
     * @brief Reserve one slot of a class for a user.
     * @param userId Requesting user
     * @param classId Class to book
     * @return The new Confirmed booking
     * @throws reservation_exception ClassNotFound, ClassUnavailable (started or
     *         full), DuplicateBooking, StorageError, LockTimeout
     */
    Booking createBooking(uint32_t userId, uint32_t classId);

    /**
     * @brief Cancel a Confirmed booking and return its slot.
     * @param actor Caller, already authorized for this booking
     * @param bookingId Booking to cancel
     * @return true if this call cancelled it, false if it was not Confirmed
     * @throws reservation_exception BookingNotFound, StorageError, LockTimeout
     *
     * Idempotent: of several concurrent calls for one booking exactly one
     * returns true and the slot is returned once.
     */
    bool cancelBooking(const Principal &actor, uint32_t bookingId);

    /**
     * @brief Edit a class; capacity changes keep the slot invariant.
     * @throws reservation_exception InvalidDefinition (also when totalSlots
     *         drops below the Confirmed bookings), ClassNotFound, LockTimeout
     */
    ClassSession updateClass(uint32_t classId, const ClassDefinition &definition);

    /**
     * @brief Remove a class and cancel its Confirmed bookings.
     * @return Number of bookings cancelled by the removal
     * @throws reservation_exception ClassNotFound, LockTimeout
     */
    uint32_t removeClass(uint32_t classId);

    /** @brief Copy of a booking, read under its class lock. */
    std::optional<Booking> findBooking(uint32_t bookingId) const;

    /**
     * @brief Bookings matching the filter, newest first.
     * @throws reservation_exception LockTimeout (class rows are read under their locks)
     */
    std::vector<Booking> listBookings(const BookingFilter &filter) const;

    /**
     * @brief Operator statistics over the last windowDays days.
     * @throws reservation_exception LockTimeout (class rows are read under their locks)
     */
    CatalogStatistics statistics(uint32_t windowDays) const;

    /** @brief Booking summary of one user. */
    MemberStatistics memberStatistics(uint32_t userId) const;

    /**
     * @brief Check slot accounting and booking uniqueness of every class.
     * @return Violations found (empty when consistent)
     */
    std::vector<InvariantViolation> audit() const;

private:
    static constexpr auto tag_{"Engine"};

    /**
     * @brief Run fn(session) for every issued class, each under its row lock.
     */
    template<typename Fn>
    void forEachClassLocked(Fn fn) const;

    ClassCatalog &catalog_;
    BookingLedger &ledger_;
};
