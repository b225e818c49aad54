#pragma once

#include <cstdint>
#include <ctime>

#include "ipc/core/Semaphore.h"
#include "ipc/model/SharedReservationState.h"
#include "reservation/Booking.h"

/**
 * @class BookingLedger
 * @brief Append-only booking table in shared memory.
 *
 * Appends are serialized by the LEDGER_APPEND latch; everything else about a
 * booking is guarded by the row lock of its class. Methods marked "caller
 * holds the row lock" must only be used inside a class transaction.
 */
class BookingLedger {
public:
    BookingLedger(SharedReservationState &state, const Semaphore &sem);

    /**
     * @brief Publish a new Confirmed booking.
     * @param userId Booking owner
     * @param classId Reserved class (caller holds its row lock)
     * @param bookedAt Creation time
     * @return Id of the new booking
     * @throws reservation_exception StorageError when the ledger is full
     */
    uint32_t append(uint32_t userId, uint32_t classId, time_t bookedAt);

    /** @brief Number of published bookings. */
    uint32_t size() const;

    /** @brief Usable rows of this run. */
    uint32_t capacity() const { return state_.ledger.capacity; }

    /**
     * @brief Published booking by id, or nullptr.
     *
     * Immutable fields may be read at any time; status and cancelledAt only
     * under the row lock of the booking's class.
     */
    Booking *find(uint32_t bookingId);
    const Booking *find(uint32_t bookingId) const;

    /**
     * @brief Confirmed booking of user for class, or nullptr. Caller holds the row lock.
     */
    const Booking *findConfirmed(uint32_t userId, uint32_t classId) const;

    /**
     * @brief Number of Confirmed bookings of a class. Caller holds the row lock.
     */
    uint32_t countConfirmed(uint32_t classId) const;

    /**
     * @brief Visit every published booking of a class. Caller holds the row lock.
     */
    template<typename Fn>
    void forEachOfClass(const uint32_t classId, Fn fn) {
        const uint32_t count = size();
        for (uint32_t i = 0; i < count; ++i) {
            Booking &booking = state_.ledger.bookings[i];
            if (booking.classId == classId) {
                fn(booking);
            }
        }
    }

private:
    static constexpr auto tag_{"Ledger"};

    SharedReservationState &state_;
    const Semaphore &sem_;
};
