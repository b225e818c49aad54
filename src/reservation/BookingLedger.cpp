#include "reservation/BookingLedger.h"

#include <string>

#include "logging/Logger.h"
#include "reservation/ReservationError.h"

BookingLedger::BookingLedger(SharedReservationState &state, const Semaphore &sem)
    : state_{state}, sem_{sem} {
}

uint32_t BookingLedger::append(const uint32_t userId, const uint32_t classId, const time_t bookedAt) {
    Semaphore::ScopedLock latch(sem_, Semaphore::Index::LEDGER_APPEND);
    auto &ledger = state_.ledger;
    if (ledger.bookingCount >= capacity()) {
        Logger::error(Logger::Source::Engine, tag_, "ledger full (%u rows), booking of user %u refused",
                      ledger.capacity, userId);
        throw reservation_exception(ReservationError::StorageError,
                                    "booking ledger is full (" + std::to_string(ledger.capacity) + " rows)");
    }

    Booking &booking = ledger.bookings[ledger.bookingCount];
    booking = Booking();
    booking.id = ledger.bookingCount + 1;
    booking.userId = userId;
    booking.classId = classId;
    booking.status = BookingStatus::CONFIRMED;
    booking.bookedAt = bookedAt;
    booking.cancelledAt = 0;

    ledger.bookingCount = booking.id;
    return booking.id;
}

uint32_t BookingLedger::size() const {
    Semaphore::ScopedLock latch(sem_, Semaphore::Index::LEDGER_APPEND);
    return state_.ledger.bookingCount;
}

Booking *BookingLedger::find(const uint32_t bookingId) {
    if (bookingId == 0 || bookingId > size()) {
        return nullptr;
    }
    return &state_.ledger.bookings[bookingId - 1];
}

const Booking *BookingLedger::find(const uint32_t bookingId) const {
    if (bookingId == 0 || bookingId > size()) {
        return nullptr;
    }
    return &state_.ledger.bookings[bookingId - 1];
}

const Booking *BookingLedger::findConfirmed(const uint32_t userId, const uint32_t classId) const {
    const uint32_t count = size();
    for (uint32_t i = 0; i < count; ++i) {
        const Booking &booking = state_.ledger.bookings[i];
        if (booking.classId == classId && booking.userId == userId && booking.isConfirmed()) {
            return &booking;
        }
    }
    return nullptr;
}

uint32_t BookingLedger::countConfirmed(const uint32_t classId) const {
    const uint32_t count = size();
    uint32_t confirmed = 0;
    for (uint32_t i = 0; i < count; ++i) {
        const Booking &booking = state_.ledger.bookings[i];
        if (booking.classId == classId && booking.isConfirmed()) {
            ++confirmed;
        }
    }
    return confirmed;
}
