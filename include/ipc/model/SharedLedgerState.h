#pragma once

#include <cstdint>

#include "core/Flags.h"
#include "reservation/Booking.h"

// ============================================================================
// BOOKING LEDGER
// ============================================================================

/**
 * Append-only booking table. Booking id N lives in bookings[N - 1].
 *
 * bookingCount is written under LEDGER_APPEND after the new row is complete.
 * Mutable fields of a published row (status, cancelledAt) are guarded by the
 * row lock of the booking's class, never by LEDGER_APPEND.
 */
struct SharedLedgerState {
    Booking bookings[Flags::Store::MAX_BOOKINGS];
    uint32_t bookingCount;
    uint32_t capacity; // Usable rows, <= MAX_BOOKINGS

    SharedLedgerState() : bookings{}, bookingCount{0}, capacity{Flags::Store::MAX_BOOKINGS} {
    }
};
