#pragma once

#include <cstdint>
#include <ctime>

#include "reservation/BookingStatus.h"

/**
 * @brief A user's reservation of one slot in a class (one ledger row).
 *
 * id, userId, classId and bookedAt never change after the row is published.
 * status and cancelledAt change once, under the row lock of classId.
 */
struct Booking {
    uint32_t id;
    uint32_t userId;
    uint32_t classId;
    BookingStatus status;
    time_t bookedAt;
    time_t cancelledAt; // 0 until cancelled

    Booking()
        : id{0}, userId{0}, classId{0}, status{BookingStatus::CONFIRMED},
          bookedAt{0}, cancelledAt{0} {
    }

    bool isConfirmed() const { return status == BookingStatus::CONFIRMED; }
};
