#pragma once

#include <cstdint>
#include <stdexcept>

/**
 * @brief Booking lifecycle: CONFIRMED -> CANCELLED, exactly once.
 */
enum class BookingStatus : uint8_t {
    CONFIRMED,
    CANCELLED
};

/**
 * @brief Convert BookingStatus enum to string representation.
 * @param status BookingStatus to convert
 * @return "CONFIRMED" or "CANCELLED"
 */
constexpr const char *toString(const BookingStatus status) {
    switch (status) {
        case BookingStatus::CONFIRMED: return "CONFIRMED";
        case BookingStatus::CANCELLED: return "CANCELLED";
        default: throw std::invalid_argument("Invalid BookingStatus value");
    }
}
