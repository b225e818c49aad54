#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * @brief Failure kinds surfaced by the catalog, the engine and the gateway.
 *
 * Every kind except StorageError and LockTimeout is detected before any
 * write, so the store is unchanged when it is thrown. StorageError and
 * LockTimeout are safe to retry: each attempt re-validates under a fresh lock.
 */
enum class ReservationError : uint8_t {
    InvalidDefinition, // Bad class definition (slots, start time, texts)
    ClassNotFound,
    BookingNotFound,
    ClassUnavailable, // Class started or no slot left
    DuplicateBooking, // User already holds a Confirmed booking for the class
    StorageError, // Transaction could not complete (table full, IPC failure)
    LockTimeout, // Row lock not acquired within SLOTBOOK_LOCK_TIMEOUT_MS
    PermissionDenied // Actor may not perform the operation
};

/**
 * @brief Convert ReservationError enum to string representation.
 */
constexpr const char *toString(const ReservationError error) {
    switch (error) {
        case ReservationError::InvalidDefinition: return "InvalidDefinition";
        case ReservationError::ClassNotFound: return "ClassNotFound";
        case ReservationError::BookingNotFound: return "BookingNotFound";
        case ReservationError::ClassUnavailable: return "ClassUnavailable";
        case ReservationError::DuplicateBooking: return "DuplicateBooking";
        case ReservationError::StorageError: return "StorageError";
        case ReservationError::LockTimeout: return "LockTimeout";
        case ReservationError::PermissionDenied: return "PermissionDenied";
        default: throw std::invalid_argument("Invalid ReservationError value");
    }
}

/**
 * @brief Exception type for reservation failures.
 *
 * Carries the failure kind so the gateway can map it to a reply status.
 */
class reservation_exception : public std::runtime_error {
public:
    reservation_exception(const ReservationError error, const std::string &message)
        : std::runtime_error(message), error_{error} {
    }

    ReservationError error() const noexcept { return error_; }

private:
    ReservationError error_;
};
