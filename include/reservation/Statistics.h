#pragma once

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

#include "catalog/ClassCategory.h"

/**
 * @brief A class ranked by its number of Confirmed bookings.
 */
struct PopularClass {
    uint32_t classId{0};
    std::string name;
    ClassCategory category{ClassCategory::YOGA};
    std::string instructor;
    time_t startTime{0};
    uint32_t confirmedBookings{0};
};

/**
 * @brief Operator overview over a look-back window.
 *
 * Classes count when they start inside the window or later; bookings count
 * when they were made inside the window.
 */
struct CatalogStatistics {
    uint32_t windowDays{0};
    uint32_t totalClasses{0};
    uint32_t totalBookings{0};
    uint32_t confirmedBookings{0};
    uint32_t cancelledBookings{0};
    std::vector<PopularClass> popularClasses; // Most booked first
};

/**
 * @brief A future class a member holds a Confirmed booking for.
 */
struct UpcomingClass {
    uint32_t classId{0};
    uint32_t bookingId{0};
    std::string name;
    ClassCategory category{ClassCategory::YOGA};
    std::string instructor;
    time_t startTime{0};
    uint32_t durationMinutes{0};
};

/**
 * @brief Booking summary of one member.
 */
struct MemberStatistics {
    uint32_t userId{0};
    uint32_t confirmedBookings{0};
    uint32_t cancelledBookings{0};
    uint32_t upcomingClasses{0};
    std::vector<UpcomingClass> upcoming; // Soonest first
};

/**
 * @brief Consistency problem found by ReservationEngine::audit().
 */
struct InvariantViolation {
    uint32_t classId{0};
    std::string description;
};
