#pragma once

#include <cstdint>
#include <ctime>
#include <string>

#include "catalog/ClassCategory.h"
#include "core/Constants.h"

/**
 * @brief Operator input for creating or editing a class.
 */
struct ClassDefinition {
    std::string name;
    ClassCategory category{ClassCategory::YOGA};
    std::string instructor;
    time_t startTime{0};
    uint32_t durationMinutes{0};
    uint32_t totalSlots{0};
};

/**
 * @brief A scheduled, capacity-bounded class (one catalog row).
 *
 * Plain data, lives in shared memory. availableSlots is only written by the
 * reservation engine while it holds the row lock; it always equals
 * totalSlots minus the number of Confirmed bookings of this class.
 */
struct ClassSession {
    uint32_t id;
    char name[Constants::Catalog::MAX_TEXT_LENGTH];
    ClassCategory category;
    char instructor[Constants::Catalog::MAX_TEXT_LENGTH];
    time_t startTime; // Absolute start (epoch seconds)
    uint32_t durationMinutes;
    uint32_t totalSlots; // Changed only by operator edits, never below confirmed bookings
    uint32_t availableSlots; // 0 <= availableSlots <= totalSlots
    time_t createdAt;
    time_t updatedAt;
    bool removed; // Operator deleted; ids are never reused

    ClassSession()
        : id{0}, name{}, category{ClassCategory::YOGA}, instructor{},
          startTime{0}, durationMinutes{0}, totalSlots{0}, availableSlots{0},
          createdAt{0}, updatedAt{0}, removed{false} {
    }

    /** @brief Start time lies strictly after now. */
    bool isUpcoming(const time_t now) const { return startTime > now; }

    /** @brief A seat can still be reserved. */
    bool isBookable(const time_t now) const { return isUpcoming(now) && availableSlots > 0; }

    /** @brief Number of seats currently held by Confirmed bookings. */
    uint32_t reservedSlots() const { return totalSlots - availableSlots; }
};
