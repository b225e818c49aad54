#pragma once

#include <cstdint>

/**
 * @brief Fixed constants of the reservation domain.
 * Tunables that differ between runs belong in Config, not here.
 */
namespace Constants {
    namespace Catalog {
        constexpr uint32_t MAX_TEXT_LENGTH{100}; // Field capacity incl. terminator
        constexpr uint32_t MAX_NAME_LENGTH{MAX_TEXT_LENGTH - 1};
    }

    namespace Statistics {
        constexpr uint32_t POPULAR_CLASSES{5}; // Top classes in the admin report
        constexpr uint32_t UPCOMING_DETAILS{5}; // Upcoming classes in a member profile
        constexpr uint32_t SECONDS_PER_DAY{24 * 3600};
    }

    namespace Logging {
        constexpr uint32_t TAG_LENGTH{32};
        constexpr uint32_t TEXT_LENGTH{256};
        constexpr uint8_t LEVEL_COUNT{4}; // DEBUG, INFO, WARN, ERROR
    }

    namespace Queue {
        constexpr uint32_t LOG_QUEUE_CAPACITY{2000}; // Log queue slots before direct fallback
    }

    namespace Member {
        constexpr uint32_t FIRST_ADMIN_ID{1}; // Member 1 acts as the operator
    }
}
