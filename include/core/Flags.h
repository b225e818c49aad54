#pragma once

#include <cstdint>

/**
 * @brief Compile-time flags.
 *
 * These values must be constexpr because they are used:
 * - For array sizes in shared memory (MAX_CLASSES, MAX_BOOKINGS, MAX_MEMBERS)
 * - For the size of the semaphore set (one row lock per class)
 * - With if constexpr for conditional compilation (logging)
 */
namespace Flags {

    namespace Store {
        constexpr uint32_t MAX_CLASSES{128}; // Catalog rows, also the number of row locks
        constexpr uint32_t MAX_BOOKINGS{8192}; // Ledger rows (runtime capacity may be lower)
        constexpr uint32_t MAX_MEMBERS{256}; // Member activity records
    }

    namespace Logging {
        constexpr bool IS_DEBUG_ENABLED{false};
        constexpr bool IS_INFO_ENABLED{true};
        constexpr bool IS_WARN_ENABLED{true};
        constexpr bool IS_ERROR_ENABLED{true};
    }

}
