#pragma once

#include <cstdint>

#include "identity/Principal.h"
#include "reservation/Booking.h"

/**
 * @brief Authorization policy of the reservation store.
 *
 * Read operations are open to every authenticated principal.
 */
namespace Permission {
    enum class Decision : uint8_t {
        ALLOW,
        DENY
    };

    constexpr const char *toString(const Decision decision) {
        return decision == Decision::ALLOW ? "ALLOW" : "DENY";
    }

    /**
     * @brief Administrators may cancel any booking, members only their own.
     */
    inline Decision authorizeCancellation(const Principal &actor, const Booking &booking) {
        if (actor.isAdministrator || actor.userId == booking.userId) {
            return Decision::ALLOW;
        }
        return Decision::DENY;
    }

    /**
     * @brief Creating, editing and removing classes and the catalog statistics.
     */
    inline Decision authorizeCatalogAdministration(const Principal &actor) {
        return actor.isAdministrator ? Decision::ALLOW : Decision::DENY;
    }

    /**
     * @brief Booking listings of another user need an administrator.
     */
    inline Decision authorizeBookingQuery(const Principal &actor, const uint32_t userId) {
        if (actor.isAdministrator || actor.userId == userId) {
            return Decision::ALLOW;
        }
        return Decision::DENY;
    }
}
