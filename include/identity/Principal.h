#pragma once

#include <cstdint>

/**
 * @brief Authenticated caller of a reservation request.
 *
 * Supplied by the identity layer; the store trusts it as given.
 */
struct Principal {
    uint32_t userId{0};
    bool isAdministrator{false};
};
