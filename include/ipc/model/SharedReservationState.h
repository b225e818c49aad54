#pragma once

#include "SharedCatalogState.h"
#include "SharedLedgerState.h"
#include "SharedOperationalState.h"
#include "core/Flags.h"
#include "stats/MemberActivityRecord.h"

// ============================================================================
// MAIN SHARED MEMORY STRUCTURE
// ============================================================================

/**
 * Main shared memory structure of the reservation store.
 *
 * Shared across all processes via System V shared memory. Access rules:
 * - catalog.rows[i]: row lock of class i + 1 (Semaphore::rowLock)
 * - catalog.classCount: CATALOG_APPEND
 * - ledger.bookingCount: LEDGER_APPEND
 * - ledger.bookings[j] status/cancelledAt: row lock of bookings[j].classId
 * - members[k]: written only by member k
 *
 * Lock ordering: row lock -> LEDGER_APPEND. CATALOG_APPEND is never held
 * together with any other lock.
 *
 * OWNERSHIP/RESPONSIBILITY:
 * - Orchestrator: creates and initializes, seeds the catalog, reads the report
 * - ClassCatalog: class rows and their locks
 * - ReservationEngine: bookings, availableSlots
 * - Members: their own activity record
 */
struct SharedReservationState {
    SharedOperationalState operational;
    SharedCatalogState catalog;
    SharedLedgerState ledger;
    MemberActivityRecord members[Flags::Store::MAX_MEMBERS];

    SharedReservationState() = default;
};
