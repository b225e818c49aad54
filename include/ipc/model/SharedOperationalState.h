#pragma once

#include <sys/types.h>
#include <ctime>
#include <cstdint>

// ============================================================================
// OPERATIONAL STATE
// ============================================================================

/**
 * Lifecycle flags and process bookkeeping.
 *
 * OWNERSHIP: Orchestrator writes everything before members start, except
 * logSequenceNum (LOG_SEQUENCE latch).
 */
struct SharedOperationalState {
    bool acceptingRequests; // Members stop issuing requests once cleared
    time_t openingTime; // When the store was initialized
    time_t closingTime; // Planned end of the load run
    uint32_t memberCount; // Number of member activity records in use
    pid_t loggerPid;

    uint64_t logSequenceNum; // Global log sequence counter for ordering

    SharedOperationalState()
        : acceptingRequests{false},
          openingTime{0},
          closingTime{0},
          memberCount{0},
          loggerPid{0},
          logSequenceNum{0} {
    }
};
