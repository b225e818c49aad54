#pragma once

#include <cstdint>
#include <sys/types.h>

/**
 * Outcome tallies of one member process.
 * Single writer (the member itself); read by the orchestrator after the member exits.
 */
struct MemberActivityRecord {
    uint32_t userId;
    bool isAdministrator;
    pid_t pid;
    uint32_t requests;
    uint32_t booked;
    uint32_t cancelled;
    uint32_t cancelNoOps;
    uint32_t rejectedUnavailable;
    uint32_t rejectedDuplicate;
    uint32_t rejectedNotFound;
    uint32_t storageErrors;
    bool finished;

    MemberActivityRecord()
        : userId{0}, isAdministrator{false}, pid{0}, requests{0}, booked{0}, cancelled{0},
          cancelNoOps{0}, rejectedUnavailable{0}, rejectedDuplicate{0}, rejectedNotFound{0},
          storageErrors{0}, finished{false} {
    }
};
