#pragma once

#include <cstdint>
#include <vector>

#include "catalog/ClassSession.h"
#include "ipc/model/SharedReservationState.h"
#include "reservation/Statistics.h"

/**
 * @brief End-of-run report of the load simulation.
 */
namespace Report {
    /**
     * Everything the report prints, collected after all members exited.
     */
    struct Data {
        CatalogStatistics statistics;
        std::vector<ClassSession> classes; // All issued classes, removed included
        std::vector<InvariantViolation> violations;
        const SharedReservationState *state{nullptr}; // Member activity records
    };

    /**
     * @brief Write the report to an open file descriptor.
     * @param fd Destination (stdout or a report file)
     * @param data Report contents
     */
    void write(int fd, const Data &data);

    /**
     * @brief Write the report to a file.
     * @param path Output path (truncated)
     * @return true on success
     */
    bool save(const char *path, const Data &data);
}
