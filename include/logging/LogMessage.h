#pragma once

#include <cstdint>
#include <sys/time.h>

#include "core/Constants.h"

/**
 * One log record on its way from a store process to logger_process.
 *
 * The message queue type (mtype) carries sequenceNum, so msgrcv with a
 * negative type hands records to the sink in global order.
 */
struct LogMessage {
    uint64_t sequenceNum; // Taken under LOG_SEQUENCE, starts at 1
    struct timeval timestamp; // Sender's wall clock

    uint8_t level; // Logger::Level of the record
    uint8_t source; // Logger::Source of the sender
    char tag[Constants::Logging::TAG_LENGTH]; // "Member 5", "Engine", ...
    char text[Constants::Logging::TEXT_LENGTH];

    LogMessage() : sequenceNum{0}, timestamp{}, level{1}, source{0}, tag{}, text{} {}

    /** Level index safe for lookup tables, whatever the sender wrote. */
    uint8_t safeLevel() const {
        return level < Constants::Logging::LEVEL_COUNT ? level : Constants::Logging::LEVEL_COUNT - 1;
    }
};
