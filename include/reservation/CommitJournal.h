#pragma once

#include <cstdint>
#include <sys/types.h>

/**
 * @brief Mutation recorded in a class row while a commit is applying.
 */
enum class JournalOp : uint8_t {
    NONE,
    BOOK,
    CANCEL,
    RESIZE,
    REMOVE
};

constexpr const char *toString(const JournalOp op) {
    switch (op) {
        case JournalOp::NONE: return "NONE";
        case JournalOp::BOOK: return "BOOK";
        case JournalOp::CANCEL: return "CANCEL";
        case JournalOp::RESIZE: return "RESIZE";
        case JournalOp::REMOVE: return "REMOVE";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Per-row intent record of an in-flight commit.
 *
 * Written under the row lock before the first in-place write of a commit and
 * cleared after the last one. Finding it active when taking the lock means
 * the previous holder died mid-commit (SEM_UNDO released its lock) and the
 * row must be repaired before use.
 */
struct CommitJournal {
    bool active;
    JournalOp op;
    uint32_t bookingId; // Booking touched by the commit (0 if none)
    pid_t holderPid;

    CommitJournal() : active{false}, op{JournalOp::NONE}, bookingId{0}, holderPid{0} {
    }
};
