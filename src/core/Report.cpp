#include "core/Report.h"

#include <cstdarg>
#include <cstdio>
#include <fcntl.h>
#include <unistd.h>

#include "logging/Logger.h"
#include "utils/TimeHelper.h"

namespace {
    /** Write formatted string to file descriptor using POSIX write() */
    void writeToFd(const int fd, const char *format, ...) {
        char buf[256];
        va_list args;
        va_start(args, format);
        int len = vsnprintf(buf, sizeof(buf), format, args);
        va_end(args);
        if (len > static_cast<int>(sizeof(buf)) - 1) {
            len = sizeof(buf) - 1;
        }
        if (len > 0) {
            ssize_t written = ::write(fd, buf, len);
            (void) written;
        }
    }
}

namespace Report {
    void write(const int fd, const Data &data) {
        const auto &stats = data.statistics;

        writeToFd(fd, "SLOTBOOK RUN REPORT\n");
        writeToFd(fd, "===================\n\n");

        writeToFd(fd, "STATISTICS (last %u days)\n", stats.windowDays);
        writeToFd(fd, "  Classes:        %u\n", stats.totalClasses);
        writeToFd(fd, "  Bookings:       %u\n", stats.totalBookings);
        writeToFd(fd, "  Confirmed:      %u\n", stats.confirmedBookings);
        writeToFd(fd, "  Cancelled:      %u\n\n", stats.cancelledBookings);

        writeToFd(fd, "POPULAR CLASSES\n");
        for (const auto &entry: stats.popularClasses) {
            char when[32];
            TimeHelper::formatDateTime(entry.startTime, when, sizeof(when));
            writeToFd(fd, "  %-4u %-24s %-6s %-18s %s  %u booked\n",
                      entry.classId, entry.name.c_str(), toString(entry.category), entry.instructor.c_str(),
                      when, entry.confirmedBookings);
        }

        writeToFd(fd, "\nCLASSES\n");
        writeToFd(fd, "%-4s %-24s %-6s %-17s %-6s %-6s %-8s\n",
                  "Id", "Name", "Type", "Start", "Total", "Free", "State");
        writeToFd(fd, "--------------------------------------------------------------------------\n");
        for (const auto &session: data.classes) {
            char when[32];
            TimeHelper::formatDateTime(session.startTime, when, sizeof(when));
            writeToFd(fd, "%-4u %-24s %-6s %-17s %-6u %-6u %-8s\n",
                      session.id, session.name, toString(session.category), when,
                      session.totalSlots, session.availableSlots,
                      session.removed ? "removed" : (session.isUpcoming(TimeHelper::now()) ? "open" : "started"));
        }

        if (data.state != nullptr) {
            const auto &state = *data.state;
            writeToFd(fd, "\nMEMBERS\n");
            writeToFd(fd, "%-6s %-6s %-8s %-7s %-9s %-6s %-6s %-5s %-5s %-7s\n",
                      "User", "Admin", "Requests", "Booked", "Cancelled", "NoOp", "Full", "Dup", "404", "Storage");
            writeToFd(fd, "--------------------------------------------------------------------------\n");
            for (uint32_t i = 0; i < state.operational.memberCount; ++i) {
                const auto &record = state.members[i];
                writeToFd(fd, "%-6u %-6s %-8u %-7u %-9u %-6u %-6u %-5u %-5u %-7u%s\n",
                          record.userId,
                          record.isAdministrator ? "Yes" : "No",
                          record.requests,
                          record.booked,
                          record.cancelled,
                          record.cancelNoOps,
                          record.rejectedUnavailable,
                          record.rejectedDuplicate,
                          record.rejectedNotFound,
                          record.storageErrors,
                          record.finished ? "" : "  (did not finish)");
            }
        }

        writeToFd(fd, "\nAUDIT\n");
        if (data.violations.empty()) {
            writeToFd(fd, "  OK: slot accounting and booking uniqueness hold for every class\n");
        }
        for (const auto &violation: data.violations) {
            writeToFd(fd, "  class %u: %s\n", violation.classId, violation.description.c_str());
        }
    }

    bool save(const char *path, const Data &data) {
        const int fd = open(path, O_WRONLY | O_CREAT | O_TRUNC, 0644);
        if (fd == -1) {
            Logger::perror(Logger::Source::Other, "Report", "open report file");
            return false;
        }
        write(fd, data);
        close(fd);
        return true;
    }
}
