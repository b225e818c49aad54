#pragma once

#include <cstdint>
#include <ctime>
#include <cstdio>

/**
 * Helpers for wall-clock timestamps of classes and bookings.
 * All stored times are epoch seconds; formatting uses local time.
 */
namespace TimeHelper {
    /** Current wall-clock time in epoch seconds. */
    inline time_t now() {
        return time(nullptr);
    }

    /**
     * Format a timestamp as "dd/mm/YYYY HH:MM" (local time).
     * @param t Epoch seconds (0 formats as "-")
     * @param buffer Output buffer, at least 17 bytes
     * @param size Size of buffer
     */
    inline void formatDateTime(const time_t t, char *buffer, const size_t size) {
        if (t == 0) {
            snprintf(buffer, size, "-");
            return;
        }
        struct tm local{};
        localtime_r(&t, &local);
        strftime(buffer, size, "%d/%m/%Y %H:%M", &local);
    }

    /**
     * Start of the local calendar day containing t.
     */
    inline time_t startOfDay(const time_t t) {
        struct tm local{};
        localtime_r(&t, &local);
        local.tm_hour = 0;
        local.tm_min = 0;
        local.tm_sec = 0;
        local.tm_isdst = -1;
        return mktime(&local);
    }

    /**
     * Check whether two timestamps fall on the same local calendar day.
     */
    inline bool isSameDay(const time_t a, const time_t b) {
        return startOfDay(a) == startOfDay(b);
    }
}
