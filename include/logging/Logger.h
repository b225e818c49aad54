#pragma once

#include <unistd.h>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <ctime>
#include <sys/time.h>
#include <sys/types.h>

#include "core/Flags.h"
#include "logging/LogMessage.h"

// Forward declarations to avoid circular includes
class Semaphore;
template<typename T>
class MessageQueue;
struct SharedReservationState;
template<typename T>
class SharedMemory;

/**
 * @brief Centralized and decentralized logging system.
 *
 * Provides logging with support for both direct output and centralized
 * logging through a message queue to a dedicated logger process.
 * Logs include wall-clock time, color-coded sources, and log levels.
 */
namespace Logger {
    /**
     * @brief Log severity levels.
     */
    enum class Level {
        DEBUG, ///< Detailed technical information
        INFO,  ///< Business logic events
        WARN,  ///< Warning conditions
        ERROR  ///< Error conditions
    };

    /**
     * @brief Log message source identifiers.
     */
    enum class Source : uint8_t {
        Catalog, ///< Class catalog (definitions, row locks)
        Engine,  ///< Reservation engine (booking transactions)
        Gateway, ///< Request gateway (identity, permissions)
        Member,  ///< Member process
        Other    ///< Orchestrator and utilities
    };

    namespace detail {
        constexpr const char *names[] = {"DEBUG", "INFO ", "WARN ", "ERROR"};

        inline const char *getTagColor(Source source, Level level) {
            if (level == Level::ERROR) return "\033[31m";
            switch (source) {
                case Source::Catalog: return "\033[36m";
                case Source::Engine: return "\033[35m";
                case Source::Gateway: return "\033[33m";
                case Source::Member: return "\033[32m";
                default: return "\033[37m";
            }
        }

        // Centralized logging state
        inline bool centralizedMode = false;
        inline MessageQueue<LogMessage> *logQueue = nullptr;
        inline Semaphore *sem = nullptr;
        inline SharedMemory<SharedReservationState> *shm = nullptr;

        /** Format wall-clock time string ([HH:MM:SS.mmm]) */
        inline void formatTime(const struct timeval &tv, char *buffer, size_t size) {
            struct tm local{};
            localtime_r(&tv.tv_sec, &local);
            snprintf(buffer, size, "[%02d:%02d:%02d.%03ld]",
                     local.tm_hour, local.tm_min, local.tm_sec,
                     static_cast<long>(tv.tv_usec / 1000));
        }

        // Direct logging (used when not in centralized mode or by LoggerProcess)
        template<typename... Args>
        void logDirect(const Source source, Level level, const char *tag, const char *message, Args... args) {
            char buf[512];
            char timeBuf[20];
            struct timeval now{};
            gettimeofday(&now, nullptr);
            formatTime(now, timeBuf, sizeof(timeBuf));

            const char *color = getTagColor(source, level);
            int n = snprintf(buf, sizeof(buf), "\033[90m%s\033[0m %s[%s] [%s]\033[0m ",
                             timeBuf,
                             color,
                             names[static_cast<int>(level)],
                             tag);
            if constexpr (sizeof...(args) == 0) {
                n += snprintf(buf + n, sizeof(buf) - n, "%s", message);
            } else {
                n += snprintf(buf + n, sizeof(buf) - n, message, args...);
            }
            if (n > static_cast<int>(sizeof(buf)) - 1) {
                n = sizeof(buf) - 1;
            }
            buf[n++] = '\n';
            ssize_t written = write(STDOUT_FILENO, buf, n);
            (void) written;
        }

        void sendToQueue(Source source, Level level, const char *tag, const char *text);

        template<typename... Args>
        void log(Source source, Level level, const char *tag, const char *message, Args... args) {
            if (centralizedMode && logQueue != nullptr) {
                // Format message
                char text[Constants::Logging::TEXT_LENGTH];
                if constexpr (sizeof...(args) == 0) {
                    snprintf(text, sizeof(text), "%s", message);
                } else {
                    snprintf(text, sizeof(text), message, args...);
                }
                sendToQueue(source, level, tag, text);
            } else {
                logDirect(source, level, tag, message, args...);
            }
        }
    }

    /**
     * @brief Initialize centralized logging mode.
     * @param shmKey Shared memory key for accessing the log sequence counter
     * @param semKey Semaphore key for synchronization
     * @param logQueueKey Message queue key for log messages
     *
     * After calling this, all log messages are sent to the logger process
     * via message queue instead of being printed directly. Falls back to
     * direct logging if any resource cannot be attached.
     */
    void initCentralized(key_t shmKey, key_t semKey, key_t logQueueKey);

    /**
     * @brief Cleanup centralized logging resources.
     *
     * Switches back to direct logging mode and releases IPC resources.
     */
    void cleanupCentralized();

    /**
     * @brief Log a debug message.
     * @param source Source component identifier
     * @param tag Short identifier (e.g., "Member 5")
     * @param message Format string (printf-style)
     * @param args Format arguments
     *
     * Debug messages are for technical details, disabled by default.
     */
    template<typename... Args>
    void debug(Source source, const char *tag, const char *message, Args... args) {
        if constexpr (Flags::Logging::IS_DEBUG_ENABLED) {
            detail::log(source, Level::DEBUG, tag, message, args...);
        }
    }

    /** @brief Log a debug message from Source::Other. */
    template<typename... Args>
    void debug(const char *tag, const char *message, Args... args) {
        debug(Source::Other, tag, message, args...);
    }

    /**
     * @brief Log an info message.
     * @param source Source component identifier
     * @param tag Short identifier (e.g., "Member 5")
     * @param message Format string (printf-style)
     * @param args Format arguments
     *
     * Info messages are for business events (bookings, cancellations).
     */
    template<typename... Args>
    void info(Source source, const char *tag, const char *message, Args... args) {
        if constexpr (Flags::Logging::IS_INFO_ENABLED) {
            detail::log(source, Level::INFO, tag, message, args...);
        }
    }

    /** @brief Log an info message from Source::Other. */
    template<typename... Args>
    void info(const char *tag, const char *message, Args... args) {
        info(Source::Other, tag, message, args...);
    }

    /**
     * @brief Log a warning message.
     * @param source Source component identifier
     * @param tag Short identifier
     * @param message Format string (printf-style)
     * @param args Format arguments
     *
     * Warning messages indicate rejected requests or recoverable issues.
     */
    template<typename... Args>
    void warn(Source source, const char *tag, const char *message, Args... args) {
        if constexpr (Flags::Logging::IS_WARN_ENABLED) {
            detail::log(source, Level::WARN, tag, message, args...);
        }
    }

    /** @brief Log a warning message from Source::Other. */
    template<typename... Args>
    void warn(const char *tag, const char *message, Args... args) {
        warn(Source::Other, tag, message, args...);
    }

    /**
     * @brief Log an error message.
     * @param source Source component identifier
     * @param tag Short identifier
     * @param message Format string (printf-style)
     * @param args Format arguments
     *
     * Error messages indicate failures that need attention.
     */
    template<typename... Args>
    void error(Source source, const char *tag, const char *message, Args... args) {
        if constexpr (Flags::Logging::IS_ERROR_ENABLED) {
            detail::log(source, Level::ERROR, tag, message, args...);
        }
    }

    /** @brief Log an error message from Source::Other. */
    template<typename... Args>
    void error(const char *tag, const char *message, Args... args) {
        error(Source::Other, tag, message, args...);
    }

    /**
     * @brief Log a POSIX error with errno description.
     * @param source Source component identifier
     * @param tag Short identifier
     * @param message Context message
     *
     * Appends strerror(errno) to the message.
     */
    inline void perror(Source source, const char *tag, const char *message) {
        if constexpr (Flags::Logging::IS_ERROR_ENABLED) {
            detail::log(source, Level::ERROR, tag, "%s: %s", message, strerror(errno));
        }
    }

    /**
     * @brief Log a state transition.
     * @param source Source component identifier
     * @param tag Short identifier
     * @param from Previous state name
     * @param to New state name
     */
    inline void stateChange(Source source, const char *tag, const char *from, const char *to) {
        if constexpr (Flags::Logging::IS_INFO_ENABLED) {
            detail::log(source, Level::INFO, tag, "%s -> %s", from, to);
        }
    }

    /**
     * @brief Print a visual separator line.
     * @param ch Character to use for the line
     * @param count Number of characters in the line
     */
    inline void separator(char ch = '-', int count = 60) {
        char buf[128];
        int n = (count < 127) ? count : 127;
        memset(buf, ch, n);
        buf[n++] = '\n';
        ssize_t written = write(STDOUT_FILENO, buf, n);
        (void) written;
    }
}
