#pragma once

#include <cstdlib>
#include <cstdint>
#include <cstdio>
#include <unistd.h>
#include <sys/types.h>

/**
 * @brief Command-line argument parsing utilities.
 *
 * Provides type-safe parsing for process arguments and validation
 * for the logger and member processes.
 */
namespace ArgumentParser {
    namespace detail {
        /**
         * @brief Write error message to stderr.
         * @param msg Error message to display
         */
        inline void err(const char *msg) {
            char buf[256];
            int n = snprintf(buf, sizeof(buf), "Error: %s\n", msg);
            ssize_t written = write(STDERR_FILENO, buf, n);
            (void) written;
        }

        /**
         * @brief Write usage message to stderr.
         * @param program Program name (argv[0])
         * @param args Expected arguments description
         */
        inline void usage(const char *program, const char *args) {
            char buf[256];
            int n = snprintf(buf, sizeof(buf), "Usage: %s %s\n", program, args);
            ssize_t written = write(STDERR_FILENO, buf, n);
            (void) written;
        }
    }

    /**
     * @brief Parse string to uint32_t.
     * @param str Input string
     * @param out Output value
     * @return true if parsing succeeded, false otherwise
     */
    inline bool parseUint32(const char *str, uint32_t &out) {
        char *end;
        out = static_cast<uint32_t>(strtoul(str, &end, 10));
        return *end == '\0' && end != str;
    }

    /**
     * @brief Parse string to key_t (IPC key).
     * @param str Input string
     * @param out Output key value
     * @return true if parsing succeeded, false otherwise
     */
    inline bool parseKeyT(const char *str, key_t &out) {
        char *end;
        out = static_cast<key_t>(strtol(str, &end, 10));
        return *end == '\0' && end != str;
    }

    /**
     * @brief Parse string to boolean (0 or 1).
     * @param str Input string ("0" or "1")
     * @param out Output boolean value
     * @return true if parsing succeeded (valid 0 or 1), false otherwise
     */
    inline bool parseBool(const char *str, bool &out) {
        char *end;
        long val = strtol(str, &end, 10);
        if (*end != '\0' || end == str || val < 0 || val > 1) return false;
        out = (val == 1);
        return true;
    }

    // ==================== Argument Structures ====================

    /**
     * @brief Arguments for the logger process.
     */
    struct LoggerArgs {
        key_t shmKey; ///< Shared memory key
        key_t semKey; ///< Semaphore set key
        key_t logMsgKey; ///< Log message queue key
    };

    /**
     * @brief Arguments for member processes.
     */
    struct MemberArgs {
        uint32_t slot; ///< Index of the member's activity record
        uint32_t userId;
        bool isAdministrator;
        key_t shmKey;
        key_t semKey;
        key_t logMsgKey;
    };

    // ==================== Parsers ====================

    /**
     * @brief Parse command-line arguments for the logger process.
     * @param argc Argument count
     * @param argv Argument values
     * @param args Output LoggerArgs structure
     * @return true if all arguments were parsed successfully, false otherwise
     *
     * Expected: <shmKey> <semKey> <logMsgKey>
     */
    inline bool parseLoggerArgs(int argc, char *argv[], LoggerArgs &args) {
        if (argc != 4) {
            detail::usage(argv[0], "<shmKey> <semKey> <logMsgKey>");
            return false;
        }
        if (!parseKeyT(argv[1], args.shmKey)) {
            detail::err("Invalid shmKey");
            return false;
        }
        if (!parseKeyT(argv[2], args.semKey)) {
            detail::err("Invalid semKey");
            return false;
        }
        if (!parseKeyT(argv[3], args.logMsgKey)) {
            detail::err("Invalid logMsgKey");
            return false;
        }
        return true;
    }

    /**
     * @brief Parse command-line arguments for a member process.
     * @param argc Argument count
     * @param argv Argument values
     * @param args Output MemberArgs structure
     * @return true if all arguments were parsed successfully, false otherwise
     *
     * Expected: <slot> <userId> <isAdmin> <shmKey> <semKey> <logMsgKey>
     */
    inline bool parseMemberArgs(int argc, char *argv[], MemberArgs &args) {
        if (argc != 7) {
            detail::usage(argv[0], "<slot> <userId> <isAdmin> <shmKey> <semKey> <logMsgKey>");
            return false;
        }
        if (!parseUint32(argv[1], args.slot)) {
            detail::err("Invalid slot");
            return false;
        }
        if (!parseUint32(argv[2], args.userId) || args.userId == 0) {
            detail::err("Invalid userId (must be > 0)");
            return false;
        }
        if (!parseBool(argv[3], args.isAdministrator)) {
            detail::err("Invalid isAdmin (0-1)");
            return false;
        }
        if (!parseKeyT(argv[4], args.shmKey)) {
            detail::err("Invalid shmKey");
            return false;
        }
        if (!parseKeyT(argv[5], args.semKey)) {
            detail::err("Invalid semKey");
            return false;
        }
        if (!parseKeyT(argv[6], args.logMsgKey)) {
            detail::err("Invalid logMsgKey");
            return false;
        }
        return true;
    }
}
