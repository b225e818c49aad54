#pragma once

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

/**
 * @brief Exception type for IPC-related errors.
 *
 * Thrown when System V IPC operations fail (shmget, semget, semop, msgget, ...).
 * Captures errno at the throw site so callers can log the system reason.
 */
class ipc_exception : public std::runtime_error {
public:
    /**
     * @brief Construct exception with the current errno.
     * @param message Error description
     */
    explicit ipc_exception(const std::string &message)
        : ipc_exception(message, errno) {
    }

    /**
     * @brief Construct exception with an explicit system error code.
     * @param message Error description
     * @param errorCode errno value describing the failure (0 if none)
     */
    ipc_exception(const std::string &message, const int errorCode)
        : std::runtime_error(errorCode != 0 ? message + ": " + strerror(errorCode) : message),
          errorCode_{errorCode} {
    }

    /** @brief errno value captured when the exception was created. */
    int errorCode() const noexcept { return errorCode_; }

private:
    int errorCode_;
};
