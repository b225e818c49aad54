#pragma once

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>
#include <unistd.h>
#include <sys/wait.h>

/**
 * @brief Process lifecycle management utilities.
 *
 * Provides functions for spawning, terminating, and waiting for child processes
 * using fork/exec. All waits handle EINTR.
 */
namespace ProcessSpawner {
    /**
     * @brief Get the full path to an executable in the same directory as current process.
     * @param processName Name of the target executable
     * @return Full path to the executable
     *
     * Resolves the /proc/self/exe symlink.
     */
    inline std::string getExecutablePath(const char *processName) {
        char path[1024];
        ssize_t len = readlink("/proc/self/exe", path, sizeof(path) - 1);
        if (len == -1) {
            return std::string("./") + processName;
        }
        path[len] = '\0';

        // Replace executable name with target process name
        if (char *lastSlash = strrchr(path, '/'); lastSlash != nullptr) {
            *(lastSlash + 1) = '\0';
            return std::string(path) + processName;
        }
        return std::string("./") + processName;
    }

    /**
     * Spawn a new process using fork/exec.
     * Parent process returns immediately with child PID.
     *
     * @param processName Name of the executable
     * @param args Vector of command-line arguments (excluding program name)
     * @return Child PID on success, -1 on failure
     */
    inline pid_t spawn(const char *processName, const std::vector<std::string> &args) {
        const pid_t pid = fork();
        if (pid == -1) {
            perror("fork");
            return -1;
        }

        if (pid == 0) {
            const std::string processPath = getExecutablePath(processName);

            // Build argv array (program name + args + nullptr)
            std::vector<char *> argv;
            argv.push_back(const_cast<char *>(processName));
            for (const auto &arg: args) {
                argv.push_back(const_cast<char *>(arg.c_str()));
            }
            argv.push_back(nullptr);

            execv(processPath.c_str(), argv.data());
            perror("execv");
            _exit(1); // Use _exit in child after fork
        }

        return pid;
    }

    /**
     * Spawn a process with three IPC keys (logger pattern).
     */
    inline pid_t spawnWithKeys(const char *processName, const key_t key1, const key_t key2, const key_t key3) {
        return spawn(processName, {
                         std::to_string(key1),
                         std::to_string(key2),
                         std::to_string(key3)
                     });
    }

    /**
     * Send SIGTERM to multiple processes.
     */
    inline void terminateAll(const std::vector<pid_t> &pids) {
        for (const pid_t pid: pids) {
            if (pid > 0) {
                kill(pid, SIGTERM);
            }
        }
    }

    /**
     * Wait for a specific process to exit (blocking).
     * Handles ECHILD (already reaped) and EINTR (interrupted by signal).
     * @return Raw wait status, or -1 if the child could not be waited for
     */
    inline int waitFor(const pid_t pid) {
        if (pid <= 0) return -1;
        int status = 0;
        while (waitpid(pid, &status, 0) == -1) {
            if (errno == ECHILD) return -1;
            if (errno == EINTR) continue;
            perror("waitpid");
            return -1;
        }
        return status;
    }

    /**
     * Wait for every listed process.
     */
    inline void waitForAll(const std::vector<pid_t> &pids) {
        for (const pid_t pid: pids) {
            waitFor(pid);
        }
    }
} // namespace ProcessSpawner
