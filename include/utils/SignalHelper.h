#pragma once

#include <csignal>
#include <unistd.h>
#include "logging/Logger.h"

/**
 * @brief Signal handling utilities for the simulation processes.
 *
 * All handlers use only async-signal-safe operations.
 */
namespace SignalHelper {
    inline constexpr auto tag = "SignalHelper";

    /**
     * @brief Signal state flags.
     *
     * Uses volatile sig_atomic_t for safe access from signal handlers.
     */
    struct Flags {
        volatile sig_atomic_t exit{0}; ///< SIGTERM/SIGINT received (shutdown)
    };

    namespace detail {
        inline Flags *g_flags = nullptr;

        inline void handler(const int32_t sig) {
            // Async-signal-safe: flag assignment only
            if (!g_flags) return;
            if (sig == SIGTERM || sig == SIGINT) {
                g_flags->exit = 1;
            }
        }
    }

    /**
     * @brief Install SIGTERM/SIGINT handlers for the main process.
     * @param flags Flags updated by the handler
     *
     * The main loop polls the exit flag and shuts down in order.
     */
    inline void setup(Flags &flags) {
        detail::g_flags = &flags;

        struct sigaction sa{};
        sa.sa_handler = detail::handler;
        sigemptyset(&sa.sa_mask);

        sigaction(SIGTERM, &sa, nullptr);
        sigaction(SIGINT, &sa, nullptr);

        Logger::debug(Logger::Source::Other, tag, "setup done");
    }

    /**
     * @brief Install handlers for child processes (ignores SIGINT).
     * @param flags Flags updated by the handler
     *
     * Ctrl+C only reaches the main process, which stops children with SIGTERM.
     * No SA_RESTART: blocking semaphore waits return EINTR so loops see the flag.
     */
    inline void setupChildProcess(Flags &flags) {
        detail::g_flags = &flags;

        signal(SIGINT, SIG_IGN);

        struct sigaction sa{};
        sa.sa_handler = detail::handler;
        sigemptyset(&sa.sa_mask);
        sigaction(SIGTERM, &sa, nullptr);

        Logger::debug(Logger::Source::Other, tag, "child setup done (SIGINT ignored)");
    }

    /**
     * @brief Check if exit signal was received.
     * @param flags Reference to Flags structure
     * @return true if SIGTERM or SIGINT was received
     */
    inline bool shouldExit(const Flags &flags) {
        return flags.exit != 0;
    }
}
