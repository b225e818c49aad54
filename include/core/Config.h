#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <string>

#include "core/Constants.h"
#include "core/Flags.h"

#ifndef SLOTBOOK_PROJECT_DIR
#define SLOTBOOK_PROJECT_DIR "."
#endif

/**
 * @brief Runtime configuration from environment variables.
 *
 * Call Config::loadEnvFile() before using config values.
 * For fixed domain constants, see Constants.h.
 * For compile-time flags, see Flags.h.
 */
namespace Config {
    namespace Runtime {
        /**
         * @brief Get uint32 environment variable with default fallback.
         * @param envName Name of the environment variable
         * @param defaultValue Value to return if variable is not set
         * @return Parsed uint32 value or default
         */
        inline uint32_t getEnvOr(const char *envName, uint32_t defaultValue) {
            const char *env = std::getenv(envName);
            if (!env) {
                return defaultValue;
            }
            return static_cast<uint32_t>(std::stoul(env));
        }

        /**
         * @brief Get required uint32 environment variable.
         * @param envName Name of the environment variable
         * @return Parsed uint32 value
         * @throws std::runtime_error If variable is not set
         */
        inline uint32_t getEnv(const char *envName) {
            const char *env = std::getenv(envName);
            if (!env) {
                throw std::runtime_error(std::string("Missing env: ") + envName);
            }
            return static_cast<uint32_t>(std::stoul(env));
        }

        /**
         * @brief Get required percentage (0-100) environment variable.
         * @param envName Name of the environment variable
         * @return Parsed value
         * @throws std::runtime_error If variable is not set or above 100
         */
        inline uint32_t getEnvPct(const char *envName) {
            const uint32_t v = getEnv(envName);
            if (v > 100) {
                throw std::runtime_error(std::string("Percentage out of range: ") + envName);
            }
            return v;
        }
    }

    /**
     * @brief Load configuration from slotbook.env file.
     *
     * Reads key=value pairs from the env file and sets them as environment
     * variables. Existing environment variables are not overwritten.
     *
     * @throws std::runtime_error If the env file cannot be opened
     */
    inline void loadEnvFile() {
        std::string path = std::string(SLOTBOOK_PROJECT_DIR) + "/slotbook.env";
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open: " + path);
        }

        std::string line;
        while (std::getline(file, line)) {
            if (line.empty() || line[0] == '#') {
                continue;
            }

            // Remove "export " prefix if present
            const std::string exportPrefix = "export ";
            if (line.compare(0, exportPrefix.size(), exportPrefix) == 0) {
                line = line.substr(exportPrefix.size());
            }

            auto eqPos = line.find('=');
            if (eqPos == std::string::npos) {
                continue;
            }

            std::string key = line.substr(0, eqPos);
            std::string value = line.substr(eqPos + 1);

            setenv(key.c_str(), value.c_str(), 0); // 0 = don't overwrite existing
        }
    }

    /**
     * @brief Time-related configuration values.
     */
    namespace Time {
        /** @brief One second in microseconds (1,000,000) */
        inline uint32_t ONE_SECOND_US() { return 1'000'000; }

        /** @brief Orchestrator polling interval in microseconds */
        inline uint32_t MAIN_LOOP_POLL_US() {
            static const uint32_t v = Runtime::getEnv("SLOTBOOK_MAIN_LOOP_POLL_US");
            return v;
        }

        /** @brief Base delay between two requests of one member in microseconds */
        inline uint32_t OPERATION_DELAY_BASE_US() {
            static const uint32_t v = Runtime::getEnv("SLOTBOOK_OPERATION_DELAY_BASE_US");
            return v;
        }

        /** @brief Random component added to the request delay in microseconds */
        inline uint32_t OPERATION_DELAY_RANDOM_US() {
            static const uint32_t v = Runtime::getEnv("SLOTBOOK_OPERATION_DELAY_RANDOM_US");
            return v;
        }
    }

    /**
     * @brief Storage layer parameters.
     *
     * Not cached: tests change them between scenarios in one process.
     */
    namespace Store {
        /** @brief Maximum time to wait for a class row lock in milliseconds */
        inline uint32_t LOCK_TIMEOUT_MS() {
            return Runtime::getEnv("SLOTBOOK_LOCK_TIMEOUT_MS");
        }

        /** @brief Usable ledger rows, capped at Flags::Store::MAX_BOOKINGS */
        inline uint32_t LEDGER_CAPACITY() {
            const uint32_t v = Runtime::getEnv("SLOTBOOK_LEDGER_CAPACITY");
            return v < Flags::Store::MAX_BOOKINGS ? v : Flags::Store::MAX_BOOKINGS;
        }
    }

    /**
     * @brief Load simulation parameters.
     */
    namespace Simulation {
        /** @brief Number of member processes to spawn */
        inline uint32_t NUM_MEMBERS() {
            static const uint32_t v = Runtime::getEnv("SLOTBOOK_NUM_MEMBERS");
            return v < Flags::Store::MAX_MEMBERS ? v : Flags::Store::MAX_MEMBERS;
        }

        /** @brief Total simulation duration in microseconds */
        inline uint32_t DURATION_US() {
            static const uint32_t v = Runtime::getEnv("SLOTBOOK_DURATION_US");
            return v;
        }

        /** @brief Chance (0-100) that a member cancels instead of booking */
        inline uint32_t CANCEL_PCT() {
            static const uint32_t v = Runtime::getEnvPct("SLOTBOOK_CANCEL_PCT");
            return v;
        }

        /** @brief Seconds until the short-notice demo class starts */
        inline uint32_t SHORT_NOTICE_SEC() {
            static const uint32_t v = Runtime::getEnv("SLOTBOOK_SHORT_NOTICE_SEC");
            return v;
        }
    }

    /**
     * @brief Reporting parameters.
     */
    namespace Report {
        /** @brief Look-back window of the admin statistics in days */
        inline uint32_t STATS_WINDOW_DAYS() {
            static const uint32_t v = Runtime::getEnv("SLOTBOOK_STATS_WINDOW_DAYS");
            return v;
        }
    }

    /**
     * @brief Validate all required configuration values.
     *
     * Attempts to load all configuration values, which will throw an exception
     * if any required environment variable is missing.
     *
     * @throws std::runtime_error If any required configuration is missing
     */
    inline void validate() {
        Time::MAIN_LOOP_POLL_US();
        Time::OPERATION_DELAY_BASE_US();
        Time::OPERATION_DELAY_RANDOM_US();
        Store::LOCK_TIMEOUT_MS();
        Store::LEDGER_CAPACITY();
        Simulation::NUM_MEMBERS();
        Simulation::DURATION_US();
        Simulation::CANCEL_PCT();
        Simulation::SHORT_NOTICE_SEC();
        Report::STATS_WINDOW_DAYS();
        // Logging flags are constexpr, no validation needed
    }
}
