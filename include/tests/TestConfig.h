#pragma once

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <string>
#include <vector>

#include "core/Flags.h"
#include "reservation/ReservationError.h"

namespace Test {
    class TestContext;

    /**
     * Test environment configuration.
     * Sets env vars to override Config values for testing.
     */
    struct TestEnvConfig {
        uint32_t lockTimeoutMs = 2000;
        uint32_t ledgerCapacity = Flags::Store::MAX_BOOKINGS;
        uint32_t statsWindowDays = 30;

        void apply() const {
            setenv("SLOTBOOK_LOCK_TIMEOUT_MS", std::to_string(lockTimeoutMs).c_str(), 1);
            setenv("SLOTBOOK_LEDGER_CAPACITY", std::to_string(ledgerCapacity).c_str(), 1);
            setenv("SLOTBOOK_STATS_WINDOW_DAYS", std::to_string(statsWindowDays).c_str(), 1);
            // Members and run time are not used - scenarios drive the store directly
            setenv("SLOTBOOK_NUM_MEMBERS", "0", 1);
            setenv("SLOTBOOK_DURATION_US", "0", 1);
        }
    };

    /**
     * Test result structure
     */
    struct TestResult {
        std::string testName;
        bool passed;
        std::vector<std::string> failures;
        std::vector<std::string> warnings;

        // Metrics collected
        uint32_t bookingsCommitted;
        uint32_t cancellations;
        uint32_t invariantViolations;
        uint32_t zombieProcesses;
        uint64_t durationMs;

        TestResult() : passed{true}, bookingsCommitted{0}, cancellations{0}, invariantViolations{0},
                       zombieProcesses{0}, durationMs{0} {
        }

        void addFailure(const std::string &msg) {
            failures.push_back(msg);
            passed = false;
        }

        void addWarning(const std::string &msg) {
            warnings.push_back(msg);
        }

        /** Record a failure unless cond holds. */
        bool check(const bool cond, const std::string &msg) {
            if (!cond) {
                addFailure(msg);
            }
            return cond;
        }

        /** Compare two counts, reporting both values on mismatch. */
        template<typename A, typename B>
        bool checkEq(const A &actual, const B &expected, const std::string &what) {
            if (actual == expected) {
                return true;
            }
            addFailure(what + ": expected " + std::to_string(expected) + ", got " + std::to_string(actual));
            return false;
        }

        /**
         * Run fn and require it to throw reservation_exception of the given kind.
         */
        template<typename Fn>
        bool checkThrows(const ReservationError expected, Fn fn, const std::string &what) {
            try {
                fn();
            } catch (const reservation_exception &e) {
                if (e.error() == expected) {
                    return true;
                }
                addFailure(what + ": expected " + toString(expected) + ", got " + toString(e.error()) +
                           " (" + e.what() + ")");
                return false;
            }
            addFailure(what + ": expected " + toString(expected) + ", nothing thrown");
            return false;
        }
    };

    /**
     * Test scenario configuration
     */
    struct TestScenario {
        std::string name;
        std::string description;
        TestEnvConfig env; // Environment configuration for this test
        bool checkInvariants{true}; // Run TestValidator over the store afterwards
        std::function<void(TestContext &, TestResult &)> body;
    };

    /**
     * Scenario groups, one per test source file.
     */
    namespace Scenarios {
        std::vector<TestScenario> catalogTests();

        std::vector<TestScenario> reservationTests();

        std::vector<TestScenario> concurrencyTests();

        std::vector<TestScenario> gatewayTests();

        /** All scenarios in execution order. */
        inline std::vector<TestScenario> all() {
            std::vector<TestScenario> scenarios;
            for (auto group: {catalogTests(), reservationTests(), concurrencyTests(), gatewayTests()}) {
                for (auto &scenario: group) {
                    scenarios.push_back(std::move(scenario));
                }
            }
            return scenarios;
        }
    }
}
