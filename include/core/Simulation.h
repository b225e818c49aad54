#pragma once

#include <vector>
#include <memory>
#include <string>
#include <csignal>
#include <cstdio>
#include <unistd.h>

#include "catalog/ClassCatalog.h"
#include "core/Config.h"
#include "core/Report.h"
#include "gateway/ReservationGateway.h"
#include "ipc/IpcManager.h"
#include "logging/Logger.h"
#include "reservation/BookingLedger.h"
#include "reservation/ReservationEngine.h"
#include "utils/ProcessSpawner.h"
#include "utils/SignalHelper.h"
#include "utils/TimeHelper.h"

/**
 * @class Simulation
 * @brief Load run of the reservation store.
 *
 * Creates the store, seeds a class schedule, lets member processes book and
 * cancel concurrently for SLOTBOOK_DURATION_US, then audits the store and
 * writes the report.
 */
class Simulation {
public:
    /**
     * @return Process exit code: 0 clean, 1 setup failure, 2 audit violations
     */
    int run() {
        Logger::separator('=');
        Logger::info(tag_, "Slotbook Simulation");
        Logger::separator('=');

        SignalHelper::setup(signals_);

        int exitCode = 0;
        try {
            setup();
            mainLoop();
        } catch (const std::exception &e) {
            Logger::error(tag_, "Exception: %s", e.what());
            exitCode = 1;
        }

        const int shutdownCode = shutdown();
        return exitCode != 0 ? exitCode : shutdownCode;
    }

private:
    static constexpr auto tag_{"Simulation"};
    static constexpr auto reportPath_{"slotbook_report.txt"};
    static constexpr uint32_t loggerReadyTimeoutMs_{2000};

    std::unique_ptr<IpcManager> ipc_;
    std::unique_ptr<ClassCatalog> catalog_;
    std::unique_ptr<BookingLedger> ledger_;
    std::unique_ptr<ReservationEngine> engine_;
    std::unique_ptr<ReservationGateway> gateway_;
    SignalHelper::Flags signals_;

    pid_t loggerPid_{-1};
    std::vector<pid_t> memberPids_;
    time_t startTime_{0};

    void setup() {
        Logger::info(tag_, "Creating IPC...");
        ipc_ = std::make_unique<IpcManager>(std::string(SLOTBOOK_PROJECT_DIR) + "/slotbook.env");
        ipc_->initSemaphores();

        startTime_ = TimeHelper::now();
        const time_t endTime = startTime_ + Config::Simulation::DURATION_US() / Config::Time::ONE_SECOND_US();
        ipc_->initState(startTime_, endTime, Config::Store::LEDGER_CAPACITY());
        Logger::stateChange(Logger::Source::Other, tag_, "INIT", "ACCEPTING");

        catalog_ = std::make_unique<ClassCatalog>(*ipc_->state(), ipc_->sem(), Config::Store::LOCK_TIMEOUT_MS());
        ledger_ = std::make_unique<BookingLedger>(*ipc_->state(), ipc_->sem());
        engine_ = std::make_unique<ReservationEngine>(*catalog_, *ledger_);
        gateway_ = std::make_unique<ReservationGateway>(*catalog_, *engine_, Config::Report::STATS_WINDOW_DAYS());

        spawnLogger();
        seedCatalog();
        spawnMembers();
    }

    void spawnLogger() {
        loggerPid_ = ProcessSpawner::spawnWithKeys("logger_process",
                                                   ipc_->shmKey(), ipc_->semKey(), ipc_->logMsgKey());
        Logger::debug(tag_, "Logger spawned: %d", loggerPid_);

        if (loggerPid_ <= 0 ||
            !ipc_->sem().waitFor(Semaphore::Index::LOGGER_READY, loggerReadyTimeoutMs_, false)) {
            Logger::warn(tag_, "logger process not ready, keeping direct output");
            return;
        }

        // From now on, logs go through the logger process
        Logger::initCentralized(ipc_->shmKey(), ipc_->semKey(), ipc_->logMsgKey());
    }

    /**
     * Demo schedule relative to now. The short-notice class starts during the
     * run, so late bookings for it are refused as unavailable.
     */
    void seedCatalog() {
        const Principal admin{Constants::Member::FIRST_ADMIN_ID, true};
        const time_t tomorrow = TimeHelper::startOfDay(startTime_) + Constants::Statistics::SECONDS_PER_DAY;
        const time_t hour = 3600;

        const std::vector<ClassDefinition> schedule = {
            {"Sunrise Yoga", ClassCategory::YOGA, "Anna Kowalska", tomorrow + 7 * hour, 60, 8},
            {"Evening Zumba", ClassCategory::ZUMBA, "Marco Rossi", tomorrow + 18 * hour, 45, 12},
            {"HIIT Blast", ClassCategory::HIIT, "Jordan Lee", tomorrow + 12 * hour, 30, 5},
            {"Power Yoga", ClassCategory::YOGA, "Anna Kowalska", tomorrow + 2 * 24 * hour + 8 * hour, 75, 10},
            {"Zumba Party", ClassCategory::ZUMBA, "Marco Rossi", tomorrow + 3 * 24 * hour + 19 * hour, 60, 3},
            {"Lunch HIIT", ClassCategory::HIIT, "Sam Novak", startTime_ + Config::Simulation::SHORT_NOTICE_SEC(), 20, 6},
        };

        for (const auto &definition: schedule) {
            const GatewayReply reply = gateway_->createClass(admin, definition);
            if (!reply.ok()) {
                Logger::warn(tag_, "seeding '%s' failed: %u %s",
                             definition.name.c_str(), reply.code(), reply.message.c_str());
            }
        }
        Logger::info(tag_, "Catalog seeded with %u classes", catalog_->size());
    }

    void spawnMembers() {
        const uint32_t count = Config::Simulation::NUM_MEMBERS();
        for (uint32_t slot = 0; slot < count; ++slot) {
            const uint32_t userId = slot + 1;
            const bool isAdmin = userId == Constants::Member::FIRST_ADMIN_ID;
            const pid_t pid = ProcessSpawner::spawn("member_process", {
                                                        std::to_string(slot),
                                                        std::to_string(userId),
                                                        isAdmin ? "1" : "0",
                                                        std::to_string(ipc_->shmKey()),
                                                        std::to_string(ipc_->semKey()),
                                                        std::to_string(ipc_->logMsgKey())
                                                    });
            if (pid > 0) {
                memberPids_.push_back(pid);
            } else {
                Logger::error(tag_, "failed to spawn member %u", userId);
            }
        }
        ipc_->state()->operational.memberCount = count;

        // Release all members at once for maximum contention
        ipc_->sem().post(Semaphore::Index::MEMBERS_GO, static_cast<int32_t>(memberPids_.size()), false);
        Logger::info(tag_, "Spawned %d members", static_cast<int>(memberPids_.size()));
    }

    void mainLoop() {
        const time_t durationSec = Config::Simulation::DURATION_US() / Config::Time::ONE_SECOND_US();
        while (!SignalHelper::shouldExit(signals_)) {
            if (TimeHelper::now() - startTime_ >= durationSec) {
                Logger::info(tag_, "Run time elapsed, closing the store");
                break;
            }
            usleep(Config::Time::MAIN_LOOP_POLL_US());
        }
    }

    int shutdown() {
        Logger::debug(tag_, "Shutting down...");
        if (ipc_ == nullptr) {
            return 1;
        }

        // Members finish their current request and exit; SIGTERM also wakes
        // members still waiting for MEMBERS_GO after a failed setup
        ipc_->state()->operational.acceptingRequests = false;
        Logger::stateChange(Logger::Source::Other, tag_, "ACCEPTING", "CLOSED");
        ProcessSpawner::terminateAll(memberPids_);
        ProcessSpawner::waitForAll(memberPids_);

        int exitCode = 0;
        if (engine_ != nullptr) {
            exitCode = writeReport();
        }

        // Stop using centralized logging before terminating logger
        Logger::cleanupCentralized();
        if (loggerPid_ > 0) {
            kill(loggerPid_, SIGTERM);
            ProcessSpawner::waitFor(loggerPid_);
        }

        ipc_.reset();
        Logger::debug(tag_, "Done");
        return exitCode;
    }

    int writeReport() {
        Report::Data data;
        data.state = ipc_->state();
        try {
            data.violations = engine_->audit();
            data.statistics = engine_->statistics(Config::Report::STATS_WINDOW_DAYS());
            ClassFilter everything;
            everything.upcomingOnly = false;
            everything.includeRemoved = true;
            data.classes = catalog_->list(everything);
        } catch (const reservation_exception &e) {
            Logger::error(tag_, "report data incomplete: %s", e.what());
            return 1;
        } catch (const ipc_exception &e) {
            Logger::error(tag_, "report data incomplete: %s", e.what());
            return 1;
        }

        Logger::cleanupCentralized();
        usleep(100000); // Let the logger print what is still queued
        Logger::separator('=');
        Report::write(STDOUT_FILENO, data);
        Logger::separator('=');
        if (Report::save(reportPath_, data)) {
            Logger::info(tag_, "Report saved to %s", reportPath_);
        }

        if (!data.violations.empty()) {
            Logger::error(tag_, "Audit found %d violations", static_cast<int>(data.violations.size()));
            return 2;
        }
        Logger::info(tag_, "Audit passed");
        return 0;
    }
};
