#include <unistd.h>
#include <ctime>
#include <cstdlib>
#include <cstdio>
#include <vector>

#include "catalog/ClassCatalog.h"
#include "gateway/ReservationGateway.h"
#include "ipc/core/SharedMemory.h"
#include "ipc/core/Semaphore.h"
#include "ipc/model/SharedReservationState.h"
#include "reservation/BookingLedger.h"
#include "reservation/ReservationEngine.h"
#include "core/Config.h"
#include "utils/SignalHelper.h"
#include "utils/ArgumentParser.h"
#include "logging/Logger.h"

namespace {
    SignalHelper::Flags g_signals;
}

/**
 * One simulated user issuing booking requests against the shared store.
 *
 * Each round either cancels one of the member's Confirmed bookings or books a
 * random upcoming class. The administrator (Constants::Member::FIRST_ADMIN_ID)
 * also cancels bookings of other members and reads the statistics.
 */
class MemberProcess {
public:
    explicit MemberProcess(const ArgumentParser::MemberArgs &args)
        : shm_{SharedMemory<SharedReservationState>::attach(args.shmKey)},
          sem_{args.semKey},
          catalog_{*shm_, sem_, Config::Store::LOCK_TIMEOUT_MS()},
          ledger_{*shm_, sem_},
          engine_{catalog_, ledger_},
          gateway_{catalog_, engine_, Config::Report::STATS_WINDOW_DAYS()},
          record_{shm_->members[args.slot]} {
        principal_.userId = args.userId;
        principal_.isAdministrator = args.isAdministrator;

        record_.userId = args.userId;
        record_.isAdministrator = args.isAdministrator;
        record_.pid = getpid();

        snprintf(tag_, sizeof(tag_), "%s %u", args.isAdministrator ? "Admin" : "Member", args.userId);
    }

    void run() {
        if (!waitForStart()) {
            record_.finished = true;
            return;
        }
        Logger::info(Logger::Source::Member, tag_, "started (PID: %d)", getpid());

        while (!SignalHelper::shouldExit(g_signals) && shm_->operational.acceptingRequests) {
            ++record_.requests;
            const bool wantsCancel = static_cast<uint32_t>(rand() % 100) < Config::Simulation::CANCEL_PCT();
            if (!wantsCancel || !cancelOne()) {
                bookOne();
            }
            if (principal_.isAdministrator && record_.requests % 10 == 0) {
                reportStatistics();
            }
            idle();
        }

        record_.finished = true;
        Logger::info(Logger::Source::Member, tag_, "done: %u requests, %u booked, %u cancelled",
                     record_.requests, record_.booked, record_.cancelled);
    }

private:
    /** Block on MEMBERS_GO; false if asked to exit first. */
    bool waitForStart() {
        while (!SignalHelper::shouldExit(g_signals)) {
            if (sem_.wait(Semaphore::Index::MEMBERS_GO, false)) {
                return true;
            }
        }
        return false;
    }

    void bookOne() {
        ClassFilter filter;
        std::vector<ClassSession> classes;
        GatewayReply reply = gateway_.listClasses(principal_, filter, classes);
        if (!reply.ok()) {
            tally(reply);
            return;
        }
        if (classes.empty()) {
            Logger::debug(Logger::Source::Member, tag_, "no upcoming classes");
            return;
        }

        const ClassSession &pick = classes[rand() % classes.size()];
        reply = gateway_.bookClass(principal_, pick.id);
        tally(reply);
        if (reply.ok()) {
            ++record_.booked;
            Logger::info(Logger::Source::Member, tag_, "booked %s (class %u) -> booking %u",
                         pick.name, pick.id, reply.resourceId);
        } else {
            Logger::debug(Logger::Source::Member, tag_, "booking class %u: %u %s",
                          pick.id, reply.code(), reply.message.c_str());
        }
    }

    /** Cancel a random visible Confirmed booking; false if there was none. */
    bool cancelOne() {
        BookingFilter filter;
        filter.status = BookingStatus::CONFIRMED;
        std::vector<Booking> bookings;
        const GatewayReply listed = gateway_.listBookings(principal_, filter, bookings);
        if (!listed.ok()) {
            tally(listed);
            return true;
        }
        if (bookings.empty()) {
            return false;
        }

        const Booking &pick = bookings[rand() % bookings.size()];
        const GatewayReply reply = gateway_.cancelBooking(principal_, pick.id);
        tally(reply);
        if (reply.ok()) {
            ++record_.cancelled;
            Logger::info(Logger::Source::Member, tag_, "cancelled booking %u (class %u, user %u)",
                         pick.id, pick.classId, pick.userId);
        }
        return true;
    }

    void reportStatistics() {
        CatalogStatistics stats;
        const GatewayReply reply = gateway_.statistics(principal_, stats);
        tally(reply);
        if (reply.ok()) {
            Logger::info(Logger::Source::Member, tag_, "stats: %u classes, %u bookings (%u confirmed, %u cancelled)",
                         stats.totalClasses, stats.totalBookings, stats.confirmedBookings,
                         stats.cancelledBookings);
        }
    }

    void tally(const GatewayReply &reply) {
        if (reply.ok()) return;
        if (!reply.error) {
            ++record_.cancelNoOps;
            return;
        }
        switch (*reply.error) {
            case ReservationError::ClassUnavailable:
                ++record_.rejectedUnavailable;
                break;
            case ReservationError::DuplicateBooking:
                ++record_.rejectedDuplicate;
                break;
            case ReservationError::ClassNotFound:
            case ReservationError::BookingNotFound:
                ++record_.rejectedNotFound;
                break;
            case ReservationError::StorageError:
            case ReservationError::LockTimeout:
                ++record_.storageErrors;
                Logger::warn(Logger::Source::Member, tag_, "%s", reply.message.c_str());
                break;
            default:
                Logger::warn(Logger::Source::Member, tag_, "%u %s", reply.code(), reply.message.c_str());
                break;
        }
    }

    static void idle() {
        const uint32_t base = Config::Time::OPERATION_DELAY_BASE_US();
        const uint32_t spread = Config::Time::OPERATION_DELAY_RANDOM_US();
        usleep(base + (spread > 0 ? static_cast<uint32_t>(rand()) % spread : 0));
    }

    SharedMemory<SharedReservationState> shm_;
    Semaphore sem_;
    ClassCatalog catalog_;
    BookingLedger ledger_;
    ReservationEngine engine_;
    ReservationGateway gateway_;
    MemberActivityRecord &record_;
    Principal principal_;
    char tag_[32]{};
};

int main(int argc, char *argv[]) {
    ArgumentParser::MemberArgs args{};
    if (!ArgumentParser::parseMemberArgs(argc, argv, args)) {
        return 1;
    }
    if (args.slot >= Flags::Store::MAX_MEMBERS) {
        fprintf(stderr, "Error: slot %u out of range\n", args.slot);
        return 1;
    }

    SignalHelper::setupChildProcess(g_signals);
    srand(static_cast<unsigned>(time(nullptr)) ^ static_cast<unsigned>(getpid()) ^ (args.userId * 31337));

    try {
        Config::loadEnvFile();
        Logger::initCentralized(args.shmKey, args.semKey, args.logMsgKey);

        MemberProcess process(args);
        process.run();

        Logger::cleanupCentralized();
    } catch (const std::exception &e) {
        Logger::error(Logger::Source::Member, "Member", "Exception: %s", e.what());
        return 1;
    }

    return 0;
}
