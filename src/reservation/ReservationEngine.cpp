#include "reservation/ReservationEngine.h"

#include <algorithm>
#include <set>
#include <string>

#include "core/Constants.h"
#include "ipc/core/IpcException.h"
#include "logging/Logger.h"
#include "reservation/ReservationError.h"
#include "reservation/Transaction.h"
#include "utils/TimeHelper.h"

namespace {
    constexpr auto guardTag{"Engine"};

    /**
     * Run an engine operation, reporting IPC failures as StorageError.
     */
    template<typename Fn>
    auto storageGuard(const char *operation, Fn fn) -> decltype(fn()) {
        try {
            return fn();
        } catch (const ipc_exception &e) {
            Logger::error(Logger::Source::Engine, guardTag, "%s failed in storage: %s", operation, e.what());
            throw reservation_exception(ReservationError::StorageError,
                                        std::string(operation) + ": storage failure: " + e.what());
        }
    }

    UpcomingClass toUpcoming(const ClassSession &session, const uint32_t bookingId) {
        UpcomingClass upcoming;
        upcoming.classId = session.id;
        upcoming.bookingId = bookingId;
        upcoming.name = session.name;
        upcoming.category = session.category;
        upcoming.instructor = session.instructor;
        upcoming.startTime = session.startTime;
        upcoming.durationMinutes = session.durationMinutes;
        return upcoming;
    }
}

ReservationEngine::ReservationEngine(ClassCatalog &catalog, BookingLedger &ledger)
    : catalog_{catalog}, ledger_{ledger} {
}

template<typename Fn>
void ReservationEngine::forEachClassLocked(Fn fn) const {
    const uint32_t count = catalog_.size();
    for (uint32_t classId = 1; classId <= count; ++classId) {
        // Read-only: opening repairs an interrupted commit, destruction releases
        Transaction txn(catalog_, ledger_, classId, true);
        fn(txn.session());
    }
}

Booking ReservationEngine::createBooking(const uint32_t userId, const uint32_t classId) {
    return storageGuard("createBooking", [&] {
        Transaction txn(catalog_, ledger_, classId);
        const ClassSession &session = txn.session();
        const time_t now = TimeHelper::now();

        if (!session.isUpcoming(now)) {
            Logger::warn(Logger::Source::Engine, tag_, "user %u: class %u already started", userId, classId);
            throw reservation_exception(ReservationError::ClassUnavailable,
                                        "class " + std::to_string(classId) + " has already started");
        }
        if (session.availableSlots == 0) {
            Logger::warn(Logger::Source::Engine, tag_, "user %u: class %u is full", userId, classId);
            throw reservation_exception(ReservationError::ClassUnavailable,
                                        "class " + std::to_string(classId) + " has no slots left");
        }
        if (ledger_.findConfirmed(userId, classId) != nullptr) {
            Logger::warn(Logger::Source::Engine, tag_, "user %u already holds a booking for class %u",
                         userId, classId);
            throw reservation_exception(ReservationError::DuplicateBooking,
                                        "user " + std::to_string(userId) + " already booked class " +
                                        std::to_string(classId));
        }

        txn.stageBooking(userId, now);
        const std::optional<uint32_t> bookingId = txn.commit();
        if (!bookingId) {
            throw reservation_exception(ReservationError::StorageError, "booking was not recorded");
        }

        Booking booking;
        booking.id = *bookingId;
        booking.userId = userId;
        booking.classId = classId;
        booking.status = BookingStatus::CONFIRMED;
        booking.bookedAt = now;

        const ClassSession &after = txn.committedSession();
        Logger::info(Logger::Source::Engine, tag_, "booking %u: user %u -> class %u [%u/%u free]",
                     booking.id, userId, classId, after.availableSlots, after.totalSlots);
        return booking;
    });
}

bool ReservationEngine::cancelBooking(const Principal &actor, const uint32_t bookingId) {
    return storageGuard("cancelBooking", [&] {
        const Booking *booking = ledger_.find(bookingId);
        if (booking == nullptr) {
            throw reservation_exception(ReservationError::BookingNotFound,
                                        "booking " + std::to_string(bookingId) + " does not exist");
        }

        // classId is immutable, status is only trusted under the row lock
        Transaction txn(catalog_, ledger_, booking->classId, true);
        if (!booking->isConfirmed()) {
            txn.rollback();
            Logger::info(Logger::Source::Engine, tag_, "booking %u already %s, nothing to cancel (by user %u)",
                         bookingId, toString(booking->status), actor.userId);
            return false;
        }

        txn.stageCancellation(bookingId);
        txn.commit();

        const ClassSession &after = txn.committedSession();
        Logger::info(Logger::Source::Engine, tag_, "booking %u cancelled by %s %u, class %u [%u/%u free]",
                     bookingId, actor.isAdministrator ? "admin" : "user", actor.userId, after.id,
                     after.availableSlots, after.totalSlots);
        return true;
    });
}

ClassSession ReservationEngine::updateClass(const uint32_t classId, const ClassDefinition &definition) {
    return storageGuard("updateClass", [&] {
        ClassCatalog::validate(definition, TimeHelper::now());

        Transaction txn(catalog_, ledger_, classId);
        const uint32_t reserved = txn.session().reservedSlots();
        if (definition.totalSlots < reserved) {
            throw reservation_exception(ReservationError::InvalidDefinition,
                                        "totalSlots " + std::to_string(definition.totalSlots) +
                                        " is below the " + std::to_string(reserved) + " confirmed bookings");
        }

        txn.stageDefinition(definition);
        txn.commit();

        const ClassSession &after = txn.committedSession();
        Logger::info(Logger::Source::Engine, tag_, "class %u updated: %s, %u slots (%u free)",
                     classId, after.name, after.totalSlots, after.availableSlots);
        return after;
    });
}

uint32_t ReservationEngine::removeClass(const uint32_t classId) {
    return storageGuard("removeClass", [&] {
        Transaction txn(catalog_, ledger_, classId);

        uint32_t cancelled = 0;
        ledger_.forEachOfClass(classId, [&](const Booking &booking) {
            if (booking.isConfirmed()) {
                txn.stageCancellation(booking.id);
                ++cancelled;
            }
        });
        txn.stageRemoval();
        txn.commit();

        Logger::info(Logger::Source::Engine, tag_, "class %u removed, %u bookings cancelled", classId, cancelled);
        return cancelled;
    });
}

std::optional<Booking> ReservationEngine::findBooking(const uint32_t bookingId) const {
    return storageGuard("findBooking", [&]() -> std::optional<Booking> {
        const Booking *booking = ledger_.find(bookingId);
        if (booking == nullptr) {
            return std::nullopt;
        }
        Transaction txn(catalog_, ledger_, booking->classId, true);
        return *booking;
    });
}

std::vector<Booking> ReservationEngine::listBookings(const BookingFilter &filter) const {
    return storageGuard("listBookings", [&] {
        std::vector<Booking> result;
        forEachClassLocked([&](const ClassSession &session) {
            if (filter.classId && *filter.classId != session.id) return;
            ledger_.forEachOfClass(session.id, [&](const Booking &booking) {
                if (filter.userId && booking.userId != *filter.userId) return;
                if (filter.status && booking.status != *filter.status) return;
                result.push_back(booking);
            });
        });

        std::sort(result.begin(), result.end(), [](const Booking &a, const Booking &b) {
            if (a.bookedAt != b.bookedAt) return a.bookedAt > b.bookedAt;
            return a.id > b.id;
        });
        return result;
    });
}

CatalogStatistics ReservationEngine::statistics(const uint32_t windowDays) const {
    return storageGuard("statistics", [&] {
        const time_t windowStart = TimeHelper::now() -
                                   static_cast<time_t>(windowDays) * Constants::Statistics::SECONDS_PER_DAY;

        CatalogStatistics stats;
        stats.windowDays = windowDays;
        std::vector<PopularClass> ranking;

        forEachClassLocked([&](const ClassSession &session) {
            uint32_t confirmedInClass = 0;
            ledger_.forEachOfClass(session.id, [&](const Booking &booking) {
                if (booking.isConfirmed()) {
                    ++confirmedInClass;
                }
                if (booking.bookedAt < windowStart) return;
                ++stats.totalBookings;
                if (booking.isConfirmed()) {
                    ++stats.confirmedBookings;
                } else {
                    ++stats.cancelledBookings;
                }
            });

            if (session.removed || session.startTime < windowStart) return;
            ++stats.totalClasses;

            PopularClass entry;
            entry.classId = session.id;
            entry.name = session.name;
            entry.category = session.category;
            entry.instructor = session.instructor;
            entry.startTime = session.startTime;
            entry.confirmedBookings = confirmedInClass;
            ranking.push_back(entry);
        });

        std::stable_sort(ranking.begin(), ranking.end(), [](const PopularClass &a, const PopularClass &b) {
            return a.confirmedBookings > b.confirmedBookings;
        });
        if (ranking.size() > Constants::Statistics::POPULAR_CLASSES) {
            ranking.resize(Constants::Statistics::POPULAR_CLASSES);
        }
        stats.popularClasses = std::move(ranking);
        return stats;
    });
}

MemberStatistics ReservationEngine::memberStatistics(const uint32_t userId) const {
    return storageGuard("memberStatistics", [&] {
        const time_t now = TimeHelper::now();
        MemberStatistics stats;
        stats.userId = userId;

        forEachClassLocked([&](const ClassSession &session) {
            ledger_.forEachOfClass(session.id, [&](const Booking &booking) {
                if (booking.userId != userId) return;
                if (!booking.isConfirmed()) {
                    ++stats.cancelledBookings;
                    return;
                }
                ++stats.confirmedBookings;
                if (!session.removed && session.isUpcoming(now)) {
                    ++stats.upcomingClasses;
                    stats.upcoming.push_back(toUpcoming(session, booking.id));
                }
            });
        });

        std::sort(stats.upcoming.begin(), stats.upcoming.end(), [](const UpcomingClass &a, const UpcomingClass &b) {
            return a.startTime < b.startTime;
        });
        if (stats.upcoming.size() > Constants::Statistics::UPCOMING_DETAILS) {
            stats.upcoming.resize(Constants::Statistics::UPCOMING_DETAILS);
        }
        return stats;
    });
}

std::vector<InvariantViolation> ReservationEngine::audit() const {
    return storageGuard("audit", [&] {
        std::vector<InvariantViolation> violations;

        forEachClassLocked([&](const ClassSession &session) {
            uint32_t confirmed = 0;
            std::set<uint32_t> holders;
            ledger_.forEachOfClass(session.id, [&](const Booking &booking) {
                if (!booking.isConfirmed()) return;
                ++confirmed;
                if (!holders.insert(booking.userId).second) {
                    violations.push_back({session.id, "user " + std::to_string(booking.userId) +
                                                      " holds more than one confirmed booking"});
                }
            });

            if (session.availableSlots > session.totalSlots) {
                violations.push_back({session.id, "availableSlots " + std::to_string(session.availableSlots) +
                                                  " exceeds totalSlots " + std::to_string(session.totalSlots)});
            }
            if (static_cast<uint64_t>(session.availableSlots) + confirmed != session.totalSlots) {
                violations.push_back({session.id, "availableSlots " + std::to_string(session.availableSlots) +
                                                  " + confirmed " + std::to_string(confirmed) +
                                                  " != totalSlots " + std::to_string(session.totalSlots)});
            }
            if (session.removed && confirmed > 0) {
                violations.push_back({session.id, "removed class still has " + std::to_string(confirmed) +
                                                  " confirmed bookings"});
            }
        });

        for (const auto &v: violations) {
            Logger::error(Logger::Source::Engine, tag_, "class %u: %s", v.classId, v.description.c_str());
        }
        return violations;
    });
}
