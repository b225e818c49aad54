#include "gateway/ReservationGateway.h"

#include <string>

#include "identity/Permission.h"
#include "logging/Logger.h"

ReservationGateway::ReservationGateway(ClassCatalog &catalog, ReservationEngine &engine,
                                       const uint32_t statsWindowDays)
    : catalog_{catalog}, engine_{engine}, statsWindowDays_{statsWindowDays} {
}

GatewayReply ReservationGateway::denied(const Principal &actor, const char *action) {
    Logger::warn(Logger::Source::Gateway, tag_, "user %u may not %s", actor.userId, action);
    return GatewayReply::failure(ReservationError::PermissionDenied,
                                 std::string("You do not have permission to ") + action + ".");
}

GatewayReply ReservationGateway::createClass(const Principal &actor, const ClassDefinition &definition) {
    if (Permission::authorizeCatalogAdministration(actor) == Permission::Decision::DENY) {
        return denied(actor, "create classes");
    }
    try {
        const ClassSession session = catalog_.create(definition);
        return GatewayReply::success(ReplyStatus::CREATED, "Class created.", session.id);
    } catch (const reservation_exception &e) {
        Logger::warn(Logger::Source::Gateway, tag_, "createClass by %u: %s", actor.userId, e.what());
        return GatewayReply::failure(e);
    } catch (const ipc_exception &e) {
        Logger::error(Logger::Source::Gateway, tag_, "createClass by %u: %s", actor.userId, e.what());
        return GatewayReply::failure(ReservationError::StorageError, e.what());
    }
}

GatewayReply ReservationGateway::updateClass(const Principal &actor, const uint32_t classId,
                                             const ClassDefinition &definition) {
    if (Permission::authorizeCatalogAdministration(actor) == Permission::Decision::DENY) {
        return denied(actor, "edit classes");
    }
    try {
        const ClassSession session = engine_.updateClass(classId, definition);
        return GatewayReply::success(ReplyStatus::OK, "Class updated.", session.id);
    } catch (const reservation_exception &e) {
        Logger::warn(Logger::Source::Gateway, tag_, "updateClass %u by %u: %s", classId, actor.userId, e.what());
        return GatewayReply::failure(e);
    }
}

GatewayReply ReservationGateway::removeClass(const Principal &actor, const uint32_t classId) {
    if (Permission::authorizeCatalogAdministration(actor) == Permission::Decision::DENY) {
        return denied(actor, "remove classes");
    }
    try {
        const uint32_t cancelled = engine_.removeClass(classId);
        return GatewayReply::success(ReplyStatus::OK,
                                     "Class removed, " + std::to_string(cancelled) + " bookings cancelled.",
                                     classId);
    } catch (const reservation_exception &e) {
        Logger::warn(Logger::Source::Gateway, tag_, "removeClass %u by %u: %s", classId, actor.userId, e.what());
        return GatewayReply::failure(e);
    }
}

GatewayReply ReservationGateway::getClass(const Principal &actor, const uint32_t classId, ClassSession &out) {
    try {
        const std::optional<ClassSession> session = catalog_.get(classId);
        if (!session) {
            return GatewayReply::failure(ReservationError::ClassNotFound,
                                         "Class " + std::to_string(classId) + " not found.");
        }
        out = *session;
        return GatewayReply::success(ReplyStatus::OK, "", classId);
    } catch (const reservation_exception &e) {
        Logger::warn(Logger::Source::Gateway, tag_, "getClass %u by %u: %s", classId, actor.userId, e.what());
        return GatewayReply::failure(e);
    } catch (const ipc_exception &e) {
        return GatewayReply::failure(ReservationError::StorageError, e.what());
    }
}

GatewayReply ReservationGateway::listClasses(const Principal &actor, const ClassFilter &filter,
                                             std::vector<ClassSession> &out) {
    try {
        out = catalog_.list(filter);
        return GatewayReply::success(ReplyStatus::OK, std::to_string(out.size()) + " classes.");
    } catch (const reservation_exception &e) {
        Logger::warn(Logger::Source::Gateway, tag_, "listClasses by %u: %s", actor.userId, e.what());
        return GatewayReply::failure(e);
    } catch (const ipc_exception &e) {
        return GatewayReply::failure(ReservationError::StorageError, e.what());
    }
}

GatewayReply ReservationGateway::bookClass(const Principal &actor, const uint32_t classId) {
    try {
        const Booking booking = engine_.createBooking(actor.userId, classId);
        return GatewayReply::success(ReplyStatus::CREATED, "Class booked successfully.", booking.id);
    } catch (const reservation_exception &e) {
        return GatewayReply::failure(e);
    }
}

GatewayReply ReservationGateway::cancelBooking(const Principal &actor, const uint32_t bookingId) {
    try {
        const std::optional<Booking> booking = engine_.findBooking(bookingId);
        if (!booking) {
            return GatewayReply::failure(ReservationError::BookingNotFound,
                                         "Booking " + std::to_string(bookingId) + " not found.");
        }
        if (Permission::authorizeCancellation(actor, *booking) == Permission::Decision::DENY) {
            return denied(actor, "cancel this booking");
        }
        if (!engine_.cancelBooking(actor, bookingId)) {
            GatewayReply reply;
            reply.status = ReplyStatus::BAD_REQUEST;
            reply.message = ALREADY_CANCELLED_MESSAGE;
            reply.resourceId = bookingId;
            return reply;
        }
        return GatewayReply::success(ReplyStatus::OK, "Booking cancelled successfully.", bookingId);
    } catch (const reservation_exception &e) {
        return GatewayReply::failure(e);
    }
}

GatewayReply ReservationGateway::listBookings(const Principal &actor, const BookingFilter &filter,
                                              std::vector<Booking> &out) {
    BookingFilter effective = filter;
    if (effective.userId &&
        Permission::authorizeBookingQuery(actor, *effective.userId) == Permission::Decision::DENY) {
        return denied(actor, "list bookings of other users");
    }
    if (!actor.isAdministrator) {
        effective.userId = actor.userId;
    }
    try {
        out = engine_.listBookings(effective);
        return GatewayReply::success(ReplyStatus::OK, std::to_string(out.size()) + " bookings.");
    } catch (const reservation_exception &e) {
        return GatewayReply::failure(e);
    }
}

GatewayReply ReservationGateway::statistics(const Principal &actor, CatalogStatistics &out) {
    if (Permission::authorizeCatalogAdministration(actor) == Permission::Decision::DENY) {
        return denied(actor, "view statistics");
    }
    try {
        out = engine_.statistics(statsWindowDays_);
        return GatewayReply::success(ReplyStatus::OK, "");
    } catch (const reservation_exception &e) {
        return GatewayReply::failure(e);
    }
}

GatewayReply ReservationGateway::profile(const Principal &actor, MemberStatistics &out) {
    try {
        out = engine_.memberStatistics(actor.userId);
        return GatewayReply::success(ReplyStatus::OK, "", actor.userId);
    } catch (const reservation_exception &e) {
        return GatewayReply::failure(e);
    }
}
