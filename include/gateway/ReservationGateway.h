#pragma once

#include <cstdint>
#include <vector>

#include "catalog/ClassCatalog.h"
#include "gateway/GatewayReply.h"
#include "identity/Principal.h"
#include "reservation/ReservationEngine.h"

/**
 * @class ReservationGateway
 * @brief Request boundary of the reservation store.
 *
 * Checks permissions, invokes the catalog or engine and turns every outcome
 * into a GatewayReply. Never throws reservation_exception; payloads of read
 * requests are returned through out parameters.
 */
class ReservationGateway {
public:
    /**
     * @param catalog Class catalog
     * @param engine Reservation engine
     * @param statsWindowDays Look-back window of the operator statistics
     */
    ReservationGateway(ClassCatalog &catalog, ReservationEngine &engine, uint32_t statsWindowDays);

    /** @brief Create a class (administrators). 201 with the class id. */
    GatewayReply createClass(const Principal &actor, const ClassDefinition &definition);

    /** @brief Edit a class (administrators). */
    GatewayReply updateClass(const Principal &actor, uint32_t classId, const ClassDefinition &definition);

    /** @brief Remove a class and cancel its bookings (administrators). */
    GatewayReply removeClass(const Principal &actor, uint32_t classId);

    /** @brief One class by id. */
    GatewayReply getClass(const Principal &actor, uint32_t classId, ClassSession &out);

    /** @brief Classes matching the filter, by start time. */
    GatewayReply listClasses(const Principal &actor, const ClassFilter &filter, std::vector<ClassSession> &out);

    /** @brief Book a class for the actor. 201 with the booking id. */
    GatewayReply bookClass(const Principal &actor, uint32_t classId);

    /**
     * @brief Cancel a booking of the actor (any booking for administrators).
     *
     * 200 when cancelled, 400 when it was already cancelled.
     */
    GatewayReply cancelBooking(const Principal &actor, uint32_t bookingId);

    /**
     * @brief Bookings visible to the actor.
     *
     * Members only see their own bookings (403 when the filter names another
     * user); administrators may filter by any user.
     */
    GatewayReply listBookings(const Principal &actor, const BookingFilter &filter, std::vector<Booking> &out);

    /** @brief Operator statistics (administrators). */
    GatewayReply statistics(const Principal &actor, CatalogStatistics &out);

    /** @brief Booking summary of the actor. */
    GatewayReply profile(const Principal &actor, MemberStatistics &out);

    static constexpr auto ALREADY_CANCELLED_MESSAGE{"Booking is already cancelled or not confirmed."};

private:
    static constexpr auto tag_{"Gateway"};

    static GatewayReply denied(const Principal &actor, const char *action);

    ClassCatalog &catalog_;
    ReservationEngine &engine_;
    uint32_t statsWindowDays_;
};
