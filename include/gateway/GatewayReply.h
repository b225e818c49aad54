#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "reservation/ReservationError.h"

/**
 * @brief HTTP-like outcome of a gateway request.
 */
enum class ReplyStatus : uint16_t {
    OK = 200,
    CREATED = 201,
    BAD_REQUEST = 400,
    FORBIDDEN = 403,
    NOT_FOUND = 404,
    CONFLICT = 409,
    SERVICE_UNAVAILABLE = 503
};

constexpr const char *toString(const ReplyStatus status) {
    switch (status) {
        case ReplyStatus::OK: return "OK";
        case ReplyStatus::CREATED: return "Created";
        case ReplyStatus::BAD_REQUEST: return "Bad Request";
        case ReplyStatus::FORBIDDEN: return "Forbidden";
        case ReplyStatus::NOT_FOUND: return "Not Found";
        case ReplyStatus::CONFLICT: return "Conflict";
        case ReplyStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
        default: return "Unknown";
    }
}

/**
 * @brief Reply status of a reservation failure.
 */
constexpr ReplyStatus replyStatusOf(const ReservationError error) {
    switch (error) {
        case ReservationError::InvalidDefinition:
        case ReservationError::ClassUnavailable:
            return ReplyStatus::BAD_REQUEST;
        case ReservationError::ClassNotFound:
        case ReservationError::BookingNotFound:
            return ReplyStatus::NOT_FOUND;
        case ReservationError::DuplicateBooking:
            return ReplyStatus::CONFLICT;
        case ReservationError::PermissionDenied:
            return ReplyStatus::FORBIDDEN;
        case ReservationError::StorageError:
        case ReservationError::LockTimeout:
        default:
            return ReplyStatus::SERVICE_UNAVAILABLE;
    }
}

/**
 * @brief Status, message and the id of the affected resource.
 */
struct GatewayReply {
    ReplyStatus status{ReplyStatus::OK};
    std::string message;
    uint32_t resourceId{0}; // Class or booking id, 0 if none
    std::optional<ReservationError> error;

    bool ok() const { return status == ReplyStatus::OK || status == ReplyStatus::CREATED; }

    uint16_t code() const { return static_cast<uint16_t>(status); }

    static GatewayReply success(const ReplyStatus status, std::string message, const uint32_t resourceId = 0) {
        GatewayReply reply;
        reply.status = status;
        reply.message = std::move(message);
        reply.resourceId = resourceId;
        return reply;
    }

    static GatewayReply failure(const reservation_exception &e) {
        GatewayReply reply;
        reply.status = replyStatusOf(e.error());
        reply.message = e.what();
        reply.error = e.error();
        return reply;
    }

    static GatewayReply failure(const ReservationError error, std::string message) {
        GatewayReply reply;
        reply.status = replyStatusOf(error);
        reply.message = std::move(message);
        reply.error = error;
        return reply;
    }
};
