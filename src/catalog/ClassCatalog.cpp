#include "catalog/ClassCatalog.h"

#include <algorithm>
#include <cstring>

#include "core/Constants.h"
#include "logging/Logger.h"
#include "reservation/ReservationError.h"
#include "utils/TimeHelper.h"

namespace {
    void copyText(char *dest, const std::string &src) {
        const size_t n = std::min<size_t>(src.size(), Constants::Catalog::MAX_NAME_LENGTH);
        std::memcpy(dest, src.data(), n);
        dest[n] = '\0';
    }

    bool matches(const ClassSession &session, const ClassFilter &filter, const time_t now) {
        if (session.removed && !filter.includeRemoved) return false;
        if (filter.upcomingOnly && !session.isUpcoming(now)) return false;
        if (filter.category && session.category != *filter.category) return false;
        if (filter.day && !TimeHelper::isSameDay(session.startTime, *filter.day)) return false;
        return true;
    }
}

ClassCatalog::ClassCatalog(SharedReservationState &state, const Semaphore &sem, const uint32_t lockTimeoutMs)
    : state_{state}, sem_{sem}, lockTimeoutMs_{lockTimeoutMs} {
}

void ClassCatalog::validate(const ClassDefinition &definition, const time_t now) {
    if (definition.name.empty() || definition.name.size() > Constants::Catalog::MAX_NAME_LENGTH) {
        throw reservation_exception(ReservationError::InvalidDefinition,
                                    "name must have 1-" + std::to_string(Constants::Catalog::MAX_NAME_LENGTH) +
                                    " characters");
    }
    if (definition.instructor.empty() || definition.instructor.size() > Constants::Catalog::MAX_NAME_LENGTH) {
        throw reservation_exception(ReservationError::InvalidDefinition,
                                    "instructor must have 1-" +
                                    std::to_string(Constants::Catalog::MAX_NAME_LENGTH) + " characters");
    }
    if (static_cast<uint32_t>(definition.category) >= CLASS_CATEGORY_COUNT) {
        throw reservation_exception(ReservationError::InvalidDefinition, "unknown category");
    }
    if (definition.totalSlots < 1) {
        throw reservation_exception(ReservationError::InvalidDefinition, "totalSlots must be at least 1");
    }
    if (definition.durationMinutes < 1) {
        throw reservation_exception(ReservationError::InvalidDefinition, "duration must be at least 1 minute");
    }
    if (definition.startTime <= now) {
        throw reservation_exception(ReservationError::InvalidDefinition, "start time must be in the future");
    }
}

ClassSession ClassCatalog::create(const ClassDefinition &definition) {
    const time_t now = TimeHelper::now();
    validate(definition, now);

    ClassSession created;
    {
        Semaphore::ScopedLock latch(sem_, Semaphore::Index::CATALOG_APPEND);
        auto &catalog = state_.catalog;
        if (catalog.classCount >= Flags::Store::MAX_CLASSES) {
            throw reservation_exception(ReservationError::StorageError, "class catalog is full");
        }

        // Row is invisible until classCount moves past it
        ClassRow &row = catalog.rows[catalog.classCount];
        row.journal = CommitJournal();
        ClassSession &session = row.session;
        session = ClassSession();
        session.id = catalog.classCount + 1;
        copyText(session.name, definition.name);
        session.category = definition.category;
        copyText(session.instructor, definition.instructor);
        session.startTime = definition.startTime;
        session.durationMinutes = definition.durationMinutes;
        session.totalSlots = definition.totalSlots;
        session.availableSlots = definition.totalSlots;
        session.createdAt = now;
        session.updatedAt = now;

        catalog.classCount = session.id;
        created = session;
    }

    char when[32];
    TimeHelper::formatDateTime(created.startTime, when, sizeof(when));
    Logger::info(Logger::Source::Catalog, tag_, "class %u created: %s (%s) by %s at %s, %u slots",
                 created.id, created.name, toString(created.category), created.instructor, when,
                 created.totalSlots);
    return created;
}

uint32_t ClassCatalog::size() const {
    Semaphore::ScopedLock latch(sem_, Semaphore::Index::CATALOG_APPEND);
    return state_.catalog.classCount;
}

ClassRowLock ClassCatalog::acquire(const uint32_t classId) const {
    if (classId == 0 || classId > size()) {
        throw reservation_exception(ReservationError::ClassNotFound,
                                    "class " + std::to_string(classId) + " does not exist");
    }

    if (!sem_.waitFor(Semaphore::rowLock(classId), lockTimeoutMs_)) {
        Logger::warn(Logger::Source::Catalog, tag_, "class %u: row lock not acquired within %u ms",
                     classId, lockTimeoutMs_);
        throw reservation_exception(ReservationError::LockTimeout,
                                    "class " + std::to_string(classId) + " is busy, try again");
    }
    return ClassRowLock(sem_, state_.catalog.rows[classId - 1]);
}

ClassRowLock ClassCatalog::lockRow(const uint32_t classId) {
    return acquire(classId);
}

ClassRowLock ClassCatalog::getForUpdate(const uint32_t classId) {
    ClassRowLock lock = acquire(classId);
    if (lock.session().removed) {
        throw reservation_exception(ReservationError::ClassNotFound,
                                    "class " + std::to_string(classId) + " was removed");
    }
    return lock;
}

std::optional<ClassSession> ClassCatalog::get(const uint32_t classId) const {
    if (classId == 0 || classId > size()) {
        return std::nullopt;
    }
    ClassRowLock lock = acquire(classId);
    if (lock.session().removed) {
        return std::nullopt;
    }
    return lock.session();
}

std::vector<ClassSession> ClassCatalog::list(const ClassFilter &filter) const {
    const time_t now = TimeHelper::now();
    const uint32_t count = size();

    std::vector<ClassSession> result;
    for (uint32_t classId = 1; classId <= count; ++classId) {
        ClassRowLock lock = acquire(classId);
        if (matches(lock.session(), filter, now)) {
            result.push_back(lock.session());
        }
    }

    std::stable_sort(result.begin(), result.end(), [](const ClassSession &a, const ClassSession &b) {
        return a.startTime < b.startTime;
    });
    return result;
}
