#include "reservation/Transaction.h"

#include <cstring>
#include <string>
#include <unistd.h>

#include "logging/Logger.h"
#include "reservation/ReservationError.h"
#include "utils/TimeHelper.h"

namespace {
    ClassRowLock lockFor(ClassCatalog &catalog, const uint32_t classId, const bool allowRemoved) {
        return allowRemoved ? catalog.lockRow(classId) : catalog.getForUpdate(classId);
    }

    void copyText(char *dest, const std::string &src) {
        const size_t n = src.size() < Constants::Catalog::MAX_NAME_LENGTH
                             ? src.size()
                             : Constants::Catalog::MAX_NAME_LENGTH;
        std::memcpy(dest, src.data(), n);
        dest[n] = '\0';
    }
}

Transaction::Transaction(ClassCatalog &catalog, BookingLedger &ledger, const uint32_t classId,
                         const bool allowRemoved)
    : lock_{lockFor(catalog, classId, allowRemoved)}, ledger_{ledger} {
    repairIfInterrupted();
    if (!allowRemoved && lock_.session().removed) {
        throw reservation_exception(ReservationError::ClassNotFound,
                                    "class " + std::to_string(classId) + " was removed");
    }
}

Transaction::~Transaction() {
    rollback();
}

void Transaction::repairIfInterrupted() {
    CommitJournal &journal = lock_.journal();
    if (!journal.active) return;

    ClassSession &session = lock_.session();
    if (journal.op == JournalOp::REMOVE) {
        const time_t now = TimeHelper::now();
        uint32_t finished = 0;
        ledger_.forEachOfClass(session.id, [&](Booking &booking) {
            if (!booking.isConfirmed()) return;
            booking.status = BookingStatus::CANCELLED;
            booking.cancelledAt = now;
            ++finished;
        });
        session.removed = true;
        session.updatedAt = now;
        Logger::warn(Logger::Source::Engine, tag_, "class %u: finished interrupted removal, %u more bookings cancelled",
                     session.id, finished);
    }

    const uint32_t confirmed = ledger_.countConfirmed(session.id);
    const uint32_t before = session.availableSlots;
    session.availableSlots = confirmed <= session.totalSlots ? session.totalSlots - confirmed : 0;

    Logger::warn(Logger::Source::Engine, tag_,
                 "class %u: repaired interrupted %s of pid %d (booking %u), available %u -> %u",
                 session.id, toString(journal.op), journal.holderPid, journal.bookingId, before,
                 session.availableSlots);
    journal = CommitJournal();
}

void Transaction::stageBooking(const uint32_t userId, const time_t bookedAt) {
    insert_ = PendingBooking{userId, bookedAt};
}

void Transaction::stageCancellation(const uint32_t bookingId) {
    cancellations_.push_back(bookingId);
}

void Transaction::stageDefinition(const ClassDefinition &definition) {
    definition_ = definition;
}

void Transaction::stageRemoval() {
    remove_ = true;
}

JournalOp Transaction::journalOp() const {
    if (remove_) return JournalOp::REMOVE;
    if (definition_) return JournalOp::RESIZE;
    if (insert_) return JournalOp::BOOK;
    if (!cancellations_.empty()) return JournalOp::CANCEL;
    return JournalOp::NONE;
}

std::optional<uint32_t> Transaction::commit() {
    if (!isOpen()) {
        throw reservation_exception(ReservationError::StorageError, "transaction already finished");
    }

    const JournalOp op = journalOp();
    if (op == JournalOp::NONE) {
        committed_ = lock_.session();
        lock_.release();
        return std::nullopt;
    }

    ClassSession &session = lock_.session();
    CommitJournal &journal = lock_.journal();
    journal.op = op;
    journal.bookingId = cancellations_.empty() ? 0 : cancellations_.front();
    journal.holderPid = getpid();
    journal.active = true;

    std::optional<uint32_t> created;
    if (insert_) {
        try {
            created = ledger_.append(insert_->userId, session.id, insert_->bookedAt);
        } catch (const reservation_exception &) {
            journal = CommitJournal();
            throw;
        }
        journal.bookingId = *created;
    }

    const time_t now = TimeHelper::now();
    int64_t slotDelta = created ? -1 : 0;
    for (const uint32_t bookingId: cancellations_) {
        Booking *booking = ledger_.find(bookingId);
        if (booking == nullptr || booking->classId != session.id || !booking->isConfirmed()) {
            continue;
        }
        booking->status = BookingStatus::CANCELLED;
        booking->cancelledAt = now;
        ++slotDelta;
    }

    if (definition_) {
        copyText(session.name, definition_->name);
        session.category = definition_->category;
        copyText(session.instructor, definition_->instructor);
        session.startTime = definition_->startTime;
        session.durationMinutes = definition_->durationMinutes;
        slotDelta += static_cast<int64_t>(definition_->totalSlots) - session.totalSlots;
        session.totalSlots = definition_->totalSlots;
    }
    session.availableSlots = static_cast<uint32_t>(session.availableSlots + slotDelta);
    if (remove_) {
        session.removed = true;
    }
    session.updatedAt = now;

    journal = CommitJournal();
    committed_ = session;
    lock_.release();
    return created;
}

void Transaction::rollback() noexcept {
    insert_.reset();
    cancellations_.clear();
    definition_.reset();
    remove_ = false;
    lock_.release();
}
