#pragma once

#include <cstdint>

#include "ipc/core/Semaphore.h"
#include "ipc/model/SharedCatalogState.h"

/**
 * @class ClassRowLock
 * @brief Exclusive, move-only hold of one catalog row.
 *
 * Produced by ClassCatalog::getForUpdate() after the row semaphore was
 * acquired; releases it on destruction. Only the holder may read or write
 * the row's mutable fields and the status of the class's bookings.
 */
class ClassRowLock {
public:
    ClassRowLock(const Semaphore &sem, ClassRow &row) : sem_{&sem}, row_{&row}, held_{true} {
    }

    ~ClassRowLock() {
        release();
    }

    ClassRowLock(const ClassRowLock &) = delete;

    ClassRowLock &operator=(const ClassRowLock &) = delete;

    ClassRowLock(ClassRowLock &&other) noexcept
        : sem_{other.sem_}, row_{other.row_}, held_{other.held_} {
        other.held_ = false;
    }

    ClassRowLock &operator=(ClassRowLock &&other) = delete;

    ClassSession &session() { return row_->session; }
    const ClassSession &session() const { return row_->session; }

    CommitJournal &journal() { return row_->journal; }

    uint32_t classId() const { return row_->session.id; }

    bool isHeld() const { return held_; }

    /**
     * @brief Release the row early. Idempotent.
     */
    void release() noexcept;

private:
    const Semaphore *sem_;
    ClassRow *row_;
    bool held_;
};
