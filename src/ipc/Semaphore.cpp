#include "ipc/core/Semaphore.h"

#include <cerrno>
#include <cstdio>
#include <ctime>

#include "logging/Logger.h"

const char* Semaphore::Index::toString(const uint16_t index) {
    if (index >= ROW_LOCK_BASE && index < TOTAL_SEMAPHORES) {
        return "ROW_LOCK";
    }
    switch (index) {
        // Startup
        case LOGGER_READY: return "LOGGER_READY";
        case MEMBERS_GO: return "MEMBERS_GO";
        // Table latches
        case CATALOG_APPEND: return "CATALOG_APPEND";
        case LEDGER_APPEND: return "LEDGER_APPEND";
        // Logging
        case LOG_SEQUENCE: return "LOG_SEQUENCE";
        case LOG_QUEUE_SLOTS: return "LOG_QUEUE_SLOTS";
        default: return "UNKNOWN_SEMAPHORE";
    }
}

Semaphore::Semaphore(const key_t key) {
    semId_ = semget(key, Index::TOTAL_SEMAPHORES, IPC_CREAT | IPC_EXCL | permissions);
    if (semId_ == -1) {
        if (errno == EEXIST) {
            semId_ = semget(key, Index::TOTAL_SEMAPHORES, permissions);
            if (semId_ == -1) {
                throw ipc_exception("Failed to connect to existing semaphore");
            }
            Logger::debug(tag_, "connected");
        } else {
            throw ipc_exception("Failed to create semaphore");
        }
    } else {
        Logger::debug(tag_, "created");
    }
}

void Semaphore::initialize(const uint16_t semIndex, const int32_t value) const {
    semun arg{};
    arg.val = value;
    if (semctl(semId_, semIndex, SETVAL, arg) == -1) {
        throw ipc_exception("Failed to initialize semaphore");
    }
    Logger::debug(tag_, "initialized: %s[%u] with value: %d", Index::toString(semIndex), semIndex, value);
}

bool Semaphore::wait(const uint16_t semIndex, const bool useUndo) const {
    sembuf operation{};
    operation.sem_num = semIndex;
    operation.sem_op = -1;
    operation.sem_flg = useUndo ? SEM_UNDO : 0;

    if (semop(semId_, &operation, 1) == -1) {
        if (errno == EINTR) return false;
        throw ipc_exception("Semaphore wait failed");
    }
    return true;
}

bool Semaphore::waitFor(const uint16_t semIndex, const uint32_t timeoutMs, const bool useUndo) const {
    sembuf operation{};
    operation.sem_num = semIndex;
    operation.sem_op = -1;
    operation.sem_flg = useUndo ? SEM_UNDO : 0;

    struct timespec deadline{};
    clock_gettime(CLOCK_MONOTONIC, &deadline);
    deadline.tv_sec += timeoutMs / 1000;
    deadline.tv_nsec += static_cast<long>(timeoutMs % 1000) * 1000000L;
    if (deadline.tv_nsec >= 1000000000L) {
        deadline.tv_sec += 1;
        deadline.tv_nsec -= 1000000000L;
    }

    while (true) {
        struct timespec now{};
        clock_gettime(CLOCK_MONOTONIC, &now);
        struct timespec remaining{};
        remaining.tv_sec = deadline.tv_sec - now.tv_sec;
        remaining.tv_nsec = deadline.tv_nsec - now.tv_nsec;
        if (remaining.tv_nsec < 0) {
            remaining.tv_sec -= 1;
            remaining.tv_nsec += 1000000000L;
        }
        if (remaining.tv_sec < 0) {
            return false;
        }

        if (semtimedop(semId_, &operation, 1, &remaining) == 0) {
            return true;
        }
        if (errno == EAGAIN) return false;
        if (errno == EINTR) continue;
        throw ipc_exception("Semaphore timed wait failed");
    }
}

bool Semaphore::tryAcquire(const uint16_t semIndex, const bool useUndo) const {
    sembuf operation{};
    operation.sem_num = semIndex;
    operation.sem_op = -1;
    operation.sem_flg = IPC_NOWAIT | (useUndo ? SEM_UNDO : 0);

    if (semop(semId_, &operation, 1) == -1) {
        if (errno == EAGAIN) return false;
        if (errno == EINTR) return false;
        throw ipc_exception("Semaphore tryAcquire failed");
    }
    return true;
}

void Semaphore::post(const uint16_t semIndex, const bool useUndo) const {
    sembuf operation{};
    operation.sem_num = semIndex;
    operation.sem_op = 1;
    operation.sem_flg = useUndo ? SEM_UNDO : 0;

    while (semop(semId_, &operation, 1) == -1) {
        if (errno == EINTR) continue;
        throw ipc_exception("Semaphore post failed");
    }
}

void Semaphore::post(const uint16_t semIndex, const int32_t n, const bool useUndo) const {
    if (n <= 0) return;

    sembuf operation{};
    operation.sem_num = semIndex;
    operation.sem_op = static_cast<short>(n);
    operation.sem_flg = useUndo ? SEM_UNDO : 0;

    while (semop(semId_, &operation, 1) == -1) {
        if (errno == EINTR) continue;
        throw ipc_exception("Semaphore post failed");
    }
}

int32_t Semaphore::getValue(const uint16_t semIndex) const {
    const int32_t val = semctl(semId_, semIndex, GETVAL);
    if (val == -1) {
        throw ipc_exception("Failed to get semaphore value");
    }
    return val;
}

void Semaphore::destroy() const {
    if (semctl(semId_, 0, IPC_RMID) == -1) {
        throw ipc_exception("Failed to destroy semaphore");
    }
    Logger::debug(tag_, "destroyed");
}

Semaphore::ScopedLock::ScopedLock(const Semaphore& sem, const uint16_t semIndex)
    : sem_(sem), semIndex_(semIndex) {
    while (!sem_.wait(semIndex_)) {
        // EINTR: the latch must be held before the guarded section runs
    }
}

Semaphore::ScopedLock::~ScopedLock() {
    try {
        sem_.post(semIndex_);
    } catch (const ipc_exception &e) {
        Logger::error(tag_, "release of %s failed: %s", Index::toString(semIndex_), e.what());
    }
}
