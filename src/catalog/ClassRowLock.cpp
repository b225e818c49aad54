#include "catalog/ClassRowLock.h"

#include "logging/Logger.h"

void ClassRowLock::release() noexcept {
    if (!held_) return;
    held_ = false;
    try {
        sem_->post(Semaphore::rowLock(row_->session.id));
    } catch (const ipc_exception &e) {
        Logger::error(Logger::Source::Catalog, "RowLock", "release of class %u failed: %s",
                      row_->session.id, e.what());
    }
}
