#pragma once

#include <cstdint>

#include "catalog/ClassSession.h"
#include "core/Flags.h"
#include "reservation/CommitJournal.h"

/**
 * One catalog row: the class itself plus the journal of its in-flight commit.
 * Guarded by Semaphore::rowLock(session.id) once published.
 */
struct ClassRow {
    ClassSession session;
    CommitJournal journal;
};

// ============================================================================
// CATALOG TABLE
// ============================================================================

/**
 * Class catalog table. Class id N lives in rows[N - 1].
 *
 * classCount is written under CATALOG_APPEND after the new row is complete,
 * so rows below classCount are always fully initialized.
 */
struct SharedCatalogState {
    ClassRow rows[Flags::Store::MAX_CLASSES];
    uint32_t classCount;

    SharedCatalogState() : rows{}, classCount{0} {
    }
};
