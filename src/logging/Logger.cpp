#include "logging/Logger.h"
#include "ipc/core/SharedMemory.h"
#include "ipc/core/Semaphore.h"
#include "ipc/core/MessageQueue.h"
#include "ipc/model/SharedReservationState.h"
#include <cstring>

namespace Logger {
    namespace detail {
        void sendToQueue(Source source, Level level, const char* tag, const char* text) {
            if (!centralizedMode || logQueue == nullptr || sem == nullptr || shm == nullptr) {
                logDirect(source, level, tag, "%s", text);
                return;
            }

            LogMessage msg;
            msg.level = static_cast<uint8_t>(level);
            msg.source = static_cast<uint8_t>(source);
            strncpy(msg.tag, tag, sizeof(msg.tag) - 1);
            msg.tag[sizeof(msg.tag) - 1] = '\0';
            strncpy(msg.text, text, sizeof(msg.text) - 1);
            msg.text[sizeof(msg.text) - 1] = '\0';
            gettimeofday(&msg.timestamp, nullptr);

            try {
                // Non-blocking: a sender may be holding a row lock
                // NOTE: useUndo=false, slots are returned by the logger process, not the sender
                if (!sem->tryAcquire(Semaphore::Index::LOG_QUEUE_SLOTS, false)) {
                    logDirect(source, level, tag, "%s", text);
                    return;
                }

                // Sequence number doubles as mtype (must be > 0) for ordered retrieval
                {
                    Semaphore::ScopedLock lock(*sem, Semaphore::Index::LOG_SEQUENCE);
                    msg.sequenceNum = ++shm->get()->operational.logSequenceNum;
                }

                if (!logQueue->trySend(msg, static_cast<long>(msg.sequenceNum))) {
                    // Kernel queue byte limit reached - release slot and fall back
                    sem->post(Semaphore::Index::LOG_QUEUE_SLOTS, false);
                    logDirect(source, level, tag, "%s", text);
                }
            } catch (const ipc_exception&) {
                // Store already torn down (shutdown race)
                logDirect(source, level, tag, "%s", text);
            }
        }
    }

    void initCentralized(key_t shmKey, key_t semKey, key_t logQueueKey) {
        try {
            detail::shm = new SharedMemory<SharedReservationState>(
                SharedMemory<SharedReservationState>::attach(shmKey));
            detail::sem = new Semaphore(semKey);
            detail::logQueue = new MessageQueue<LogMessage>(logQueueKey, "LogQueue");
            detail::centralizedMode = true;
        } catch (const ipc_exception& e) {
            cleanupCentralized();
            detail::logDirect(Source::Other, Level::WARN, "Logger",
                              "centralized logging unavailable, using direct output: %s", e.what());
        }
    }

    void cleanupCentralized() {
        detail::centralizedMode = false;
        delete detail::logQueue;
        detail::logQueue = nullptr;
        delete detail::sem;
        detail::sem = nullptr;
        delete detail::shm;
        detail::shm = nullptr;
    }
}
