#include <unistd.h>
#include <climits>
#include <cstdio>
#include <vector>
#include <algorithm>

#include "ipc/core/SharedMemory.h"
#include "ipc/core/Semaphore.h"
#include "ipc/core/MessageQueue.h"
#include "ipc/model/SharedReservationState.h"
#include "logging/LogMessage.h"
#include "logging/Logger.h"
#include "utils/SignalHelper.h"
#include "utils/ArgumentParser.h"

namespace {
    SignalHelper::Flags g_signals;
    constexpr const char* TAG = "Logger";
}

/**
 * Single consumer of the log queue. Prints messages in sequence order and
 * returns their queue slots to the senders.
 */
class LoggerProcess {
public:
    LoggerProcess(key_t shmKey, key_t semKey, key_t logMsgKey)
        : shm_{SharedMemory<SharedReservationState>::attach(shmKey)},
          sem_{semKey},
          logQueue_{logMsgKey, "LogQueue"} {
        shm_->operational.loggerPid = getpid();
        sem_.post(Semaphore::Index::LOGGER_READY, false);
        Logger::detail::logDirect(Logger::Source::Other, Logger::Level::INFO, TAG, "started (PID: %d)", getpid());
    }

    void run() {
        while (!g_signals.exit) {
            // Lowest mtype first = lowest sequence number first
            auto msg = logQueue_.tryReceive(-LONG_MAX);
            if (!msg) {
                usleep(1000);
                continue;
            }
            releaseSlot();
            printLog(*msg);
        }

        drainQueue();
    }

private:
    void releaseSlot() {
        sem_.post(Semaphore::Index::LOG_QUEUE_SLOTS, false);
    }

    static void printLog(const LogMessage& msg) {
        char timeBuf[20];
        Logger::detail::formatTime(msg.timestamp, timeBuf, sizeof(timeBuf));

        const uint8_t level = msg.safeLevel();
        const auto source = static_cast<Logger::Source>(msg.source);
        const char* color = Logger::detail::getTagColor(source, static_cast<Logger::Level>(level));

        char buf[512];
        int n = snprintf(buf, sizeof(buf), "\033[90m%s\033[0m %s[%s] [%s]\033[0m %s\n",
                         timeBuf,
                         color,
                         Logger::detail::names[level],
                         msg.tag,
                         msg.text);
        if (n > static_cast<int>(sizeof(buf)) - 1) {
            n = sizeof(buf) - 1;
        }
        ssize_t written = write(STDOUT_FILENO, buf, n);
        (void) written;
    }

    void drainQueue() {
        std::vector<LogMessage> remaining;

        while (true) {
            auto msg = logQueue_.tryReceive(0);
            if (!msg) break;
            releaseSlot();
            remaining.push_back(*msg);
        }

        std::sort(remaining.begin(), remaining.end(),
                  [](const LogMessage& a, const LogMessage& b) {
                      return a.sequenceNum < b.sequenceNum;
                  });

        for (const auto& msg : remaining) {
            printLog(msg);
        }
    }

    SharedMemory<SharedReservationState> shm_;
    Semaphore sem_;
    MessageQueue<LogMessage> logQueue_;
};

int main(int argc, char* argv[]) {
    ArgumentParser::LoggerArgs args{};
    if (!ArgumentParser::parseLoggerArgs(argc, argv, args)) {
        return 1;
    }

    SignalHelper::setupChildProcess(g_signals);

    try {
        LoggerProcess logger(args.shmKey, args.semKey, args.logMsgKey);
        logger.run();
    } catch (const std::exception& e) {
        fprintf(stderr, "[%s] Exception: %s\n", TAG, e.what());
        return 1;
    }

    return 0;
}
