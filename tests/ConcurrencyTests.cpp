#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <sys/wait.h>
#include <unistd.h>

#include "tests/TestConfig.h"
#include "tests/TestContext.h"

namespace Test {
    namespace {
        // Worker exit codes: 0 = effect applied, 1 = no-op, 10 + error = refused
        constexpr int EXIT_APPLIED{0};
        constexpr int EXIT_NOOP{1};
        constexpr int EXIT_UNEXPECTED{2};
        constexpr int EXIT_ERROR_BASE{10};

        int exitCodeOf(const ReservationError error) {
            return EXIT_ERROR_BASE + static_cast<int>(error);
        }

        /**
         * Fork a worker that blocks on MEMBERS_GO, runs fn and leaves with its exit code.
         * The child never unwinds into the runner: it always ends in _exit().
         */
        template<typename Fn>
        pid_t forkWorker(TestContext &ctx, Fn fn) {
            const pid_t pid = fork();
            if (pid != 0) {
                return pid;
            }

            int code = EXIT_UNEXPECTED;
            try {
                while (!ctx.ipc.sem().wait(Semaphore::Index::MEMBERS_GO, false)) {
                }
                code = fn();
            } catch (const reservation_exception &e) {
                code = exitCodeOf(e.error());
            } catch (const std::exception &e) {
                Logger::error("Worker", "%s", e.what());
            }
            _exit(code);
        }

        /** Release the gate for every forked worker and collect their exit codes. */
        std::vector<int> releaseAndCollect(TestContext &ctx, const std::vector<pid_t> &pids, TestResult &result) {
            ctx.ipc.sem().post(Semaphore::Index::MEMBERS_GO, static_cast<int32_t>(pids.size()), false);

            std::vector<int> codes;
            for (const pid_t pid: pids) {
                if (pid == -1) {
                    result.addFailure("fork failed");
                    continue;
                }
                int status = 0;
                if (waitpid(pid, &status, 0) == -1 || !WIFEXITED(status)) {
                    result.addFailure("worker " + std::to_string(pid) + " did not exit normally");
                    continue;
                }
                codes.push_back(WEXITSTATUS(status));
            }
            return codes;
        }

        /**
         * One-shot start line for threads so they hit the store together.
         */
        class StartGate {
        public:
            void wait() {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return open_; });
            }

            void open() {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    open_ = true;
                }
                cv_.notify_all();
            }

        private:
            std::mutex mutex_;
            std::condition_variable cv_;
            bool open_{false};
        };

        void noOversellProcesses(TestContext &ctx, TestResult &result) {
            constexpr uint32_t slots = 5;
            constexpr uint32_t workers = 20;
            const ClassSession session = ctx.makeClass("Sunrise Yoga", slots);

            std::vector<pid_t> pids;
            for (uint32_t user = 1; user <= workers; ++user) {
                pids.push_back(forkWorker(ctx, [&ctx, user, &session] {
                    ctx.engine.createBooking(user, session.id);
                    return EXIT_APPLIED;
                }));
            }
            const auto codes = releaseAndCollect(ctx, pids, result);

            const auto booked = std::count(codes.begin(), codes.end(), EXIT_APPLIED);
            const auto refused = std::count(codes.begin(), codes.end(),
                                            exitCodeOf(ReservationError::ClassUnavailable));
            result.checkEq(booked, static_cast<long>(slots), "successful bookings");
            result.checkEq(refused, static_cast<long>(workers - slots), "ClassUnavailable refusals");
            result.checkEq(ctx.row(session.id).availableSlots, 0u, "class exactly full");
            result.bookingsCommitted = static_cast<uint32_t>(booked);
        }

        void noOversellThreads(TestContext &ctx, TestResult &result) {
            constexpr uint32_t slots = 7;
            constexpr uint32_t workers = 32;
            const ClassSession session = ctx.makeClass("Lunch HIIT", slots, 86400, ClassCategory::HIIT);

            StartGate gate;
            std::atomic<uint32_t> booked{0};
            std::atomic<uint32_t> unavailable{0};
            std::atomic<uint32_t> other{0};
            std::vector<std::thread> threads;
            for (uint32_t user = 1; user <= workers; ++user) {
                threads.emplace_back([&, user] {
                    gate.wait();
                    try {
                        ctx.engine.createBooking(user, session.id);
                        ++booked;
                    } catch (const reservation_exception &e) {
                        if (e.error() == ReservationError::ClassUnavailable) {
                            ++unavailable;
                        } else {
                            ++other;
                        }
                    }
                });
            }
            gate.open();
            for (auto &t: threads) {
                t.join();
            }

            result.checkEq(booked.load(), slots, "successful bookings");
            result.checkEq(unavailable.load(), workers - slots, "ClassUnavailable refusals");
            result.checkEq(other.load(), 0u, "unexpected errors");
            result.checkEq(ctx.row(session.id).availableSlots, 0u, "class exactly full");
            result.bookingsCommitted = booked.load();
        }

        void concurrentCancelProcesses(TestContext &ctx, TestResult &result) {
            const ClassSession session = ctx.makeClass("Evening Zumba", 3, 86400, ClassCategory::ZUMBA);
            const Booking booking = ctx.engine.createBooking(1, session.id);
            const Principal owner{1, false};

            std::vector<pid_t> pids;
            for (int i = 0; i < 8; ++i) {
                pids.push_back(forkWorker(ctx, [&ctx, &owner, &booking] {
                    return ctx.engine.cancelBooking(owner, booking.id) ? EXIT_APPLIED : EXIT_NOOP;
                }));
            }
            const auto codes = releaseAndCollect(ctx, pids, result);

            result.checkEq(std::count(codes.begin(), codes.end(), EXIT_APPLIED), 1L, "cancellations applied");
            result.checkEq(std::count(codes.begin(), codes.end(), EXIT_NOOP), 7L, "no-op cancellations");
            result.checkEq(ctx.row(session.id).availableSlots, 3u, "slot returned exactly once");
            result.bookingsCommitted = 1;
            result.cancellations = 1;
        }

        void concurrentCancelThreads(TestContext &ctx, TestResult &result) {
            const ClassSession session = ctx.makeClass("Power Yoga", 4);
            const Booking booking = ctx.engine.createBooking(5, session.id);
            ctx.engine.createBooking(6, session.id);

            StartGate gate;
            std::atomic<uint32_t> applied{0};
            std::atomic<uint32_t> noop{0};
            std::vector<std::thread> threads;
            for (int i = 0; i < 2; ++i) {
                // The owner and an administrator race on the same booking
                const Principal actor = i == 0 ? Principal{5, false} : Principal{100, true};
                threads.emplace_back([&, actor] {
                    gate.wait();
                    if (ctx.engine.cancelBooking(actor, booking.id)) {
                        ++applied;
                    } else {
                        ++noop;
                    }
                });
            }
            gate.open();
            for (auto &t: threads) {
                t.join();
            }

            result.checkEq(applied.load(), 1u, "exactly one cancellation applied");
            result.checkEq(noop.load(), 1u, "the other cancellation was a no-op");
            result.checkEq(ctx.row(session.id).availableSlots, 3u, "one slot returned");
            result.bookingsCommitted = 2;
            result.cancellations = 1;
        }

        void duplicateRace(TestContext &ctx, TestResult &result) {
            const ClassSession session = ctx.makeClass("Spin", 10, 86400, ClassCategory::HIIT);

            StartGate gate;
            std::atomic<uint32_t> booked{0};
            std::atomic<uint32_t> duplicates{0};
            std::vector<std::thread> threads;
            for (int i = 0; i < 6; ++i) {
                threads.emplace_back([&] {
                    gate.wait();
                    try {
                        ctx.engine.createBooking(42, session.id);
                        ++booked;
                    } catch (const reservation_exception &e) {
                        if (e.error() == ReservationError::DuplicateBooking) {
                            ++duplicates;
                        }
                    }
                });
            }
            gate.open();
            for (auto &t: threads) {
                t.join();
            }

            result.checkEq(booked.load(), 1u, "one booking per member");
            result.checkEq(duplicates.load(), 5u, "DuplicateBooking refusals");
            result.checkEq(ctx.row(session.id).availableSlots, 9u, "one slot consumed");
            result.bookingsCommitted = 1;
        }

        void independentClasses(TestContext &ctx, TestResult &result) {
            const ClassSession held = ctx.makeClass("Sunrise Yoga", 3);
            const ClassSession other = ctx.makeClass("Evening Zumba", 3, 86400, ClassCategory::ZUMBA);

            std::atomic<bool> locked{false};
            std::thread holder([&] {
                ClassRowLock lock = ctx.catalog.lockRow(held.id);
                locked = true;
                std::this_thread::sleep_for(std::chrono::milliseconds(800));
            });
            while (!locked) {
                std::this_thread::yield();
            }

            std::atomic<bool> waitedBooking{false};
            std::thread waiter([&] {
                ctx.engine.createBooking(1, held.id);
                waitedBooking = true;
            });

            const auto start = std::chrono::steady_clock::now();
            ctx.engine.createBooking(2, other.id);
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();

            result.check(elapsed < 400, "booking another class is not delayed by the held row (" +
                                        std::to_string(elapsed) + " ms)");
            result.check(!waitedBooking, "booking of the held class waits for the lock");

            holder.join();
            waiter.join();
            result.check(waitedBooking, "waiting booking completes after release");
            result.checkEq(ctx.row(held.id).availableSlots, 2u, "held class booked once");
            result.checkEq(ctx.row(other.id).availableSlots, 2u, "free class booked once");
            result.bookingsCommitted = 2;
        }

        void lockTimeout(TestContext &ctx, TestResult &result) {
            const ClassSession session = ctx.makeClass("Power Yoga", 3);
            {
                ClassRowLock lock = ctx.catalog.lockRow(session.id);
                result.checkThrows(ReservationError::LockTimeout,
                                   [&] { ctx.engine.createBooking(1, session.id); }, "row held past the timeout");
                result.checkThrows(ReservationError::LockTimeout,
                                   [&] { ctx.catalog.get(session.id); }, "read of a held row");
                result.checkEq(ctx.ledger.size(), 0u, "timed out booking left no record");
            }

            ctx.engine.createBooking(1, session.id);
            result.checkEq(ctx.row(session.id).availableSlots, 2u, "booking succeeds once the row is free");
            result.bookingsCommitted = 1;
        }

        void crashRecovery(TestContext &ctx, TestResult &result) {
            const ClassSession session = ctx.makeClass("Lunch HIIT", 4, 86400, ClassCategory::HIIT);
            ctx.engine.createBooking(1, session.id);

            const pid_t pid = fork();
            if (pid == 0) {
                int code = EXIT_APPLIED;
                try {
                    // Die between recording the booking and updating the slot count
                    ClassRowLock lock = ctx.catalog.getForUpdate(session.id);
                    CommitJournal &journal = lock.journal();
                    journal.op = JournalOp::BOOK;
                    journal.holderPid = getpid();
                    journal.active = true;
                    journal.bookingId = ctx.ledger.append(2, session.id, TimeHelper::now());
                    _exit(EXIT_APPLIED);
                } catch (const reservation_exception &e) {
                    code = exitCodeOf(e.error());
                }
                _exit(code);
            }
            if (!result.check(pid != -1, "fork")) {
                return;
            }

            int status = 0;
            waitpid(pid, &status, 0);
            result.check(WIFEXITED(status) && WEXITSTATUS(status) == EXIT_APPLIED, "worker died mid-commit");

            result.checkEq(ctx.ipc.sem().getValue(Semaphore::rowLock(session.id)), 1,
                           "kernel released the dead worker's row lock");
            const ClassRow &row = ctx.ipc.state()->catalog.rows[session.id - 1];
            result.check(row.journal.active, "interrupted commit left its journal");
            result.checkEq(row.session.availableSlots, 3u, "slot count not yet updated");

            // The kernel released the row lock; the next transaction repairs the row
            const Booking next = ctx.engine.createBooking(3, session.id);
            result.check(!row.journal.active, "journal cleared by repair");
            result.checkEq(row.session.availableSlots, 1u, "slots recomputed from confirmed bookings");
            result.checkThrows(ReservationError::DuplicateBooking,
                               [&] { ctx.engine.createBooking(2, session.id); },
                               "recorded booking of the dead worker counts");
            result.check(next.id == 3, "ledger ids continue after the interrupted booking");
            result.bookingsCommitted = 3;
        }

        void crashDuringRemoval(TestContext &ctx, TestResult &result) {
            const ClassSession session = ctx.makeClass("Evening Zumba", 3, 86400, ClassCategory::ZUMBA);
            const Booking first = ctx.engine.createBooking(1, session.id);
            const Booking second = ctx.engine.createBooking(2, session.id);

            const pid_t pid = fork();
            if (pid == 0) {
                int code = EXIT_APPLIED;
                try {
                    // Die after cancelling the first booking of a removal
                    ClassRowLock lock = ctx.catalog.getForUpdate(session.id);
                    CommitJournal &journal = lock.journal();
                    journal.op = JournalOp::REMOVE;
                    journal.holderPid = getpid();
                    journal.active = true;
                    ctx.ledger.forEachOfClass(session.id, [&](Booking &booking) {
                        if (booking.id == first.id) {
                            booking.status = BookingStatus::CANCELLED;
                            booking.cancelledAt = TimeHelper::now();
                        }
                    });
                    _exit(EXIT_APPLIED);
                } catch (const reservation_exception &e) {
                    code = exitCodeOf(e.error());
                }
                _exit(code);
            }
            if (!result.check(pid != -1, "fork")) {
                return;
            }

            int status = 0;
            waitpid(pid, &status, 0);
            result.check(WIFEXITED(status) && WEXITSTATUS(status) == EXIT_APPLIED, "worker died mid-removal");

            const ClassRow &row = ctx.ipc.state()->catalog.rows[session.id - 1];
            result.check(row.journal.active, "interrupted removal left its journal");
            result.check(!row.session.removed, "row not yet marked removed");

            // The next writer finishes the removal before giving up on the class
            result.checkThrows(ReservationError::ClassNotFound,
                               [&] { ctx.engine.createBooking(3, session.id); },
                               "booking a class whose removal was interrupted");
            result.check(!row.journal.active, "journal cleared by repair");
            result.check(row.session.removed, "repair marks the class removed");
            result.checkEq(row.session.availableSlots, 3u, "no confirmed bookings left on the removed class");
            result.check(!ctx.catalog.get(session.id).has_value(), "removed class is no longer visible");

            for (const uint32_t id: {first.id, second.id}) {
                const std::optional<Booking> booking = ctx.engine.findBooking(id);
                result.check(booking.has_value() && booking->status == BookingStatus::CANCELLED,
                             "booking " + std::to_string(id) + " cancelled with its class");
            }
            result.checkEq(ctx.ledger.size(), 2u, "repair records no new booking");
            result.bookingsCommitted = 2;
            result.cancellations = 2;
        }

        void mixedLoad(TestContext &ctx, TestResult &result) {
            constexpr uint32_t classes = 3;
            constexpr uint32_t workers = 6;
            constexpr int rounds = 40;
            for (uint32_t i = 0; i < classes; ++i) {
                const std::string name = "Class " + std::to_string(i + 1);
                ctx.makeClass(name.c_str(), 4);
            }

            std::vector<pid_t> pids;
            for (uint32_t user = 1; user <= workers; ++user) {
                pids.push_back(forkWorker(ctx, [&ctx, user] {
                    srand(static_cast<unsigned>(getpid()));
                    const Principal self{user, false};
                    for (int i = 0; i < rounds; ++i) {
                        try {
                            if (rand() % 100 < 40) {
                                BookingFilter mine;
                                mine.userId = user;
                                mine.status = BookingStatus::CONFIRMED;
                                const auto held = ctx.engine.listBookings(mine);
                                if (!held.empty()) {
                                    ctx.engine.cancelBooking(self, held[rand() % held.size()].id);
                                }
                            } else {
                                ctx.engine.createBooking(user, 1 + static_cast<uint32_t>(rand()) % classes);
                            }
                        } catch (const reservation_exception &e) {
                            if (e.error() != ReservationError::ClassUnavailable &&
                                e.error() != ReservationError::DuplicateBooking) {
                                throw;
                            }
                        }
                        usleep(static_cast<useconds_t>(rand() % 2000));
                    }
                    return EXIT_APPLIED;
                }));
            }
            const auto codes = releaseAndCollect(ctx, pids, result);
            result.checkEq(std::count(codes.begin(), codes.end(), EXIT_APPLIED), static_cast<long>(workers),
                           "workers finished without unexpected errors");

            uint32_t cancelled = 0;
            for (const auto &booking: ctx.engine.listBookings(BookingFilter{})) {
                if (!booking.isConfirmed()) ++cancelled;
            }
            result.bookingsCommitted = ctx.ledger.size();
            result.cancellations = cancelled;
        }
    }

    namespace Scenarios {
        std::vector<TestScenario> concurrencyTests() {
            std::vector<TestScenario> scenarios;

            TestScenario processes;
            processes.name = "Concurrency_NoOversellProcesses";
            processes.description = "20 processes race for 5 slots";
            processes.body = noOversellProcesses;
            scenarios.push_back(processes);

            TestScenario threads;
            threads.name = "Concurrency_NoOversellThreads";
            threads.description = "32 threads race for 7 slots";
            threads.body = noOversellThreads;
            scenarios.push_back(threads);

            TestScenario cancelProcesses;
            cancelProcesses.name = "Concurrency_CancelRaceProcesses";
            cancelProcesses.description = "8 processes cancel the same booking";
            cancelProcesses.body = concurrentCancelProcesses;
            scenarios.push_back(cancelProcesses);

            TestScenario cancelThreads;
            cancelThreads.name = "Concurrency_CancelRaceThreads";
            cancelThreads.description = "Owner and administrator cancel the same booking together";
            cancelThreads.body = concurrentCancelThreads;
            scenarios.push_back(cancelThreads);

            TestScenario duplicate;
            duplicate.name = "Concurrency_DuplicateRace";
            duplicate.description = "One member books the same class from 6 threads";
            duplicate.body = duplicateRace;
            scenarios.push_back(duplicate);

            TestScenario independent;
            independent.name = "Concurrency_IndependentClasses";
            independent.description = "A held class row does not block bookings of other classes";
            independent.body = independentClasses;
            scenarios.push_back(independent);

            TestScenario timeout;
            timeout.name = "Concurrency_LockTimeout";
            timeout.description = "Waiting longer than the lock timeout fails with LockTimeout";
            timeout.env.lockTimeoutMs = 200;
            timeout.body = lockTimeout;
            scenarios.push_back(timeout);

            TestScenario crash;
            crash.name = "Concurrency_CrashRecovery";
            crash.description = "A worker dying inside a commit is repaired by the next transaction";
            crash.body = crashRecovery;
            scenarios.push_back(crash);

            TestScenario crashRemove;
            crashRemove.name = "Concurrency_CrashDuringRemoval";
            crashRemove.description = "A removal interrupted by a dying worker is finished by the next writer";
            crashRemove.body = crashDuringRemoval;
            scenarios.push_back(crashRemove);

            TestScenario mixed;
            mixed.name = "Concurrency_MixedLoad";
            mixed.description = "6 processes book and cancel at random across 3 classes";
            mixed.body = mixedLoad;
            scenarios.push_back(mixed);

            return scenarios;
        }
    }
}
