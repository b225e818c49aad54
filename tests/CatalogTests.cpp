#include <string>
#include <unistd.h>

#include "tests/TestConfig.h"
#include "tests/TestContext.h"

namespace Test {
    namespace {
        ClassDefinition definition(const char *name, const uint32_t slots, const time_t startInSec) {
            ClassDefinition def;
            def.name = name;
            def.category = ClassCategory::HIIT;
            def.instructor = "Jordan Lee";
            def.startTime = TimeHelper::now() + startInSec;
            def.durationMinutes = 30;
            def.totalSlots = slots;
            return def;
        }

        void createValidation(TestContext &ctx, TestResult &result) {
            const ClassSession created = ctx.catalog.create(definition("HIIT Blast", 5, 3600));
            result.checkEq(created.id, 1u, "first class id");
            result.checkEq(created.availableSlots, 5u, "new class starts with all slots free");
            result.check(created.createdAt > 0 && created.updatedAt == created.createdAt, "timestamps set");

            result.checkThrows(ReservationError::InvalidDefinition,
                               [&] { ctx.catalog.create(definition("No Seats", 0, 3600)); },
                               "zero slots");
            result.checkThrows(ReservationError::InvalidDefinition,
                               [&] { ctx.catalog.create(definition("Yesterday", 5, -86400)); },
                               "start time in the past");
            result.checkThrows(ReservationError::InvalidDefinition,
                               [&] { ctx.catalog.create(definition("", 5, 3600)); },
                               "empty name");
            result.checkThrows(ReservationError::InvalidDefinition,
                               [&] { ctx.catalog.create(definition(std::string(100, 'x').c_str(), 5, 3600)); },
                               "name longer than 99 characters");

            ClassDefinition noInstructor = definition("Solo", 5, 3600);
            noInstructor.instructor.clear();
            result.checkThrows(ReservationError::InvalidDefinition,
                               [&] { ctx.catalog.create(noInstructor); }, "empty instructor");

            ClassDefinition noDuration = definition("Instant", 5, 3600);
            noDuration.durationMinutes = 0;
            result.checkThrows(ReservationError::InvalidDefinition,
                               [&] { ctx.catalog.create(noDuration); }, "zero duration");

            result.checkEq(ctx.catalog.size(), 1u, "rejected definitions leave the catalog unchanged");

            const ClassSession longest = ctx.catalog.create(definition(std::string(99, 'y').c_str(), 1, 60));
            result.checkEq(std::string(longest.name).size(), static_cast<size_t>(99), "99 character name stored");
        }

        void listAndFilter(TestContext &ctx, TestResult &result) {
            const time_t day = 86400;
            const ClassSession later = ctx.makeClass("Evening Zumba", 10, 2 * day, ClassCategory::ZUMBA);
            const ClassSession first = ctx.makeClass("Sunrise Yoga", 10, day, ClassCategory::YOGA);
            const ClassSession second = ctx.makeClass("Power Yoga", 10, 2 * day + 3600, ClassCategory::YOGA);
            const ClassSession soon = ctx.makeClass("Lunch HIIT", 10, 1, ClassCategory::HIIT);

            sleep(2); // "Lunch HIIT" has started now

            const auto upcoming = ctx.catalog.list(ClassFilter{});
            if (result.checkEq(upcoming.size(), static_cast<size_t>(3), "upcoming classes")) {
                result.checkEq(upcoming[0].id, first.id, "ordered by start time (1st)");
                result.checkEq(upcoming[1].id, later.id, "ordered by start time (2nd)");
                result.checkEq(upcoming[2].id, second.id, "ordered by start time (3rd)");
            }

            ClassFilter everything;
            everything.upcomingOnly = false;
            const auto all = ctx.catalog.list(everything);
            result.checkEq(all.size(), static_cast<size_t>(4), "listing with started classes");
            if (!all.empty()) {
                result.checkEq(all[0].id, soon.id, "started class listed first");
            }

            result.check(!parseClassCategory("PILATES").has_value(), "unknown category name");
            ClassFilter yoga;
            yoga.category = parseClassCategory("YOGA");
            result.checkEq(ctx.catalog.list(yoga).size(), static_cast<size_t>(2), "category filter");

            ClassFilter onDay;
            onDay.day = later.startTime;
            const auto sameDay = ctx.catalog.list(onDay);
            result.checkEq(sameDay.size(), static_cast<size_t>(TimeHelper::isSameDay(later.startTime, second.startTime)
                                                                   ? 2
                                                                   : 1), "day filter");

            result.check(ctx.catalog.get(first.id).has_value(), "get existing class");
            result.check(!ctx.catalog.get(0).has_value(), "get id 0");
            result.check(!ctx.catalog.get(99).has_value(), "get unknown id");
            result.checkThrows(ReservationError::ClassNotFound, [&] { ctx.catalog.getForUpdate(99); },
                               "lock unknown class");
        }

        void updateClass(TestContext &ctx, TestResult &result) {
            const ClassSession session = ctx.makeClass("Power Yoga", 5);
            for (uint32_t user = 1; user <= 3; ++user) {
                ctx.engine.createBooking(user, session.id);
            }

            ClassDefinition shrink = definition("Power Yoga", 2, 86400);
            result.checkThrows(ReservationError::InvalidDefinition,
                               [&] { ctx.engine.updateClass(session.id, shrink); },
                               "capacity below confirmed bookings");
            result.checkEq(ctx.row(session.id).totalSlots, 5u, "failed update leaves capacity");
            result.checkEq(ctx.row(session.id).availableSlots, 2u, "failed update leaves free slots");

            ClassDefinition grow = definition("Power Yoga XL", 8, 2 * 86400);
            grow.category = ClassCategory::YOGA;
            const ClassSession updated = ctx.engine.updateClass(session.id, grow);
            result.checkEq(updated.totalSlots, 8u, "capacity raised");
            result.checkEq(updated.availableSlots, 5u, "free slots follow capacity");
            result.check(std::string(updated.name) == "Power Yoga XL", "name updated");
            result.check(updated.updatedAt >= updated.createdAt, "updatedAt refreshed");

            ClassDefinition exact = definition("Power Yoga", 3, 86400);
            const ClassSession full = ctx.engine.updateClass(session.id, exact);
            result.checkEq(full.availableSlots, 0u, "capacity equal to bookings leaves no free slot");
            result.checkThrows(ReservationError::ClassUnavailable,
                               [&] { ctx.engine.createBooking(9, session.id); }, "booking after shrink to full");
            result.bookingsCommitted = 3;
        }

        void removeClass(TestContext &ctx, TestResult &result) {
            const ClassSession session = ctx.makeClass("Evening Zumba", 4, 86400, ClassCategory::ZUMBA);
            const ClassSession other = ctx.makeClass("Sunrise Yoga", 4);
            const Booking a = ctx.engine.createBooking(1, session.id);
            ctx.engine.createBooking(2, session.id);
            ctx.engine.createBooking(1, other.id);

            result.checkEq(ctx.engine.removeClass(session.id), 2u, "removal cancels confirmed bookings");
            result.check(!ctx.catalog.get(session.id).has_value(), "removed class is not found");
            result.checkEq(ctx.catalog.list(ClassFilter{}).size(), static_cast<size_t>(1), "removed class not listed");
            result.checkThrows(ReservationError::ClassNotFound,
                               [&] { ctx.engine.createBooking(3, session.id); }, "booking a removed class");
            result.checkThrows(ReservationError::ClassNotFound,
                               [&] { ctx.engine.removeClass(session.id); }, "removing twice");

            const Principal owner{1, false};
            result.check(!ctx.engine.cancelBooking(owner, a.id), "booking of removed class already cancelled");
            const auto found = ctx.engine.findBooking(a.id);
            result.check(found && found->status == BookingStatus::CANCELLED && found->cancelledAt > 0,
                         "removal stamps cancelledAt");

            result.checkEq(ctx.row(other.id).availableSlots, 3u, "other class untouched");
            result.cancellations = 2;
        }

        void catalogFull(TestContext &ctx, TestResult &result) {
            for (uint32_t i = 0; i < Flags::Store::MAX_CLASSES; ++i) {
                const std::string name = "Class " + std::to_string(i + 1);
                ctx.makeClass(name.c_str(), 1);
            }
            result.checkThrows(ReservationError::StorageError,
                               [&] { ctx.makeClass("One Too Many", 1); }, "catalog table full");
            result.checkEq(ctx.catalog.size(), Flags::Store::MAX_CLASSES, "catalog size at limit");
        }
    }

    namespace Scenarios {
        std::vector<TestScenario> catalogTests() {
            std::vector<TestScenario> scenarios;

            TestScenario create;
            create.name = "Catalog_CreateValidation";
            create.description = "Class definitions are validated before anything is stored";
            create.body = createValidation;
            scenarios.push_back(create);

            TestScenario list;
            list.name = "Catalog_ListAndFilter";
            list.description = "Listings are ordered by start time and filter by category, day and start";
            list.body = listAndFilter;
            scenarios.push_back(list);

            TestScenario update;
            update.name = "Catalog_UpdateClass";
            update.description = "Capacity edits keep free slots equal to capacity minus confirmed bookings";
            update.body = updateClass;
            scenarios.push_back(update);

            TestScenario remove;
            remove.name = "Catalog_RemoveClass";
            remove.description = "Removing a class cancels its bookings and hides it from the catalog";
            remove.body = removeClass;
            scenarios.push_back(remove);

            TestScenario full;
            full.name = "Catalog_TableFull";
            full.description = "Creating more classes than the table holds fails with StorageError";
            full.body = catalogFull;
            scenarios.push_back(full);

            return scenarios;
        }
    }
}
