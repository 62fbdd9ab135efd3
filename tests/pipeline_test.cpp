#include "pipeline.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

TEST(ReplenishmentPipeline, ConstructorClearsSlots) {
    std::vector<std::uint64_t> slots(4, 99);
    ReplenishmentPipeline pipeline(slots.data(), 4);
    for (std::size_t i = 0; i < 4; ++i) EXPECT_EQ(pipeline.pending(i), 0u);
}

TEST(ReplenishmentPipeline, ArrivalTakesAndClearsSlot) {
    std::vector<std::uint64_t> slots(3);
    ReplenishmentPipeline pipeline(slots.data(), 3);
    pipeline.schedule(0, 12);          // slot 2
    EXPECT_EQ(pipeline.pending(2), 12u);
    EXPECT_EQ(pipeline.arrivalDueToday(2), 12u);
    EXPECT_EQ(pipeline.pending(2), 0u);
    EXPECT_EQ(pipeline.arrivalDueToday(5), 0u);
}

TEST(ReplenishmentPipeline, OrderArrivesOnLastDayOfLeadTime) {
    for (std::uint64_t lead : {2u, 3u, 7u, 10u}) {
        for (std::uint64_t placed : {0u, 1u, 13u, 200u}) {
            std::vector<std::uint64_t> slots(lead);
            ReplenishmentPipeline pipeline(slots.data(), lead);
            pipeline.schedule(placed, 21);

            std::uint64_t arrivedOn = 0;
            for (std::uint64_t day = placed + 1; day <= placed + lead; ++day) {
                if (pipeline.arrivalDueToday(day) == 21) {
                    arrivedOn = day;
                    break;
                }
            }
            EXPECT_EQ(arrivedOn, placed + lead - 1) << "lead " << lead << " placed " << placed;
        }
    }
}

TEST(ReplenishmentPipeline, UnitLeadTimeArrivesNextDay) {
    std::vector<std::uint64_t> slots(1);
    ReplenishmentPipeline pipeline(slots.data(), 1);
    pipeline.schedule(41, 6);
    EXPECT_EQ(pipeline.arrivalDueToday(42), 6u);
}

TEST(ReplenishmentPipeline, ScheduleReplacesPendingQuantity) {
    std::vector<std::uint64_t> slots(5);
    ReplenishmentPipeline pipeline(slots.data(), 5);

    pipeline.schedule(3, 5);
    pipeline.schedule(3, 8);
    EXPECT_EQ(pipeline.arrivalDueToday(7), 8u);

    pipeline.schedule(0, 5);
    pipeline.schedule(5, 7);           // same slot, previous order not yet taken
    EXPECT_EQ(pipeline.arrivalDueToday(4), 7u);
}

TEST(ReplenishmentPipeline, TrailingOrderIsNeverDelivered) {
    const std::uint64_t lead = 10;
    std::vector<std::uint64_t> slots(lead);
    ReplenishmentPipeline pipeline(slots.data(), lead);

    pipeline.schedule(360, 14);        // due on day 369, past the 365-day year
    for (std::uint64_t day = 361; day < 365; ++day) EXPECT_EQ(pipeline.arrivalDueToday(day), 0u);
    EXPECT_EQ(pipeline.pending((360 + lead - 1) % lead), 14u);
}
