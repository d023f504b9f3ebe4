#include <gtest/gtest.h>
#include "log/txlog_clock.hpp"
#include "test_clock_helpers.hpp"
#include <thread>

using namespace txlog;

TEST(ClockTest, NanosecondTicksConvertExactly) {
    EXPECT_EQ(Clock::toDuration(1500, 1000000000), Duration(1500));
    EXPECT_EQ(Clock::toDuration(-20, 1000000000), Duration(-20));
}

TEST(ClockTest, CoarseTicksScaleUp) {
    // 毫秒级计数
    EXPECT_EQ(Clock::toDuration(3, 1000), std::chrono::milliseconds(3));
    EXPECT_EQ(Clock::toDuration(7, 1), std::chrono::seconds(7));
}

TEST(ClockTest, UnevenFrequencyRoundsHalfAwayFromZero) {
    // 3 ticks/s: 1 tick = 333,333,333.33 ns
    EXPECT_EQ(Clock::toDuration(1, 3), Duration(333333333));
    // 2,000,000,000 ticks/s 不能整除：1 tick = 0.5 ns
    EXPECT_EQ(Clock::toDuration(1, 2000000000), Duration(1));
    EXPECT_EQ(Clock::toDuration(-1, 2000000000), Duration(-1));
    EXPECT_EQ(Clock::toDuration(3, 2000000000), Duration(2));
}

TEST(ClockTest, InvalidFrequencyYieldsZero) {
    EXPECT_EQ(Clock::toDuration(100, 0), Duration::zero());
}

TEST(ClockTest, UnitConversions) {
    Duration d = std::chrono::microseconds(2500);
    EXPECT_DOUBLE_EQ(Clock::toMilliseconds(d), 2.5);
    EXPECT_DOUBLE_EQ(Clock::toMicroseconds(d), 2500.0);
    EXPECT_DOUBLE_EQ(Clock::toSeconds(d), 0.0025);
}

TEST(ClockTest, SteadyClockIsMonotonic) {
    int64_t start = Clock::now();
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    EXPECT_GE(Clock::now(), start);
    EXPECT_GE(Clock::durationSince(start), std::chrono::milliseconds(1));
    EXPECT_GT(SteadyClock::getInstance().ticksPerSecond(), 0);
}

TEST(ClockTest, ManualClockAdvances) {
    ManualClock clock;
    Timestamp before = clock.wallNow();
    clock.advance(std::chrono::milliseconds(5));
    EXPECT_EQ(clock.ticks(), 5000000);
    EXPECT_EQ(clock.wallNow() - before, std::chrono::milliseconds(5));
}
