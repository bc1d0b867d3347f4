/******************************************************************************
 * @brief Unit tests for system time parsing and the loop cadence clock.
 *
 * @file TimeOperationsTests.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-31
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "../../src/util/TimeOperations.hpp"

/// \cond
#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <thread>

/// \endcond

TEST(TimeOperationsTest, SystemTimeKeepsMilliseconds)
{
    timeops::SystemTimestamp stTimestamp = timeops::ParseSystemTime("2024:05:01:12:30:15:250");

    ASSERT_FALSE(stTimestamp.bIsFallback);
    double dWhole = 0.0;
    EXPECT_NEAR(std::modf(stTimestamp.dEpochSeconds, &dWhole), 0.25, 1e-6);
}

TEST(TimeOperationsTest, SystemTimeDifferencesAreExact)
{
    timeops::SystemTimestamp stFirst  = timeops::ParseSystemTime("2024:05:01:12:30:15:250");
    timeops::SystemTimestamp stSecond = timeops::ParseSystemTime("2024:05:01:12:30:17:750");

    ASSERT_FALSE(stFirst.bIsFallback);
    ASSERT_FALSE(stSecond.bIsFallback);
    EXPECT_NEAR(stSecond.dEpochSeconds - stFirst.dEpochSeconds, 2.5, 1e-6);
}

TEST(TimeOperationsTest, UnparsableSystemTimeFallsBackToNow)
{
    for (const char* pInput : {"", "garbage", "2024:05:01:12:30:15", "2024:13:01:12:30:15:000", "2024:02:30:12:30:15:000", "2024:05:01:12:30:15:25x"})
    {
        double dBefore                       = timeops::GetEpochSeconds();
        timeops::SystemTimestamp stTimestamp = timeops::ParseSystemTime(pInput);
        double dAfter                        = timeops::GetEpochSeconds();

        EXPECT_TRUE(stTimestamp.bIsFallback) << pInput;
        EXPECT_GE(stTimestamp.dEpochSeconds, dBefore) << pInput;
        EXPECT_LE(stTimestamp.dEpochSeconds, dAfter) << pInput;
    }
}

TEST(TimeOperationsTest, CadenceClockWaitsWhenOnTime)
{
    timeops::CadenceClock stClock(std::chrono::milliseconds(20));

    std::chrono::steady_clock::time_point tmStart = std::chrono::steady_clock::now();
    EXPECT_TRUE(stClock.WaitForNextTick());
    EXPECT_TRUE(stClock.WaitForNextTick());
    EXPECT_GE(std::chrono::steady_clock::now() - tmStart, std::chrono::milliseconds(35));
}

TEST(TimeOperationsTest, CadenceClockNeverBurstsAfterAnOverrun)
{
    timeops::CadenceClock stClock(std::chrono::milliseconds(20));

    // Overrun three periods.
    std::this_thread::sleep_for(std::chrono::milliseconds(70));
    EXPECT_FALSE(stClock.WaitForNextTick());

    // The next tick is a full period later, not immediately to catch up.
    std::chrono::steady_clock::time_point tmStart = std::chrono::steady_clock::now();
    EXPECT_TRUE(stClock.WaitForNextTick());
    EXPECT_GE(std::chrono::steady_clock::now() - tmStart, std::chrono::milliseconds(15));
}
