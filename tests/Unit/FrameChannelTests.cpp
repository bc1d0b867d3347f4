/******************************************************************************
 * @brief Unit tests for the FrameChannel latest-wins handoff.
 *
 * @file FrameChannelTests.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-31
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "../../src/interfaces/FrameChannel.hpp"

/// \cond
#include <gtest/gtest.h>

#include <string>
#include <thread>

/// \endcond

TEST(FrameChannelTest, EmptyChannelHasNothingToTake)
{
    FrameChannel<int> stChannel;

    EXPECT_FALSE(stChannel.TryTake().has_value());
    EXPECT_EQ(stChannel.GetDroppedCount(), 0u);
}

TEST(FrameChannelTest, LatestPublishWins)
{
    FrameChannel<int> stChannel;
    stChannel.Publish(1);
    stChannel.Publish(2);
    stChannel.Publish(3);

    std::optional<int> nTaken = stChannel.TryTake();
    ASSERT_TRUE(nTaken.has_value());
    EXPECT_EQ(*nTaken, 3);
    EXPECT_EQ(stChannel.GetDroppedCount(), 2u);
}

TEST(FrameChannelTest, TakingTwiceWithoutPublishGivesNothing)
{
    FrameChannel<std::string> stChannel;
    stChannel.Publish("frame");

    ASSERT_TRUE(stChannel.TryTake().has_value());
    EXPECT_FALSE(stChannel.TryTake().has_value());
}

TEST(FrameChannelTest, TakenItemsAreNotCountedAsDropped)
{
    FrameChannel<int> stChannel;
    stChannel.Publish(1);
    ASSERT_TRUE(stChannel.TryTake().has_value());
    stChannel.Publish(2);
    ASSERT_TRUE(stChannel.TryTake().has_value());

    EXPECT_EQ(stChannel.GetDroppedCount(), 0u);
}

TEST(FrameChannelTest, ConsumerThreadSeesTheLatestPublish)
{
    FrameChannel<int> stChannel;
    std::thread thProducer(
        [&stChannel]()
        {
            for (int nValue = 1; nValue <= 100; ++nValue)
            {
                stChannel.Publish(nValue);
            }
        });
    thProducer.join();

    std::optional<int> nTaken = stChannel.TryTake();
    ASSERT_TRUE(nTaken.has_value());
    EXPECT_EQ(*nTaken, 100);
    EXPECT_EQ(stChannel.GetDroppedCount(), 99u);
}
