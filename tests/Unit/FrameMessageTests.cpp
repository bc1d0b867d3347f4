/******************************************************************************
 * @brief Unit tests for decoding inbound frame messages.
 *
 * @file FrameMessageTests.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-31
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "../../src/network/FrameMessage.hpp"
#include "TestUtilities.hpp"

/// \cond
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

/// \endcond

namespace
{
    nlohmann::json MakeMessage()
    {
        std::vector<uint8_t> vEncoded;
        cv::imencode(".png", testutils::MakeTexturedImage(cv::Size(64, 48)), vEncoded);

        nlohmann::json jsMessage;
        jsMessage["frame"]       = 17;
        jsMessage["gaze_x"]      = 0.25;
        jsMessage["gaze_y"]      = 0.75;
        jsMessage["image"]       = encodeops::Base64Encode(vEncoded);
        jsMessage["score_right"] = 0.9;
        jsMessage["score_left"]  = 0.8;
        jsMessage["system_time"] = "2024:05:01:12:30:15:250";
        return jsMessage;
    }
}    // namespace

TEST(FrameMessageTest, DecodesAFullMessage)
{
    std::string szError;
    std::optional<IncomingFrame> stFrame = FrameMessage::Decode(MakeMessage().dump(), szError);

    ASSERT_TRUE(stFrame.has_value()) << szError;
    EXPECT_EQ(stFrame->nFrameNumber, 17);
    EXPECT_DOUBLE_EQ(stFrame->dGazeX, 0.25);
    EXPECT_DOUBLE_EQ(stFrame->dGazeY, 0.75);
    EXPECT_DOUBLE_EQ(stFrame->dScoreRight, 0.9);
    EXPECT_DOUBLE_EQ(stFrame->dScoreLeft, 0.8);
    ASSERT_TRUE(stFrame->szSystemTime.has_value());
    EXPECT_EQ(*stFrame->szSystemTime, "2024:05:01:12:30:15:250");
    EXPECT_EQ(stFrame->cvImage.size(), cv::Size(64, 48));
    EXPECT_EQ(stFrame->cvImage.type(), CV_8UC3);
}

TEST(FrameMessageTest, OptionalFieldsDefault)
{
    nlohmann::json jsMessage = MakeMessage();
    jsMessage.erase("score_right");
    jsMessage["score_left"] = "not a number";
    jsMessage.erase("system_time");

    std::string szError;
    std::optional<IncomingFrame> stFrame = FrameMessage::Decode(jsMessage.dump(), szError);

    ASSERT_TRUE(stFrame.has_value()) << szError;
    EXPECT_DOUBLE_EQ(stFrame->dScoreRight, 0.0);
    EXPECT_DOUBLE_EQ(stFrame->dScoreLeft, 0.0);
    EXPECT_FALSE(stFrame->szSystemTime.has_value());
}

TEST(FrameMessageTest, MissingRequiredFieldsAreRejected)
{
    for (const char* pField : {"frame", "gaze_x", "gaze_y", "image"})
    {
        nlohmann::json jsMessage = MakeMessage();
        jsMessage.erase(pField);

        std::string szError;
        EXPECT_FALSE(FrameMessage::Decode(jsMessage.dump(), szError).has_value()) << pField;
        EXPECT_FALSE(szError.empty()) << pField;
    }
}

TEST(FrameMessageTest, WrongTypesAreRejected)
{
    nlohmann::json jsMessage = MakeMessage();
    jsMessage["frame"]       = 1.5;

    std::string szError;
    EXPECT_FALSE(FrameMessage::Decode(jsMessage.dump(), szError).has_value());

    jsMessage           = MakeMessage();
    jsMessage["gaze_x"] = "0.5";
    EXPECT_FALSE(FrameMessage::Decode(jsMessage.dump(), szError).has_value());
}

TEST(FrameMessageTest, BadBase64IsRejected)
{
    nlohmann::json jsMessage = MakeMessage();
    jsMessage["image"]       = "not*base64";

    std::string szError;
    EXPECT_FALSE(FrameMessage::Decode(jsMessage.dump(), szError).has_value());
    EXPECT_NE(szError.find("base64"), std::string::npos);
}

TEST(FrameMessageTest, UndecodableImageIsRejected)
{
    nlohmann::json jsMessage = MakeMessage();
    jsMessage["image"]       = encodeops::Base64Encode(std::vector<uint8_t>{1, 2, 3, 4, 5, 6});

    std::string szError;
    EXPECT_FALSE(FrameMessage::Decode(jsMessage.dump(), szError).has_value());
}

TEST(FrameMessageTest, InvalidJSONIsRejected)
{
    std::string szError;
    EXPECT_FALSE(FrameMessage::Decode("{\"frame\": 1,", szError).has_value());
    EXPECT_FALSE(FrameMessage::Decode("[1, 2, 3]", szError).has_value());
}
