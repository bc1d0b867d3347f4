/******************************************************************************
 * @brief Unit tests for the per tick gaze mapping pipeline.
 *
 * @file FrameProcessorTests.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-31
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "../../src/processing/FrameProcessor.h"
#include "TestUtilities.hpp"

/// \cond
#include <gtest/gtest.h>

#include <fstream>
#include <limits>

/// \endcond

class FrameProcessorTest : public ::testing::Test
{
    protected:
        void SetUp() override
        {
            m_cvReference = testutils::MakeTexturedImage();

            std::string szError;
            m_pEngineConfig = EngineConfig::Create(testutils::MakeCenteredCameraMatrix(), testutils::MakeZeroDistortion(), m_cvReference, szError);
            ASSERT_NE(m_pEngineConfig, nullptr) << szError;
        }

        IncomingFrame MakeFrame(int64_t nFrameNumber, double dGazeX = 0.5, double dGazeY = 0.5) const
        {
            IncomingFrame stFrame;
            stFrame.cvImage      = m_cvReference.clone();
            stFrame.dGazeX       = dGazeX;
            stFrame.dGazeY       = dGazeY;
            stFrame.nFrameNumber = nFrameNumber;
            stFrame.dScoreRight  = 0.75;
            stFrame.dScoreLeft   = 0.5;
            return stFrame;
        }

        cv::Mat m_cvReference;
        std::shared_ptr<const EngineConfig> m_pEngineConfig;
        FrameChannel<IncomingFrame> m_stChannel;
};

TEST_F(FrameProcessorTest, NoFrameMeansNoTick)
{
    FrameProcessor stProcessor(m_pEngineConfig, m_stChannel);

    EXPECT_FALSE(stProcessor.Tick().has_value());
}

TEST_F(FrameProcessorTest, TickTakesTheNewestFrame)
{
    FrameProcessor stProcessor(m_pEngineConfig, m_stChannel);
    m_stChannel.Publish(this->MakeFrame(1));
    m_stChannel.Publish(this->MakeFrame(2));

    std::optional<FrameResult> stResult = stProcessor.Tick();
    ASSERT_TRUE(stResult.has_value());
    EXPECT_EQ(stResult->nFrameNumber, 2);
    EXPECT_FALSE(stProcessor.Tick().has_value());
}

TEST_F(FrameProcessorTest, IdenticalSceneMapsGazeToTheSamePixel)
{
    FrameProcessor stProcessor(m_pEngineConfig, m_stChannel);
    stProcessor.GetAOITracker().AddAOI(cv::Rect2f(300.0f, 220.0f, 40.0f, 40.0f), "Center");

    IncomingFrame stFrame = this->MakeFrame(7);
    stFrame.szSystemTime  = "2024:05:01:12:30:15:250";
    FrameResult stResult  = stProcessor.ProcessFrame(stFrame);

    ASSERT_TRUE(stResult.bRegistered) << TickStatusToString(stResult.eStatus);
    EXPECT_EQ(stResult.eStatus, TickStatus::eRegistered);
    ASSERT_TRUE(stResult.cvGazePoint.has_value());
    EXPECT_NEAR(stResult.cvGazePoint->x, 320.0f, 3.0f);
    EXPECT_NEAR(stResult.cvGazePoint->y, 240.0f, 3.0f);
    EXPECT_FALSE(stResult.bTimestampIsFallback);
    EXPECT_EQ(stResult.szActiveAOI, "Center");
    ASSERT_EQ(stResult.vAOIs.size(), 1u);
    EXPECT_EQ(stResult.vAOIs[0].unHitCount, 1u);
    EXPECT_TRUE(stResult.vAOIs[0].bGazeInside);
    EXPECT_EQ(stResult.cvComposite.size(), m_cvReference.size());
    EXPECT_EQ(stProcessor.GetHeatmap().GetSize(), 1u);
    ASSERT_EQ(stProcessor.GetScoreHistory().size(), 1u);
    EXPECT_DOUBLE_EQ(stProcessor.GetScoreHistory().back().dScoreRight, 0.75);
}

TEST_F(FrameProcessorTest, InvalidGazeLeavesStatisticsUntouched)
{
    FrameProcessor stProcessor(m_pEngineConfig, m_stChannel);
    stProcessor.GetAOITracker().AddAOI(cv::Rect2f(0.0f, 0.0f, 640.0f, 480.0f), "All");

    for (double dGaze : {1.5, -0.2, std::numeric_limits<double>::quiet_NaN()})
    {
        FrameResult stResult = stProcessor.ProcessFrame(this->MakeFrame(1, dGaze, 0.5));

        EXPECT_FALSE(stResult.bRegistered);
        EXPECT_EQ(stResult.eStatus, TickStatus::eInvalidGaze);
        EXPECT_FALSE(stResult.cvGazePoint.has_value());
    }

    EXPECT_EQ(stProcessor.GetAOITracker().GetAOIs()[0].unHitCount, 0u);
    EXPECT_EQ(stProcessor.GetHeatmap().GetSize(), 0u);
    EXPECT_TRUE(stProcessor.GetScoreHistory().empty());
}

TEST_F(FrameProcessorTest, EmptyFrameIsReported)
{
    FrameProcessor stProcessor(m_pEngineConfig, m_stChannel);
    IncomingFrame stFrame = this->MakeFrame(3);
    stFrame.cvImage       = cv::Mat();

    FrameResult stResult = stProcessor.ProcessFrame(stFrame);

    EXPECT_EQ(stResult.eStatus, TickStatus::eInvalidFrame);
    EXPECT_FALSE(stResult.bRegistered);
}

TEST_F(FrameProcessorTest, FailedRegistrationKeepsThePreviousComposite)
{
    FrameProcessor stProcessor(m_pEngineConfig, m_stChannel);
    FrameResult stFirst = stProcessor.ProcessFrame(this->MakeFrame(1));
    ASSERT_TRUE(stFirst.bRegistered) << TickStatusToString(stFirst.eStatus);

    IncomingFrame stBlank = this->MakeFrame(2);
    stBlank.cvImage       = cv::Mat(480, 640, CV_8UC3, cv::Scalar(70, 70, 70));
    FrameResult stSecond  = stProcessor.ProcessFrame(stBlank);

    EXPECT_FALSE(stSecond.bRegistered);
    EXPECT_EQ(stSecond.eStatus, TickStatus::eNoDescriptors);
    EXPECT_EQ(cv::norm(stSecond.cvComposite, stFirst.cvComposite, cv::NORM_INF), 0.0);
    EXPECT_EQ(stProcessor.GetHeatmap().GetSize(), 1u);
}

TEST_F(FrameProcessorTest, RecordingWritesOneRowPerRegisteredTick)
{
    FrameProcessor stProcessor(m_pEngineConfig, m_stChannel);
    std::filesystem::path szDirectory = testutils::MakeScratchDirectory();
    ASSERT_TRUE(stProcessor.StartRecording(szDirectory));
    ASSERT_TRUE(stProcessor.IsRecording());

    FrameResult stFirst = stProcessor.ProcessFrame(this->MakeFrame(10));
    ASSERT_TRUE(stFirst.stRecordRow.has_value());
    EXPECT_EQ(stFirst.stRecordRow->unFrame, 1u);
    EXPECT_EQ(stFirst.stRecordRow->nPicNum, 10);

    // Unregistered ticks write nothing.
    FrameResult stSkipped = stProcessor.ProcessFrame(this->MakeFrame(11, 2.0, 0.5));
    EXPECT_FALSE(stSkipped.stRecordRow.has_value());

    FrameResult stSecond = stProcessor.ProcessFrame(this->MakeFrame(12));
    ASSERT_TRUE(stSecond.stRecordRow.has_value());
    EXPECT_EQ(stSecond.stRecordRow->unFrame, 2u);

    std::filesystem::path szPath = *stProcessor.GetRecordingPath();
    stProcessor.StopRecording();
    EXPECT_FALSE(stProcessor.IsRecording());

    std::ifstream fsInput(szPath);
    std::string szLine;
    size_t siLines = 0;
    while (std::getline(fsInput, szLine))
    {
        ++siLines;
    }
    EXPECT_EQ(siLines, 3u);

    // A new recording restarts the frame counter in a new file.
    ASSERT_TRUE(stProcessor.StartRecording(szDirectory));
    FrameResult stRestarted = stProcessor.ProcessFrame(this->MakeFrame(13));
    ASSERT_TRUE(stRestarted.stRecordRow.has_value());
    EXPECT_EQ(stRestarted.stRecordRow->unFrame, 1u);
    EXPECT_NE(*stProcessor.GetRecordingPath(), szPath);
}

TEST_F(FrameProcessorTest, ResetCountsKeepsTheHeatmap)
{
    FrameProcessor stProcessor(m_pEngineConfig, m_stChannel);
    stProcessor.GetAOITracker().AddAOI(cv::Rect2f(0.0f, 0.0f, 640.0f, 480.0f));
    ASSERT_TRUE(stProcessor.ProcessFrame(this->MakeFrame(1)).bRegistered);

    stProcessor.ResetCounts();

    EXPECT_EQ(stProcessor.GetAOITracker().GetAOIs()[0].unHitCount, 0u);
    EXPECT_EQ(stProcessor.GetHeatmap().GetSize(), 1u);

    // The gaze never left the AOI, so the next tick is not a new hit.
    ASSERT_TRUE(stProcessor.ProcessFrame(this->MakeFrame(2)).bRegistered);
    EXPECT_EQ(stProcessor.GetAOITracker().GetAOIs()[0].unHitCount, 0u);
    EXPECT_EQ(stProcessor.GetHeatmap().GetSize(), 2u);
}

TEST_F(FrameProcessorTest, PreviewDrawsTheDraftWithoutRegistering)
{
    FrameProcessor stProcessor(m_pEngineConfig, m_stChannel);

    cv::Mat cvPlain   = stProcessor.RenderPreview();
    cv::Mat cvDrafted = stProcessor.RenderPreview(cv::Rect2f(50.0f, 50.0f, 100.0f, 80.0f));

    EXPECT_EQ(cv::norm(cvPlain, m_cvReference, cv::NORM_INF), 0.0);
    EXPECT_EQ(cvDrafted.at<cv::Vec3b>(50, 100), cv::Vec3b(255, 0, 0));
    EXPECT_EQ(stProcessor.GetUndistortionMap().GetRecomputeCount(), 0u);
}

TEST_F(FrameProcessorTest, PreviewShowsEditsWhileRegistrationFails)
{
    FrameProcessor stProcessor(m_pEngineConfig, m_stChannel);
    ASSERT_TRUE(stProcessor.ProcessFrame(this->MakeFrame(1)).bRegistered);

    IncomingFrame stBlank = this->MakeFrame(2);
    stBlank.cvImage       = cv::Mat(480, 640, CV_8UC3, cv::Scalar(70, 70, 70));
    FrameResult stFailed  = stProcessor.ProcessFrame(stBlank);
    ASSERT_FALSE(stFailed.bRegistered);

    // Edits made after the last registered tick.
    stProcessor.GetAOITracker().AddAOI(cv::Rect2f(100.0f, 100.0f, 80.0f, 60.0f), "Late");
    RenderOptions stOptions = stProcessor.GetRenderOptions();
    stOptions.bShowHeatmap  = true;
    stProcessor.SetRenderOptions(stOptions);

    cv::Mat cvPreview = stProcessor.RenderPreview();
    EXPECT_GT(cv::norm(cvPreview, stProcessor.GetLastComposite(), cv::NORM_INF), 0.0);

    cv::Scalar cvOutside = constants::RENDER_AOI_OUTSIDE_COLOR;
    EXPECT_EQ(cvPreview.at<cv::Vec3b>(100, 140), cv::Vec3b(static_cast<uchar>(cvOutside[0]), static_cast<uchar>(cvOutside[1]), static_cast<uchar>(cvOutside[2])));
}

TEST_F(FrameProcessorTest, HistoryLengthIsClamped)
{
    FrameProcessor stProcessor(m_pEngineConfig, m_stChannel);

    EXPECT_EQ(stProcessor.SetHistoryLength(50), 50u);
    EXPECT_EQ(stProcessor.SetHistoryLength(0), 1u);
}

TEST(EngineConfigTest, InvalidInputsBlockActivation)
{
    std::string szError;

    EXPECT_EQ(EngineConfig::Create(cv::Mat::eye(2, 2, CV_64F), testutils::MakeZeroDistortion(), testutils::MakeTexturedImage(), szError), nullptr);
    EXPECT_EQ(EngineConfig::Create(testutils::MakeCenteredCameraMatrix(), testutils::MakeZeroDistortion(), cv::Mat(), szError), nullptr);
    EXPECT_EQ(EngineConfig::Create(testutils::MakeCenteredCameraMatrix(), testutils::MakeZeroDistortion(), cv::Mat(480, 640, CV_8UC3, cv::Scalar::all(0)), szError),
              nullptr);
    EXPECT_FALSE(szError.empty());
}
