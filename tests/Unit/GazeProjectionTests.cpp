/******************************************************************************
 * @brief Unit tests for mapping normalized gaze into reference pixels.
 *
 * @file GazeProjectionTests.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-31
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "../../src/tracking/HeatmapAccumulator.h"
#include "../../src/util/vision/ImageOperations.hpp"
#include "../../src/vision/algorithms/GazeProjection.hpp"
#include "TestUtilities.hpp"

/// \cond
#include <gtest/gtest.h>

#include <limits>

/// \endcond

TEST(GazeProjectionTest, CenterGazeDenormalizesToFrameCenter)
{
    cv::Point2f cvPoint = GazeProjection::DenormalizeGaze(0.5, 0.5, cv::Size(640, 480));

    EXPECT_FLOAT_EQ(cvPoint.x, 320.0f);
    EXPECT_FLOAT_EQ(cvPoint.y, 240.0f);
}

TEST(GazeProjectionTest, GazeValidity)
{
    EXPECT_TRUE(GazeProjection::IsGazeValid(0.0, 0.0));
    EXPECT_TRUE(GazeProjection::IsGazeValid(1.0, 1.0));
    EXPECT_TRUE(GazeProjection::IsGazeValid(0.25, 0.75));

    EXPECT_FALSE(GazeProjection::IsGazeValid(-0.01, 0.5));
    EXPECT_FALSE(GazeProjection::IsGazeValid(0.5, 1.01));
    EXPECT_FALSE(GazeProjection::IsGazeValid(std::numeric_limits<double>::quiet_NaN(), 0.5));
    EXPECT_FALSE(GazeProjection::IsGazeValid(0.5, std::numeric_limits<double>::infinity()));
}

TEST(GazeProjectionTest, PointAtInfinityIsRejected)
{
    // Maps every point with x = 1 onto the line at infinity.
    cv::Mat cvHomography = (cv::Mat_<double>(3, 3) << 1.0, 0.0, 0.0, 0.0, 1.0, 0.0, 1.0, 0.0, -1.0);

    EXPECT_FALSE(GazeProjection::ApplyHomography(cv::Point2f(1.0f, 5.0f), cvHomography).has_value());
}

TEST(GazeProjectionTest, NearHorizonPointIsSafeToAccumulateAndDraw)
{
    // w = 2e-7 is small but above the rejection threshold, so x lands near 5e9.
    cv::Mat cvHomography = (cv::Mat_<double>(3, 3) << 1.0, 0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0, 2e-7);

    std::optional<cv::Point2f> cvProjected = GazeProjection::ApplyHomography(cv::Point2f(1000.0f, -1000.0f), cvHomography);
    ASSERT_TRUE(cvProjected.has_value());
    EXPECT_GT(cvProjected->x, 1e9f);
    EXPECT_LT(cvProjected->y, -1e9f);

    HeatmapAccumulator stHeatmap(5);
    stHeatmap.AddPoint(*cvProjected);
    EXPECT_EQ(stHeatmap.GetPoints().back(), cv::Point(std::numeric_limits<int>::max(), std::numeric_limits<int>::min()));

    cv::Mat cvCanvas(120, 160, CV_8UC3, cv::Scalar(40, 50, 60));
    cv::Mat cvBefore = cvCanvas.clone();
    stHeatmap.Render(cvCanvas, 10, 0.6);
    imgops::DrawGazeMarker(cvCanvas, *cvProjected, 10, cv::Scalar(0, 0, 255), 1.0);
    EXPECT_EQ(cv::norm(cvCanvas, cvBefore, cv::NORM_INF), 0.0);

    // The box is pinned past the right edge, only its caption can touch the last columns.
    imgops::DrawLabeledBox(cvCanvas, cv::Rect2f(cvProjected->x, cvProjected->y, 3e9f, 3e9f), "Far", cv::Scalar(0, 255, 0));
    cv::Rect cvInterior(0, 0, 150, 120);
    EXPECT_EQ(cv::norm(cvCanvas(cvInterior), cvBefore(cvInterior), cv::NORM_INF), 0.0);
}

TEST(GazeProjectionTest, ZeroDistortionKeepsThePointUpToTheCrop)
{
    std::string szError;
    std::optional<CameraCalibration> stCalibration = MakeCameraCalibration(testutils::MakeCenteredCameraMatrix(), testutils::MakeZeroDistortion(), szError);
    ASSERT_TRUE(stCalibration.has_value());
    Undistortion::RemapTable stTable = Undistortion::ComputeRemapTable(*stCalibration, cv::Size(640, 480));

    // Translate the cropped frame back by the crop offset, as registration of an identical scene would.
    cv::Mat cvHomography = (cv::Mat_<double>(3, 3) << 1.0, 0.0, stTable.cvROI.x, 0.0, 1.0, stTable.cvROI.y, 0.0, 0.0, 1.0);

    std::optional<cv::Point2f> cvProjected = GazeProjection::ProjectGazePoint(0.5, 0.5, cv::Size(640, 480), *stCalibration, stTable, cvHomography);
    ASSERT_TRUE(cvProjected.has_value());
    EXPECT_NEAR(cvProjected->x, 320.0f, 2.0f);
    EXPECT_NEAR(cvProjected->y, 240.0f, 2.0f);
}

TEST(GazeProjectionTest, UndistortedGazeFollowsTheRemappedImage)
{
    std::string szError;
    cv::Mat cvDistortion                           = (cv::Mat_<double>(1, 5) << -0.2, 0.05, 0.001, -0.001, 0.0);
    std::optional<CameraCalibration> stCalibration = MakeCameraCalibration(testutils::MakeCenteredCameraMatrix(), cvDistortion, szError);
    ASSERT_TRUE(stCalibration.has_value()) << szError;
    Undistortion::RemapTable stTable = Undistortion::ComputeRemapTable(*stCalibration, cv::Size(640, 480));

    for (const cv::Point& cvRawPixel : {cv::Point(480, 360), cv::Point(170, 130), cv::Point(500, 140), cv::Point(320, 240)})
    {
        // A small bright marker at a known raw pixel.
        cv::Mat cvRaw = cv::Mat::zeros(480, 640, CV_8UC3);
        cv::circle(cvRaw, cvRawPixel, 3, cv::Scalar::all(255), cv::FILLED, cv::LINE_AA);

        std::optional<cv::Mat> cvUndistorted = Undistortion::ApplyRemapTable(cvRaw, stTable);
        ASSERT_TRUE(cvUndistorted.has_value());
        cv::Mat cvGray;
        cv::cvtColor(*cvUndistorted, cvGray, cv::COLOR_BGR2GRAY);
        cv::Moments cvMoments = cv::moments(cvGray);
        ASSERT_GT(cvMoments.m00, 0.0) << "marker at " << cvRawPixel << " was cropped away";
        cv::Point2f cvMarker(static_cast<float>(cvMoments.m10 / cvMoments.m00), static_cast<float>(cvMoments.m01 / cvMoments.m00));

        cv::Point2f cvExpected = GazeProjection::UndistortGazePoint(cv::Point2f(cvRawPixel), *stCalibration, stTable);
        EXPECT_NEAR(cvExpected.x, cvMarker.x, 1.0f) << "raw " << cvRawPixel;
        EXPECT_NEAR(cvExpected.y, cvMarker.y, 1.0f) << "raw " << cvRawPixel;
    }

    // The lens model moves off-center pixels by more than the crop offset alone.
    cv::Point2f cvCorner = GazeProjection::UndistortGazePoint(cv::Point2f(480.0f, 360.0f), *stCalibration, stTable);
    cv::Point2f cvCropOnly(480.0f - static_cast<float>(stTable.cvROI.x), 360.0f - static_cast<float>(stTable.cvROI.y));
    EXPECT_GT(cv::norm(cvCorner - cvCropOnly), 2.0);
}

TEST(GazeProjectionTest, InvalidGazeIsNotProjected)
{
    std::string szError;
    std::optional<CameraCalibration> stCalibration = MakeCameraCalibration(testutils::MakeCenteredCameraMatrix(), testutils::MakeZeroDistortion(), szError);
    ASSERT_TRUE(stCalibration.has_value());
    Undistortion::RemapTable stTable = Undistortion::ComputeRemapTable(*stCalibration, cv::Size(640, 480));

    EXPECT_FALSE(GazeProjection::ProjectGazePoint(1.5, 0.5, cv::Size(640, 480), *stCalibration, stTable, cv::Mat::eye(3, 3, CV_64F)).has_value());
}
