/******************************************************************************
 * @brief Unit tests for ORB/FLANN registration of frames against the reference.
 *
 * @file FeatureRegistrationTests.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-31
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "../../src/vision/algorithms/FeatureRegistration.hpp"
#include "../../src/vision/algorithms/GazeProjection.hpp"
#include "TestUtilities.hpp"

/// \cond
#include <gtest/gtest.h>

/// \endcond

namespace
{
    cv::Mat ToGray(const cv::Mat& cvImage)
    {
        cv::Mat cvGray;
        cv::cvtColor(cvImage, cvGray, cv::COLOR_BGR2GRAY);
        return cvGray;
    }

    // Keypoints on a grid and matches pairing keypoint i with keypoint i.
    void MakeCorrespondences(size_t siCount, const cv::Point2f& cvShift, std::vector<cv::KeyPoint>& vReference, std::vector<cv::KeyPoint>& vFrame, std::vector<cv::DMatch>& vMatches)
    {
        for (size_t siI = 0; siI < siCount; ++siI)
        {
            cv::Point2f cvPoint(static_cast<float>(40 + 50 * (siI % 6)), static_cast<float>(40 + 45 * (siI / 6)));
            vReference.emplace_back(cvPoint, 1.0f);
            vFrame.emplace_back(cvPoint + cvShift, 1.0f);
            vMatches.emplace_back(static_cast<int>(siI), static_cast<int>(siI), 0.0f);
        }
    }
}    // namespace

TEST(FeatureRegistrationTest, RatioTestKeepsOnlyDistinctMatches)
{
    std::vector<std::vector<cv::DMatch>> vKnnMatches;
    vKnnMatches.push_back({cv::DMatch(0, 5, 10.0f), cv::DMatch(0, 6, 20.0f)});    // 10 < 15, kept.
    vKnnMatches.push_back({cv::DMatch(1, 7, 18.0f), cv::DMatch(1, 8, 20.0f)});    // 18 >= 15, rejected.
    vKnnMatches.push_back({cv::DMatch(2, 9, 1.0f)});                              // Single candidate, skipped.
    vKnnMatches.push_back({});                                                    // No candidates, skipped.

    std::vector<cv::DMatch> vGood = FeatureRegistration::FilterMatchesByRatio(vKnnMatches);

    ASSERT_EQ(vGood.size(), 1u);
    EXPECT_EQ(vGood[0].queryIdx, 0);
    EXPECT_EQ(vGood[0].trainIdx, 5);
}

TEST(FeatureRegistrationTest, TenMatchesNeverProduceAHomography)
{
    std::vector<cv::KeyPoint> vReference, vFrame;
    std::vector<cv::DMatch> vMatches;
    MakeCorrespondences(10, cv::Point2f(5.0f, 3.0f), vReference, vFrame, vMatches);

    EXPECT_FALSE(FeatureRegistration::EstimateHomography(vReference, vFrame, vMatches).has_value());
}

TEST(FeatureRegistrationTest, ElevenMatchesProduceAHomography)
{
    std::vector<cv::KeyPoint> vReference, vFrame;
    std::vector<cv::DMatch> vMatches;
    MakeCorrespondences(11, cv::Point2f(5.0f, 3.0f), vReference, vFrame, vMatches);

    std::optional<cv::Mat> cvHomography = FeatureRegistration::EstimateHomography(vReference, vFrame, vMatches);
    ASSERT_TRUE(cvHomography.has_value());

    // Frame -> reference undoes the shift.
    std::optional<cv::Point2f> cvMapped = GazeProjection::ApplyHomography(cv::Point2f(105.0f, 83.0f), *cvHomography);
    ASSERT_TRUE(cvMapped.has_value());
    EXPECT_NEAR(cvMapped->x, 100.0f, 0.5f);
    EXPECT_NEAR(cvMapped->y, 80.0f, 0.5f);
}

TEST(FeatureRegistrationTest, OutOfRangeMatchIndicesAreRejected)
{
    std::vector<cv::KeyPoint> vReference, vFrame;
    std::vector<cv::DMatch> vMatches;
    MakeCorrespondences(12, cv::Point2f(0.0f, 0.0f), vReference, vFrame, vMatches);
    vMatches.back().trainIdx = 500;

    EXPECT_FALSE(FeatureRegistration::EstimateHomography(vReference, vFrame, vMatches).has_value());
}

TEST(FeatureRegistrationTest, FeaturelessReferenceHasNoModel)
{
    cv::Mat cvBlank(480, 640, CV_8UC3, cv::Scalar(90, 90, 90));

    EXPECT_FALSE(FeatureRegistration::BuildReferenceModel(cvBlank).has_value());
}

TEST(FeatureRegistrationTest, GrayscaleReferenceIsConvertedToBGR)
{
    std::optional<FeatureRegistration::ReferenceModel> stModel = FeatureRegistration::BuildReferenceModel(ToGray(testutils::MakeTexturedImage()));

    ASSERT_TRUE(stModel.has_value());
    EXPECT_EQ(stModel->cvImage.type(), CV_8UC3);
    EXPECT_EQ(stModel->cvGray.type(), CV_8UC1);
    EXPECT_EQ(static_cast<size_t>(stModel->cvDescriptors.rows), stModel->vKeypoints.size());
}

TEST(FeatureRegistrationTest, IdenticalFrameRegistersNearIdentity)
{
    cv::Mat cvReference                                        = testutils::MakeTexturedImage();
    std::optional<FeatureRegistration::ReferenceModel> stModel = FeatureRegistration::BuildReferenceModel(cvReference);
    ASSERT_TRUE(stModel.has_value());

    FeatureRegistration::RegistrationResult stResult = FeatureRegistration::RegisterFrame(*stModel, ToGray(cvReference));

    ASSERT_TRUE(stResult.IsRegistered()) << FeatureRegistration::StatusToString(stResult.eStatus);
    EXPECT_GE(stResult.siGoodMatches, constants::REGISTRATION_MIN_GOOD_MATCHES);
    for (const cv::Point2f& cvPoint : {cv::Point2f(100.0f, 100.0f), cv::Point2f(320.0f, 240.0f), cv::Point2f(550.0f, 400.0f)})
    {
        std::optional<cv::Point2f> cvMapped = GazeProjection::ApplyHomography(cvPoint, stResult.cvHomography);
        ASSERT_TRUE(cvMapped.has_value());
        EXPECT_NEAR(cvMapped->x, cvPoint.x, 1.0f);
        EXPECT_NEAR(cvMapped->y, cvPoint.y, 1.0f);
    }
}

TEST(FeatureRegistrationTest, ShiftedFrameRegistersToTheShift)
{
    cv::Mat cvReference                                        = testutils::MakeTexturedImage();
    std::optional<FeatureRegistration::ReferenceModel> stModel = FeatureRegistration::BuildReferenceModel(cvReference);
    ASSERT_TRUE(stModel.has_value());

    // The frame sees the reference moved 15 px right and 10 px down.
    cv::Mat cvShift = (cv::Mat_<double>(2, 3) << 1.0, 0.0, 15.0, 0.0, 1.0, 10.0);
    cv::Mat cvFrame;
    cv::warpAffine(cvReference, cvFrame, cvShift, cvReference.size());

    FeatureRegistration::RegistrationResult stResult = FeatureRegistration::RegisterFrame(*stModel, ToGray(cvFrame));
    ASSERT_TRUE(stResult.IsRegistered()) << FeatureRegistration::StatusToString(stResult.eStatus);

    std::optional<cv::Point2f> cvMapped = GazeProjection::ApplyHomography(cv::Point2f(335.0f, 250.0f), stResult.cvHomography);
    ASSERT_TRUE(cvMapped.has_value());
    EXPECT_NEAR(cvMapped->x, 320.0f, 2.0f);
    EXPECT_NEAR(cvMapped->y, 240.0f, 2.0f);
}

TEST(FeatureRegistrationTest, FeaturelessFrameReportsNoDescriptors)
{
    std::optional<FeatureRegistration::ReferenceModel> stModel = FeatureRegistration::BuildReferenceModel(testutils::MakeTexturedImage());
    ASSERT_TRUE(stModel.has_value());

    FeatureRegistration::RegistrationResult stResult = FeatureRegistration::RegisterFrame(*stModel, cv::Mat(480, 640, CV_8UC1, cv::Scalar(60)));

    EXPECT_FALSE(stResult.IsRegistered());
    EXPECT_EQ(stResult.eStatus, FeatureRegistration::RegistrationStatus::eNoDescriptors);
    EXPECT_TRUE(stResult.cvHomography.empty());
}
