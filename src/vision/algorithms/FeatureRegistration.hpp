/******************************************************************************
 * @brief Atomic functional library for registering scene camera frames against
 * a fixed reference image. ORB features are matched with a FLANN LSH index and
 * a RANSAC homography maps frame pixels onto reference pixels.
 *
 * @file FeatureRegistration.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef FEATURE_REGISTRATION_HPP
#define FEATURE_REGISTRATION_HPP

#include "../../Constants.h"
#include "../../Logging.h"

/// \cond
#include <opencv2/features2d.hpp>
#include <opencv2/flann.hpp>
#include <opencv2/opencv.hpp>

#include <optional>
#include <vector>

/// \endcond

namespace FeatureRegistration
{
    /******************************************************************************
     * @brief The reference image and its features. Built once, never changed.
     ******************************************************************************/
    struct ReferenceModel
    {
            cv::Mat cvImage;                           // BGR reference image.
            cv::Mat cvGray;                            // Grayscale copy used for detection.
            std::vector<cv::KeyPoint> vKeypoints;      // ORB keypoints of the reference.
            cv::Mat cvDescriptors;                     // ORB descriptors, one row per keypoint.
    };

    /******************************************************************************
     * @brief Outcome of one registration attempt.
     ******************************************************************************/
    enum class RegistrationStatus
    {
        eRegistered,             // A homography was found.
        eNoDescriptors,          // The frame or the reference has no descriptors.
        eInsufficientMatches,    // Too few matches survived the ratio test.
        eHomographyFailed        // RANSAC produced no usable homography.
    };

    /******************************************************************************
     * @brief Result struct of RegisterFrame().
     ******************************************************************************/
    struct RegistrationResult
    {
            RegistrationStatus eStatus = RegistrationStatus::eNoDescriptors;
            cv::Mat cvHomography;          // 3x3 CV_64F, frame pixels -> reference pixels. Empty unless registered.
            size_t siGoodMatches = 0;      // Matches that passed the ratio test.
            size_t siFrameKeypoints = 0;   // Keypoints detected in the frame.

            bool IsRegistered() const { return eStatus == RegistrationStatus::eRegistered; }
    };

    /******************************************************************************
     * @brief Creates the ORB detector. The reference and every live frame must go
     *      through a detector with these same parameters.
     *
     * @return cv::Ptr<cv::ORB> - The detector.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    inline cv::Ptr<cv::ORB> CreateDetector()
    {
        return cv::ORB::create(constants::ORB_MAX_FEATURES,
                               constants::ORB_SCALE_FACTOR,
                               constants::ORB_PYRAMID_LEVELS,
                               constants::ORB_EDGE_THRESHOLD,
                               0,
                               2,
                               cv::ORB::HARRIS_SCORE,
                               constants::ORB_PATCH_SIZE,
                               constants::ORB_FAST_THRESHOLD);
    }

    /******************************************************************************
     * @brief Builds the reference model from a BGR (or grayscale) image.
     *
     * @param cvReferenceImage - The reference image.
     * @return std::optional<ReferenceModel> - The model, nullopt if the image is
     *      empty or has no usable features.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    inline std::optional<ReferenceModel> BuildReferenceModel(const cv::Mat& cvReferenceImage)
    {
        if (cvReferenceImage.empty())
        {
            return std::nullopt;
        }

        ReferenceModel stModel;
        if (cvReferenceImage.channels() == 1)
        {
            cv::cvtColor(cvReferenceImage, stModel.cvImage, cv::COLOR_GRAY2BGR);
        }
        else
        {
            stModel.cvImage = cvReferenceImage.clone();
        }
        cv::cvtColor(stModel.cvImage, stModel.cvGray, cv::COLOR_BGR2GRAY);

        CreateDetector()->detectAndCompute(stModel.cvGray, cv::noArray(), stModel.vKeypoints, stModel.cvDescriptors);
        if (stModel.cvDescriptors.empty())
        {
            // Submit logger message.
            LOG_ERROR(logging::g_qSharedLogger, "Reference image has no ORB features. It can't be used for registration.");
            return std::nullopt;
        }

        // Submit logger message.
        LOG_INFO(logging::g_qSharedLogger,
                 "Reference model built from a {}x{} image with {} keypoints.",
                 stModel.cvImage.cols,
                 stModel.cvImage.rows,
                 stModel.vKeypoints.size());

        return stModel;
    }

    /******************************************************************************
     * @brief Lowe's ratio test. A match is kept when its distance is less than
     *      fRatio times the distance of the second best candidate. Entries with
     *      fewer than two candidates are skipped.
     *
     * @param vKnnMatches - k = 2 nearest neighbour matches.
     * @param fRatio - The ratio threshold.
     * @return std::vector<cv::DMatch> - The best match of every accepted entry.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    inline std::vector<cv::DMatch> FilterMatchesByRatio(const std::vector<std::vector<cv::DMatch>>& vKnnMatches,
                                                        float fRatio = constants::REGISTRATION_RATIO_TEST_THRESHOLD)
    {
        std::vector<cv::DMatch> vGoodMatches;
        for (const std::vector<cv::DMatch>& vCandidates : vKnnMatches)
        {
            if (vCandidates.size() < 2)
            {
                continue;
            }
            if (vCandidates[0].distance < fRatio * vCandidates[1].distance)
            {
                vGoodMatches.push_back(vCandidates[0]);
            }
        }

        return vGoodMatches;
    }

    /******************************************************************************
     * @brief Estimates the frame to reference homography from ratio tested matches.
     *      The matches must use reference keypoints as the query set and frame
     *      keypoints as the train set.
     *
     * @param vReferenceKeypoints - Keypoints of the reference image.
     * @param vFrameKeypoints - Keypoints of the frame.
     * @param vGoodMatches - Accepted matches.
     * @return std::optional<cv::Mat> - The 3x3 homography. Nullopt if there are
     *      fewer than the minimum number of matches or RANSAC fails.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    inline std::optional<cv::Mat> EstimateHomography(const std::vector<cv::KeyPoint>& vReferenceKeypoints,
                                                     const std::vector<cv::KeyPoint>& vFrameKeypoints,
                                                     const std::vector<cv::DMatch>& vGoodMatches)
    {
        if (vGoodMatches.size() < constants::REGISTRATION_MIN_GOOD_MATCHES)
        {
            return std::nullopt;
        }

        std::vector<cv::Point2f> vReferencePoints, vFramePoints;
        vReferencePoints.reserve(vGoodMatches.size());
        vFramePoints.reserve(vGoodMatches.size());
        for (const cv::DMatch& cvMatch : vGoodMatches)
        {
            if (cvMatch.queryIdx < 0 || cvMatch.queryIdx >= static_cast<int>(vReferenceKeypoints.size()) || cvMatch.trainIdx < 0 ||
                cvMatch.trainIdx >= static_cast<int>(vFrameKeypoints.size()))
            {
                return std::nullopt;
            }
            vReferencePoints.push_back(vReferenceKeypoints[cvMatch.queryIdx].pt);
            vFramePoints.push_back(vFrameKeypoints[cvMatch.trainIdx].pt);
        }

        cv::Mat cvHomography = cv::findHomography(vFramePoints, vReferencePoints, cv::RANSAC, constants::REGISTRATION_RANSAC_REPROJ_THRESHOLD);
        if (cvHomography.empty() || !cv::checkRange(cvHomography))
        {
            return std::nullopt;
        }

        return cvHomography;
    }

    /******************************************************************************
     * @brief Registers one grayscale frame against the reference model. The
     *      matcher is created for every call, so this holds no state between
     *      frames.
     *
     * @param stModel - The reference model.
     * @param cvFrameGray - The undistorted, cropped grayscale frame.
     * @return RegistrationResult - Status, homography and match statistics.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    inline RegistrationResult RegisterFrame(const ReferenceModel& stModel, const cv::Mat& cvFrameGray)
    {
        RegistrationResult stResult;

        // 1. Detect frame features.
        std::vector<cv::KeyPoint> vFrameKeypoints;
        cv::Mat cvFrameDescriptors;
        if (!cvFrameGray.empty())
        {
            CreateDetector()->detectAndCompute(cvFrameGray, cv::noArray(), vFrameKeypoints, cvFrameDescriptors);
        }
        stResult.siFrameKeypoints = vFrameKeypoints.size();

        if (cvFrameDescriptors.empty() || stModel.cvDescriptors.empty())
        {
            stResult.eStatus = RegistrationStatus::eNoDescriptors;
            return stResult;
        }

        // 2. Match reference descriptors against the frame.
        cv::FlannBasedMatcher cvMatcher(cv::makePtr<cv::flann::LshIndexParams>(constants::LSH_TABLE_NUMBER, constants::LSH_KEY_SIZE, constants::LSH_MULTI_PROBE_LEVEL),
                                        cv::makePtr<cv::flann::SearchParams>(constants::LSH_SEARCH_CHECKS));
        std::vector<std::vector<cv::DMatch>> vKnnMatches;
        cvMatcher.knnMatch(stModel.cvDescriptors, cvFrameDescriptors, vKnnMatches, 2);

        // 3. Ratio test.
        std::vector<cv::DMatch> vGoodMatches = FilterMatchesByRatio(vKnnMatches);
        stResult.siGoodMatches               = vGoodMatches.size();
        if (vGoodMatches.size() < constants::REGISTRATION_MIN_GOOD_MATCHES)
        {
            stResult.eStatus = RegistrationStatus::eInsufficientMatches;
            return stResult;
        }

        // 4. Homography.
        std::optional<cv::Mat> cvHomography = EstimateHomography(stModel.vKeypoints, vFrameKeypoints, vGoodMatches);
        if (!cvHomography.has_value())
        {
            stResult.eStatus = RegistrationStatus::eHomographyFailed;
            return stResult;
        }

        stResult.eStatus      = RegistrationStatus::eRegistered;
        stResult.cvHomography = *cvHomography;
        return stResult;
    }

    /******************************************************************************
     * @brief Accessor for a printable name of a registration status.
     *
     * @param eStatus - The status.
     * @return const char* - Its name.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    inline const char* StatusToString(RegistrationStatus eStatus)
    {
        switch (eStatus)
        {
            case RegistrationStatus::eRegistered: return "Registered";
            case RegistrationStatus::eNoDescriptors: return "NoDescriptors";
            case RegistrationStatus::eInsufficientMatches: return "InsufficientMatches";
            case RegistrationStatus::eHomographyFailed: return "HomographyFailed";
            default: return "Unknown";
        }
    }
}    // namespace FeatureRegistration

#endif    // FEATURE_REGISTRATION_HPP
