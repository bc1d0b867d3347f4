/******************************************************************************
 * @brief Atomic functional library for projecting a normalized gaze coordinate
 * from the scene camera onto the reference image.
 *
 * @file GazeProjection.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef GAZE_PROJECTION_HPP
#define GAZE_PROJECTION_HPP

#include "../../util/vision/CameraModels.hpp"
#include "Undistortion.hpp"

/// \cond
#include <opencv2/opencv.hpp>

#include <cmath>
#include <limits>
#include <optional>
#include <vector>

/// \endcond

namespace GazeProjection
{
    /******************************************************************************
     * @brief Checks that a normalized gaze coordinate is usable. Both components
     *      must be finite and inside [0, 1].
     *
     * @param dGazeX - Normalized horizontal gaze.
     * @param dGazeY - Normalized vertical gaze.
     * @return true - The gaze can be projected.
     * @return false - The gaze is NaN, infinite or off frame.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    inline bool IsGazeValid(double dGazeX, double dGazeY)
    {
        return std::isfinite(dGazeX) && std::isfinite(dGazeY) && dGazeX >= 0.0 && dGazeX <= 1.0 && dGazeY >= 0.0 && dGazeY <= 1.0;
    }

    /******************************************************************************
     * @brief Scales a normalized gaze coordinate to raw frame pixels.
     *
     * @param dGazeX - Normalized horizontal gaze.
     * @param dGazeY - Normalized vertical gaze.
     * @param cvFrameSize - Size of the raw frame.
     * @return cv::Point2f - Pixel coordinate (x * width, y * height).
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    inline cv::Point2f DenormalizeGaze(double dGazeX, double dGazeY, const cv::Size& cvFrameSize)
    {
        return cv::Point2f(static_cast<float>(dGazeX * cvFrameSize.width), static_cast<float>(dGazeY * cvFrameSize.height));
    }

    /******************************************************************************
     * @brief Moves a raw frame pixel into the undistorted, cropped frame.
     *
     * @param cvRawPoint - Pixel in the raw (distorted) frame.
     * @param stCalibration - Scene camera intrinsics and distortion.
     * @param stTable - Remap table of the current frame size.
     * @return cv::Point2f - Pixel in the undistorted frame after the crop offset
     *      has been removed.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    inline cv::Point2f UndistortGazePoint(const cv::Point2f& cvRawPoint, const CameraCalibration& stCalibration, const Undistortion::RemapTable& stTable)
    {
        std::vector<cv::Point2f> vRawPoints{cvRawPoint};
        std::vector<cv::Point2f> vUndistortedPoints;
        cv::undistortPoints(vRawPoints, vUndistortedPoints, stCalibration.cvK, stCalibration.cvD, cv::noArray(), stTable.cvNewCameraMatrix);

        return cv::Point2f(vUndistortedPoints[0].x - static_cast<float>(stTable.cvROI.x), vUndistortedPoints[0].y - static_cast<float>(stTable.cvROI.y));
    }

    /******************************************************************************
     * @brief Applies a homography to a single point.
     *
     * @param cvPoint - Point in the undistorted, cropped frame.
     * @param cvHomography - Frame to reference homography.
     * @return std::optional<cv::Point2f> - Point in reference pixels, nullopt if the
     *      result is not finite (the point maps to infinity).
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    inline std::optional<cv::Point2f> ApplyHomography(const cv::Point2f& cvPoint, const cv::Mat& cvHomography)
    {
        if (cvHomography.rows != 3 || cvHomography.cols != 3)
        {
            return std::nullopt;
        }

        // perspectiveTransform writes (0, 0) instead of infinity when w vanishes.
        cv::Mat cvH;
        cvHomography.convertTo(cvH, CV_64F);
        double dW = cvH.at<double>(2, 0) * cvPoint.x + cvH.at<double>(2, 1) * cvPoint.y + cvH.at<double>(2, 2);
        if (!std::isfinite(dW) || std::abs(dW) < std::numeric_limits<float>::epsilon())
        {
            return std::nullopt;
        }

        std::vector<cv::Point2f> vSource{cvPoint};
        std::vector<cv::Point2f> vProjected;
        cv::perspectiveTransform(vSource, vProjected, cvH);

        if (vProjected.empty() || !std::isfinite(vProjected[0].x) || !std::isfinite(vProjected[0].y))
        {
            return std::nullopt;
        }

        return vProjected[0];
    }

    /******************************************************************************
     * @brief Full gaze projection pipeline. Denormalize, undistort, remove the crop
     *      offset, then transform into the reference image.
     *
     * @param dGazeX - Normalized horizontal gaze.
     * @param dGazeY - Normalized vertical gaze.
     * @param cvFrameSize - Size of the raw frame.
     * @param stCalibration - Scene camera intrinsics and distortion.
     * @param stTable - Remap table of the current frame size.
     * @param cvHomography - Frame to reference homography.
     * @return std::optional<cv::Point2f> - Gaze in reference pixels. Nullopt for
     *      invalid gaze or a degenerate projection.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    inline std::optional<cv::Point2f> ProjectGazePoint(double dGazeX,
                                                       double dGazeY,
                                                       const cv::Size& cvFrameSize,
                                                       const CameraCalibration& stCalibration,
                                                       const Undistortion::RemapTable& stTable,
                                                       const cv::Mat& cvHomography)
    {
        if (!IsGazeValid(dGazeX, dGazeY))
        {
            return std::nullopt;
        }

        cv::Point2f cvRawPoint         = DenormalizeGaze(dGazeX, dGazeY, cvFrameSize);
        cv::Point2f cvUndistortedPoint = UndistortGazePoint(cvRawPoint, stCalibration, stTable);
        return ApplyHomography(cvUndistortedPoint, cvHomography);
    }
}    // namespace GazeProjection

#endif    // GAZE_PROJECTION_HPP
