/******************************************************************************
 * @brief Defines camera models and related utilities.
 *
 * @file CameraModels.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-11-24
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef CAMERA_MODELS_HPP
#define CAMERA_MODELS_HPP

/// \cond
#include <opencv2/opencv.hpp>

#include <optional>
#include <string>

/// \endcond

/******************************************************************************
 * @brief Intrinsic parameters of the scene camera, pinhole model with
 *      radial/tangential distortion (k1, k2, p1, p2, k3). Only build these
 *      through MakeCameraCalibration() so the matrices always have the
 *      expected shape and type.
 ******************************************************************************/
struct CameraCalibration
{
    public:
        cv::Mat cvK;    // Intrinsic Matrix (3x3, CV_64F).
        cv::Mat cvD;    // Distortion Coefficients (1x5, CV_64F).

        double GetFx() const { return cvK.at<double>(0, 0); }
        double GetFy() const { return cvK.at<double>(1, 1); }
        double GetCx() const { return cvK.at<double>(0, 2); }
        double GetCy() const { return cvK.at<double>(1, 2); }
};

/******************************************************************************
 * @brief Validates and normalizes a camera matrix and distortion vector.
 *
 * @param cvCameraMatrix - 3x3 intrinsic matrix, any numeric type.
 * @param cvDistortion - Exactly 5 distortion coefficients as a row or column vector.
 * @param szError - Set to a description of the problem when validation fails.
 * @return std::optional<CameraCalibration> - The calibration with deep copied
 *      CV_64F matrices, or nullopt if the input is malformed.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 ******************************************************************************/
inline std::optional<CameraCalibration> MakeCameraCalibration(const cv::Mat& cvCameraMatrix, const cv::Mat& cvDistortion, std::string& szError)
{
    if (cvCameraMatrix.empty() || cvCameraMatrix.rows != 3 || cvCameraMatrix.cols != 3 || cvCameraMatrix.channels() != 1)
    {
        szError = "camera matrix must be 3x3";
        return std::nullopt;
    }
    if (cvDistortion.empty() || cvDistortion.total() != 5 || cvDistortion.channels() != 1 || (cvDistortion.rows != 1 && cvDistortion.cols != 1))
    {
        szError = "distortion coefficients must be a vector of exactly 5 values";
        return std::nullopt;
    }

    CameraCalibration stCalibration;
    cvCameraMatrix.convertTo(stCalibration.cvK, CV_64F);
    cvDistortion.reshape(1, 1).convertTo(stCalibration.cvD, CV_64F);
    // convertTo shares data when no conversion is needed.
    stCalibration.cvK = stCalibration.cvK.clone();
    stCalibration.cvD = stCalibration.cvD.clone();

    if (!cv::checkRange(stCalibration.cvK) || !cv::checkRange(stCalibration.cvD))
    {
        szError = "calibration contains NaN or infinite values";
        return std::nullopt;
    }
    if (stCalibration.GetFx() <= 0.0 || stCalibration.GetFy() <= 0.0)
    {
        szError = "focal lengths must be positive";
        return std::nullopt;
    }

    return stCalibration;
}

#endif    // CAMERA_MODELS_HPP
