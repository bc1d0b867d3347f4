/******************************************************************************
 * @brief Implements the EngineConfig class.
 *
 * @file EngineConfig.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "EngineConfig.h"
#include "../Logging.h"

/// \cond
#include <optional>
#include <utility>

/// \endcond

/******************************************************************************
 * @brief Validates the calibration and builds the reference model.
 *
 * @param cvCameraMatrix - 3x3 intrinsic matrix of the scene camera.
 * @param cvDistortion - 5 distortion coefficients.
 * @param cvReferenceImage - The reference image (BGR or grayscale).
 * @param szError - Set to the reason when validation fails.
 * @return std::shared_ptr<const EngineConfig> - The config, nullptr if any input
 *      is invalid.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 ******************************************************************************/
std::shared_ptr<const EngineConfig> EngineConfig::Create(const cv::Mat& cvCameraMatrix, const cv::Mat& cvDistortion, const cv::Mat& cvReferenceImage, std::string& szError)
{
    std::optional<CameraCalibration> stCalibration = MakeCameraCalibration(cvCameraMatrix, cvDistortion, szError);
    if (!stCalibration.has_value())
    {
        // Submit logger message.
        LOG_ERROR(logging::g_qSharedLogger, "Invalid camera calibration: {}", szError);
        return nullptr;
    }

    if (cvReferenceImage.empty())
    {
        szError = "reference image is empty";

        // Submit logger message.
        LOG_ERROR(logging::g_qSharedLogger, "Invalid reference image: {}", szError);
        return nullptr;
    }

    std::optional<FeatureRegistration::ReferenceModel> stReferenceModel;
    try
    {
        stReferenceModel = FeatureRegistration::BuildReferenceModel(cvReferenceImage);
    }
    catch (const cv::Exception& cvException)
    {
        // Submit logger message.
        LOG_ERROR(logging::g_qSharedLogger, "OpenCV error while building the reference model: {}", cvException.what());
    }
    if (!stReferenceModel.has_value())
    {
        szError = "reference image has no usable features";
        return nullptr;
    }

    return std::make_shared<const EngineConfig>(ConstructionKey(), std::move(*stCalibration), std::move(*stReferenceModel));
}

EngineConfig::EngineConfig(ConstructionKey /*stKey*/, CameraCalibration stCalibration, FeatureRegistration::ReferenceModel stReferenceModel) :
    m_stCalibration(std::move(stCalibration)), m_stReferenceModel(std::move(stReferenceModel))
{}
