/******************************************************************************
 * @brief Defines the EngineConfig class.
 *
 * @file EngineConfig.h
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef ENGINECONFIG_H
#define ENGINECONFIG_H

#include "../util/vision/CameraModels.hpp"
#include "../vision/algorithms/FeatureRegistration.hpp"

/// \cond
#include <opencv2/opencv.hpp>

#include <memory>
#include <string>

/// \endcond

/******************************************************************************
 * @brief The validated, immutable inputs of a mapping session: scene camera
 *      calibration and the reference model. Only Create() builds one, so an
 *      EngineConfig that exists is always complete.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 ******************************************************************************/
class EngineConfig
{
    private:
        // Only Create() can name this, so only Create() can construct a config.
        struct ConstructionKey
        {
                explicit ConstructionKey() = default;
        };

    public:
        static std::shared_ptr<const EngineConfig> Create(const cv::Mat& cvCameraMatrix,
                                                          const cv::Mat& cvDistortion,
                                                          const cv::Mat& cvReferenceImage,
                                                          std::string& szError);

        EngineConfig(ConstructionKey stKey, CameraCalibration stCalibration, FeatureRegistration::ReferenceModel stReferenceModel);

        const CameraCalibration& GetCalibration() const { return m_stCalibration; }
        const FeatureRegistration::ReferenceModel& GetReferenceModel() const { return m_stReferenceModel; }
        cv::Size GetReferenceSize() const { return m_stReferenceModel.cvImage.size(); }

    private:
        const CameraCalibration m_stCalibration;
        const FeatureRegistration::ReferenceModel m_stReferenceModel;
};

#endif    // ENGINECONFIG_H
