/******************************************************************************
 * @brief Defines the SessionConfig struct, the contents of a session JSON file.
 *
 *        Example:
 *        {
 *            "camera_matrix": [[fx, 0, cx], [0, fy, cy], [0, 0, 1]],
 *            "dist_coeffs": [k1, k2, p1, p2, k3],
 *            "reference_image": "reference.png",
 *            "endpoint": "tcp://127.0.0.1:5555",
 *            "aoi_file": "layout.aoi",
 *            "history_length": 100,
 *            "recording_directory": "recordings",
 *            "active_aoi_policy": "last_defined",
 *            "render": {
 *                "point_size": 10, "point_color": [0, 0, 255], "point_opacity": 1.0,
 *                "overlay_scene": false, "scene_opacity": 0.5,
 *                "heatmap": false, "heatmap_opacity": 0.5, "show_fps": false
 *            }
 *        }
 *
 *        Relative paths are resolved against the directory of the file.
 *
 * @file SessionConfig.h
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef SESSIONCONFIG_H
#define SESSIONCONFIG_H

#include "../processing/FrameProcessor.h"

/// \cond
#include <opencv2/opencv.hpp>

#include <filesystem>
#include <optional>
#include <string>

/// \endcond

/******************************************************************************
 * @brief Everything needed to start a mapping session. Shapes are validated
 *      on load, the values of the calibration are validated again when the
 *      EngineConfig is built.
 ******************************************************************************/
struct SessionConfig
{
    public:
        cv::Mat cvCameraMatrix;                          // 3x3 CV_64F.
        cv::Mat cvDistortion;                            // 1x5 CV_64F.
        std::filesystem::path szReferenceImagePath;
        std::string szEndpoint = constants::RECEIVER_DEFAULT_ENDPOINT;
        std::optional<std::filesystem::path> szAOIFile;
        size_t siHistoryLength = constants::HEATMAP_DEFAULT_HISTORY;
        std::filesystem::path szRecordingDirectory = constants::RECORDING_DEFAULT_DIRECTORY;
        RenderOptions stRenderOptions;
        ActiveAOIPolicy eActivePolicy = ActiveAOIPolicy::eLastDefined;

        static std::optional<SessionConfig> Parse(const std::string& szText, const std::filesystem::path& szBaseDirectory, std::string& szError);
        static std::optional<SessionConfig> Load(const std::filesystem::path& szPath, std::string& szError);
};

#endif    // SESSIONCONFIG_H
