/******************************************************************************
 * @brief Declares constants for GazeMapper.
 *
 * @file Constants.h
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef GAZEMAPPER_CONSTANTS_H
#define GAZEMAPPER_CONSTANTS_H

/// \cond
#include <opencv2/opencv.hpp>
#include <quill/core/LogLevel.h>

#include <string>

/// \endcond

/******************************************************************************
 * @brief Namespace containing all constants for GazeMapper. Runtime session
 *      values (calibration, reference image, endpoint) are NOT stored here,
 *      they are loaded from the session config file.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
namespace constants
{
    ///////////////////////////////////////////////////////////////////////////
    //// General Constants.
    ///////////////////////////////////////////////////////////////////////////

    // Logging constants.
    extern const std::string LOGGING_OUTPUT_PATH_ABSOLUTE;
    extern const quill::LogLevel CONSOLE_MIN_LEVEL;
    extern const quill::LogLevel FILE_MIN_LEVEL;
    extern const quill::LogLevel CONSOLE_DEFAULT_LEVEL;
    extern const quill::LogLevel FILE_DEFAULT_LEVEL;

    // Logging color constants.
    extern const std::string szTraceL3Color;
    extern const std::string szTraceL2Color;
    extern const std::string szTraceL1Color;
    extern const std::string szDebugColor;
    extern const std::string szInfoColor;
    extern const std::string szNoticeColor;
    extern const std::string szWarningColor;
    extern const std::string szErrorColor;
    extern const std::string szCriticalColor;
    extern const std::string szBacktraceColor;
    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// Receiver Constants.
    ///////////////////////////////////////////////////////////////////////////

    extern const std::string RECEIVER_DEFAULT_ENDPOINT;
    extern const int RECEIVER_RECV_TIMEOUT_MS;
    extern const int RECEIVER_IO_THREADS;
    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// Processor Constants.
    ///////////////////////////////////////////////////////////////////////////

    extern const int PROCESSOR_TICK_PERIOD_MS;
    extern const std::size_t PROCESSOR_SCORE_HISTORY_LENGTH;
    extern const cv::InterpolationFlags UNDISTORT_REMAP_INTERPOLATION_METHOD;
    extern const double UNDISTORT_ALPHA;
    extern const bool UNDISTORT_CENTER_PRINCIPAL_POINT;
    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// Registration Constants.
    ///////////////////////////////////////////////////////////////////////////

    // ORB detector. Must be identical for the reference model and live frames.
    extern const int ORB_MAX_FEATURES;
    extern const float ORB_SCALE_FACTOR;
    extern const int ORB_PYRAMID_LEVELS;
    extern const int ORB_EDGE_THRESHOLD;
    extern const int ORB_PATCH_SIZE;
    extern const int ORB_FAST_THRESHOLD;

    // FLANN LSH matcher.
    extern const int LSH_TABLE_NUMBER;
    extern const int LSH_KEY_SIZE;
    extern const int LSH_MULTI_PROBE_LEVEL;
    extern const int LSH_SEARCH_CHECKS;

    // Match filtering and homography.
    extern const float REGISTRATION_RATIO_TEST_THRESHOLD;
    extern const std::size_t REGISTRATION_MIN_GOOD_MATCHES;
    extern const double REGISTRATION_RANSAC_REPROJ_THRESHOLD;
    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// Heatmap and Render Constants.
    ///////////////////////////////////////////////////////////////////////////

    extern const double HEATMAP_GAUSSIAN_SIGMA;
    extern const cv::ColormapTypes HEATMAP_COLORMAP;
    extern const std::size_t HEATMAP_DEFAULT_HISTORY;
    extern const std::size_t HEATMAP_MAX_HISTORY;

    extern const int RENDER_DEFAULT_POINT_SIZE;
    extern const cv::Scalar RENDER_DEFAULT_POINT_COLOR;
    extern const double RENDER_DEFAULT_POINT_OPACITY;
    extern const double RENDER_DEFAULT_SCENE_OPACITY;
    extern const double RENDER_DEFAULT_HEATMAP_OPACITY;
    extern const cv::Scalar RENDER_AOI_INSIDE_COLOR;
    extern const cv::Scalar RENDER_AOI_OUTSIDE_COLOR;
    extern const cv::Scalar RENDER_AOI_DRAFT_COLOR;
    extern const double RENDER_AOI_LABEL_SCALE;
    extern const std::string RENDER_AOI_UNNAMED_LABEL;
    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// Recording Constants.
    ///////////////////////////////////////////////////////////////////////////

    extern const std::string RECORDING_DEFAULT_DIRECTORY;
    extern const std::string RECORDING_BASE_FILENAME;
    ///////////////////////////////////////////////////////////////////////////
}    // namespace constants

#endif    // GAZEMAPPER_CONSTANTS_H
