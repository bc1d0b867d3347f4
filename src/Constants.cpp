/******************************************************************************
 * @brief Defines constants for GazeMapper.
 *
 * @file Constants.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "./Constants.h"

/******************************************************************************
 * @brief Namespace containing all constants for GazeMapper.
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
    const std::string LOGGING_OUTPUT_PATH_ABSOLUTE = "../gaze_logs/";          // The absolute path to write output logging files to.
    const quill::LogLevel CONSOLE_MIN_LEVEL        = quill::LogLevel::TraceL3;    // The minimum logging level that is allowed to send to the console log stream.
    const quill::LogLevel FILE_MIN_LEVEL           = quill::LogLevel::TraceL3;    // The minimum logging level that is allowed to send to the file log streams.
    const quill::LogLevel CONSOLE_DEFAULT_LEVEL    = quill::LogLevel::Info;       // The default logging level for console stream.
    const quill::LogLevel FILE_DEFAULT_LEVEL       = quill::LogLevel::Debug;      // The default logging level for file streams.

    // Logging color constants.
    const std::string szTraceL3Color   = "\033[30m";           // Standard Grey
    const std::string szTraceL2Color   = "\033[30m";           // Standard Grey
    const std::string szTraceL1Color   = "\033[30m";           // Standard Grey
    const std::string szDebugColor     = "\033[36m";           // Standard Cyan
    const std::string szInfoColor      = "\033[32m";           // Standard Green
    const std::string szNoticeColor    = "\033[97m\033[1m";    // Bright Bold White
    const std::string szWarningColor   = "\033[93m\033[1m";    // Bright Bold Yellow
    const std::string szErrorColor     = "\033[91m\033[1m";    // Bright Bold Red
    const std::string szCriticalColor  = "\033[95m\033[1m";    // Bright Bold Magenta
    const std::string szBacktraceColor = "\033[30m";           // Standard Grey

    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// Receiver Constants.
    ///////////////////////////////////////////////////////////////////////////

    const std::string RECEIVER_DEFAULT_ENDPOINT = "tcp://127.0.0.1:5555";    // The ZeroMQ publisher to subscribe to if the session config has none.
    const int RECEIVER_RECV_TIMEOUT_MS          = 100;                       // Receive timeout so the receiver thread can notice a stop request.
    const int RECEIVER_IO_THREADS               = 1;                         // Number of ZeroMQ context IO threads.

    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// Processor Constants.
    ///////////////////////////////////////////////////////////////////////////

    const int PROCESSOR_TICK_PERIOD_MS               = 16;     // ~60 Hz processing cadence.
    const std::size_t PROCESSOR_SCORE_HISTORY_LENGTH = 100;    // Number of score samples kept for plotting.

    // Undistortion.
    const cv::InterpolationFlags UNDISTORT_REMAP_INTERPOLATION_METHOD = cv::InterpolationFlags::INTER_LINEAR;    // Resampling used when undistorting frames.
    const double UNDISTORT_ALPHA                                       = 0.0;     // 0 = no black borders, 1 = keep all source pixels.
    const bool UNDISTORT_CENTER_PRINCIPAL_POINT                        = true;    // Center the principal point of the adjusted camera matrix.

    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// Registration Constants.
    ///////////////////////////////////////////////////////////////////////////

    // ORB detector.
    const int ORB_MAX_FEATURES     = 300;     // Caps the worst case cost of matching.
    const float ORB_SCALE_FACTOR   = 1.2f;    // Pyramid decimation ratio.
    const int ORB_PYRAMID_LEVELS   = 8;       // Number of pyramid levels.
    const int ORB_EDGE_THRESHOLD   = 31;      // Border where features are not detected.
    const int ORB_PATCH_SIZE       = 31;      // Size of the patch used by the BRIEF descriptor.
    const int ORB_FAST_THRESHOLD   = 7;       // FAST corner threshold.

    // FLANN LSH matcher.
    const int LSH_TABLE_NUMBER      = 6;     // Number of hash tables.
    const int LSH_KEY_SIZE          = 12;    // Hash key length in bits.
    const int LSH_MULTI_PROBE_LEVEL = 1;     // Neighbouring buckets also searched.
    const int LSH_SEARCH_CHECKS     = 50;    // Leaf checks per query.

    // Match filtering and homography.
    const float REGISTRATION_RATIO_TEST_THRESHOLD     = 0.75f;    // Lowe's ratio. Best must be below this fraction of second best.
    const std::size_t REGISTRATION_MIN_GOOD_MATCHES   = 11;       // Minimum accepted matches before a homography is attempted.
    const double REGISTRATION_RANSAC_REPROJ_THRESHOLD = 5.0;      // RANSAC inlier threshold in pixels.

    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// Heatmap and Render Constants.
    ///////////////////////////////////////////////////////////////////////////

    const double HEATMAP_GAUSSIAN_SIGMA         = 15.0;                   // Smoothing kernel sigma in pixels.
    const cv::ColormapTypes HEATMAP_COLORMAP    = cv::COLORMAP_JET;       // Density to color mapping.
    const std::size_t HEATMAP_DEFAULT_HISTORY   = 100;                    // Default number of gaze points kept.
    const std::size_t HEATMAP_MAX_HISTORY       = 1000;                   // Upper bound for the gaze history length.

    const int RENDER_DEFAULT_POINT_SIZE         = 10;                     // Gaze marker and heatmap disc radius.
    const cv::Scalar RENDER_DEFAULT_POINT_COLOR = cv::Scalar(0, 0, 255);    // Red (BGR).
    const double RENDER_DEFAULT_POINT_OPACITY   = 1.0;
    const double RENDER_DEFAULT_SCENE_OPACITY   = 0.5;
    const double RENDER_DEFAULT_HEATMAP_OPACITY = 0.5;
    const cv::Scalar RENDER_AOI_INSIDE_COLOR    = cv::Scalar(0, 0, 255);    // Red (BGR).
    const cv::Scalar RENDER_AOI_OUTSIDE_COLOR   = cv::Scalar(0, 255, 0);    // Green (BGR).
    const cv::Scalar RENDER_AOI_DRAFT_COLOR     = cv::Scalar(255, 0, 0);    // Blue (BGR).
    const double RENDER_AOI_LABEL_SCALE         = 0.6;
    const std::string RENDER_AOI_UNNAMED_LABEL  = "Unnamed";

    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// Recording Constants.
    ///////////////////////////////////////////////////////////////////////////

    const std::string RECORDING_DEFAULT_DIRECTORY = "../gaze_recordings/";    // Where recording CSVs go if the session config has none.
    const std::string RECORDING_BASE_FILENAME     = "recorded_data";          // Base name, a (n) suffix is added if the file exists.

    ///////////////////////////////////////////////////////////////////////////
}    // namespace constants
