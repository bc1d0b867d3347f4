/******************************************************************************
 * @brief Defines the FrameProcessor class, the per tick gaze mapping pipeline.
 *
 * @file FrameProcessor.h
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef FRAMEPROCESSOR_H
#define FRAMEPROCESSOR_H

#include "../Constants.h"
#include "../interfaces/FrameChannel.hpp"
#include "../io/RecordingWriter.h"
#include "../network/FrameMessage.hpp"
#include "../tracking/AOITracker.h"
#include "../tracking/HeatmapAccumulator.h"
#include "../util/IPS.hpp"
#include "../vision/algorithms/Undistortion.hpp"
#include "EngineConfig.h"

/// \cond
#include <opencv2/opencv.hpp>

#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/// \endcond

/******************************************************************************
 * @brief How the composite image is drawn. Can be changed between ticks.
 ******************************************************************************/
struct RenderOptions
{
    public:
        int nPointSize         = constants::RENDER_DEFAULT_POINT_SIZE;         // Gaze marker and heatmap disc radius.
        cv::Scalar cvPointColor = constants::RENDER_DEFAULT_POINT_COLOR;       // BGR.
        double dPointOpacity   = constants::RENDER_DEFAULT_POINT_OPACITY;
        bool bOverlayScene     = false;
        double dSceneOpacity   = constants::RENDER_DEFAULT_SCENE_OPACITY;
        bool bShowHeatmap      = false;
        double dHeatmapOpacity = constants::RENDER_DEFAULT_HEATMAP_OPACITY;
        bool bShowFPS          = false;
};

/******************************************************************************
 * @brief Outcome of one tick.
 ******************************************************************************/
enum class TickStatus
{
    eRegistered,             // Gaze mapped, statistics updated.
    eInvalidFrame,           // The frame had no pixels.
    eInvalidGaze,            // Gaze was NaN, infinite or outside [0, 1].
    eEmptyCrop,              // Undistortion left no valid pixels.
    eNoDescriptors,          // No ORB descriptors in the frame.
    eInsufficientMatches,    // Too few matches passed the ratio test.
    eHomographyFailed,       // RANSAC gave no usable homography.
    eProjectionFailed,       // The gaze mapped to infinity.
    eOpenCVError             // OpenCV threw during the tick.
};

/******************************************************************************
 * @brief Statistics of one AOI at the time of a tick.
 ******************************************************************************/
struct AOISnapshot
{
    public:
        std::string szName;
        cv::Rect2f cvRect;
        uint32_t unHitCount  = 0;
        double dDwellSeconds = 0.0;    // Includes the visit in progress.
        bool bGazeInside     = false;
};

/******************************************************************************
 * @brief A right/left score pair of a registered tick, for plotting.
 ******************************************************************************/
struct ScoreSample
{
    public:
        double dTime       = 0.0;
        double dScoreRight = 0.0;
        double dScoreLeft  = 0.0;
};

/******************************************************************************
 * @brief Everything one tick produced.
 ******************************************************************************/
struct FrameResult
{
    public:
        cv::Mat cvComposite;                          // New composite, or the previous one if the tick failed.
        std::vector<AOISnapshot> vAOIs;
        std::optional<cv::Point2f> cvGazePoint;       // Gaze in reference pixels, if registered.
        bool bRegistered = false;
        TickStatus eStatus = TickStatus::eInvalidFrame;
        size_t siGoodMatches = 0;
        double dFPS = 0.0;
        int64_t nFrameNumber = 0;
        double dScoreRight = 0.0;
        double dScoreLeft  = 0.0;
        double dTimestamp  = 0.0;                     // Parsed system time, or wall clock if unparsable.
        bool bTimestampIsFallback = true;
        std::string szActiveAOI;
        std::vector<AOITransition> vTransitions;
        std::optional<RecordRow> stRecordRow;         // Set when a row was recorded this tick.
};

/******************************************************************************
 * @brief Pulls the newest frame from the channel and runs it through
 *      undistortion, registration, gaze projection, AOI tracking and the
 *      heatmap, then draws the composite. All methods must be called from one
 *      thread.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 ******************************************************************************/
class FrameProcessor
{
    public:
        /////////////////////////////////////////
        // Declare public methods and member variables.
        /////////////////////////////////////////

        FrameProcessor(std::shared_ptr<const EngineConfig> pEngineConfig, FrameChannel<IncomingFrame>& stChannel, const RenderOptions& stRenderOptions = RenderOptions());
        ~FrameProcessor();

        std::optional<FrameResult> Tick();
        FrameResult ProcessFrame(const IncomingFrame& stFrame);
        cv::Mat RenderPreview(const std::optional<cv::Rect2f>& cvDraftRect = std::nullopt) const;

        bool StartRecording(const std::filesystem::path& szDirectory);
        void StopRecording();
        void ResetCounts();
        size_t SetHistoryLength(size_t siLength);

        /////////////////////////////////////////
        // Setters.
        /////////////////////////////////////////

        void SetRenderOptions(const RenderOptions& stRenderOptions) { m_stRenderOptions = stRenderOptions; }

        /////////////////////////////////////////
        // Getters.
        /////////////////////////////////////////

        const RenderOptions& GetRenderOptions() const { return m_stRenderOptions; }
        AOITracker& GetAOITracker() { return m_stAOITracker; }
        const AOITracker& GetAOITracker() const { return m_stAOITracker; }
        const HeatmapAccumulator& GetHeatmap() const { return m_stHeatmap; }
        const Undistortion::UndistortionMap& GetUndistortionMap() const { return m_stUndistortionMap; }
        const std::deque<ScoreSample>& GetScoreHistory() const { return m_dqScoreHistory; }
        const cv::Mat& GetLastComposite() const { return m_cvLastComposite; }
        bool IsRecording() const { return m_pRecordingWriter != nullptr; }
        std::optional<std::filesystem::path> GetRecordingPath() const;
        std::vector<AOISnapshot> GetAOISnapshots(double dNow) const;

    private:
        /////////////////////////////////////////
        // Declare private methods.
        /////////////////////////////////////////

        cv::Mat Compose(const std::optional<cv::Point2f>& cvGazePoint, const std::optional<cv::Rect2f>& cvDraftRect) const;
        void PushScoreSample(double dTime, double dScoreRight, double dScoreLeft);

        /////////////////////////////////////////
        // Declare private member variables.
        /////////////////////////////////////////

        std::shared_ptr<const EngineConfig> m_pEngineConfig;
        FrameChannel<IncomingFrame>& m_stChannel;
        Undistortion::UndistortionMap m_stUndistortionMap;
        AOITracker m_stAOITracker;
        HeatmapAccumulator m_stHeatmap;
        RenderOptions m_stRenderOptions;
        IPS m_IPS;

        // State of the last registered tick, used to redraw without registering.
        cv::Mat m_cvLastComposite;
        cv::Mat m_cvLastScene;
        cv::Mat m_cvLastHomography;
        std::optional<cv::Point2f> m_cvLastGazePoint;
        double m_dLastTimestamp;

        std::deque<ScoreSample> m_dqScoreHistory;
        std::unique_ptr<RecordingWriter> m_pRecordingWriter;
        uint64_t m_unRecordedFrameCounter;
};

const char* TickStatusToString(TickStatus eStatus);

#endif    // FRAMEPROCESSOR_H
