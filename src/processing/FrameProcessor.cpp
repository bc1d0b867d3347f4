/******************************************************************************
 * @brief Implements the FrameProcessor class.
 *
 * @file FrameProcessor.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "FrameProcessor.h"
#include "../Logging.h"
#include "../util/TimeOperations.hpp"
#include "../util/vision/ImageOperations.hpp"
#include "../vision/algorithms/FeatureRegistration.hpp"
#include "../vision/algorithms/GazeProjection.hpp"

/// \cond
#include <utility>

/// \endcond

/******************************************************************************
 * @brief Construct a new FrameProcessor::FrameProcessor object.
 *
 * @param pEngineConfig - Calibration and reference model. Must not be null.
 * @param stChannel - The channel frames are taken from. Must outlive this object.
 * @param stRenderOptions - Initial render options.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 ******************************************************************************/
FrameProcessor::FrameProcessor(std::shared_ptr<const EngineConfig> pEngineConfig, FrameChannel<IncomingFrame>& stChannel, const RenderOptions& stRenderOptions) :
    m_pEngineConfig(std::move(pEngineConfig)), m_stChannel(stChannel), m_stUndistortionMap(m_pEngineConfig->GetCalibration()),
    m_stHeatmap(constants::HEATMAP_DEFAULT_HISTORY), m_stRenderOptions(stRenderOptions), m_dLastTimestamp(0.0), m_unRecordedFrameCounter(0)
{
    // Start out showing the plain reference image.
    m_cvLastComposite = m_pEngineConfig->GetReferenceModel().cvImage.clone();
}

/******************************************************************************
 * @brief Destroy the FrameProcessor::FrameProcessor object. Closes any running
 *      recording.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 ******************************************************************************/
FrameProcessor::~FrameProcessor()
{
    this->StopRecording();
}

/******************************************************************************
 * @brief Runs one tick on the newest frame in the channel.
 *
 * @return std::optional<FrameResult> - The tick's result, nullopt if no new
 *      frame was published since the last tick.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 ******************************************************************************/
std::optional<FrameResult> FrameProcessor::Tick()
{
    std::optional<IncomingFrame> stFrame = m_stChannel.TryTake();
    if (!stFrame.has_value())
    {
        return std::nullopt;
    }

    return this->ProcessFrame(*stFrame);
}

/******************************************************************************
 * @brief The per tick pipeline. Failures at any stage are reported through
 *      FrameResult::eStatus and leave AOI statistics, the heatmap, the score
 *      history and the recording untouched.
 *
 * @param stFrame - The frame to process.
 * @return FrameResult - What the tick produced.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 ******************************************************************************/
FrameResult FrameProcessor::ProcessFrame(const IncomingFrame& stFrame)
{
    FrameResult stResult;
    stResult.nFrameNumber = stFrame.nFrameNumber;
    stResult.dScoreRight  = stFrame.dScoreRight;
    stResult.dScoreLeft   = stFrame.dScoreLeft;
    stResult.cvComposite  = m_cvLastComposite;

    // Every consumed frame counts for the frame rate, registered or not.
    m_IPS.Tick();
    stResult.dFPS = m_IPS.GetExactIPS();

    const CameraCalibration& stCalibration                = m_pEngineConfig->GetCalibration();
    const FeatureRegistration::ReferenceModel& stReference = m_pEngineConfig->GetReferenceModel();

    try
    {
        if (stFrame.cvImage.empty())
        {
            stResult.eStatus = TickStatus::eInvalidFrame;
            stResult.vAOIs   = this->GetAOISnapshots(m_dLastTimestamp);
            return stResult;
        }

        // 1. Remap table for this geometry. Only rebuilt when the size changes.
        const Undistortion::RemapTable& stTable = m_stUndistortionMap.Acquire(stFrame.cvImage.size());

        // 2. Gaze validity.
        if (!GazeProjection::IsGazeValid(stFrame.dGazeX, stFrame.dGazeY))
        {
            // Submit logger message.
            LOG_TRACE_L1(logging::g_qSharedLogger, "Frame {}: invalid gaze ({}, {}).", stFrame.nFrameNumber, stFrame.dGazeX, stFrame.dGazeY);

            stResult.eStatus = TickStatus::eInvalidGaze;
            stResult.vAOIs   = this->GetAOISnapshots(m_dLastTimestamp);
            return stResult;
        }

        // 3. Undistort and crop.
        std::optional<cv::Mat> cvUndistorted = Undistortion::ApplyRemapTable(stFrame.cvImage, stTable);
        if (!cvUndistorted.has_value())
        {
            // Submit logger message.
            LOG_DEBUG(logging::g_qSharedLogger, "Frame {}: undistortion left an empty crop region.", stFrame.nFrameNumber);

            stResult.eStatus = TickStatus::eEmptyCrop;
            stResult.vAOIs   = this->GetAOISnapshots(m_dLastTimestamp);
            return stResult;
        }

        // 4. Register against the reference.
        cv::Mat cvGray;
        cv::cvtColor(*cvUndistorted, cvGray, cv::COLOR_BGR2GRAY);
        FeatureRegistration::RegistrationResult stRegistration = FeatureRegistration::RegisterFrame(stReference, cvGray);
        stResult.siGoodMatches                                 = stRegistration.siGoodMatches;
        if (!stRegistration.IsRegistered())
        {
            switch (stRegistration.eStatus)
            {
                case FeatureRegistration::RegistrationStatus::eNoDescriptors: stResult.eStatus = TickStatus::eNoDescriptors; break;
                case FeatureRegistration::RegistrationStatus::eInsufficientMatches: stResult.eStatus = TickStatus::eInsufficientMatches; break;
                default: stResult.eStatus = TickStatus::eHomographyFailed; break;
            }

            // Submit logger message.
            LOG_TRACE_L1(logging::g_qSharedLogger,
                         "Frame {}: registration failed ({}), {} good matches of {} keypoints.",
                         stFrame.nFrameNumber,
                         FeatureRegistration::StatusToString(stRegistration.eStatus),
                         stRegistration.siGoodMatches,
                         stRegistration.siFrameKeypoints);

            stResult.vAOIs = this->GetAOISnapshots(m_dLastTimestamp);
            return stResult;
        }

        // 5. Project the gaze.
        std::optional<cv::Point2f> cvGazePoint =
            GazeProjection::ProjectGazePoint(stFrame.dGazeX, stFrame.dGazeY, stFrame.cvImage.size(), stCalibration, stTable, stRegistration.cvHomography);
        if (!cvGazePoint.has_value())
        {
            // Submit logger message.
            LOG_TRACE_L1(logging::g_qSharedLogger, "Frame {}: gaze projected to infinity.", stFrame.nFrameNumber);

            stResult.eStatus = TickStatus::eProjectionFailed;
            stResult.vAOIs   = this->GetAOISnapshots(m_dLastTimestamp);
            return stResult;
        }

        // 6. Timestamp for dwell bookkeeping.
        timeops::SystemTimestamp stTimestamp = timeops::ParseSystemTime(stFrame.szSystemTime.value_or(""));
        if (stTimestamp.bIsFallback && stFrame.szSystemTime.has_value())
        {
            // Submit logger message.
            LOG_DEBUG(logging::g_qSharedLogger, "Frame {}: unparsable system time '{}', using wall clock.", stFrame.nFrameNumber, *stFrame.szSystemTime);
        }

        // 7. Update statistics.
        m_stHeatmap.AddPoint(*cvGazePoint);
        AOIUpdateResult stUpdate = m_stAOITracker.Update(*cvGazePoint, stTimestamp.dEpochSeconds);
        this->PushScoreSample(stTimestamp.dEpochSeconds, stFrame.dScoreRight, stFrame.dScoreLeft);

        m_cvLastScene      = std::move(*cvUndistorted);
        m_cvLastHomography = stRegistration.cvHomography;
        m_cvLastGazePoint  = cvGazePoint;
        m_dLastTimestamp   = stTimestamp.dEpochSeconds;

        // 8. Draw.
        m_cvLastComposite = this->Compose(cvGazePoint, std::nullopt);

        stResult.cvComposite          = m_cvLastComposite;
        stResult.cvGazePoint          = cvGazePoint;
        stResult.bRegistered          = true;
        stResult.eStatus              = TickStatus::eRegistered;
        stResult.dTimestamp           = stTimestamp.dEpochSeconds;
        stResult.bTimestampIsFallback = stTimestamp.bIsFallback;
        stResult.szActiveAOI          = stUpdate.szActiveName;
        stResult.vTransitions         = std::move(stUpdate.vTransitions);
        stResult.vAOIs                = this->GetAOISnapshots(stTimestamp.dEpochSeconds);

        // 9. Record.
        if (m_pRecordingWriter)
        {
            RecordRow stRow;
            stRow.unFrame      = ++m_unRecordedFrameCounter;
            stRow.nPicNum      = stFrame.nFrameNumber;
            stRow.dGazeX       = cvGazePoint->x;
            stRow.dGazeY       = cvGazePoint->y;
            stRow.szAOI        = stResult.szActiveAOI;
            stRow.dScoreRight  = stFrame.dScoreRight;
            stRow.dScoreLeft   = stFrame.dScoreLeft;
            stRow.szSystemTime = stFrame.szSystemTime.value_or("");
            if (m_pRecordingWriter->WriteRow(stRow))
            {
                stResult.stRecordRow = stRow;
            }
        }
    }
    catch (const cv::Exception& cvException)
    {
        // Submit logger message.
        LOG_WARNING(logging::g_qSharedLogger, "Frame {}: OpenCV error during processing: {}", stFrame.nFrameNumber, cvException.what());

        stResult.eStatus     = TickStatus::eOpenCVError;
        stResult.bRegistered = false;
        stResult.cvGazePoint.reset();
        stResult.cvComposite = m_cvLastComposite;
        stResult.vAOIs       = this->GetAOISnapshots(m_dLastTimestamp);
    }

    return stResult;
}

/******************************************************************************
 * @brief Redraws the composite from the last registered tick with the current
 *      render options, plus an optional AOI being drawn. Never registers.
 *
 * @param cvDraftRect - AOI rectangle in progress, drawn in blue.
 * @return cv::Mat - The redrawn composite.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 ******************************************************************************/
cv::Mat FrameProcessor::RenderPreview(const std::optional<cv::Rect2f>& cvDraftRect) const
{
    return this->Compose(m_cvLastGazePoint, cvDraftRect);
}

/******************************************************************************
 * @brief Starts writing a row for every registered tick. The Frame column
 *      restarts at 1. Stops a recording that is already running first.
 *
 * @param szDirectory - Where the CSV file is created.
 * @return true - Recording.
 * @return false - The file could not be created.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 ******************************************************************************/
bool FrameProcessor::StartRecording(const std::filesystem::path& szDirectory)
{
    this->StopRecording();

    m_pRecordingWriter       = RecordingWriter::Open(szDirectory);
    m_unRecordedFrameCounter = 0;

    return m_pRecordingWriter != nullptr;
}

/******************************************************************************
 * @brief Stops and closes the running recording, if any.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 ******************************************************************************/
void FrameProcessor::StopRecording()
{
    if (m_pRecordingWriter)
    {
        m_pRecordingWriter->Close();
        m_pRecordingWriter.reset();
    }
}

/******************************************************************************
 * @brief Zeroes all AOI hit counts and dwell times.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 ******************************************************************************/
void FrameProcessor::ResetCounts()
{
    m_stAOITracker.Reset();
}

/******************************************************************************
 * @brief Changes how many gaze points the heatmap keeps.
 *
 * @param siLength - Requested history length.
 * @return size_t - The length applied after clamping.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 ******************************************************************************/
size_t FrameProcessor::SetHistoryLength(size_t siLength)
{
    return m_stHeatmap.SetCapacity(siLength);
}

std::optional<std::filesystem::path> FrameProcessor::GetRecordingPath() const
{
    if (!m_pRecordingWriter)
    {
        return std::nullopt;
    }

    return m_pRecordingWriter->GetPath();
}

/******************************************************************************
 * @brief Accessor for the statistics of every AOI.
 *
 * @param dNow - Timestamp used for the dwell of visits in progress.
 * @return std::vector<AOISnapshot> - One entry per AOI, in order.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 ******************************************************************************/
std::vector<AOISnapshot> FrameProcessor::GetAOISnapshots(double dNow) const
{
    std::vector<AOISnapshot> vSnapshots;
    const std::vector<AOI>& vAOIs = m_stAOITracker.GetAOIs();
    vSnapshots.reserve(vAOIs.size());
    for (size_t siI = 0; siI < vAOIs.size(); ++siI)
    {
        AOISnapshot stSnapshot;
        stSnapshot.szName        = vAOIs[siI].szName;
        stSnapshot.cvRect        = vAOIs[siI].cvRect;
        stSnapshot.unHitCount    = vAOIs[siI].unHitCount;
        stSnapshot.dDwellSeconds = m_stAOITracker.GetInstantDwell(siI, dNow).value_or(0.0);
        stSnapshot.bGazeInside   = vAOIs[siI].bGazeInside;
        vSnapshots.push_back(stSnapshot);
    }

    return vSnapshots;
}

/******************************************************************************
 * @brief Draws the composite. Layers, bottom to top: reference image, warped
 *      scene, heatmap, gaze marker, AOI boxes with "name: hits" labels, draft
 *      AOI, FPS text.
 *
 * @param cvGazePoint - Gaze marker position, none to skip the marker.
 * @param cvDraftRect - AOI rectangle in progress.
 * @return cv::Mat - The composite, reference image sized.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 ******************************************************************************/
cv::Mat FrameProcessor::Compose(const std::optional<cv::Point2f>& cvGazePoint, const std::optional<cv::Rect2f>& cvDraftRect) const
{
    cv::Mat cvCanvas = m_pEngineConfig->GetReferenceModel().cvImage.clone();

    if (m_stRenderOptions.bOverlayScene && !m_cvLastScene.empty() && !m_cvLastHomography.empty())
    {
        imgops::OverlayWarpedScene(cvCanvas, m_cvLastScene, m_cvLastHomography, m_stRenderOptions.dSceneOpacity);
    }

    if (m_stRenderOptions.bShowHeatmap)
    {
        m_stHeatmap.Render(cvCanvas, m_stRenderOptions.nPointSize, m_stRenderOptions.dHeatmapOpacity);
    }

    if (cvGazePoint.has_value())
    {
        imgops::DrawGazeMarker(cvCanvas, *cvGazePoint, m_stRenderOptions.nPointSize, m_stRenderOptions.cvPointColor, m_stRenderOptions.dPointOpacity);
    }

    for (const AOI& stAOI : m_stAOITracker.GetAOIs())
    {
        const cv::Scalar& cvColor = stAOI.bGazeInside ? constants::RENDER_AOI_INSIDE_COLOR : constants::RENDER_AOI_OUTSIDE_COLOR;
        std::string szLabel       = (stAOI.szName.empty() ? constants::RENDER_AOI_UNNAMED_LABEL : stAOI.szName) + ": " + std::to_string(stAOI.unHitCount);
        imgops::DrawLabeledBox(cvCanvas, stAOI.cvRect, szLabel, cvColor);
    }

    if (cvDraftRect.has_value())
    {
        imgops::DrawLabeledBox(cvCanvas, *cvDraftRect, "", constants::RENDER_AOI_DRAFT_COLOR);
    }

    if (m_stRenderOptions.bShowFPS)
    {
        imgops::DrawFPS(cvCanvas, m_IPS.GetExactIPS());
    }

    return cvCanvas;
}

/******************************************************************************
 * @brief Appends to the score history, dropping the oldest sample when full.
 *
 * @param dTime - Timestamp of the sample.
 * @param dScoreRight - Right eye score.
 * @param dScoreLeft - Left eye score.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 ******************************************************************************/
void FrameProcessor::PushScoreSample(double dTime, double dScoreRight, double dScoreLeft)
{
    m_dqScoreHistory.push_back(ScoreSample{dTime, dScoreRight, dScoreLeft});
    while (m_dqScoreHistory.size() > constants::PROCESSOR_SCORE_HISTORY_LENGTH)
    {
        m_dqScoreHistory.pop_front();
    }
}

/******************************************************************************
 * @brief Accessor for a printable name of a tick status.
 *
 * @param eStatus - The status.
 * @return const char* - Its name.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 ******************************************************************************/
const char* TickStatusToString(TickStatus eStatus)
{
    switch (eStatus)
    {
        case TickStatus::eRegistered: return "Registered";
        case TickStatus::eInvalidFrame: return "InvalidFrame";
        case TickStatus::eInvalidGaze: return "InvalidGaze";
        case TickStatus::eEmptyCrop: return "EmptyCrop";
        case TickStatus::eNoDescriptors: return "NoDescriptors";
        case TickStatus::eInsufficientMatches: return "InsufficientMatches";
        case TickStatus::eHomographyFailed: return "HomographyFailed";
        case TickStatus::eProjectionFailed: return "ProjectionFailed";
        case TickStatus::eOpenCVError: return "OpenCVError";
        default: return "Unknown";
    }
}
