/******************************************************************************
 * @brief Main program file. Loads the session, starts the frame receiver and
 *      runs the gaze mapping loop.
 *
 * @file main.cpp
 * @author ClayJay3 (claytonraycowen@gmail.com)
 * @date 2025-06-20
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "./Logging.h"
#include "interfaces/FrameChannel.hpp"
#include "io/AOIStorage.h"
#include "io/SessionConfig.h"
#include "network/FrameReceiver.h"
#include "processing/EngineConfig.h"
#include "processing/FrameProcessor.h"
#include "util/IPS.hpp"
#include "util/TimeOperations.hpp"

/// \cond
#include <CLI/CLI.hpp>
#include <opencv2/opencv.hpp>

#include <csignal>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

/// \endcond

// Create a boolean used to handle a SIGINT and exit gracefully.
volatile sig_atomic_t bMainStop = false;
// Store original terminal settings.
struct termios g_stOriginalTermSettings;

// Name of the preview window.
static const char* WINDOW_NAME = "Gaze Mapper";
// Default file the AOIs are saved to when the session has no aoi_file.
static const char* DEFAULT_AOI_FILENAME = "areas_of_interest.aoi";

/******************************************************************************
 * @brief State of the AOI being drawn with the mouse in the preview window.
 ******************************************************************************/
struct AOIDraftState
{
    public:
        bool bDragging = false;
        cv::Point2f cvStart;
        cv::Point2f cvCurrent;
        std::optional<cv::Rect2f> cvFinished;    // Set on mouse release, consumed by the main loop.
        std::optional<cv::Point2f> cvRemoveAt;   // Set on right click, consumed by the main loop.
        std::optional<cv::Point2f> cvRenameAt;   // Set on left double click, consumed by the main loop.
};

/******************************************************************************
 * @brief A rename in progress. The new name is typed key by key, Enter commits
 *      and Esc cancels.
 ******************************************************************************/
struct AOIRenameState
{
    public:
        std::optional<size_t> siIndex;    // AOI being renamed, empty when no rename is active.
        std::string szBuffer;
};

/******************************************************************************
 * @brief Help function given to the C++ csignal standard library to run when
 * a CONTROL^C is given from the terminal.
 *
 * @param nSignal - Integer representing the interrupt value.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-01-08
 ******************************************************************************/
void SignalHandler(int nSignal)
{
    // Check signal type.
    if (nSignal == SIGINT || nSignal == SIGTERM)
    {
        // Submit logger message.
        LOG_INFO(logging::g_qSharedLogger, "Ctrl+C or SIGTERM received. Cleaning up...");

        // Update stop signal.
        bMainStop = true;
    }
    // The SIGQUIT signal can be sent to the terminal by pressing CNTL+\.
    else if (nSignal == SIGQUIT)
    {
        // Submit logger message.
        LOG_INFO(logging::g_qSharedLogger, "Quit signal key pressed. Cleaning up...");

        // Update stop signal.
        bMainStop = true;
    }
}

/******************************************************************************
 * @brief Reset terminal mode to original settings.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-04-04
 ******************************************************************************/
void ResetTerminalMode()
{
    tcsetattr(STDIN_FILENO, TCSANOW, &g_stOriginalTermSettings);
}

/******************************************************************************
 * @brief Puts the terminal in non canonical mode so single key presses can be
 *      read without waiting for a newline.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-04-04
 ******************************************************************************/
void SetNonCanonicalTerminalMode()
{
    struct termios stNewTermSettings;

    tcgetattr(STDIN_FILENO, &g_stOriginalTermSettings);
    std::memcpy(&stNewTermSettings, &g_stOriginalTermSettings, sizeof(struct termios));

    stNewTermSettings.c_lflag &= ~(ICANON | ECHO);
    tcsetattr(STDIN_FILENO, TCSANOW, &stNewTermSettings);

    atexit(ResetTerminalMode);
}

/******************************************************************************
 * @brief Check if a key has been pressed in the terminal.
 *
 * @return int - Number of bytes waiting in the terminal buffer.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-04-04
 ******************************************************************************/
int CheckKeyPress()
{
    int nBytesWaiting = 0;
    if (ioctl(STDIN_FILENO, FIONREAD, &nBytesWaiting) != 0)
    {
        return 0;
    }
    return nBytesWaiting;
}

/******************************************************************************
 * @brief Mouse callback of the preview window. Left drag draws a new AOI,
 *      right click removes the AOI under the cursor and a left double click
 *      renames it.
 *
 * @param nEvent - OpenCV mouse event.
 * @param nX - Cursor column in reference pixels.
 * @param nY - Cursor row in reference pixels.
 * @param nFlags - Unused.
 * @param pUserData - Pointer to the AOIDraftState.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 ******************************************************************************/
void PreviewMouseCallback(int nEvent, int nX, int nY, int nFlags, void* pUserData)
{
    (void) nFlags;
    AOIDraftState* pDraft = static_cast<AOIDraftState*>(pUserData);
    cv::Point2f cvPoint(static_cast<float>(nX), static_cast<float>(nY));

    switch (nEvent)
    {
        case cv::EVENT_LBUTTONDOWN:
            pDraft->bDragging = true;
            pDraft->cvStart   = cvPoint;
            pDraft->cvCurrent = cvPoint;
            break;
        case cv::EVENT_MOUSEMOVE:
            if (pDraft->bDragging)
            {
                pDraft->cvCurrent = cvPoint;
            }
            break;
        case cv::EVENT_LBUTTONUP:
            if (pDraft->bDragging)
            {
                pDraft->bDragging  = false;
                pDraft->cvCurrent  = cvPoint;
                pDraft->cvFinished = cv::Rect2f(pDraft->cvStart, pDraft->cvCurrent);
            }
            break;
        case cv::EVENT_LBUTTONDBLCLK:
            pDraft->bDragging  = false;
            pDraft->cvRenameAt = cvPoint;
            break;
        case cv::EVENT_RBUTTONDOWN: pDraft->cvRemoveAt = cvPoint; break;
        default: break;
    }
}

/******************************************************************************
 * @brief  main function.
 *
 * @param argc - Number of command line arguments.
 * @param argv - Command line arguments.
 * @return int - Exit status number.
 *
 * @author ClayJay3 (claytonraycowen@gmail.com)
 * @date 2025-06-20
 ******************************************************************************/
int main(int argc, char** argv)
{
    /////////////////////////////////////////
    // Parse command line.
    /////////////////////////////////////////
    std::string szConfigPath;
    std::string szEndpointOverride;
    std::string szAOIFileOverride;
    std::string szLogDirectory = constants::LOGGING_OUTPUT_PATH_ABSOLUTE;
    std::string szLogLevel;
    std::string szActivePolicyOverride;
    bool bHeadless = false;

    CLI::App cliApp{"Real time gaze to reference image mapper"};
    cliApp.add_option("--config", szConfigPath, "Path to the session config JSON file")->required();
    cliApp.add_option("--endpoint", szEndpointOverride, "ZeroMQ address to subscribe to, overrides the config");
    cliApp.add_option("--aoi", szAOIFileOverride, "AOI file to load and save, overrides the config");
    cliApp.add_option("--active-aoi", szActivePolicyOverride, "How the recorded AOI is picked when AOIs overlap, overrides the config")
        ->check(CLI::IsMember({"last_defined", "first_defined", "smallest_area"}));
    cliApp.add_flag("--headless", bHeadless, "Run without the preview window");
    cliApp.add_option("--log-dir", szLogDirectory, "Directory the log files are written to");
    cliApp.add_option("--log-level", szLogLevel, "Console log level (e.g. Debug, Info, Warning)");
    CLI11_PARSE(cliApp, argc, argv);

    // Initialize Loggers
    logging::InitializeLoggers(szLogDirectory);
    if (!szLogLevel.empty() && !logging::SetConsoleLogLevel(szLogLevel))
    {
        // Submit logger message.
        LOG_WARNING(logging::g_qSharedLogger, "Unknown log level '{}'. Keeping the default console level.", szLogLevel);
    }

    /////////////////////////////////////////
    // Setup global objects.
    /////////////////////////////////////////
    // Setup signal interrupt handler.
    struct sigaction stSigBreak;
    stSigBreak.sa_handler = SignalHandler;
    stSigBreak.sa_flags   = 0;
    sigemptyset(&stSigBreak.sa_mask);
    sigaction(SIGINT, &stSigBreak, nullptr);
    sigaction(SIGTERM, &stSigBreak, nullptr);
    sigaction(SIGQUIT, &stSigBreak, nullptr);

    /////////////////////////////////////////
    // Load the session. Any failure here blocks activation.
    /////////////////////////////////////////
    std::string szError;
    std::optional<SessionConfig> stSession = SessionConfig::Load(szConfigPath, szError);
    if (!stSession.has_value())
    {
        return 1;
    }
    if (!szEndpointOverride.empty())
    {
        stSession->szEndpoint = szEndpointOverride;
    }
    if (!szAOIFileOverride.empty())
    {
        stSession->szAOIFile = std::filesystem::path(szAOIFileOverride);
    }
    if (!szActivePolicyOverride.empty())
    {
        // Already validated by the option check.
        stSession->eActivePolicy = ActiveAOIPolicyFromString(szActivePolicyOverride).value_or(stSession->eActivePolicy);
    }

    cv::Mat cvReferenceImage = cv::imread(stSession->szReferenceImagePath.string(), cv::IMREAD_COLOR);
    if (cvReferenceImage.empty())
    {
        // Submit logger message.
        LOG_ERROR(logging::g_qSharedLogger, "Unable to read the reference image {}.", stSession->szReferenceImagePath.string());
        return 1;
    }

    std::shared_ptr<const EngineConfig> pEngineConfig = EngineConfig::Create(stSession->cvCameraMatrix, stSession->cvDistortion, cvReferenceImage, szError);
    if (!pEngineConfig)
    {
        // Submit logger message.
        LOG_ERROR(logging::g_qSharedLogger, "Unable to activate the session: {}", szError);
        return 1;
    }

    /////////////////////////////////////////
    // Declare local variables used in main loop.
    /////////////////////////////////////////
    FrameChannel<IncomingFrame> stChannel;
    FrameProcessor stProcessor(pEngineConfig, stChannel, stSession->stRenderOptions);
    stProcessor.SetHistoryLength(stSession->siHistoryLength);
    stProcessor.GetAOITracker().SetActivePolicy(stSession->eActivePolicy);

    // Submit logger message.
    LOG_INFO(logging::g_qSharedLogger, "Active AOI policy: {}.", ActiveAOIPolicyToString(stSession->eActivePolicy));

    // Load the AOIs, a missing file just means no AOIs yet.
    std::filesystem::path szAOIPath = stSession->szAOIFile.value_or(std::filesystem::path(DEFAULT_AOI_FILENAME));
    if (stSession->szAOIFile.has_value() && std::filesystem::exists(szAOIPath))
    {
        std::optional<std::vector<AOI>> vAOIs = aoistorage::LoadAOIs(szAOIPath, szError);
        if (!vAOIs.has_value())
        {
            // Submit logger message.
            LOG_ERROR(logging::g_qSharedLogger, "Unable to load AOI file {}: {}", szAOIPath.string(), szError);
            return 1;
        }
        stProcessor.GetAOITracker().SetAOIs(*vAOIs);
    }

    // Start receiving frames.
    std::unique_ptr<FrameReceiver> pReceiver = std::make_unique<FrameReceiver>(stSession->szEndpoint, stChannel);
    if (!pReceiver->GetIsConnected())
    {
        // Submit logger message.
        LOG_ERROR(logging::g_qSharedLogger, "Unable to connect to {}.", stSession->szEndpoint);
        return 1;
    }
    pReceiver->Start();

    // Preview window.
    AOIDraftState stDraft;
    AOIRenameState stRename;
    // Set when the last composite no longer shows the current AOIs or render options.
    bool bPreviewStale = false;
    if (!bHeadless)
    {
        cv::namedWindow(WINDOW_NAME, cv::WINDOW_AUTOSIZE);
        cv::setMouseCallback(WINDOW_NAME, PreviewMouseCallback, &stDraft);
    }
    // Set the terminal to non-canonical mode so keys also work from the terminal.
    SetNonCanonicalTerminalMode();

    IPS IterPerSecond = IPS();
    timeops::CadenceClock stClock(std::chrono::milliseconds(constants::PROCESSOR_TICK_PERIOD_MS));
    std::optional<FrameResult> stLastResult;

    /*
        This while loop is the main periodic loop of the gaze mapper.
        Loop until user sends sigkill or sigterm.
    */
    while (!bMainStop)
    {
        // Process the newest frame, if any.
        std::optional<FrameResult> stResult = stProcessor.Tick();
        if (stResult.has_value())
        {
            if (!stResult->bRegistered)
            {
                // Submit logger message.
                LOG_TRACE_L1(logging::g_qSharedLogger, "Frame {} not mapped: {}", stResult->nFrameNumber, TickStatusToString(stResult->eStatus));
            }
            if (stResult->bRegistered)
            {
                bPreviewStale = false;
            }
            stLastResult = std::move(stResult);
        }

        // Apply finished mouse edits.
        if (stDraft.cvFinished.has_value())
        {
            cv::Rect2f cvRect = *stDraft.cvFinished;
            stDraft.cvFinished.reset();
            if (cvRect.width >= 1.0f && cvRect.height >= 1.0f)
            {
                size_t siIndex = stProcessor.GetAOITracker().AddAOI(cvRect, "AOI " + std::to_string(stProcessor.GetAOITracker().GetAOICount() + 1));

                // Submit logger message.
                LOG_INFO(logging::g_qSharedLogger, "Added AOI {} at ({}, {}, {}, {}).", siIndex, cvRect.x, cvRect.y, cvRect.width, cvRect.height);
                bPreviewStale = true;
            }
        }
        if (stDraft.cvRemoveAt.has_value())
        {
            std::optional<size_t> siHit = stProcessor.GetAOITracker().FindTopmostAOI(*stDraft.cvRemoveAt);
            stDraft.cvRemoveAt.reset();
            if (siHit.has_value())
            {
                // Submit logger message.
                LOG_INFO(logging::g_qSharedLogger, "Removed AOI '{}'.", stProcessor.GetAOITracker().GetAOIs()[*siHit].szName);

                stProcessor.GetAOITracker().RemoveAOI(*siHit);
                // Indices shift after a removal.
                stRename.siIndex.reset();
                bPreviewStale = true;
            }
        }
        if (stDraft.cvRenameAt.has_value())
        {
            std::optional<size_t> siHit = stProcessor.GetAOITracker().FindTopmostAOI(*stDraft.cvRenameAt);
            stDraft.cvRenameAt.reset();
            if (siHit.has_value())
            {
                stRename.siIndex = siHit;
                stRename.szBuffer.clear();

                // Submit logger message.
                LOG_NOTICE(logging::g_qSharedLogger,
                           "Renaming AOI '{}'. Type the new name and press Enter, Esc cancels.",
                           stProcessor.GetAOITracker().GetAOIs()[*siHit].szName);
            }
        }

        // Show the composite and read window keys.
        char chInput = 0;
        if (!bHeadless)
        {
            std::optional<cv::Rect2f> cvDraftRect;
            if (stDraft.bDragging)
            {
                cvDraftRect = cv::Rect2f(stDraft.cvStart, stDraft.cvCurrent);
            }
            bool bRecompose = cvDraftRect.has_value() || bPreviewStale || stProcessor.GetLastComposite().empty();
            cv::Mat cvFrame = bRecompose ? stProcessor.RenderPreview(cvDraftRect) : stProcessor.GetLastComposite();
            cv::imshow(WINDOW_NAME, cvFrame);

            int nKey = cv::waitKey(1);
            if (nKey >= 0)
            {
                chInput = static_cast<char>(nKey & 0xFF);
            }
        }
        if (chInput == 0 && CheckKeyPress() > 0)
        {
            ssize_t nBytesRead = read(STDIN_FILENO, &chInput, 1);
            if (nBytesRead <= 0)
            {
                LOG_WARNING(logging::g_qSharedLogger, "Failed to read from terminal input.");
                chInput = 0;
            }
        }

        // Create a string to append FPS values to.
        std::string szMainInfo = "";
        szMainInfo += "--------[ Threads FPS ]--------\n";
        szMainInfo += "Main Process FPS: " + std::to_string(IterPerSecond.GetExactIPS()) + " (avg " + std::to_string(IterPerSecond.GetAverageIPS()) + ")\n";
        szMainInfo += "Frames Received: " + std::to_string(pReceiver->GetReceivedCount()) + ", Malformed: " + std::to_string(pReceiver->GetMalformedCount()) +
                      ", Dropped: " + std::to_string(stChannel.GetDroppedCount()) + "\n";
        if (stLastResult.has_value())
        {
            szMainInfo += "Processing FPS: " + std::to_string(stLastResult->dFPS) + ", Last Status: " + TickStatusToString(stLastResult->eStatus) + "\n";
        }

        // While a rename is active every key goes into the new name.
        if (stRename.siIndex.has_value() && chInput != 0)
        {
            if (chInput == '\n' || chInput == '\r')
            {
                if (!stRename.szBuffer.empty() && stProcessor.GetAOITracker().RenameAOI(*stRename.siIndex, stRename.szBuffer))
                {
                    // Submit logger message.
                    LOG_INFO(logging::g_qSharedLogger, "AOI {} renamed to '{}'.", *stRename.siIndex, stRename.szBuffer);
                    bPreviewStale = true;
                }
                stRename.siIndex.reset();
            }
            else if (chInput == 27)
            {
                // Submit logger message.
                LOG_INFO(logging::g_qSharedLogger, "Rename cancelled.");
                stRename.siIndex.reset();
            }
            else if ((chInput == 8 || chInput == 127) && !stRename.szBuffer.empty())
            {
                stRename.szBuffer.pop_back();
            }
            else if (chInput >= 32 && chInput <= 126)
            {
                stRename.szBuffer += chInput;
            }
            chInput = 0;
        }

        switch (chInput)
        {
            case 'h':
            case 'H':
                // Print help message to console.
                LOG_NOTICE(logging::g_qSharedLogger,
                           "\n--------[ Gaze Mapper Help ]--------\n"
                           "Press 'h' to print this help message.\n"
                           "Press 'f' to print FPS stats.\n"
                           "Press 'm' to toggle the heatmap.\n"
                           "Press 'o' to toggle the scene overlay.\n"
                           "Press 'p' to toggle the FPS counter on the composite.\n"
                           "Press 'r' to reset AOI hit counts and dwell times.\n"
                           "Press 's' to start or stop recording.\n"
                           "Press 'a' to save the AOIs.\n"
                           "Drag with the left mouse button to add an AOI, right click to remove one,\n"
                           "double click one to rename it.\n"
                           "Press 'q' to quit the program.\n"
                           "-------------------------------------------\n");
                break;
            case 'f':
            case 'F': LOG_NOTICE(logging::g_qSharedLogger, "{}", szMainInfo); break;
            case 'm':
            case 'M':
            {
                RenderOptions stOptions = stProcessor.GetRenderOptions();
                stOptions.bShowHeatmap  = !stOptions.bShowHeatmap;
                stProcessor.SetRenderOptions(stOptions);
                bPreviewStale = true;
                LOG_INFO(logging::g_qSharedLogger, "Heatmap {}.", stOptions.bShowHeatmap ? "enabled" : "disabled");
                break;
            }
            case 'o':
            case 'O':
            {
                RenderOptions stOptions = stProcessor.GetRenderOptions();
                stOptions.bOverlayScene = !stOptions.bOverlayScene;
                stProcessor.SetRenderOptions(stOptions);
                bPreviewStale = true;
                LOG_INFO(logging::g_qSharedLogger, "Scene overlay {}.", stOptions.bOverlayScene ? "enabled" : "disabled");
                break;
            }
            case 'p':
            case 'P':
            {
                RenderOptions stOptions = stProcessor.GetRenderOptions();
                stOptions.bShowFPS      = !stOptions.bShowFPS;
                stProcessor.SetRenderOptions(stOptions);
                bPreviewStale = true;
                break;
            }
            case 'r':
            case 'R':
                stProcessor.ResetCounts();
                LOG_INFO(logging::g_qSharedLogger, "AOI hit counts and dwell times reset.");
                bPreviewStale = true;
                break;
            case 's':
            case 'S':
                if (stProcessor.IsRecording())
                {
                    stProcessor.StopRecording();
                }
                else if (!stProcessor.StartRecording(stSession->szRecordingDirectory))
                {
                    LOG_ERROR(logging::g_qSharedLogger, "Unable to start recording in {}.", stSession->szRecordingDirectory.string());
                }
                break;
            case 'a':
            case 'A':
                if (aoistorage::SaveAOIs(szAOIPath, stProcessor.GetAOITracker().GetAOIs()))
                {
                    LOG_INFO(logging::g_qSharedLogger, "Saved {} AOIs to {}.", stProcessor.GetAOITracker().GetAOICount(), szAOIPath.string());
                }
                break;
            case 'q':
            case 'Q':
                LOG_INFO(logging::g_qSharedLogger, "'Q' key pressed. Initiating shutdown...");
                bMainStop = true;
                break;
            default: break;
        }

        // Update IPS tick.
        IterPerSecond.Tick();

        // Wait for the next tick. An overrun delays the next tick, it never skips it.
        if (!stClock.WaitForNextTick())
        {
            LOG_TRACE_L1(logging::g_qSharedLogger, "Main loop overran its {} ms period.", constants::PROCESSOR_TICK_PERIOD_MS);
        }
    }

    /////////////////////////////////////////
    // Cleanup.
    /////////////////////////////////////////

    stProcessor.StopRecording();
    pReceiver->RequestStop();
    pReceiver->Join();
    pReceiver.reset();
    if (!bHeadless)
    {
        cv::destroyAllWindows();
    }

    // Submit logger message that program is done cleaning up and is now exiting.
    LOG_INFO(logging::g_qSharedLogger, "Clean up finished. Exiting...");

    // Successful exit.
    return 0;
}
