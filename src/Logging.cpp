/******************************************************************************
 * @brief Sets up functions and classes used by logging project wide.
 *
 * @file Logging.cpp
 * @author ClayJay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "Logging.h"

/// \cond
#include <quill/core/QuillError.h>

#include <algorithm>
#include <filesystem>
#include <iostream>

/// \endcond

/******************************************************************************
 * @brief Namespace containing all global type/structs that will be used project wide
 *      for logging.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-28
 ******************************************************************************/
namespace logging
{
    /////////////////////////////////////////
    // Forward declarations for namespace variables and objects.
    /////////////////////////////////////////
    quill::Logger* g_qFileLogger;
    quill::Logger* g_qConsoleLogger;
    quill::Logger* g_qSharedLogger;

    quill::LogLevel g_eConsoleLogLevel;
    quill::LogLevel g_eFileLogLevel;

    std::string g_szProgramStartTimeString;
    std::string g_szLoggingOutputPath;

    /******************************************************************************
     * @brief Logger Initializer - Sets up the console and file sinks and the three
     *        loggers that share them. Each program run gets its own folder under
     *        the given output path.
     *
     * @param szLoggingOutputPath - A string containing the filepath to output log files to.
     *                      Must be properly formatted.
     * @param szProgramTimeLogsDir - The name of the folder for this run.
     *
     * @author ClayJay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    void InitializeLoggers(std::string szLoggingOutputPath, std::string szProgramTimeLogsDir)
    {
        // Store start time string in member variable.
        g_szProgramStartTimeString = szProgramTimeLogsDir;

        // Assemble filepath string.
        std::filesystem::path szFilePath;
        std::filesystem::path szFilename;
        szFilePath = szLoggingOutputPath;                  // Main location for all logs.
        szFilePath += g_szProgramStartTimeString + "/";    // Folder for each program run.
        szFilename = "console_output";                     // Base file name.

        // Store the logging output path.
        g_szLoggingOutputPath = szFilePath.string();

        // Check if directory exists.
        if (!std::filesystem::exists(szFilePath))
        {
            // Create directory.
            std::error_code errCode;
            if (!std::filesystem::create_directories(szFilePath, errCode))
            {
                // The loggers don't exist yet.
                std::cerr << "Unable to create the logging output directory: " << szFilePath.string() << " (" << errCode.message() << ")" << std::endl;
            }
        }

        // Construct the full output path.
        std::filesystem::path szFullOutputPath = szFilePath / szFilename;

        // Set Console Color Profile
        quill::ConsoleSinkConfig::Colours qColors;
        qColors.apply_default_colours();
        qColors.assign_colour_to_log_level(quill::LogLevel::TraceL3, constants::szTraceL3Color);
        qColors.assign_colour_to_log_level(quill::LogLevel::TraceL2, constants::szTraceL2Color);
        qColors.assign_colour_to_log_level(quill::LogLevel::TraceL1, constants::szTraceL1Color);
        qColors.assign_colour_to_log_level(quill::LogLevel::Debug, constants::szDebugColor);
        qColors.assign_colour_to_log_level(quill::LogLevel::Info, constants::szInfoColor);
        qColors.assign_colour_to_log_level(quill::LogLevel::Notice, constants::szNoticeColor);
        qColors.assign_colour_to_log_level(quill::LogLevel::Warning, constants::szWarningColor);
        qColors.assign_colour_to_log_level(quill::LogLevel::Error, constants::szErrorColor);
        qColors.assign_colour_to_log_level(quill::LogLevel::Critical, constants::szCriticalColor);
        qColors.assign_colour_to_log_level(quill::LogLevel::Backtrace, constants::szBacktraceColor);

        // Create Patterns
        std::string szLogFilePattern   = "%(time) %(log_level) [%(thread_id)] [%(file_name):%(line_number)] %(message)";
        std::string szCSVFilePattern   = "%(time),\t%(log_level),\t[%(thread_id)],\t[%(file_name):%(line_number)],\t\"%(message)\"";
        std::string szConsolePattern   = "%(time) %(log_level:9) [%(thread_id)] [%(file_name):%(line_number)] %(message)";
        std::string szTimestampPattern = "%Y-%m-%d %H:%M:%S.%Qms";

        // Create Sinks
        std::shared_ptr<quill::Sink> qLogFileSink = quill::Frontend::create_or_get_sink<GazeRotatingFileSink>(
            szFullOutputPath.replace_extension(".log"),    // Log Output Path
            []()
            {
                quill::RotatingFileSinkConfig cfg;
                cfg.set_open_mode('a');
                return cfg;
            }(),
            szLogFilePattern,
            szTimestampPattern,
            quill::Timezone::LocalTime);

        std::shared_ptr<quill::Sink> qCSVFileSink = quill::Frontend::create_or_get_sink<GazeRotatingFileSink>(
            szFullOutputPath.replace_extension(".csv"),    // Log Output Path
            []()
            {
                quill::RotatingFileSinkConfig cfg;
                cfg.set_open_mode('a');
                return cfg;
            }(),
            szCSVFilePattern,
            szTimestampPattern,
            quill::Timezone::LocalTime);

        std::shared_ptr<quill::Sink> qConsoleSink = quill::Frontend::create_or_get_sink<GazeConsoleSink>("ConsoleSink",
                                                                                                       qColors,
                                                                                                       quill::ConsoleSinkConfig::ColourMode::Automatic,
                                                                                                       szConsolePattern,
                                                                                                       szTimestampPattern);

        // Start Quill
        quill::BackendOptions qBackendConfig;
        quill::Backend::start(qBackendConfig);

        // Create Loggers
        g_qFileLogger    = quill::Frontend::create_or_get_logger("FILE_LOGGER", {qLogFileSink, qCSVFileSink});
        g_qConsoleLogger = quill::Frontend::create_or_get_logger("CONSOLE_LOGGER", {qConsoleSink});
        g_qSharedLogger  = quill::Frontend::create_or_get_logger("SHARED_LOGGER", {qLogFileSink, qCSVFileSink, qConsoleSink});

        // Set Internal Logging Level Limiters
        g_eFileLogLevel    = constants::FILE_DEFAULT_LEVEL;
        g_eConsoleLogLevel = constants::CONSOLE_DEFAULT_LEVEL;

        // Set Base Logging Levels. The sinks do the real filtering.
        g_qFileLogger->set_log_level(constants::FILE_MIN_LEVEL);
        g_qConsoleLogger->set_log_level(constants::CONSOLE_MIN_LEVEL);
        g_qSharedLogger->set_log_level(std::min(constants::FILE_MIN_LEVEL, constants::CONSOLE_MIN_LEVEL));

        // Enable Backtrace
        g_qFileLogger->init_backtrace(10, quill::LogLevel::Critical);
        g_qConsoleLogger->init_backtrace(10, quill::LogLevel::Critical);
        g_qSharedLogger->init_backtrace(10, quill::LogLevel::Critical);
    }

    /******************************************************************************
     * @brief Mutator for the console log level. Accepts the quill level names
     *      (tracel3, tracel2, tracel1, debug, info, notice, warning, error,
     *      critical, backtrace, none).
     *
     * @param szLogLevel - The name of the new console level.
     * @return true - The level was recognized and applied.
     * @return false - Unknown level name, the console level is unchanged.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-30
     ******************************************************************************/
    bool SetConsoleLogLevel(const std::string& szLogLevel)
    {
        try
        {
            quill::LogLevel eLevel = quill::loglevel_from_string(szLogLevel);
            // Never go below what the logger itself lets through.
            g_eConsoleLogLevel = std::max(eLevel, constants::CONSOLE_MIN_LEVEL);
            return true;
        }
        catch (const quill::QuillError& qError)
        {
            LOG_WARNING(g_qSharedLogger, "Unknown console log level '{}': {}", szLogLevel, qError.what());
            return false;
        }
    }

    /******************************************************************************
     * @brief Formats a message for the console sink and forwards it to
     *      quill::ConsoleSink if it passes the console level.
     *
     * @note Called by the quill backend thread, never by this codebase.
     *
     * @author ClayJay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    void GazeConsoleSink::write_log(quill::MacroMetadata const* qLogMetadata,
                                    uint64_t unLogTimestamp,
                                    std::string_view szThreadID,
                                    std::string_view szThreadName,
                                    const std::string& szProcessID,
                                    std::string_view szLoggerName,
                                    quill::LogLevel qLogLevel,
                                    std::string_view szLogLevelDescription,
                                    std::string_view szLogLevelShortCode,
                                    const std::vector<std::pair<std::string, std::string>>* vNamedArgs,
                                    std::string_view szLogMessage,
                                    std::string_view)
    {
        // Check if logging level is permitted
        if (static_cast<int>(g_eConsoleLogLevel) > static_cast<int>(qLogLevel))
        {
            return;
        }

        // Format the log message
        std::string_view szFormattedLogMessage = qFormatter.format(unLogTimestamp,
                                                                   szThreadID,
                                                                   szThreadName,
                                                                   szProcessID,
                                                                   szLoggerName,
                                                                   szLogLevelDescription,
                                                                   szLogLevelShortCode,
                                                                   *qLogMetadata,
                                                                   vNamedArgs,
                                                                   szLogMessage);

        quill::ConsoleSink::write_log(qLogMetadata,
                                      unLogTimestamp,
                                      szThreadID,
                                      szThreadName,
                                      szProcessID,
                                      szLoggerName,
                                      qLogLevel,
                                      szLogLevelDescription,
                                      szLogLevelShortCode,
                                      vNamedArgs,
                                      szLogMessage,
                                      szFormattedLogMessage);
    }

    /******************************************************************************
     * @brief Formats a message for a rotating file sink and forwards it to
     *      quill::RotatingFileSink if it passes the file level.
     *
     * @note Called by the quill backend thread, never by this codebase.
     *
     * @author ClayJay3 (claytonraycowen@gmail.com)
     * @date 2025-12-28
     ******************************************************************************/
    void GazeRotatingFileSink::write_log(const quill::MacroMetadata* qLogMetadata,
                                         uint64_t unLogTimestamp,
                                         std::string_view szThreadID,
                                         std::string_view szThreadName,
                                         const std::string& szProcessID,
                                         std::string_view szLoggerName,
                                         quill::LogLevel qLogLevel,
                                         std::string_view szLogLevelDescription,
                                         std::string_view szLogLevelShortCode,
                                         const std::vector<std::pair<std::string, std::string>>* vNamedArgs,
                                         std::string_view szLogMessage,
                                         std::string_view)
    {
        // Check if logging level is permitted
        if (static_cast<int>(g_eFileLogLevel) > static_cast<int>(qLogLevel))
        {
            return;
        }

        // Format the log message
        std::string_view szFormattedLogMessage = qFormatter.format(unLogTimestamp,
                                                                   szThreadID,
                                                                   szThreadName,
                                                                   szProcessID,
                                                                   szLoggerName,
                                                                   szLogLevelDescription,
                                                                   szLogLevelShortCode,
                                                                   *qLogMetadata,
                                                                   vNamedArgs,
                                                                   szLogMessage);

        quill::RotatingFileSink::write_log(qLogMetadata,
                                           unLogTimestamp,
                                           szThreadID,
                                           szThreadName,
                                           szProcessID,
                                           szLoggerName,
                                           qLogLevel,
                                           szLogLevelDescription,
                                           szLogLevelShortCode,
                                           vNamedArgs,
                                           szLogMessage,
                                           szFormattedLogMessage);
    }
}    // namespace logging
