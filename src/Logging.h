/******************************************************************************
 * @brief Implements Logging for GazeMapper
 *
 *        Note: The loggers are defined in Logging.cpp. Keeping the declarations
 *              in a separate header lets the low level vision and tracking
 *              headers log without pulling in the rest of the program.
 *
 * @file Logging.h
 * @author Eli Byrd (edbgkk@mst.edu)
 * @date 2025-12-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef GAZEMAPPER_LOGGING_H
#define GAZEMAPPER_LOGGING_H

/// \cond
#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>

#include "quill/backend/PatternFormatter.h"
#include "quill/core/Attributes.h"
#include "quill/core/Common.h"
#include "quill/core/Filesystem.h"

#include "quill/sinks/ConsoleSink.h"
#include "quill/sinks/RotatingFileSink.h"

#include <string>

/// \endcond

#include "./Constants.h"
#include "./util/TimeOperations.hpp"

/******************************************************************************
 * @brief Logging Levels:
 *
 *        Priority > Level     > Description
 *        Level 1  > TRACE_L3  > Unused
 *        Level 2  > TRACE_L2  > Unused
 *        Level 3  > TRACE_L1  > Per tick registration details (match counts, statuses)
 *        Level 4  > DEBUG     > Remap recomputes, dropped messages, recording rows
 *        Level 5  > INFO      > Session start/stop, configuration, recording start/stop
 *        Level 6  > WARNING   > Malformed inbound messages, unreadable optional files
 *        Level 7  > ERROR     > Configuration errors that block activation
 *        Level 8  > CRITICAL  > Something went very wrong - application will exit after logging is sent.
 *
 *        Note: The console defaults to INFO. The log files default to DEBUG so a
 *              session can be reviewed afterwards without flooding the terminal.
 *
 *
 * @author Eli Byrd (edbgkk@mst.edu)
 * @date 2025-12-28
 ******************************************************************************/
namespace logging
{
    //////////////////////////////////////////
    // Declare namespace external variables and objects.
    /////////////////////////////////////////

    extern quill::Logger* g_qFileLogger;
    extern quill::Logger* g_qConsoleLogger;
    extern quill::Logger* g_qSharedLogger;

    extern quill::LogLevel g_eConsoleLogLevel;
    extern quill::LogLevel g_eFileLogLevel;

    extern std::string g_szProgramStartTimeString;
    extern std::string g_szLoggingOutputPath;

    /////////////////////////////////////////
    // Declare namespace methods.
    /////////////////////////////////////////

    void InitializeLoggers(std::string szLoggingOutputPath, std::string szProgramTimeLogsDir = timeops::GetTimestamp());
    bool SetConsoleLogLevel(const std::string& szLogLevel);

    /////////////////////////////////////////
    // Define namespace custom sinks
    /////////////////////////////////////////

    /******************************************************************************
     * @brief A console sink that formats every message with its own pattern
     *        formatter and drops anything below logging::g_eConsoleLogLevel. The
     *        console level can be changed at runtime (for example from the command
     *        line) without touching the file sinks.
     *
     * @see quill::ConsoleSink
     * @see quill::PatternFormatter
     *
     * @author Eli Byrd (edbgkk@mst.edu)
     * @date 2025-12-28
     ******************************************************************************/
    class GazeConsoleSink : public quill::ConsoleSink
    {
        public:
            /******************************************************************************
             * @brief Constructs a new GazeConsoleSink object.
             *
             * @param qColors - The console colors configuration for highlighting log levels.
             * @param qColorMode - Whether colors are always, never, or automatically used.
             * @param szFormatPattern - The pattern used to format the log message.
             * @param szTimeFormat - The format of the timestamp in the log message.
             * @param qTimestampTimezone - The timezone used for the timestamp (default: LocalTime).
             * @param szStream - The stream to output the logs to (default: "stdout").
             *
             * @author Eli Byrd (edbgkk@mst.edu)
             * @date 2025-12-28
             ******************************************************************************/
            GazeConsoleSink(const quill::ConsoleSinkConfig::Colours& qColors,
                            const quill::ConsoleSinkConfig::ColourMode& qColorMode,
                            const std::string& szFormatPattern,
                            const std::string& szTimeFormat,
                            quill::Timezone qTimestampTimezone = quill::Timezone::LocalTime,
                            const std::string& szStream        = "stdout") :
                quill::ConsoleSink(
                    [&]
                    {
                        // Configure ConsoleSinkConfig in a lambda to inline
                        quill::ConsoleSinkConfig qConsoleConfig;
                        qConsoleConfig.set_stream(szStream);
                        qConsoleConfig.set_colour_mode(qColorMode);
                        qConsoleConfig.set_colours(qColors);
                        qConsoleConfig.set_override_pattern_formatter_options(quill::PatternFormatterOptions(szFormatPattern, szTimeFormat, qTimestampTimezone));
                        return qConsoleConfig;
                    }()),
                qFormatter(quill::PatternFormatterOptions(szFormatPattern, szTimeFormat, qTimestampTimezone))
            {}

            void write_log(const quill::MacroMetadata* qLogMetadata,
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
                           std::string_view) override;

        private:
            quill::PatternFormatter qFormatter;
    };

    /******************************************************************************
     * @brief A rotating file sink that formats every message with its own pattern
     *        formatter and drops anything below logging::g_eFileLogLevel. Used for
     *        both the plain .log output and the .csv output of a run.
     *
     * @see quill::RotatingFileSink
     * @see quill::PatternFormatter
     *
     * @author Eli Byrd (edbgkk@mst.edu)
     * @date 2025-12-28
     ******************************************************************************/
    class GazeRotatingFileSink : public quill::RotatingFileSink
    {
        public:
            /******************************************************************************
             * @brief Constructs a new GazeRotatingFileSink object.
             *
             * @param qFilename - The path to the log file.
             * @param qConfig - The configuration for rotating the log file.
             * @param szFormatPattern - The pattern used to format the log message.
             * @param szTimeFormat - The format of the timestamp in the log message.
             * @param qTimestampTimezone - The timezone used for the timestamp (default: LocalTime).
             * @param qFileEventNotifier - Optional event notifier for file-related events (default: none).
             *
             * @author Eli Byrd (edbgkk@mst.edu)
             * @date 2025-12-28
             ******************************************************************************/
            GazeRotatingFileSink(const quill::fs::path& qFilename,
                                 const quill::RotatingFileSinkConfig& qConfig,
                                 const std::string& szFormatPattern,
                                 const std::string& szTimeFormat,
                                 quill::Timezone qTimestampTimezone          = quill::Timezone::LocalTime,
                                 quill::FileEventNotifier qFileEventNotifier = quill::FileEventNotifier{}) :
                quill::RotatingFileSink(qFilename, qConfig, qFileEventNotifier),
                qFormatter(quill::PatternFormatterOptions(szFormatPattern, szTimeFormat, qTimestampTimezone))
            {}

            void write_log(const quill::MacroMetadata* qLogMetadata,
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
                           std::string_view) override;

        private:
            quill::PatternFormatter qFormatter;
    };
}    // namespace logging
#endif    // GAZEMAPPER_LOGGING_H
