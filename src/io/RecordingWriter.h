/******************************************************************************
 * @brief Defines the RecordingWriter class and the RecordRow struct.
 *
 * @file RecordingWriter.h
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef RECORDINGWRITER_H
#define RECORDINGWRITER_H

/// \cond
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

/// \endcond

/******************************************************************************
 * @brief One line of a recording, written for every registered tick while a
 *      recording is running.
 ******************************************************************************/
struct RecordRow
{
    public:
        uint64_t unFrame     = 0;      // Counts registered ticks since recording started, starts at 1.
        int64_t nPicNum      = 0;      // The sender's frame number.
        double dGazeX        = 0.0;    // Gaze in reference pixels.
        double dGazeY        = 0.0;
        std::string szAOI;             // Active AOI name, empty if none.
        double dScoreRight   = 0.0;
        double dScoreLeft    = 0.0;
        std::string szSystemTime;      // The raw system time string, empty if none was sent.
};

/******************************************************************************
 * @brief Streams RecordRows to a CSV file. Each recording gets its own file,
 *      recorded_data.csv, recorded_data(1).csv, ... so nothing is overwritten.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 ******************************************************************************/
class RecordingWriter
{
    private:
        // Only Open() can name this, so only Open() can construct a writer.
        struct ConstructionKey
        {
                explicit ConstructionKey() = default;
        };

    public:
        /////////////////////////////////////////
        // Declare public methods and member variables.
        /////////////////////////////////////////

        static std::unique_ptr<RecordingWriter> Open(const std::filesystem::path& szDirectory);
        static std::filesystem::path MakeUniquePath(const std::filesystem::path& szDirectory, const std::string& szBaseName);
        static std::string EscapeField(const std::string& szField);

        RecordingWriter(ConstructionKey stKey, const std::filesystem::path& szPath, std::ofstream&& fsOutput);
        ~RecordingWriter();
        RecordingWriter(const RecordingWriter&)            = delete;
        RecordingWriter& operator=(const RecordingWriter&) = delete;

        bool WriteRow(const RecordRow& stRow);
        void Close();

        /////////////////////////////////////////
        // Getters.
        /////////////////////////////////////////

        const std::filesystem::path& GetPath() const { return m_szPath; }
        uint64_t GetRowCount() const { return m_unRowCount; }

    private:
        /////////////////////////////////////////
        // Declare private methods and member variables.
        /////////////////////////////////////////

        std::filesystem::path m_szPath;
        std::ofstream m_fsOutput;
        uint64_t m_unRowCount;
};

#endif    // RECORDINGWRITER_H
