/******************************************************************************
 * @brief Implements the RecordingWriter class.
 *
 * @file RecordingWriter.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "RecordingWriter.h"
#include "../Constants.h"
#include "../Logging.h"

/// \cond
#include <iomanip>
#include <limits>
#include <utility>

/// \endcond

/******************************************************************************
 * @brief Creates the directory if needed, picks an unused file name and writes
 *      the CSV header.
 *
 * @param szDirectory - Where the recording goes.
 * @return std::unique_ptr<RecordingWriter> - The writer, nullptr if the file
 *      could not be created.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 ******************************************************************************/
std::unique_ptr<RecordingWriter> RecordingWriter::Open(const std::filesystem::path& szDirectory)
{
    // Check if directory exists.
    std::error_code errCode;
    if (!std::filesystem::exists(szDirectory, errCode))
    {
        // Create directory.
        if (!std::filesystem::create_directories(szDirectory, errCode))
        {
            // Submit logger message.
            LOG_ERROR(logging::g_qSharedLogger, "Unable to create the recording output directory: {} ({})", szDirectory.string(), errCode.message());
            return nullptr;
        }
    }

    std::filesystem::path szPath = MakeUniquePath(szDirectory, constants::RECORDING_BASE_FILENAME);
    std::ofstream fsOutput(szPath, std::ios::out | std::ios::trunc);
    if (!fsOutput.is_open())
    {
        // Submit logger message.
        LOG_ERROR(logging::g_qSharedLogger, "Unable to open recording file {}", szPath.string());
        return nullptr;
    }

    fsOutput << "Frame,PicNum,GazeX,GazeY,AOI,ScoreRight,ScoreLeft,SystemTime\n";
    fsOutput << std::setprecision(std::numeric_limits<double>::max_digits10);
    fsOutput.flush();

    // Submit logger message.
    LOG_INFO(logging::g_qSharedLogger, "Recording to {}", szPath.string());

    return std::make_unique<RecordingWriter>(ConstructionKey(), szPath, std::move(fsOutput));
}

/******************************************************************************
 * @brief Picks base.csv, or base(1).csv, base(2).csv, ... if taken.
 *
 * @param szDirectory - The directory to look in.
 * @param szBaseName - File name without extension.
 * @return std::filesystem::path - The first path that doesn't exist yet.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 ******************************************************************************/
std::filesystem::path RecordingWriter::MakeUniquePath(const std::filesystem::path& szDirectory, const std::string& szBaseName)
{
    std::filesystem::path szCandidate = szDirectory / (szBaseName + ".csv");
    for (int nIndex = 1; std::filesystem::exists(szCandidate); ++nIndex)
    {
        szCandidate = szDirectory / (szBaseName + "(" + std::to_string(nIndex) + ").csv");
    }

    return szCandidate;
}

/******************************************************************************
 * @brief Quotes a CSV field if it contains a comma, quote or line break.
 *
 * @param szField - Raw field text.
 * @return std::string - The field as it should appear in the file.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 ******************************************************************************/
std::string RecordingWriter::EscapeField(const std::string& szField)
{
    if (szField.find_first_of(",\"\r\n") == std::string::npos)
    {
        return szField;
    }

    std::string szEscaped = "\"";
    for (char chCharacter : szField)
    {
        if (chCharacter == '"')
        {
            szEscaped += '"';
        }
        szEscaped += chCharacter;
    }
    szEscaped += '"';

    return szEscaped;
}

RecordingWriter::RecordingWriter(ConstructionKey /*stKey*/, const std::filesystem::path& szPath, std::ofstream&& fsOutput) :
    m_szPath(szPath), m_fsOutput(std::move(fsOutput)), m_unRowCount(0)
{}

RecordingWriter::~RecordingWriter()
{
    this->Close();
}

/******************************************************************************
 * @brief Appends a row and flushes it so a crash loses at most one row.
 *
 * @param stRow - The row.
 * @return true - Written.
 * @return false - The file is closed or the write failed.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 ******************************************************************************/
bool RecordingWriter::WriteRow(const RecordRow& stRow)
{
    if (!m_fsOutput.is_open())
    {
        return false;
    }

    m_fsOutput << stRow.unFrame << ',' << stRow.nPicNum << ',' << stRow.dGazeX << ',' << stRow.dGazeY << ',' << EscapeField(stRow.szAOI) << ','
               << stRow.dScoreRight << ',' << stRow.dScoreLeft << ',' << EscapeField(stRow.szSystemTime) << '\n';
    m_fsOutput.flush();

    if (!m_fsOutput.good())
    {
        // Submit logger message.
        LOG_ERROR(logging::g_qSharedLogger, "Failed to write recording row {} to {}", stRow.unFrame, m_szPath.string());
        return false;
    }

    ++m_unRowCount;
    return true;
}

/******************************************************************************
 * @brief Closes the file. Safe to call more than once.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 ******************************************************************************/
void RecordingWriter::Close()
{
    if (m_fsOutput.is_open())
    {
        m_fsOutput.close();

        // Submit logger message.
        LOG_INFO(logging::g_qSharedLogger, "Recording {} closed with {} rows.", m_szPath.string(), m_unRowCount);
    }
}
