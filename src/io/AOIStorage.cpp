/******************************************************************************
 * @brief Implements reading and writing of AOI files.
 *
 * @file AOIStorage.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "AOIStorage.h"
#include "../Logging.h"

/// \cond
#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

/// \endcond

namespace aoistorage
{
    /******************************************************************************
     * @brief Parses the text of an AOI file. Statistics of the parsed AOIs start
     *      at zero.
     *
     * @param szText - File contents.
     * @param szError - Set to the reason when parsing fails.
     * @return std::optional<std::vector<AOI>> - The AOIs in file order, nullopt if
     *      anything in the file is malformed.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-30
     ******************************************************************************/
    std::optional<std::vector<AOI>> ParseAOIs(const std::string& szText, std::string& szError)
    {
        nlohmann::json jsDocument;
        try
        {
            jsDocument = nlohmann::json::parse(szText);
        }
        catch (const nlohmann::json::parse_error& jsError)
        {
            szError = std::string("invalid JSON: ") + jsError.what();
            return std::nullopt;
        }

        if (!jsDocument.is_array())
        {
            szError = "AOI file must contain a JSON array";
            return std::nullopt;
        }

        std::vector<AOI> vAOIs;
        for (size_t siI = 0; siI < jsDocument.size(); ++siI)
        {
            const nlohmann::json& jsEntry = jsDocument[siI];
            if (!jsEntry.is_object() || !jsEntry.contains("rect") || !jsEntry["rect"].is_array() || jsEntry["rect"].size() != 4)
            {
                szError = "entry " + std::to_string(siI) + " needs a 'rect' of 4 numbers";
                return std::nullopt;
            }

            double aValues[4];
            for (size_t siJ = 0; siJ < 4; ++siJ)
            {
                const nlohmann::json& jsValue = jsEntry["rect"][siJ];
                if (!jsValue.is_number() || !std::isfinite(jsValue.get<double>()))
                {
                    szError = "entry " + std::to_string(siI) + " has a non-numeric rect value";
                    return std::nullopt;
                }
                if (std::abs(jsValue.get<double>()) > std::numeric_limits<float>::max())
                {
                    szError = "entry " + std::to_string(siI) + " has a rect value out of range";
                    return std::nullopt;
                }
                aValues[siJ] = jsValue.get<double>();
            }

            AOI stAOI;
            stAOI.cvRect = cv::Rect2f(static_cast<float>(aValues[0]), static_cast<float>(aValues[1]), static_cast<float>(aValues[2]), static_cast<float>(aValues[3]));
            if (jsEntry.contains("name") && jsEntry["name"].is_string())
            {
                stAOI.szName = jsEntry["name"].get<std::string>();
            }
            vAOIs.push_back(stAOI);
        }

        return vAOIs;
    }

    /******************************************************************************
     * @brief Serializes AOIs to the file format. Only names and rectangles are
     *      stored.
     *
     * @param vAOIs - The AOIs.
     * @return std::string - Indented JSON text.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-30
     ******************************************************************************/
    std::string SerializeAOIs(const std::vector<AOI>& vAOIs)
    {
        nlohmann::json jsDocument = nlohmann::json::array();
        for (const AOI& stAOI : vAOIs)
        {
            nlohmann::json jsEntry;
            jsEntry["name"] = stAOI.szName;
            jsEntry["rect"] = {stAOI.cvRect.x, stAOI.cvRect.y, stAOI.cvRect.width, stAOI.cvRect.height};
            jsDocument.push_back(jsEntry);
        }

        return jsDocument.dump(4);
    }

    /******************************************************************************
     * @brief Reads and parses an AOI file.
     *
     * @param szPath - Path of the file.
     * @param szError - Set to the reason when loading fails.
     * @return std::optional<std::vector<AOI>> - The AOIs, nullopt on failure.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-30
     ******************************************************************************/
    std::optional<std::vector<AOI>> LoadAOIs(const std::filesystem::path& szPath, std::string& szError)
    {
        std::ifstream fsInput(szPath);
        if (!fsInput.is_open())
        {
            szError = "unable to open " + szPath.string();
            return std::nullopt;
        }

        std::stringstream ssBuffer;
        ssBuffer << fsInput.rdbuf();

        std::optional<std::vector<AOI>> vAOIs = ParseAOIs(ssBuffer.str(), szError);
        if (vAOIs.has_value())
        {
            // Submit logger message.
            LOG_INFO(logging::g_qSharedLogger, "Loaded {} AOIs from {}", vAOIs->size(), szPath.string());
        }

        return vAOIs;
    }

    /******************************************************************************
     * @brief Writes AOIs to a file, replacing it.
     *
     * @param szPath - Path of the file.
     * @param vAOIs - The AOIs.
     * @return true - Saved.
     * @return false - The file could not be written.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-30
     ******************************************************************************/
    bool SaveAOIs(const std::filesystem::path& szPath, const std::vector<AOI>& vAOIs)
    {
        std::ofstream fsOutput(szPath, std::ios::out | std::ios::trunc);
        if (!fsOutput.is_open())
        {
            // Submit logger message.
            LOG_ERROR(logging::g_qSharedLogger, "Unable to open {} to save AOIs.", szPath.string());
            return false;
        }

        fsOutput << SerializeAOIs(vAOIs) << '\n';
        fsOutput.close();
        if (fsOutput.fail())
        {
            // Submit logger message.
            LOG_ERROR(logging::g_qSharedLogger, "Failed while writing AOIs to {}.", szPath.string());
            return false;
        }

        // Submit logger message.
        LOG_INFO(logging::g_qSharedLogger, "Saved {} AOIs to {}", vAOIs.size(), szPath.string());
        return true;
    }
}    // namespace aoistorage
