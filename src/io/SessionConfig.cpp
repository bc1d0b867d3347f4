/******************************************************************************
 * @brief Implements loading of the session config file.
 *
 * @file SessionConfig.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "SessionConfig.h"
#include "../Logging.h"

/// \cond
#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <sstream>

/// \endcond

namespace
{
    // Reads a finite number from jsObject[szKey] into dValue if the key exists.
    bool ReadOptionalNumber(const nlohmann::json& jsObject, const std::string& szKey, double dMin, double dMax, double& dValue, std::string& szError)
    {
        if (!jsObject.contains(szKey))
        {
            return true;
        }

        const nlohmann::json& jsValue = jsObject[szKey];
        if (!jsValue.is_number() || !std::isfinite(jsValue.get<double>()) || jsValue.get<double>() < dMin || jsValue.get<double>() > dMax)
        {
            szError = "'" + szKey + "' must be a number between " + std::to_string(dMin) + " and " + std::to_string(dMax);
            return false;
        }

        dValue = jsValue.get<double>();
        return true;
    }

    bool ReadOptionalBool(const nlohmann::json& jsObject, const std::string& szKey, bool& bValue, std::string& szError)
    {
        if (!jsObject.contains(szKey))
        {
            return true;
        }
        if (!jsObject[szKey].is_boolean())
        {
            szError = "'" + szKey + "' must be true or false";
            return false;
        }

        bValue = jsObject[szKey].get<bool>();
        return true;
    }

    // Reads a nRows x nCols matrix. A single row may also be given as a flat array.
    bool ReadMatrix(const nlohmann::json& jsValue, int nRows, int nCols, cv::Mat& cvMatrix, std::string& szError)
    {
        std::vector<double> vValues;
        if (!jsValue.is_array())
        {
            return false;
        }

        if (nRows == 1)
        {
            for (const nlohmann::json& jsElement : jsValue)
            {
                if (!jsElement.is_number())
                {
                    return false;
                }
                vValues.push_back(jsElement.get<double>());
            }
        }
        else
        {
            if (jsValue.size() != static_cast<size_t>(nRows))
            {
                return false;
            }
            for (const nlohmann::json& jsRow : jsValue)
            {
                if (!jsRow.is_array() || jsRow.size() != static_cast<size_t>(nCols))
                {
                    return false;
                }
                for (const nlohmann::json& jsElement : jsRow)
                {
                    if (!jsElement.is_number())
                    {
                        return false;
                    }
                    vValues.push_back(jsElement.get<double>());
                }
            }
        }

        if (vValues.size() != static_cast<size_t>(nRows * nCols))
        {
            return false;
        }

        cvMatrix = cv::Mat(vValues, true).reshape(1, nRows);
        if (!cv::checkRange(cvMatrix))
        {
            szError = "matrix contains NaN or infinite values";
            return false;
        }

        return true;
    }

    std::filesystem::path ResolvePath(const std::filesystem::path& szBaseDirectory, const std::string& szPath)
    {
        std::filesystem::path szResolved(szPath);
        if (szResolved.is_relative() && !szBaseDirectory.empty())
        {
            szResolved = szBaseDirectory / szResolved;
        }
        return szResolved;
    }
}    // namespace

/******************************************************************************
 * @brief Parses and validates the text of a session config file.
 *
 * @param szText - File contents.
 * @param szBaseDirectory - Relative paths are resolved against this directory.
 * @param szError - Set to the reason when validation fails.
 * @return std::optional<SessionConfig> - The config, nullopt if anything is
 *      missing or malformed.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 ******************************************************************************/
std::optional<SessionConfig> SessionConfig::Parse(const std::string& szText, const std::filesystem::path& szBaseDirectory, std::string& szError)
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

    if (!jsDocument.is_object())
    {
        szError = "session config must be a JSON object";
        return std::nullopt;
    }

    SessionConfig stConfig;

    // Calibration.
    if (!jsDocument.contains("camera_matrix") || !ReadMatrix(jsDocument["camera_matrix"], 3, 3, stConfig.cvCameraMatrix, szError))
    {
        if (szError.empty())
        {
            szError = "'camera_matrix' must be a 3x3 array of numbers";
        }
        return std::nullopt;
    }
    if (!jsDocument.contains("dist_coeffs") || !ReadMatrix(jsDocument["dist_coeffs"], 1, 5, stConfig.cvDistortion, szError))
    {
        if (szError.empty())
        {
            szError = "'dist_coeffs' must be an array of exactly 5 numbers";
        }
        return std::nullopt;
    }

    // Paths and endpoint.
    if (!jsDocument.contains("reference_image") || !jsDocument["reference_image"].is_string() || jsDocument["reference_image"].get<std::string>().empty())
    {
        szError = "'reference_image' must be a non-empty path";
        return std::nullopt;
    }
    stConfig.szReferenceImagePath = ResolvePath(szBaseDirectory, jsDocument["reference_image"].get<std::string>());

    if (jsDocument.contains("endpoint"))
    {
        if (!jsDocument["endpoint"].is_string() || jsDocument["endpoint"].get<std::string>().empty())
        {
            szError = "'endpoint' must be a non-empty string";
            return std::nullopt;
        }
        stConfig.szEndpoint = jsDocument["endpoint"].get<std::string>();
    }

    if (jsDocument.contains("aoi_file") && !jsDocument["aoi_file"].is_null())
    {
        if (!jsDocument["aoi_file"].is_string())
        {
            szError = "'aoi_file' must be a path";
            return std::nullopt;
        }
        stConfig.szAOIFile = ResolvePath(szBaseDirectory, jsDocument["aoi_file"].get<std::string>());
    }

    if (jsDocument.contains("recording_directory"))
    {
        if (!jsDocument["recording_directory"].is_string() || jsDocument["recording_directory"].get<std::string>().empty())
        {
            szError = "'recording_directory' must be a non-empty path";
            return std::nullopt;
        }
        stConfig.szRecordingDirectory = ResolvePath(szBaseDirectory, jsDocument["recording_directory"].get<std::string>());
    }

    if (jsDocument.contains("history_length"))
    {
        const nlohmann::json& jsHistory = jsDocument["history_length"];
        if (!jsHistory.is_number_integer() || jsHistory.get<int64_t>() < 1 || jsHistory.get<int64_t>() > static_cast<int64_t>(constants::HEATMAP_MAX_HISTORY))
        {
            szError = "'history_length' must be an integer between 1 and " + std::to_string(constants::HEATMAP_MAX_HISTORY);
            return std::nullopt;
        }
        stConfig.siHistoryLength = static_cast<size_t>(jsHistory.get<int64_t>());
    }

    if (jsDocument.contains("active_aoi_policy"))
    {
        const nlohmann::json& jsPolicy          = jsDocument["active_aoi_policy"];
        std::optional<ActiveAOIPolicy> ePolicy = jsPolicy.is_string() ? ActiveAOIPolicyFromString(jsPolicy.get<std::string>()) : std::nullopt;
        if (!ePolicy.has_value())
        {
            szError = "'active_aoi_policy' must be one of last_defined, first_defined, smallest_area";
            return std::nullopt;
        }
        stConfig.eActivePolicy = *ePolicy;
    }

    // Render options.
    if (jsDocument.contains("render"))
    {
        const nlohmann::json& jsRender = jsDocument["render"];
        if (!jsRender.is_object())
        {
            szError = "'render' must be an object";
            return std::nullopt;
        }

        RenderOptions& stRender = stConfig.stRenderOptions;
        double dPointSize       = stRender.nPointSize;
        if (!ReadOptionalNumber(jsRender, "point_size", 0.0, 500.0, dPointSize, szError) ||
            !ReadOptionalNumber(jsRender, "point_opacity", 0.0, 1.0, stRender.dPointOpacity, szError) ||
            !ReadOptionalNumber(jsRender, "scene_opacity", 0.0, 1.0, stRender.dSceneOpacity, szError) ||
            !ReadOptionalNumber(jsRender, "heatmap_opacity", 0.0, 1.0, stRender.dHeatmapOpacity, szError) ||
            !ReadOptionalBool(jsRender, "overlay_scene", stRender.bOverlayScene, szError) || !ReadOptionalBool(jsRender, "heatmap", stRender.bShowHeatmap, szError) ||
            !ReadOptionalBool(jsRender, "show_fps", stRender.bShowFPS, szError))
        {
            return std::nullopt;
        }
        stRender.nPointSize = static_cast<int>(dPointSize);

        if (jsRender.contains("point_color"))
        {
            const nlohmann::json& jsColor = jsRender["point_color"];
            if (!jsColor.is_array() || jsColor.size() != 3)
            {
                szError = "'point_color' must be [b, g, r]";
                return std::nullopt;
            }
            for (size_t siI = 0; siI < 3; ++siI)
            {
                if (!jsColor[siI].is_number() || jsColor[siI].get<double>() < 0.0 || jsColor[siI].get<double>() > 255.0)
                {
                    szError = "'point_color' channels must be between 0 and 255";
                    return std::nullopt;
                }
                stRender.cvPointColor[static_cast<int>(siI)] = jsColor[siI].get<double>();
            }
        }
    }

    return stConfig;
}

/******************************************************************************
 * @brief Reads and validates a session config file.
 *
 * @param szPath - Path of the file.
 * @param szError - Set to the reason when loading fails.
 * @return std::optional<SessionConfig> - The config, nullopt on failure.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 ******************************************************************************/
std::optional<SessionConfig> SessionConfig::Load(const std::filesystem::path& szPath, std::string& szError)
{
    std::ifstream fsInput(szPath);
    if (!fsInput.is_open())
    {
        szError = "unable to open " + szPath.string();

        // Submit logger message.
        LOG_ERROR(logging::g_qSharedLogger, "Session config: {}", szError);
        return std::nullopt;
    }

    std::stringstream ssBuffer;
    ssBuffer << fsInput.rdbuf();

    std::optional<SessionConfig> stConfig = Parse(ssBuffer.str(), szPath.parent_path(), szError);
    if (!stConfig.has_value())
    {
        // Submit logger message.
        LOG_ERROR(logging::g_qSharedLogger, "Session config {} is invalid: {}", szPath.string(), szError);
        return std::nullopt;
    }

    // Submit logger message.
    LOG_INFO(logging::g_qSharedLogger,
             "Session config {} loaded. Reference {}, endpoint {}.",
             szPath.string(),
             stConfig->szReferenceImagePath.string(),
             stConfig->szEndpoint);

    return stConfig;
}
