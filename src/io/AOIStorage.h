/******************************************************************************
 * @brief Declares the functions that read and write AOI files.
 *
 *        File format: a JSON array of {"name": string, "rect": [left, top, width, height]}
 *        in reference image pixels.
 *
 * @file AOIStorage.h
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-30
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef AOISTORAGE_H
#define AOISTORAGE_H

#include "../tracking/AOITracker.h"

/// \cond
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/// \endcond

namespace aoistorage
{
    std::optional<std::vector<AOI>> ParseAOIs(const std::string& szText, std::string& szError);
    std::string SerializeAOIs(const std::vector<AOI>& vAOIs);
    std::optional<std::vector<AOI>> LoadAOIs(const std::filesystem::path& szPath, std::string& szError);
    bool SaveAOIs(const std::filesystem::path& szPath, const std::vector<AOI>& vAOIs);
}    // namespace aoistorage

#endif    // AOISTORAGE_H
