/******************************************************************************
 * @brief Unit tests for reading and writing AOI files.
 *
 * @file AOIStorageTests.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-31
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "../../src/io/AOIStorage.h"
#include "TestUtilities.hpp"

/// \cond
#include <gtest/gtest.h>

/// \endcond

TEST(AOIStorageTest, ParsesTheFileFormat)
{
    std::string szError;
    std::optional<std::vector<AOI>> vAOIs =
        aoistorage::ParseAOIs(R"([{"name": "Logo", "rect": [10, 20, 30, 40]}, {"rect": [0.5, 1.5, 2, 3]}])", szError);

    ASSERT_TRUE(vAOIs.has_value()) << szError;
    ASSERT_EQ(vAOIs->size(), 2u);
    EXPECT_EQ((*vAOIs)[0].szName, "Logo");
    EXPECT_EQ((*vAOIs)[0].cvRect, cv::Rect2f(10.0f, 20.0f, 30.0f, 40.0f));
    EXPECT_EQ((*vAOIs)[0].unHitCount, 0u);
    EXPECT_TRUE((*vAOIs)[1].szName.empty());
    EXPECT_FLOAT_EQ((*vAOIs)[1].cvRect.x, 0.5f);
}

TEST(AOIStorageTest, RejectsMalformedFiles)
{
    std::string szError;
    EXPECT_FALSE(aoistorage::ParseAOIs("{}", szError).has_value());
    EXPECT_FALSE(aoistorage::ParseAOIs(R"([{"name": "A"}])", szError).has_value());
    EXPECT_FALSE(aoistorage::ParseAOIs(R"([{"rect": [1, 2, 3]}])", szError).has_value());
    EXPECT_FALSE(aoistorage::ParseAOIs(R"([{"rect": [1, 2, "3", 4]}])", szError).has_value());
    EXPECT_FALSE(aoistorage::ParseAOIs("[", szError).has_value());
}

TEST(AOIStorageTest, RectValuesBeyondFloatRangeAreRejected)
{
    std::string szError;
    EXPECT_FALSE(aoistorage::ParseAOIs(R"([{"name": "Far", "rect": [1e39, 0, 10, 10]}])", szError).has_value());
    EXPECT_NE(szError.find("out of range"), std::string::npos);

    // Large but representable values still load.
    std::optional<std::vector<AOI>> vAOIs = aoistorage::ParseAOIs(R"([{"name": "Wide", "rect": [-1e9, 0, 3e9, 10]}])", szError);
    ASSERT_TRUE(vAOIs.has_value()) << szError;
    EXPECT_FLOAT_EQ((*vAOIs)[0].cvRect.width, 3e9f);
}

TEST(AOIStorageTest, SavedFileLoadsBack)
{
    std::filesystem::path szPath = testutils::MakeScratchDirectory() / "layout.aoi";

    std::vector<AOI> vAOIs(2);
    vAOIs[0].szName     = "Header";
    vAOIs[0].cvRect     = cv::Rect2f(0.0f, 0.0f, 640.0f, 60.0f);
    vAOIs[0].unHitCount = 7;
    vAOIs[1].cvRect     = cv::Rect2f(100.0f, 200.0f, 50.0f, 25.0f);

    ASSERT_TRUE(aoistorage::SaveAOIs(szPath, vAOIs));

    std::string szError;
    std::optional<std::vector<AOI>> vLoaded = aoistorage::LoadAOIs(szPath, szError);
    ASSERT_TRUE(vLoaded.has_value()) << szError;
    ASSERT_EQ(vLoaded->size(), 2u);
    EXPECT_EQ((*vLoaded)[0].szName, "Header");
    EXPECT_EQ((*vLoaded)[0].cvRect, vAOIs[0].cvRect);
    // Statistics are not stored.
    EXPECT_EQ((*vLoaded)[0].unHitCount, 0u);
    EXPECT_EQ((*vLoaded)[1].cvRect, vAOIs[1].cvRect);
}

TEST(AOIStorageTest, MissingFileFailsToLoad)
{
    std::string szError;
    EXPECT_FALSE(aoistorage::LoadAOIs(testutils::MakeScratchDirectory() / "missing.aoi", szError).has_value());
    EXPECT_FALSE(szError.empty());
}
