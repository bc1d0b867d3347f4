/******************************************************************************
 * @brief Unit tests for session config validation.
 *
 * @file SessionConfigTests.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-31
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "../../src/io/SessionConfig.h"
#include "TestUtilities.hpp"

/// \cond
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <fstream>

/// \endcond

namespace
{
    nlohmann::json MakeSessionJSON()
    {
        nlohmann::json jsSession;
        jsSession["camera_matrix"]   = {{500.0, 0.0, 319.5}, {0.0, 500.0, 239.5}, {0.0, 0.0, 1.0}};
        jsSession["dist_coeffs"]     = {0.0, 0.0, 0.0, 0.0, 0.0};
        jsSession["reference_image"] = "reference.png";
        return jsSession;
    }
}    // namespace

TEST(SessionConfigTest, MinimalSessionUsesDefaults)
{
    std::string szError;
    std::optional<SessionConfig> stConfig = SessionConfig::Parse(MakeSessionJSON().dump(), "/data/session", szError);

    ASSERT_TRUE(stConfig.has_value()) << szError;
    EXPECT_EQ(stConfig->cvCameraMatrix.size(), cv::Size(3, 3));
    EXPECT_DOUBLE_EQ(stConfig->cvCameraMatrix.at<double>(0, 2), 319.5);
    EXPECT_EQ(stConfig->cvDistortion.size(), cv::Size(5, 1));
    EXPECT_EQ(stConfig->szReferenceImagePath, std::filesystem::path("/data/session/reference.png"));
    EXPECT_EQ(stConfig->szEndpoint, constants::RECEIVER_DEFAULT_ENDPOINT);
    EXPECT_FALSE(stConfig->szAOIFile.has_value());
    EXPECT_EQ(stConfig->siHistoryLength, constants::HEATMAP_DEFAULT_HISTORY);
    EXPECT_FALSE(stConfig->stRenderOptions.bShowHeatmap);
    EXPECT_EQ(stConfig->eActivePolicy, ActiveAOIPolicy::eLastDefined);
}

TEST(SessionConfigTest, OptionalFieldsAreRead)
{
    nlohmann::json jsSession         = MakeSessionJSON();
    jsSession["reference_image"]     = "/abs/reference.png";
    jsSession["endpoint"]            = "tcp://10.0.0.2:6000";
    jsSession["aoi_file"]            = "layout.aoi";
    jsSession["history_length"]      = 250;
    jsSession["recording_directory"] = "out";
    jsSession["active_aoi_policy"]   = "smallest_area";
    jsSession["render"]              = {{"point_size", 6}, {"point_color", {255, 0, 0}}, {"heatmap", true}, {"heatmap_opacity", 0.3}, {"show_fps", true}};

    std::string szError;
    std::optional<SessionConfig> stConfig = SessionConfig::Parse(jsSession.dump(), "/data/session", szError);

    ASSERT_TRUE(stConfig.has_value()) << szError;
    EXPECT_EQ(stConfig->szReferenceImagePath, std::filesystem::path("/abs/reference.png"));
    EXPECT_EQ(stConfig->szEndpoint, "tcp://10.0.0.2:6000");
    ASSERT_TRUE(stConfig->szAOIFile.has_value());
    EXPECT_EQ(*stConfig->szAOIFile, std::filesystem::path("/data/session/layout.aoi"));
    EXPECT_EQ(stConfig->siHistoryLength, 250u);
    EXPECT_EQ(stConfig->szRecordingDirectory, std::filesystem::path("/data/session/out"));
    EXPECT_EQ(stConfig->stRenderOptions.nPointSize, 6);
    EXPECT_EQ(stConfig->stRenderOptions.cvPointColor, cv::Scalar(255, 0, 0));
    EXPECT_TRUE(stConfig->stRenderOptions.bShowHeatmap);
    EXPECT_DOUBLE_EQ(stConfig->stRenderOptions.dHeatmapOpacity, 0.3);
    EXPECT_TRUE(stConfig->stRenderOptions.bShowFPS);
    EXPECT_FALSE(stConfig->stRenderOptions.bOverlayScene);
    EXPECT_EQ(stConfig->eActivePolicy, ActiveAOIPolicy::eSmallestArea);
}

TEST(SessionConfigTest, MalformedCalibrationIsRejected)
{
    std::string szError;

    nlohmann::json jsSession     = MakeSessionJSON();
    jsSession["camera_matrix"]   = {{500.0, 0.0}, {0.0, 500.0}};
    EXPECT_FALSE(SessionConfig::Parse(jsSession.dump(), "", szError).has_value());

    jsSession                    = MakeSessionJSON();
    jsSession["dist_coeffs"]     = {0.0, 0.0, 0.0, 0.0};
    EXPECT_FALSE(SessionConfig::Parse(jsSession.dump(), "", szError).has_value());

    jsSession = MakeSessionJSON();
    jsSession.erase("camera_matrix");
    EXPECT_FALSE(SessionConfig::Parse(jsSession.dump(), "", szError).has_value());
    EXPECT_FALSE(szError.empty());
}

TEST(SessionConfigTest, OutOfRangeValuesAreRejected)
{
    std::string szError;

    nlohmann::json jsSession      = MakeSessionJSON();
    jsSession["history_length"]   = 0;
    EXPECT_FALSE(SessionConfig::Parse(jsSession.dump(), "", szError).has_value());

    jsSession                     = MakeSessionJSON();
    jsSession["render"]           = {{"point_opacity", 1.5}};
    EXPECT_FALSE(SessionConfig::Parse(jsSession.dump(), "", szError).has_value());

    jsSession                     = MakeSessionJSON();
    jsSession["render"]           = {{"point_color", {0, 0}}};
    EXPECT_FALSE(SessionConfig::Parse(jsSession.dump(), "", szError).has_value());

    jsSession                     = MakeSessionJSON();
    jsSession["reference_image"]  = "";
    EXPECT_FALSE(SessionConfig::Parse(jsSession.dump(), "", szError).has_value());

    jsSession                     = MakeSessionJSON();
    jsSession["active_aoi_policy"] = "largest_area";
    EXPECT_FALSE(SessionConfig::Parse(jsSession.dump(), "", szError).has_value());
    EXPECT_NE(szError.find("active_aoi_policy"), std::string::npos);
}

TEST(SessionConfigTest, LoadResolvesPathsAgainstTheFile)
{
    std::filesystem::path szDirectory = testutils::MakeScratchDirectory();
    std::filesystem::path szPath      = szDirectory / "session.json";
    {
        std::ofstream fsOutput(szPath);
        fsOutput << MakeSessionJSON().dump(4);
    }

    std::string szError;
    std::optional<SessionConfig> stConfig = SessionConfig::Load(szPath, szError);

    ASSERT_TRUE(stConfig.has_value()) << szError;
    EXPECT_EQ(stConfig->szReferenceImagePath, szDirectory / "reference.png");
}

TEST(SessionConfigTest, MissingFileFailsToLoad)
{
    std::string szError;
    EXPECT_FALSE(SessionConfig::Load(testutils::MakeScratchDirectory() / "none.json", szError).has_value());
    EXPECT_FALSE(szError.empty());
}
