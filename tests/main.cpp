/******************************************************************************
 * @brief Main file of the unit test executable. Sets up the loggers so logging
 *      code paths run during the tests, then runs every registered test.
 *
 * @file main.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-31
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "../src/Logging.h"

/// \cond
#include <gtest/gtest.h>

#include <filesystem>

/// \endcond

/******************************************************************************
 * @brief Test main function.
 *
 * @param argc - Number of command line arguments.
 * @param argv - Command line arguments, forwarded to GoogleTest.
 * @return int - Exit status number.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-31
 ******************************************************************************/
int main(int argc, char** argv)
{
    // Log into the temp directory instead of the program's log folder.
    std::filesystem::path szLogDirectory = std::filesystem::temp_directory_path() / "gazemapper_test_logs/";
    logging::InitializeLoggers(szLogDirectory.string());

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
