/******************************************************************************
 * @brief Atomic functional library for lens undistortion of scene camera frames.
 * Builds remap tables from the camera intrinsics and caches them per frame size.
 *
 * @file Undistortion.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef UNDISTORTION_HPP
#define UNDISTORTION_HPP

#include "../../Constants.h"
#include "../../Logging.h"
#include "../../util/vision/CameraModels.hpp"

/// \cond
#include <opencv2/opencv.hpp>

#include <cstdint>
#include <optional>

/// \endcond

namespace Undistortion
{
    /******************************************************************************
     * @brief Everything needed to undistort frames of one size, and to map points
     *      from the raw frame into the undistorted, cropped frame.
     ******************************************************************************/
    struct RemapTable
    {
            cv::Size cvFrameSize;         // Size of the raw frames this table was built for.
            cv::Mat cvMap1;               // Remap grid, CV_16SC2 fixed point coordinates.
            cv::Mat cvMap2;               // Remap grid, CV_16UC1 interpolation table.
            cv::Rect cvROI;               // Valid pixel region of the undistorted frame.
            cv::Mat cvNewCameraMatrix;    // Camera matrix of the undistorted frame (before cropping).
    };

    /******************************************************************************
     * @brief Builds remap tables for a frame size. Uses alpha = 0 so the crop ROI
     *      contains no black border pixels, and centers the principal point.
     *
     * @param stCalibration - Intrinsics and distortion of the scene camera.
     * @param cvFrameSize - Size of the raw frames.
     * @return RemapTable - The remap grids, crop region and adjusted camera matrix.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    inline RemapTable ComputeRemapTable(const CameraCalibration& stCalibration, const cv::Size& cvFrameSize)
    {
        RemapTable stTable;
        stTable.cvFrameSize       = cvFrameSize;
        stTable.cvNewCameraMatrix = cv::getOptimalNewCameraMatrix(stCalibration.cvK,
                                                                  stCalibration.cvD,
                                                                  cvFrameSize,
                                                                  constants::UNDISTORT_ALPHA,
                                                                  cvFrameSize,
                                                                  &stTable.cvROI,
                                                                  constants::UNDISTORT_CENTER_PRINCIPAL_POINT);

        cv::initUndistortRectifyMap(stCalibration.cvK,
                                    stCalibration.cvD,
                                    cv::Mat(),
                                    stTable.cvNewCameraMatrix,
                                    cvFrameSize,
                                    CV_16SC2,
                                    stTable.cvMap1,
                                    stTable.cvMap2);

        return stTable;
    }

    /******************************************************************************
     * @brief Undistorts a frame with a remap table and crops it to the valid region.
     *
     * @param cvFrame - The raw frame. Must have the size the table was built for.
     * @param stTable - The remap table.
     * @return std::optional<cv::Mat> - The undistorted, cropped frame. Nullopt if the
     *      frame doesn't match the table or the crop region is empty.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    inline std::optional<cv::Mat> ApplyRemapTable(const cv::Mat& cvFrame, const RemapTable& stTable)
    {
        if (cvFrame.empty() || cvFrame.size() != stTable.cvFrameSize)
        {
            return std::nullopt;
        }

        // Intersect with the frame in case the ROI reaches past the border.
        cv::Rect cvCrop = stTable.cvROI & cv::Rect(0, 0, cvFrame.cols, cvFrame.rows);
        if (cvCrop.empty())
        {
            return std::nullopt;
        }

        cv::Mat cvUndistorted;
        cv::remap(cvFrame, cvUndistorted, stTable.cvMap1, stTable.cvMap2, constants::UNDISTORT_REMAP_INTERPOLATION_METHOD);
        return cvUndistorted(cvCrop).clone();
    }

    /******************************************************************************
     * @brief Caches the remap table of the most recently seen frame size. The
     *      table is only rebuilt when the frame size changes.
     *
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    class UndistortionMap
    {
        public:
            explicit UndistortionMap(const CameraCalibration& stCalibration) : m_stCalibration(stCalibration), m_unRecomputeCount(0) {}

            /******************************************************************************
             * @brief Returns the table for the given frame size, rebuilding it only if the
             *      size differs from the last call.
             *
             * @param cvFrameSize - Size of the current raw frame.
             * @return const RemapTable& - The table. Valid until the next call with another size.
             *
             * @author clayjay3 (claytonraycowen@gmail.com)
             * @date 2025-12-29
             ******************************************************************************/
            const RemapTable& Acquire(const cv::Size& cvFrameSize)
            {
                if (!m_stTable.has_value() || m_stTable->cvFrameSize != cvFrameSize)
                {
                    m_stTable = ComputeRemapTable(m_stCalibration, cvFrameSize);
                    ++m_unRecomputeCount;

                    // Submit logger message.
                    LOG_DEBUG(logging::g_qSharedLogger,
                              "Remap table rebuilt for {}x{} frames. Crop region is {}x{} at ({}, {}).",
                              cvFrameSize.width,
                              cvFrameSize.height,
                              m_stTable->cvROI.width,
                              m_stTable->cvROI.height,
                              m_stTable->cvROI.x,
                              m_stTable->cvROI.y);
                }

                return *m_stTable;
            }

            uint64_t GetRecomputeCount() const { return m_unRecomputeCount; }

            const CameraCalibration& GetCalibration() const { return m_stCalibration; }

        private:
            CameraCalibration m_stCalibration;
            std::optional<RemapTable> m_stTable;
            uint64_t m_unRecomputeCount;
    };
}    // namespace Undistortion

#endif    // UNDISTORTION_HPP
