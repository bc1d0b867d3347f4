/******************************************************************************
 * @brief Defines and implements functions related to GENERAL operations on images. All
 *      functions are defined within the imgops namespace.
 *
 * @file ImageOperations.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-08-31
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef IMAGE_OPERATIONS_HPP
#define IMAGE_OPERATIONS_HPP

#include "../../Logging.h"

/// \cond
#include <opencv2/opencv.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

/// \endcond

/******************************************************************************
 * @brief Namespace containing functions related to GENERAL operations on images or other
 *      large binary operations.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-08-31
 ******************************************************************************/
namespace imgops
{
    /******************************************************************************
     * @brief Truncates a sub-pixel point toward zero to whole pixels. Coordinates
     *      outside the int range saturate to INT_MIN/INT_MAX and NaN becomes 0.
     *
     * @param cvPoint - Point in pixels, may be arbitrarily far off the image.
     * @return cv::Point - The integer pixel.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2026-01-06
     ******************************************************************************/
    inline cv::Point TruncateToPixel(const cv::Point2f& cvPoint)
    {
        return cv::Point(cv::saturate_cast<int>(std::trunc(static_cast<double>(cvPoint.x))),
                         cv::saturate_cast<int>(std::trunc(static_cast<double>(cvPoint.y))));
    }

    /******************************************************************************
     * @brief Checks whether a disc of the given radius overlaps the canvas at all.
     *
     * @param cvCanvasSize - Size of the canvas.
     * @param cvCenter - Disc center in pixels.
     * @param nRadius - Disc radius in pixels.
     * @return true - Some pixel of the disc lands on the canvas.
     * @return false - The disc is entirely off the canvas.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2026-01-06
     ******************************************************************************/
    inline bool DiscTouchesCanvas(const cv::Size& cvCanvasSize, const cv::Point& cvCenter, int nRadius)
    {
        int64_t nRadius64 = std::max(nRadius, 0);
        return static_cast<int64_t>(cvCenter.x) + nRadius64 >= 0 && static_cast<int64_t>(cvCenter.x) - nRadius64 < cvCanvasSize.width &&
               static_cast<int64_t>(cvCenter.y) + nRadius64 >= 0 && static_cast<int64_t>(cvCenter.y) - nRadius64 < cvCanvasSize.height;
    }

    /******************************************************************************
     * @brief Decodes a compressed image (JPEG, PNG, ...) held in memory into a
     *      BGR cv::Mat.
     *
     * @param vBytes - The compressed image bytes.
     * @return cv::Mat - The decoded 8-bit, 3 channel image. Empty if the bytes
     *      could not be decoded.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    inline cv::Mat DecodeImage(const std::vector<uint8_t>& vBytes)
    {
        if (vBytes.empty())
        {
            return cv::Mat();
        }

        cv::Mat cvImage;
        try
        {
            cvImage = cv::imdecode(vBytes, cv::IMREAD_COLOR);
        }
        catch (const cv::Exception& cvException)
        {
            // Submit logger message.
            LOG_WARNING(logging::g_qSharedLogger, "DecodeImage: imdecode threw: {}", cvException.what());
            return cv::Mat();
        }

        return cvImage;
    }

    /******************************************************************************
     * @brief Blends an overlay onto a base image with a per-pixel alpha mask.
     *      out = (1 - alpha) * base + alpha * overlay, computed in floating point.
     *
     * @param cvBase - The 8-bit BGR base image. Modified in place.
     * @param cvOverlay - The 8-bit BGR overlay, same size as the base.
     * @param cvAlpha - Single channel CV_32F mask in [0, 1], same size as the base.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    inline void BlendWithAlphaMask(cv::Mat& cvBase, const cv::Mat& cvOverlay, const cv::Mat& cvAlpha)
    {
        if (cvBase.size() != cvOverlay.size() || cvBase.size() != cvAlpha.size() || cvAlpha.type() != CV_32FC1)
        {
            // Submit logger message.
            LOG_ERROR(logging::g_qSharedLogger,
                      "BlendWithAlphaMask: mismatched inputs! base {}x{}, overlay {}x{}, alpha {}x{} (type {})",
                      cvBase.cols,
                      cvBase.rows,
                      cvOverlay.cols,
                      cvOverlay.rows,
                      cvAlpha.cols,
                      cvAlpha.rows,
                      cvAlpha.type());
            return;
        }

        cv::Mat cvBaseFloat, cvOverlayFloat, cvAlpha3, cvInverseAlpha3;
        cvBase.convertTo(cvBaseFloat, CV_32FC3, 1.0 / 255.0);
        cvOverlay.convertTo(cvOverlayFloat, CV_32FC3, 1.0 / 255.0);
        cv::merge(std::vector<cv::Mat>{cvAlpha, cvAlpha, cvAlpha}, cvAlpha3);
        cv::subtract(cv::Scalar::all(1.0), cvAlpha3, cvInverseAlpha3);

        cv::Mat cvBlended = cvInverseAlpha3.mul(cvBaseFloat) + cvAlpha3.mul(cvOverlayFloat);
        cvBlended.convertTo(cvBase, CV_8UC3, 255.0);
    }

    /******************************************************************************
     * @brief Warps the scene frame into reference coordinates and blends it over
     *      the reference image at a constant opacity.
     *
     * @param cvCanvas - The reference sized canvas. Modified in place.
     * @param cvScene - The undistorted, cropped scene frame.
     * @param cvHomography - Scene to reference homography.
     * @param dOpacity - Weight of the warped scene, the canvas gets 1 - dOpacity.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    inline void OverlayWarpedScene(cv::Mat& cvCanvas, const cv::Mat& cvScene, const cv::Mat& cvHomography, double dOpacity)
    {
        cv::Mat cvWarped;
        cv::warpPerspective(cvScene, cvWarped, cvHomography, cvCanvas.size());
        cv::addWeighted(cvWarped, dOpacity, cvCanvas, 1.0 - dOpacity, 0.0, cvCanvas);
    }

    /******************************************************************************
     * @brief Draws a filled gaze marker with the given opacity.
     *
     * @param cvCanvas - Image to draw on.
     * @param cvPoint - Marker center, truncated to whole pixels.
     * @param nRadius - Marker radius in pixels.
     * @param cvColor - BGR marker color.
     * @param dOpacity - 1.0 draws the marker solid, 0.0 leaves the canvas untouched.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    inline void DrawGazeMarker(cv::Mat& cvCanvas, const cv::Point2f& cvPoint, int nRadius, const cv::Scalar& cvColor, double dOpacity)
    {
        cv::Point cvCenter = TruncateToPixel(cvPoint);
        if (!DiscTouchesCanvas(cvCanvas.size(), cvCenter, nRadius))
        {
            return;
        }

        cv::Mat cvOverlay = cvCanvas.clone();
        cv::circle(cvOverlay, cvCenter, nRadius, cvColor, cv::FILLED);
        cv::addWeighted(cvOverlay, dOpacity, cvCanvas, 1.0 - dOpacity, 0.0, cvCanvas);
    }

    /******************************************************************************
     * @brief Draws a one pixel AOI outline with a "label" caption. The caption
     *      sits 5 px above the box, or below it when there is no room above.
     *
     * @param cvCanvas - Image to draw on.
     * @param cvRect - The AOI rectangle in canvas pixels.
     * @param szLabel - Caption text.
     * @param cvColor - BGR color for both outline and caption.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    inline void DrawLabeledBox(cv::Mat& cvCanvas, const cv::Rect2f& cvRect, const std::string& szLabel, const cv::Scalar& cvColor)
    {
        // Corners are pinned one pixel outside the canvas at most. The visible outline is unchanged.
        cv::Point cvTopLeft     = TruncateToPixel(cvRect.tl());
        cv::Point cvBottomRight = TruncateToPixel(cv::Point2f(cvRect.x + cvRect.width, cvRect.y + cvRect.height));
        cvTopLeft.x             = std::clamp(cvTopLeft.x, -1, cvCanvas.cols);
        cvTopLeft.y             = std::clamp(cvTopLeft.y, -1, cvCanvas.rows);
        cvBottomRight.x         = std::clamp(cvBottomRight.x, -1, cvCanvas.cols);
        cvBottomRight.y         = std::clamp(cvBottomRight.y, -1, cvCanvas.rows);
        cv::rectangle(cvCanvas, cvTopLeft, cvBottomRight, cvColor, 1);

        if (szLabel.empty())
        {
            return;
        }

        int nBaseline         = 0;
        cv::Size cvTextSize   = cv::getTextSize(szLabel, cv::FONT_HERSHEY_SIMPLEX, constants::RENDER_AOI_LABEL_SCALE, 1, &nBaseline);
        cv::Point cvTextPoint = cv::Point(cvTopLeft.x, cvTopLeft.y - 5);
        if (cvTextPoint.y < 0)
        {
            cvTextPoint.y = cvBottomRight.y + cvTextSize.height + 5;
        }
        cv::putText(cvCanvas, szLabel, cvTextPoint, cv::FONT_HERSHEY_SIMPLEX, constants::RENDER_AOI_LABEL_SCALE, cvColor, 1);
    }

    /******************************************************************************
     * @brief Prints "FPS: x.xx" in the top left corner.
     *
     * @param cvCanvas - Image to draw on.
     * @param dFPS - The value to print.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    inline void DrawFPS(cv::Mat& cvCanvas, double dFPS)
    {
        cv::putText(cvCanvas, cv::format("FPS: %.2f", dFPS), cv::Point(10, 30), cv::FONT_HERSHEY_SIMPLEX, 1.0, cv::Scalar(255, 255, 255), 2);
    }
}    // namespace imgops

#endif    // IMAGE_OPERATIONS_HPP
