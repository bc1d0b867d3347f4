/******************************************************************************
 * @brief Implements the HeatmapAccumulator class.
 *
 * @file HeatmapAccumulator.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "HeatmapAccumulator.h"
#include "../Logging.h"
#include "../util/vision/ImageOperations.hpp"

/// \cond
#include <algorithm>

/// \endcond

/******************************************************************************
 * @brief Construct a new HeatmapAccumulator::HeatmapAccumulator object.
 *
 * @param siCapacity - Number of points kept, clamped to 1..HEATMAP_MAX_HISTORY.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 ******************************************************************************/
HeatmapAccumulator::HeatmapAccumulator(size_t siCapacity) : m_siCapacity(std::clamp<size_t>(siCapacity, 1, constants::HEATMAP_MAX_HISTORY)) {}

/******************************************************************************
 * @brief Adds a point, truncated to whole pixels and saturated to the int
 *      range. Evicts the oldest point when the history is full.
 *
 * @param cvPoint - Gaze point in reference pixels.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 ******************************************************************************/
void HeatmapAccumulator::AddPoint(const cv::Point2f& cvPoint)
{
    m_dqPoints.push_back(imgops::TruncateToPixel(cvPoint));
    while (m_dqPoints.size() > m_siCapacity)
    {
        m_dqPoints.pop_front();
    }
}

/******************************************************************************
 * @brief Changes the capacity. Shrinking keeps the most recent points.
 *
 * @param siCapacity - Requested capacity.
 * @return size_t - The capacity actually applied after clamping.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 ******************************************************************************/
size_t HeatmapAccumulator::SetCapacity(size_t siCapacity)
{
    size_t siClamped = std::clamp<size_t>(siCapacity, 1, constants::HEATMAP_MAX_HISTORY);
    if (siClamped != siCapacity)
    {
        // Submit logger message.
        LOG_WARNING(logging::g_qSharedLogger, "Gaze history length {} clamped to {}.", siCapacity, siClamped);
    }

    m_siCapacity = siClamped;
    while (m_dqPoints.size() > m_siCapacity)
    {
        m_dqPoints.pop_front();
    }

    return m_siCapacity;
}

/******************************************************************************
 * @brief Rasterizes the history into an 8-bit density image. Every point is a
 *      filled disc on a float field, the field is blurred with a gaussian and
 *      min-max normalized to 0..255.
 *
 * @param cvCanvasSize - Size of the reference image.
 * @param nPointRadius - Disc radius in pixels.
 * @return cv::Mat - CV_8UC1 density. All zero when the history is empty.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 ******************************************************************************/
cv::Mat HeatmapAccumulator::RenderDensity(const cv::Size& cvCanvasSize, int nPointRadius) const
{
    cv::Mat cvField = cv::Mat::zeros(cvCanvasSize, CV_32FC1);
    if (m_dqPoints.empty())
    {
        return cv::Mat::zeros(cvCanvasSize, CV_8UC1);
    }

    for (const cv::Point& cvPoint : m_dqPoints)
    {
        if (!imgops::DiscTouchesCanvas(cvCanvasSize, cvPoint, nPointRadius))
        {
            continue;
        }
        cv::circle(cvField, cvPoint, std::max(nPointRadius, 0), cv::Scalar(1.0), cv::FILLED);
    }

    cv::GaussianBlur(cvField, cvField, cv::Size(0, 0), constants::HEATMAP_GAUSSIAN_SIGMA, constants::HEATMAP_GAUSSIAN_SIGMA);
    cv::normalize(cvField, cvField, 0.0, 255.0, cv::NORM_MINMAX);

    cv::Mat cvDensity;
    cvField.convertTo(cvDensity, CV_8UC1);
    return cvDensity;
}

/******************************************************************************
 * @brief Blends the colored density onto a canvas. Each pixel's alpha is its
 *      density / 255 times the opacity, so empty areas stay untouched.
 *
 * @param cvCanvas - BGR reference sized canvas. Modified in place.
 * @param nPointRadius - Disc radius in pixels.
 * @param dOpacity - Opacity at peak density.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 ******************************************************************************/
void HeatmapAccumulator::Render(cv::Mat& cvCanvas, int nPointRadius, double dOpacity) const
{
    if (m_dqPoints.empty() || cvCanvas.empty())
    {
        return;
    }

    cv::Mat cvDensity = this->RenderDensity(cvCanvas.size(), nPointRadius);

    cv::Mat cvColored;
    cv::applyColorMap(cvDensity, cvColored, constants::HEATMAP_COLORMAP);

    cv::Mat cvAlpha;
    cvDensity.convertTo(cvAlpha, CV_32FC1, dOpacity / 255.0);

    imgops::BlendWithAlphaMask(cvCanvas, cvColored, cvAlpha);
}
