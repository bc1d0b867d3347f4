/******************************************************************************
 * @brief Defines the HeatmapAccumulator class.
 *
 * @file HeatmapAccumulator.h
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef HEATMAPACCUMULATOR_H
#define HEATMAPACCUMULATOR_H

#include "../Constants.h"

/// \cond
#include <opencv2/opencv.hpp>

#include <deque>

/// \endcond

/******************************************************************************
 * @brief Keeps the most recent projected gaze points (whole reference pixels)
 *      and renders them as a colored density overlay. The oldest point is
 *      evicted first once the capacity is reached.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 ******************************************************************************/
class HeatmapAccumulator
{
    public:
        /////////////////////////////////////////
        // Declare public methods and member variables.
        /////////////////////////////////////////

        explicit HeatmapAccumulator(size_t siCapacity = constants::HEATMAP_DEFAULT_HISTORY);

        void AddPoint(const cv::Point2f& cvPoint);
        void Render(cv::Mat& cvCanvas, int nPointRadius, double dOpacity) const;
        cv::Mat RenderDensity(const cv::Size& cvCanvasSize, int nPointRadius) const;

        /////////////////////////////////////////
        // Setters.
        /////////////////////////////////////////

        size_t SetCapacity(size_t siCapacity);

        /////////////////////////////////////////
        // Getters.
        /////////////////////////////////////////

        size_t GetCapacity() const { return m_siCapacity; }
        size_t GetSize() const { return m_dqPoints.size(); }
        const std::deque<cv::Point>& GetPoints() const { return m_dqPoints; }

    private:
        /////////////////////////////////////////
        // Declare private member variables.
        /////////////////////////////////////////

        size_t m_siCapacity;
        std::deque<cv::Point> m_dqPoints;
};

#endif    // HEATMAPACCUMULATOR_H
