/******************************************************************************
 * @brief Defines the AOITracker class.
 *
 * @file AOITracker.h
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef AOITRACKER_H
#define AOITRACKER_H

/// \cond
#include <opencv2/opencv.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/// \endcond

/******************************************************************************
 * @brief An area of interest on the reference image and its gaze statistics.
 *      Times are seconds on the eye tracker's clock.
 ******************************************************************************/
struct AOI
{
    public:
        cv::Rect2f cvRect;                   // Reference image pixels, never negative width/height.
        std::string szName;                  // May be empty.
        uint32_t unHitCount = 0;             // Number of times the gaze entered.
        double dDwellSeconds = 0.0;          // Completed visits only.
        bool bGazeInside     = false;
        std::optional<double> dEntryTime;    // Set while the gaze is inside.

        /******************************************************************************
         * @brief Edge inclusive containment test, left <= x <= right and
         *      top <= y <= bottom.
         *
         * @param cvPoint - Point in reference pixels.
         * @return true - The point is inside or on the border.
         * @return false - The point is outside.
         *
         * @author clayjay3 (claytonraycowen@gmail.com)
         * @date 2025-12-29
         ******************************************************************************/
        bool Contains(const cv::Point2f& cvPoint) const
        {
            return cvPoint.x >= cvRect.x && cvPoint.x <= cvRect.x + cvRect.width && cvPoint.y >= cvRect.y && cvPoint.y <= cvRect.y + cvRect.height;
        }
};

/******************************************************************************
 * @brief Picks the single "active" AOI name when several AOIs contain the gaze.
 ******************************************************************************/
enum class ActiveAOIPolicy
{
    eLastDefined,     // The containing AOI added last.
    eFirstDefined,    // The containing AOI added first.
    eSmallestArea     // The containing AOI with the smallest area, first one wins ties.
};

std::optional<ActiveAOIPolicy> ActiveAOIPolicyFromString(std::string_view szName);
const char* ActiveAOIPolicyToString(ActiveAOIPolicy eActivePolicy);

/******************************************************************************
 * @brief An enter or exit event produced by AOITracker::Update().
 ******************************************************************************/
struct AOITransition
{
    public:
        size_t siIndex = 0;
        bool bEntered  = false;    // True for enter, false for exit.
        double dTime   = 0.0;
};

/******************************************************************************
 * @brief What happened during one AOITracker::Update() call.
 ******************************************************************************/
struct AOIUpdateResult
{
    public:
        std::string szActiveName;                 // Empty if the gaze is in no AOI.
        std::optional<size_t> siActiveIndex;      // Index of the active AOI.
        std::vector<AOITransition> vTransitions;
};

/******************************************************************************
 * @brief Tracks enter/exit events, hit counts and dwell time for a list of
 *      possibly overlapping AOIs. Every AOI is evaluated on every update.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 ******************************************************************************/
class AOITracker
{
    public:
        /////////////////////////////////////////
        // Declare public methods and member variables.
        /////////////////////////////////////////

        explicit AOITracker(ActiveAOIPolicy eActivePolicy = ActiveAOIPolicy::eLastDefined);

        AOIUpdateResult Update(const cv::Point2f& cvGazePoint, double dNow);
        void Reset();

        size_t AddAOI(const cv::Rect2f& cvRect, const std::string& szName = "");
        bool RemoveAOI(size_t siIndex);
        bool RenameAOI(size_t siIndex, const std::string& szName);
        void SetAOIs(const std::vector<AOI>& vAOIs);

        /////////////////////////////////////////
        // Setters.
        /////////////////////////////////////////

        void SetActivePolicy(ActiveAOIPolicy eActivePolicy) { m_eActivePolicy = eActivePolicy; }

        /////////////////////////////////////////
        // Getters.
        /////////////////////////////////////////

        const std::vector<AOI>& GetAOIs() const { return m_vAOIs; }
        size_t GetAOICount() const { return m_vAOIs.size(); }
        ActiveAOIPolicy GetActivePolicy() const { return m_eActivePolicy; }
        std::optional<double> GetInstantDwell(size_t siIndex, double dNow) const;
        std::optional<size_t> FindTopmostAOI(const cv::Point2f& cvPoint) const;

    private:
        /////////////////////////////////////////
        // Declare private member variables.
        /////////////////////////////////////////

        std::vector<AOI> m_vAOIs;
        ActiveAOIPolicy m_eActivePolicy;
};

#endif    // AOITRACKER_H
