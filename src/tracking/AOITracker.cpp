/******************************************************************************
 * @brief Implements the AOITracker class.
 *
 * @file AOITracker.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "AOITracker.h"
#include "../Logging.h"

/// \cond
#include <algorithm>
#include <cmath>

/// \endcond

namespace
{
    // Flips negative sizes so the rect always spans left/top to right/bottom.
    cv::Rect2f NormalizeRect(const cv::Rect2f& cvRect)
    {
        cv::Rect2f cvNormalized = cvRect;
        if (cvNormalized.width < 0)
        {
            cvNormalized.x += cvNormalized.width;
            cvNormalized.width = -cvNormalized.width;
        }
        if (cvNormalized.height < 0)
        {
            cvNormalized.y += cvNormalized.height;
            cvNormalized.height = -cvNormalized.height;
        }
        return cvNormalized;
    }
}    // namespace

/******************************************************************************
 * @brief Parses a policy name as written in session files and on the command
 *      line: "last_defined", "first_defined" or "smallest_area".
 *
 * @param szName - The policy name.
 * @return std::optional<ActiveAOIPolicy> - The policy, nullopt if unknown.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2026-01-06
 ******************************************************************************/
std::optional<ActiveAOIPolicy> ActiveAOIPolicyFromString(std::string_view szName)
{
    if (szName == "last_defined")
    {
        return ActiveAOIPolicy::eLastDefined;
    }
    if (szName == "first_defined")
    {
        return ActiveAOIPolicy::eFirstDefined;
    }
    if (szName == "smallest_area")
    {
        return ActiveAOIPolicy::eSmallestArea;
    }
    return std::nullopt;
}

const char* ActiveAOIPolicyToString(ActiveAOIPolicy eActivePolicy)
{
    switch (eActivePolicy)
    {
        case ActiveAOIPolicy::eFirstDefined: return "first_defined";
        case ActiveAOIPolicy::eSmallestArea: return "smallest_area";
        case ActiveAOIPolicy::eLastDefined:
        default: return "last_defined";
    }
}

/******************************************************************************
 * @brief Construct a new AOITracker::AOITracker object.
 *
 * @param eActivePolicy - How the active AOI is chosen when AOIs overlap.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 ******************************************************************************/
AOITracker::AOITracker(ActiveAOIPolicy eActivePolicy) : m_eActivePolicy(eActivePolicy) {}

/******************************************************************************
 * @brief Feeds one projected gaze point through every AOI's state machine.
 *
 *      Outside -> Inside: hit count + 1, entry time = now.
 *      Inside  -> Outside: dwell += now - entry (never negative), entry cleared.
 *      Inside  -> Inside and Outside -> Outside: nothing changes.
 *
 * @param cvGazePoint - Gaze in reference pixels.
 * @param dNow - Timestamp of the gaze sample in seconds.
 * @return AOIUpdateResult - The active AOI and the transitions of this update.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 ******************************************************************************/
AOIUpdateResult AOITracker::Update(const cv::Point2f& cvGazePoint, double dNow)
{
    AOIUpdateResult stResult;

    for (size_t siI = 0; siI < m_vAOIs.size(); ++siI)
    {
        AOI& stAOI       = m_vAOIs[siI];
        bool bGazeInside = stAOI.Contains(cvGazePoint);

        if (bGazeInside && !stAOI.bGazeInside)
        {
            stAOI.unHitCount += 1;
            stAOI.dEntryTime = dNow;
            stResult.vTransitions.push_back(AOITransition{siI, true, dNow});
        }
        else if (!bGazeInside && stAOI.bGazeInside)
        {
            if (stAOI.dEntryTime.has_value())
            {
                // The tracker clock can step backwards. Never subtract dwell.
                stAOI.dDwellSeconds += std::max(0.0, dNow - *stAOI.dEntryTime);
                stAOI.dEntryTime.reset();
            }
            stResult.vTransitions.push_back(AOITransition{siI, false, dNow});
        }
        stAOI.bGazeInside = bGazeInside;

        if (!bGazeInside)
        {
            continue;
        }

        // Pick the active AOI.
        switch (m_eActivePolicy)
        {
            case ActiveAOIPolicy::eFirstDefined:
                if (!stResult.siActiveIndex.has_value())
                {
                    stResult.siActiveIndex = siI;
                }
                break;
            case ActiveAOIPolicy::eSmallestArea:
                if (!stResult.siActiveIndex.has_value() || stAOI.cvRect.area() < m_vAOIs[*stResult.siActiveIndex].cvRect.area())
                {
                    stResult.siActiveIndex = siI;
                }
                break;
            case ActiveAOIPolicy::eLastDefined:
            default: stResult.siActiveIndex = siI; break;
        }
    }

    if (stResult.siActiveIndex.has_value())
    {
        stResult.szActiveName = m_vAOIs[*stResult.siActiveIndex].szName;
    }

    for (const AOITransition& stTransition : stResult.vTransitions)
    {
        // Submit logger message.
        LOG_TRACE_L1(logging::g_qSharedLogger,
                     "Gaze {} AOI {} '{}' at {:.3f}",
                     stTransition.bEntered ? "entered" : "left",
                     stTransition.siIndex,
                     m_vAOIs[stTransition.siIndex].szName,
                     stTransition.dTime);
    }

    return stResult;
}

/******************************************************************************
 * @brief Clears hit counts, dwell times and entry times of every AOI.
 *      Rectangles, names and the inside state are kept, so a gaze that is
 *      inside at reset time is not counted as a new hit. The visit in progress
 *      contributes no dwell.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 ******************************************************************************/
void AOITracker::Reset()
{
    for (AOI& stAOI : m_vAOIs)
    {
        stAOI.unHitCount    = 0;
        stAOI.dDwellSeconds = 0.0;
        stAOI.dEntryTime.reset();
    }

    // Submit logger message.
    LOG_INFO(logging::g_qSharedLogger, "AOI statistics reset for {} AOIs.", m_vAOIs.size());
}

/******************************************************************************
 * @brief Appends a new AOI with zeroed statistics.
 *
 * @param cvRect - Rectangle in reference pixels. Negative sizes are flipped.
 * @param szName - Display name, may be empty.
 * @return size_t - Index of the new AOI.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 ******************************************************************************/
size_t AOITracker::AddAOI(const cv::Rect2f& cvRect, const std::string& szName)
{
    AOI stAOI;
    stAOI.cvRect = NormalizeRect(cvRect);
    stAOI.szName = szName;
    m_vAOIs.push_back(stAOI);

    // Submit logger message.
    LOG_INFO(logging::g_qSharedLogger,
             "Added AOI {} '{}' at ({:.1f}, {:.1f}) size {:.1f}x{:.1f}.",
             m_vAOIs.size() - 1,
             szName,
             stAOI.cvRect.x,
             stAOI.cvRect.y,
             stAOI.cvRect.width,
             stAOI.cvRect.height);

    return m_vAOIs.size() - 1;
}

/******************************************************************************
 * @brief Removes an AOI. Later AOIs move down one index.
 *
 * @param siIndex - Index of the AOI.
 * @return true - Removed.
 * @return false - Index out of range.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 ******************************************************************************/
bool AOITracker::RemoveAOI(size_t siIndex)
{
    if (siIndex >= m_vAOIs.size())
    {
        // Submit logger message.
        LOG_WARNING(logging::g_qSharedLogger, "RemoveAOI: index {} out of range ({} AOIs).", siIndex, m_vAOIs.size());
        return false;
    }

    m_vAOIs.erase(m_vAOIs.begin() + static_cast<std::ptrdiff_t>(siIndex));
    return true;
}

/******************************************************************************
 * @brief Changes the display name of an AOI.
 *
 * @param siIndex - Index of the AOI.
 * @param szName - New name.
 * @return true - Renamed.
 * @return false - Index out of range.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 ******************************************************************************/
bool AOITracker::RenameAOI(size_t siIndex, const std::string& szName)
{
    if (siIndex >= m_vAOIs.size())
    {
        // Submit logger message.
        LOG_WARNING(logging::g_qSharedLogger, "RenameAOI: index {} out of range ({} AOIs).", siIndex, m_vAOIs.size());
        return false;
    }

    m_vAOIs[siIndex].szName = szName;
    return true;
}

/******************************************************************************
 * @brief Replaces the whole AOI list. Rectangles are normalized, negative or
 *      non-finite statistics are cleared.
 *
 * @param vAOIs - The new AOIs.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 ******************************************************************************/
void AOITracker::SetAOIs(const std::vector<AOI>& vAOIs)
{
    m_vAOIs = vAOIs;
    for (AOI& stAOI : m_vAOIs)
    {
        stAOI.cvRect = NormalizeRect(stAOI.cvRect);
        if (!std::isfinite(stAOI.dDwellSeconds) || stAOI.dDwellSeconds < 0.0)
        {
            stAOI.dDwellSeconds = 0.0;
        }
        if (!stAOI.bGazeInside)
        {
            stAOI.dEntryTime.reset();
        }
    }
}

/******************************************************************************
 * @brief Dwell time including the visit in progress.
 *
 * @param siIndex - Index of the AOI.
 * @param dNow - Current timestamp in seconds.
 * @return std::optional<double> - Completed dwell plus (now - entry) if the gaze
 *      is inside. Nullopt if the index is out of range.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 ******************************************************************************/
std::optional<double> AOITracker::GetInstantDwell(size_t siIndex, double dNow) const
{
    if (siIndex >= m_vAOIs.size())
    {
        return std::nullopt;
    }

    const AOI& stAOI = m_vAOIs[siIndex];
    if (stAOI.bGazeInside && stAOI.dEntryTime.has_value())
    {
        return stAOI.dDwellSeconds + std::max(0.0, dNow - *stAOI.dEntryTime);
    }

    return stAOI.dDwellSeconds;
}

/******************************************************************************
 * @brief Finds the AOI drawn on top at a point, which is the last defined AOI
 *      containing it. Used to pick the AOI under the cursor.
 *
 * @param cvPoint - Point in reference pixels.
 * @return std::optional<size_t> - Index of the AOI, nullopt if none contains
 *      the point.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2026-01-06
 ******************************************************************************/
std::optional<size_t> AOITracker::FindTopmostAOI(const cv::Point2f& cvPoint) const
{
    for (size_t siI = m_vAOIs.size(); siI > 0; --siI)
    {
        if (m_vAOIs[siI - 1].Contains(cvPoint))
        {
            return siI - 1;
        }
    }

    return std::nullopt;
}
