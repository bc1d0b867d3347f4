/******************************************************************************
 * @brief Defines and implements functions related to operations on time and
 *        date within the timeops namespace.
 *
 * @file TimeOperations.hpp
 * @author Eli Byrd (edbgkk@mst.edu)
 * @date 2025-01-07
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef TIME_OPERATIONS_HPP
#define TIME_OPERATIONS_HPP

/// \cond
#include <charconv>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

/// \endcond

/******************************************************************************
 * @brief Namespace containing functions related to operations on time and
 *        date related data types.
 *
 * @author Eli Byrd (edbgkk@mst.edu)
 * @date 2025-01-07
 ******************************************************************************/
namespace timeops
{
    /******************************************************************************
     * @brief Accessor for getting the current time in a specified format.
     *
     * @param szFormat - The format to return the time in.
     * @return std::string - The current time in the specified format.
     *
     * @author Eli Byrd (edbgkk@mst.edu)
     * @date 2025-01-07
     ******************************************************************************/
    inline std::string GetTimestamp(const std::string& szFormat = "%Y%m%d-%H%M%S")
    {
        // Retrieve the current time
        auto now       = std::chrono::system_clock::now();
        time_t timeNow = std::chrono::system_clock::to_time_t(now);

        // Convert to local time (thread-safe)
        tm localTime{};
        localtime_r(&timeNow, &localTime);

        // Format the time
        std::ostringstream oss;
        oss << std::put_time(&localTime, szFormat.c_str());
        return oss.str();
    }

    /******************************************************************************
     * @brief Accessor for the current wall clock time as fractional seconds since
     *      the unix epoch.
     *
     * @return double - Seconds since epoch.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    inline double GetEpochSeconds()
    {
        return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
    }

    /******************************************************************************
     * @brief The result of parsing an eye tracker system time string. When the
     *      string could not be parsed the timestamp holds the wall clock time at
     *      the moment of parsing and bIsFallback is set.
     ******************************************************************************/
    struct SystemTimestamp
    {
        public:
            double dEpochSeconds = 0.0;    // Seconds since epoch, local time interpretation.
            bool bIsFallback     = true;   // True if dEpochSeconds is "now" rather than the parsed value.
    };

    /******************************************************************************
     * @brief Parses a system time string of the form YYYY:MM:DD:HH:MM:SS:MS
     *      (colon delimited, millisecond precision, local time). Any malformed or
     *      out of range field falls back to the current wall clock time.
     *
     * @param szSystemTime - The string sent by the eye tracker.
     * @return SystemTimestamp - The parsed time, or "now" tagged as a fallback.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    inline SystemTimestamp ParseSystemTime(std::string_view szSystemTime)
    {
        SystemTimestamp stFallback;
        stFallback.dEpochSeconds = GetEpochSeconds();
        stFallback.bIsFallback   = true;

        // Split into exactly seven integer fields.
        std::vector<int> vFields;
        size_t siStart = 0;
        while (siStart <= szSystemTime.size())
        {
            size_t siEnd = szSystemTime.find(':', siStart);
            if (siEnd == std::string_view::npos)
            {
                siEnd = szSystemTime.size();
            }

            std::string_view szField = szSystemTime.substr(siStart, siEnd - siStart);
            int nValue               = 0;
            auto stResult            = std::from_chars(szField.data(), szField.data() + szField.size(), nValue);
            if (szField.empty() || stResult.ec != std::errc() || stResult.ptr != szField.data() + szField.size())
            {
                return stFallback;
            }
            vFields.push_back(nValue);

            siStart = siEnd + 1;
        }

        if (vFields.size() != 7)
        {
            return stFallback;
        }

        const int nYear = vFields[0], nMonth = vFields[1], nDay = vFields[2];
        const int nHour = vFields[3], nMinute = vFields[4], nSecond = vFields[5], nMillisecond = vFields[6];
        if (nYear < 1900 || nMonth < 1 || nMonth > 12 || nDay < 1 || nDay > 31 || nHour < 0 || nHour > 23 || nMinute < 0 || nMinute > 59 || nSecond < 0 ||
            nSecond > 59 || nMillisecond < 0 || nMillisecond > 999)
        {
            return stFallback;
        }

        tm stTime{};
        stTime.tm_year  = nYear - 1900;
        stTime.tm_mon   = nMonth - 1;
        stTime.tm_mday  = nDay;
        stTime.tm_hour  = nHour;
        stTime.tm_min   = nMinute;
        stTime.tm_sec   = nSecond;
        stTime.tm_isdst = -1;

        time_t tmEpoch = mktime(&stTime);
        // mktime normalizes impossible dates (Feb 30 -> Mar 2). Reject those.
        if (tmEpoch == static_cast<time_t>(-1) || stTime.tm_mday != nDay || stTime.tm_mon != nMonth - 1)
        {
            return stFallback;
        }

        SystemTimestamp stParsed;
        stParsed.dEpochSeconds = static_cast<double>(tmEpoch) + nMillisecond / 1000.0;
        stParsed.bIsFallback   = false;
        return stParsed;
    }

    /******************************************************************************
     * @brief Paces a loop at a fixed period. A loop body that overruns its period
     *      delays the next iteration instead of skipping it, and the clock never
     *      tries to catch up by running iterations back to back.
     *
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    class CadenceClock
    {
        public:
            /******************************************************************************
             * @brief Construct a new Cadence Clock object.
             *
             * @param tmPeriod - The target time between the start of two iterations.
             *
             * @author clayjay3 (claytonraycowen@gmail.com)
             * @date 2025-12-29
             ******************************************************************************/
            explicit CadenceClock(std::chrono::microseconds tmPeriod) : m_tmPeriod(tmPeriod), m_tmNextTick(std::chrono::steady_clock::now() + tmPeriod) {}

            /******************************************************************************
             * @brief Sleeps until the next tick is due. Returns right away if the
             *      previous iteration overran, and reschedules from the current time.
             *
             * @return true - The caller had to wait (iteration finished on time).
             * @return false - The iteration overran its period.
             *
             * @author clayjay3 (claytonraycowen@gmail.com)
             * @date 2025-12-29
             ******************************************************************************/
            bool WaitForNextTick()
            {
                std::chrono::steady_clock::time_point tmNow = std::chrono::steady_clock::now();
                if (tmNow >= m_tmNextTick)
                {
                    // Overran. Start the next period now instead of bursting to catch up.
                    m_tmNextTick = tmNow + m_tmPeriod;
                    return false;
                }

                std::this_thread::sleep_until(m_tmNextTick);
                m_tmNextTick += m_tmPeriod;
                return true;
            }

            std::chrono::microseconds GetPeriod() const { return m_tmPeriod; }

        private:
            std::chrono::microseconds m_tmPeriod;
            std::chrono::steady_clock::time_point m_tmNextTick;
    };
}    // namespace timeops

#endif    // TIME_OPERATIONS_HPP
