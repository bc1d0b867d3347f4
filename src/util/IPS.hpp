/******************************************************************************
 * @brief Defines and implements the IPS (iterations per second) class used to
 *      measure how fast a loop or thread is running.
 *
 * @file IPS.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef IPS_HPP
#define IPS_HPP

/// \cond
#include <chrono>
#include <deque>
#include <numeric>

/// \endcond

/******************************************************************************
 * @brief Measures iterations per second. Call Tick() once per loop iteration.
 *      The exact IPS is derived from the interval between the last two ticks,
 *      the average IPS from a short sliding window of intervals.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 ******************************************************************************/
class IPS
{
    public:
        /******************************************************************************
         * @brief Construct a new IPS object.
         *
         * @param siWindowSize - The number of intervals used for the average.
         *
         * @author clayjay3 (claytonraycowen@gmail.com)
         * @date 2025-12-29
         ******************************************************************************/
        explicit IPS(size_t siWindowSize = 30) : m_siWindowSize(siWindowSize > 0 ? siWindowSize : 1), m_bHasTicked(false), m_dExactIPS(0.0) {}

        /******************************************************************************
         * @brief Records one iteration.
         *
         *
         * @author clayjay3 (claytonraycowen@gmail.com)
         * @date 2025-12-29
         ******************************************************************************/
        void Tick()
        {
            std::chrono::steady_clock::time_point tmNow = std::chrono::steady_clock::now();
            if (m_bHasTicked)
            {
                double dInterval = std::chrono::duration<double>(tmNow - m_tmLastTick).count();
                if (dInterval > 0.0)
                {
                    m_dExactIPS = 1.0 / dInterval;
                    m_dqIntervals.push_back(dInterval);
                    if (m_dqIntervals.size() > m_siWindowSize)
                    {
                        m_dqIntervals.pop_front();
                    }
                }
            }

            m_tmLastTick = tmNow;
            m_bHasTicked = true;
        }

        /******************************************************************************
         * @brief Accessor for the IPS measured from the last interval.
         *
         * @return double - Iterations per second, 0 until two ticks happened.
         *
         * @author clayjay3 (claytonraycowen@gmail.com)
         * @date 2025-12-29
         ******************************************************************************/
        double GetExactIPS() const { return m_dExactIPS; }

        /******************************************************************************
         * @brief Accessor for the IPS averaged over the sliding window.
         *
         * @return double - Iterations per second, 0 until two ticks happened.
         *
         * @author clayjay3 (claytonraycowen@gmail.com)
         * @date 2025-12-29
         ******************************************************************************/
        double GetAverageIPS() const
        {
            if (m_dqIntervals.empty())
            {
                return 0.0;
            }

            double dTotal = std::accumulate(m_dqIntervals.begin(), m_dqIntervals.end(), 0.0);
            return dTotal > 0.0 ? static_cast<double>(m_dqIntervals.size()) / dTotal : 0.0;
        }

    private:
        size_t m_siWindowSize;
        bool m_bHasTicked;
        double m_dExactIPS;
        std::chrono::steady_clock::time_point m_tmLastTick;
        std::deque<double> m_dqIntervals;
};

#endif    // IPS_HPP
