/******************************************************************************
 * @brief Defines and implements the PeriodicThread interface class. Any class
 *      that needs a worker loop inherits from this and implements
 *      ThreadedContinuousCode().
 *
 * @file PeriodicThread.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef PERIODIC_THREAD_HPP
#define PERIODIC_THREAD_HPP

#include "../util/TimeOperations.hpp"

/// \cond
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

/// \endcond

/******************************************************************************
 * @brief Owns one std::thread that repeatedly calls ThreadedContinuousCode()
 *      until RequestStop() is called. The loop can optionally be capped to a
 *      number of iterations per second.
 *
 * @note Derived classes must call RequestStop() and Join() in their own
 *      destructor. By the time ~PeriodicThread() runs the derived part of the
 *      object is already gone.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 ******************************************************************************/
class PeriodicThread
{
    public:
        /////////////////////////////////////////
        // Declare public enums.
        /////////////////////////////////////////

        enum class ThreadState
        {
            eStarting,
            eRunning,
            eStopping,
            eStopped
        };

        PeriodicThread() : m_eThreadState(ThreadState::eStopped), m_nMainThreadMaxIPS(0) {}
        PeriodicThread(const PeriodicThread&)            = delete;
        PeriodicThread& operator=(const PeriodicThread&) = delete;

        /******************************************************************************
         * @brief Destroy the Periodic Thread object. Joins the thread if a derived
         *      class forgot to.
         *
         *
         * @author clayjay3 (claytonraycowen@gmail.com)
         * @date 2025-12-29
         ******************************************************************************/
        virtual ~PeriodicThread()
        {
            this->RequestStop();
            this->Join();
        }

        /******************************************************************************
         * @brief Starts the worker thread. Does nothing if it is already running.
         *
         *
         * @author clayjay3 (claytonraycowen@gmail.com)
         * @date 2025-12-29
         ******************************************************************************/
        void Start()
        {
            std::lock_guard<std::mutex> lkThreadLock(m_muThreadMutex);
            if (m_thMainThread.joinable())
            {
                return;
            }

            m_eThreadState = ThreadState::eStarting;
            m_thMainThread = std::thread(&PeriodicThread::RunMainLoop, this);
        }

        /******************************************************************************
         * @brief Asks the worker loop to exit after its current iteration.
         *
         *
         * @author clayjay3 (claytonraycowen@gmail.com)
         * @date 2025-12-29
         ******************************************************************************/
        void RequestStop()
        {
            ThreadState eExpected = ThreadState::eRunning;
            if (!m_eThreadState.compare_exchange_strong(eExpected, ThreadState::eStopping))
            {
                eExpected = ThreadState::eStarting;
                m_eThreadState.compare_exchange_strong(eExpected, ThreadState::eStopping);
            }
        }

        /******************************************************************************
         * @brief Blocks until the worker thread has exited.
         *
         *
         * @author clayjay3 (claytonraycowen@gmail.com)
         * @date 2025-12-29
         ******************************************************************************/
        void Join()
        {
            std::lock_guard<std::mutex> lkThreadLock(m_muThreadMutex);
            if (m_thMainThread.joinable())
            {
                m_thMainThread.join();
            }
        }

        /******************************************************************************
         * @brief Mutator for the iterations per second cap of the worker loop.
         *
         * @param nMaxIPS - The cap. Zero or less runs the loop as fast as it goes.
         *
         * @author clayjay3 (claytonraycowen@gmail.com)
         * @date 2025-12-29
         ******************************************************************************/
        void SetMainThreadIPSLimit(int nMaxIPS) { m_nMainThreadMaxIPS = nMaxIPS; }

        ThreadState GetThreadState() const { return m_eThreadState; }

    protected:
        /******************************************************************************
         * @brief One iteration of the worker loop. Runs on the worker thread.
         *
         *
         * @author clayjay3 (claytonraycowen@gmail.com)
         * @date 2025-12-29
         ******************************************************************************/
        virtual void ThreadedContinuousCode() = 0;

    private:
        void RunMainLoop()
        {
            int nCurrentLimit = m_nMainThreadMaxIPS;
            timeops::CadenceClock tmCadence(std::chrono::microseconds(nCurrentLimit > 0 ? 1000000 / nCurrentLimit : 0));

            // Anything but eStarting means a stop was requested before the thread got here.
            ThreadState eExpected = ThreadState::eStarting;
            m_eThreadState.compare_exchange_strong(eExpected, ThreadState::eRunning);

            while (m_eThreadState == ThreadState::eRunning)
            {
                this->ThreadedContinuousCode();

                // Pick up a changed limit.
                if (m_nMainThreadMaxIPS != nCurrentLimit)
                {
                    nCurrentLimit = m_nMainThreadMaxIPS;
                    tmCadence     = timeops::CadenceClock(std::chrono::microseconds(nCurrentLimit > 0 ? 1000000 / nCurrentLimit : 0));
                }
                if (nCurrentLimit > 0)
                {
                    tmCadence.WaitForNextTick();
                }
            }

            m_eThreadState = ThreadState::eStopped;
        }

        std::thread m_thMainThread;
        std::mutex m_muThreadMutex;
        std::atomic<ThreadState> m_eThreadState;
        std::atomic<int> m_nMainThreadMaxIPS;
};

#endif    // PERIODIC_THREAD_HPP
