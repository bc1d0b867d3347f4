/******************************************************************************
 * @brief Unit tests for the PeriodicThread worker loop.
 *
 * @file PeriodicThreadTests.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-31
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "../../src/interfaces/PeriodicThread.hpp"

/// \cond
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

/// \endcond

namespace
{
    class CountingThread : public PeriodicThread
    {
        public:
            ~CountingThread()
            {
                this->RequestStop();
                this->Join();
            }

            int GetIterations() const { return m_nIterations; }

        private:
            void ThreadedContinuousCode() override { ++m_nIterations; }

            std::atomic<int> m_nIterations{0};
    };
}    // namespace

TEST(PeriodicThreadTest, RunsUntilStopped)
{
    CountingThread stThread;
    EXPECT_EQ(stThread.GetThreadState(), PeriodicThread::ThreadState::eStopped);

    stThread.SetMainThreadIPSLimit(200);
    stThread.Start();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    stThread.RequestStop();
    stThread.Join();

    EXPECT_EQ(stThread.GetThreadState(), PeriodicThread::ThreadState::eStopped);
    EXPECT_GT(stThread.GetIterations(), 0);
}

TEST(PeriodicThreadTest, IPSLimitCapsTheLoop)
{
    CountingThread stThread;
    stThread.SetMainThreadIPSLimit(50);
    stThread.Start();
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    stThread.RequestStop();
    stThread.Join();

    // About 10 iterations in 200 ms. Leave room for slow machines.
    EXPECT_LE(stThread.GetIterations(), 15);
}

TEST(PeriodicThreadTest, StopBeforeTheThreadRunsIsHonoured)
{
    CountingThread stThread;
    stThread.Start();
    stThread.RequestStop();
    stThread.Join();

    EXPECT_EQ(stThread.GetThreadState(), PeriodicThread::ThreadState::eStopped);
}
