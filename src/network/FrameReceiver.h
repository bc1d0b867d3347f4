/******************************************************************************
 * @brief Defines the FrameReceiver class.
 *
 * @file FrameReceiver.h
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef FRAMERECEIVER_H
#define FRAMERECEIVER_H

#include "../interfaces/FrameChannel.hpp"
#include "../interfaces/PeriodicThread.hpp"
#include "FrameMessage.hpp"

/// \cond
#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <string>

/// \endcond

/******************************************************************************
 * @brief Subscribes to the eye tracker's ZeroMQ publisher on its own thread and
 *      pushes every decoded frame into a FrameChannel. Malformed messages are
 *      logged and dropped, the loop keeps going.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 ******************************************************************************/
class FrameReceiver : public PeriodicThread
{
    public:
        /////////////////////////////////////////
        // Declare public methods and member variables.
        /////////////////////////////////////////

        FrameReceiver(const std::string& szEndpoint, FrameChannel<IncomingFrame>& stChannel);
        ~FrameReceiver();

        /////////////////////////////////////////
        // Getters.
        /////////////////////////////////////////

        bool GetIsConnected() const { return m_bConnected; }
        const std::string& GetEndpoint() const { return m_szEndpoint; }
        uint64_t GetReceivedCount() const { return m_unReceivedCount; }
        uint64_t GetMalformedCount() const { return m_unMalformedCount; }

    private:
        /////////////////////////////////////////
        // Declare private member variables.
        /////////////////////////////////////////

        std::string m_szEndpoint;
        FrameChannel<IncomingFrame>& m_stChannel;
        zmq::context_t m_zmqContext;
        zmq::socket_t m_zmqSocket;
        bool m_bConnected;
        std::atomic<uint64_t> m_unReceivedCount;
        std::atomic<uint64_t> m_unMalformedCount;

        /////////////////////////////////////////
        // Declare private methods.
        /////////////////////////////////////////

        void ThreadedContinuousCode() override;
};

#endif    // FRAMERECEIVER_H
