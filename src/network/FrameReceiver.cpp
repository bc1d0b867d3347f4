/******************************************************************************
 * @brief Implements the FrameReceiver class.
 *
 * @file FrameReceiver.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "FrameReceiver.h"
#include "../Constants.h"
#include "../Logging.h"

/// \cond
#include <string_view>
#include <utility>

/// \endcond

/******************************************************************************
 * @brief Construct a new FrameReceiver::FrameReceiver object. Connects the SUB
 *      socket right away, the thread is started separately with Start().
 *
 * @param szEndpoint - ZeroMQ address of the eye tracker publisher.
 * @param stChannel - The channel decoded frames are published to. Must outlive this object.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 ******************************************************************************/
FrameReceiver::FrameReceiver(const std::string& szEndpoint, FrameChannel<IncomingFrame>& stChannel) :
    m_szEndpoint(szEndpoint), m_stChannel(stChannel), m_zmqContext(constants::RECEIVER_IO_THREADS), m_zmqSocket(m_zmqContext, zmq::socket_type::sub),
    m_bConnected(false), m_unReceivedCount(0), m_unMalformedCount(0)
{
    try
    {
        // Subscribe to everything and wake up regularly so a stop request is noticed.
        m_zmqSocket.set(zmq::sockopt::subscribe, "");
        m_zmqSocket.set(zmq::sockopt::rcvtimeo, constants::RECEIVER_RECV_TIMEOUT_MS);
        m_zmqSocket.set(zmq::sockopt::linger, 0);
        m_zmqSocket.connect(m_szEndpoint);
        m_bConnected = true;

        // Submit logger message.
        LOG_INFO(logging::g_qSharedLogger, "Frame receiver subscribed to {}", m_szEndpoint);
    }
    catch (const zmq::error_t& zmqError)
    {
        // Submit logger message.
        LOG_ERROR(logging::g_qSharedLogger, "Frame receiver could not connect to {}: {}", m_szEndpoint, zmqError.what());
    }
}

/******************************************************************************
 * @brief Destroy the FrameReceiver::FrameReceiver object. Stops and joins the
 *      thread before the socket is closed.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 ******************************************************************************/
FrameReceiver::~FrameReceiver()
{
    // Stop threaded code.
    this->RequestStop();
    this->Join();

    m_zmqSocket.close();

    // Submit logger message.
    LOG_INFO(logging::g_qSharedLogger,
             "Frame receiver for {} closed. {} messages received, {} malformed.",
             m_szEndpoint,
             m_unReceivedCount.load(),
             m_unMalformedCount.load());
}

/******************************************************************************
 * @brief Waits for one message (bounded by the receive timeout), decodes it and
 *      publishes it. Runs on the receiver thread.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 ******************************************************************************/
void FrameReceiver::ThreadedContinuousCode()
{
    if (!m_bConnected)
    {
        // Nothing to read from. Shut the thread down.
        this->RequestStop();

        // Submit logger message.
        LOG_CRITICAL(logging::g_qSharedLogger, "Frame receiver was started, but it is not connected to {}!", m_szEndpoint);
        return;
    }

    zmq::message_t zmqMessage;
    try
    {
        zmq::recv_result_t stResult = m_zmqSocket.recv(zmqMessage, zmq::recv_flags::none);
        if (!stResult.has_value())
        {
            // Timed out, check for a stop request and come back.
            return;
        }

        // Only the first part carries the payload. Drain anything else.
        while (zmqMessage.more())
        {
            zmq::message_t zmqExtraPart;
            if (!m_zmqSocket.recv(zmqExtraPart, zmq::recv_flags::none).has_value() || !zmqExtraPart.more())
            {
                break;
            }
        }
    }
    catch (const zmq::error_t& zmqError)
    {
        // Submit logger message.
        LOG_WARNING(logging::g_qSharedLogger, "Frame receiver failed to receive from {}: {}", m_szEndpoint, zmqError.what());
        return;
    }

    ++m_unReceivedCount;

    std::string szError;
    std::optional<IncomingFrame> stFrame =
        FrameMessage::Decode(std::string_view(static_cast<const char*>(zmqMessage.data()), zmqMessage.size()), szError);
    if (!stFrame.has_value())
    {
        ++m_unMalformedCount;

        // Submit logger message.
        LOG_WARNING(logging::g_qSharedLogger, "Dropped malformed message #{} from {}: {}", m_unReceivedCount.load(), m_szEndpoint, szError);
        return;
    }

    // Submit logger message.
    LOG_TRACE_L1(logging::g_qSharedLogger,
                 "Received frame {} ({}x{}) gaze ({:.4f}, {:.4f})",
                 stFrame->nFrameNumber,
                 stFrame->cvImage.cols,
                 stFrame->cvImage.rows,
                 stFrame->dGazeX,
                 stFrame->dGazeY);

    m_stChannel.Publish(std::move(*stFrame));
}
