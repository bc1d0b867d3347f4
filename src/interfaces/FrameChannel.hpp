/******************************************************************************
 * @brief Defines the FrameChannel class, a single slot mailbox that hands the
 *      newest item from a producer thread to a consumer thread.
 *
 * @file FrameChannel.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef FRAME_CHANNEL_HPP
#define FRAME_CHANNEL_HPP

/// \cond
#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>

/// \endcond

/******************************************************************************
 * @brief Capacity one, overwrite on full channel. Publish() never blocks and
 *      never fails, it replaces whatever the consumer has not taken yet. Each
 *      published item is handed out at most once.
 *
 * @tparam T - The item type. Stored by value, so the producer and consumer
 *      never share the item's storage unless T itself shares it.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 ******************************************************************************/
template<typename T>
class FrameChannel
{
    public:
        FrameChannel() : m_bAvailable(false), m_unDroppedCount(0) {}
        FrameChannel(const FrameChannel&)            = delete;
        FrameChannel& operator=(const FrameChannel&) = delete;

        /******************************************************************************
         * @brief Stores an item in the slot, replacing any item not yet taken.
         *
         * @param stItem - The item to publish.
         *
         * @author clayjay3 (claytonraycowen@gmail.com)
         * @date 2025-12-29
         ******************************************************************************/
        void Publish(T stItem)
        {
            std::lock_guard<std::mutex> lkSlotLock(m_muSlotMutex);
            if (m_bAvailable)
            {
                ++m_unDroppedCount;
            }
            m_stSlot     = std::move(stItem);
            m_bAvailable = true;
        }

        /******************************************************************************
         * @brief Takes the latest item if one was published since the last take.
         *
         * @return std::optional<T> - The item, or nullopt if nothing new is available.
         *
         * @author clayjay3 (claytonraycowen@gmail.com)
         * @date 2025-12-29
         ******************************************************************************/
        std::optional<T> TryTake()
        {
            std::lock_guard<std::mutex> lkSlotLock(m_muSlotMutex);
            return this->TakeLocked();
        }

        // Items that were overwritten before the consumer took them.
        uint64_t GetDroppedCount() const
        {
            std::lock_guard<std::mutex> lkSlotLock(m_muSlotMutex);
            return m_unDroppedCount;
        }

    private:
        // Caller must hold m_muSlotMutex.
        std::optional<T> TakeLocked()
        {
            if (!m_bAvailable)
            {
                return std::nullopt;
            }

            m_bAvailable = false;
            std::optional<T> stItem(std::move(m_stSlot));
            m_stSlot = T();
            return stItem;
        }

        mutable std::mutex m_muSlotMutex;
        T m_stSlot;
        bool m_bAvailable;
        uint64_t m_unDroppedCount;
};

#endif    // FRAME_CHANNEL_HPP
