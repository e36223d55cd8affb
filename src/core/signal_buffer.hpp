/**
 * @file   signal_buffer.hpp
 * @brief  Single-slot coalescing mailbox for scheduler signals.
 *
 * @author recurrent contributors
 * @date   2026-10-19
 */
#pragma once

#include <atomic>
#include "clock.hpp"

namespace recurrent {

/**
 * @class SignalBuffer
 * @brief Holds at most one pending signal.
 *
 * Any thread may post(); only the scheduler loop take()s. Posting while a
 * signal is already pending, or after close(), is a silent no-op, so a
 * poster never blocks beyond the Waker's brief notify.
 */
class SignalBuffer {
public:
    /**
     * @brief Construct an empty, open buffer.
     * @param waker  Woken whenever a post fills the empty slot.
     */
    explicit SignalBuffer(WakerPtr waker);

    SignalBuffer(const SignalBuffer&) = delete;
    SignalBuffer& operator=(const SignalBuffer&) = delete;

    /**
     * @brief Post a signal.
     * @return True if the slot was empty and now holds the signal; false if
     *         the signal was coalesced into a pending one or the buffer is
     *         closed.
     */
    bool post();

    /**
     * @brief Consume the pending signal, if any.
     * @return True if a signal was pending.
     */
    bool take() noexcept;

    /** @return True if a signal is waiting to be taken. */
    bool pending() const noexcept;

    /** @brief Refuse further posts and drop the pending signal. */
    void close() noexcept;

    /** @return True once close() has been called. */
    bool closed() const noexcept;

private:
    WakerPtr          m_waker;          ///< Loop to wake on a fresh post
    std::atomic<bool> m_pending{false}; ///< The single slot
    std::atomic<bool> m_closed{false};  ///< Set when the loop exits
};

} // namespace recurrent
