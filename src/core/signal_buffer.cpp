/**
 * @file   signal_buffer.cpp
 * @brief  Implements SignalBuffer: try-post, take and close on an atomic slot.
 *
 * @author recurrent contributors
 * @date   2026-10-19
 */

#include "signal_buffer.hpp"

namespace recurrent {

SignalBuffer::SignalBuffer(WakerPtr waker)
: m_waker(std::move(waker))
{}

bool SignalBuffer::post() {
    if (m_closed.load()) return false;
    if (m_pending.exchange(true)) return false;   // coalesced
    if (m_waker) m_waker->notify();
    return true;
}

bool SignalBuffer::take() noexcept {
    return m_pending.exchange(false);
}

bool SignalBuffer::pending() const noexcept {
    return m_pending.load();
}

void SignalBuffer::close() noexcept {
    m_closed.store(true);
    m_pending.store(false);
}

bool SignalBuffer::closed() const noexcept {
    return m_closed.load();
}

} // namespace recurrent
