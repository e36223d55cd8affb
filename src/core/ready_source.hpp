/**
 * @file   ready_source.hpp
 * @brief  Gate deciding when a pending signal may trigger the target.
 *
 * The gate is a tagged variant chosen once when the scheduler loop starts:
 * Immediate lets every posted signal through, Throttled only lets a signal
 * through on a tick of its own ticker.
 *
 * @author recurrent contributors
 * @date   2026-10-19
 */
#pragma once

#include <optional>
#include <variant>
#include "clock.hpp"
#include "signal_buffer.hpp"

namespace recurrent {

/**
 * @class ReadySource
 * @brief Immediate | Throttled(ticker) gate in front of the SignalBuffer.
 */
class ReadySource {
public:
    /// Unthrottled: a pending signal passes as soon as it is seen.
    struct Immediate {};

    /// Throttled: a pending signal passes only on a ticker tick.
    struct Throttled {
        TimerPtr ticker;  ///< Gate ticker, period = throttle window
    };

    /** @brief Build the unthrottled gate. */
    static ReadySource immediate();

    /**
     * @brief Build a throttled gate.
     * @param ticker  Ticker of the throttle window, owned by the gate.
     */
    static ReadySource throttled(TimerPtr ticker);

    /**
     * @brief Decide whether the target fires now.
     *
     * Immediate: takes the pending signal, if any. Throttled: consumes one
     * tick; on a tick, takes the pending signal, if any. A tick that finds
     * the buffer empty is lost.
     *
     * @param signals  Buffer to take the signal from.
     * @return True if a signal was released (and consumed).
     */
    bool ready(SignalBuffer& signals);

    /** @return When the gate next needs polling (the next tick), if ever. */
    std::optional<TimePoint> deadline() const;

    /** @return True for the Throttled variant. */
    bool isThrottled() const noexcept;

    /** @brief Stop the owned ticker, if any. */
    void release();

private:
    using Gate = std::variant<Immediate, Throttled>;

    explicit ReadySource(Gate gate);

    Gate m_gate;
};

} // namespace recurrent
