/**
 * @file   clock.hpp
 * @brief  Time source abstraction used by the recurring scheduler.
 *
 * Declares the Waker used to rouse the scheduler loop, the Timer handle
 * shared by one-shot timers and periodic tickers, the abstract Clock that
 * creates them, and RealClock, the steady-clock implementation used outside
 * of tests.
 *
 * @author recurrent contributors
 * @date   2026-10-19
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

namespace recurrent {

/// Monotonic clock every deadline is expressed in.
using SteadyClock = std::chrono::steady_clock;
/// Time point in the above clock.
using TimePoint   = SteadyClock::time_point;
/// Scheduling resolution (milliseconds).
using Duration    = std::chrono::milliseconds;

/**
 * @class Waker
 * @brief Wake-up line from event producers to the scheduler loop.
 *
 * Producers call notify() after publishing an event. The loop samples
 * epoch() before it polls its event sources and, if nothing was ready,
 * blocks in waitFor() until the epoch moves on or a deadline passes. A
 * notification racing with the poll therefore bumps the epoch and is
 * never lost.
 */
class Waker {
public:
    /** @return Number of notifications delivered so far. */
    std::uint64_t epoch() const;

    /** @brief Record an event and wake the waiting loop. */
    void notify();

    /**
     * @brief Block until a notification newer than `seen` arrives.
     *
     * @param seen      Epoch observed before the caller polled its sources.
     * @param deadline  Latest wake-up time; std::nullopt waits indefinitely.
     */
    void waitFor(std::uint64_t seen, std::optional<TimePoint> deadline);

private:
    mutable std::mutex      m_mtx;      ///< Guards m_epoch
    std::condition_variable m_cv;       ///< Signalled on every notify()
    std::uint64_t           m_epoch{0}; ///< Notification counter
};

/// Shared handle; timers created by a Clock keep the loop's Waker alive.
using WakerPtr = std::shared_ptr<Waker>;

/**
 * @class Timer
 * @brief Readiness event produced by a Clock.
 *
 * Used both for one-shot timers (Clock::after) and for periodic tickers
 * (Clock::newTicker). The scheduler loop polls fired() after every wake-up;
 * between polls it sleeps until deadline().
 */
class Timer {
public:
    virtual ~Timer() = default;

    /**
     * @brief Consume one pending expiry.
     * @return True if the timer expired since the previous call.
     */
    virtual bool fired() = 0;

    /**
     * @brief Instant of the next expiry.
     * @return The deadline, or std::nullopt if the expiry cannot be
     *         predicted (the timer then wakes the loop through its Waker)
     *         or will never come.
     */
    virtual std::optional<TimePoint> deadline() const = 0;

    /** @brief Cancel the timer; fired() keeps returning false afterwards. */
    virtual void stop() = 0;
};

using TimerPtr = std::unique_ptr<Timer>;

/**
 * @class Clock
 * @brief Factory of timers, injected into the Scheduler.
 */
class Clock {
public:
    virtual ~Clock() = default;

    /**
     * @brief Create a timer that expires once, `delay` from now.
     * @param delay  Time until expiry.
     * @param waker  Loop waker to notify on expiry (if the timer needs it).
     */
    virtual TimerPtr after(Duration delay, WakerPtr waker) = 0;

    /**
     * @brief Create a ticker that expires every `period` until stopped.
     *
     * Ticks missed while nobody polled collapse into a single pending tick.
     *
     * @param period Tick period; must be positive.
     * @param waker  Loop waker to notify on every tick (if needed).
     */
    virtual TimerPtr newTicker(Duration period, WakerPtr waker) = 0;
};

using ClockPtr = std::shared_ptr<Clock>;

/**
 * @class RealClock
 * @brief Clock backed by std::chrono::steady_clock.
 *
 * Its timers are plain deadlines: they never call the waker, the loop
 * sleeps until the earliest deadline instead. They must be polled from
 * the thread that owns them.
 */
class RealClock final : public Clock {
public:
    TimerPtr after(Duration delay, WakerPtr waker) override;
    TimerPtr newTicker(Duration period, WakerPtr waker) override;
};

/** @brief Earlier of two optional deadlines (std::nullopt = none). */
std::optional<TimePoint> earliest(std::optional<TimePoint> a,
                                  std::optional<TimePoint> b) noexcept;

} // namespace recurrent
