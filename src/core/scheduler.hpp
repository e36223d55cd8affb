/**
 * @file   scheduler.hpp
 * @brief  Recurring single-task scheduler with out-of-band signals and
 *         optional throttling.
 *
 * Provides the Scheduler class, which invokes a target callback every
 * interval on a background task, lets callers request an immediate extra
 * invocation through signal(), and, when throttled, coalesces bursts of
 * signals into at most one invocation per throttle window.
 *
 * @author recurrent contributors
 * @date   2026-10-19
 */
#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <optional>
#include <vector>

#include "clock.hpp"
#include "ready_source.hpp"
#include "signal_buffer.hpp"

namespace recurrent {

/**
 * @struct Settings
 * @brief Construction-time configuration assembled from Options.
 */
struct Settings {
    Duration                interval{std::chrono::seconds(1)}; ///< Automatic firing period
    std::optional<Duration> throttle;                          ///< Throttle window; empty = unthrottled
    ClockPtr                clock;                             ///< Time source; empty = RealClock
};

/// Composable modifier applied to Settings by the Scheduler constructor.
using Option = std::function<void(Settings&)>;

/** @brief Set the automatic firing period (default one second). */
Option withInterval(Duration interval);

/** @brief Allow at most one signal-triggered firing per `window`. */
Option withThrottle(Duration window);

/** @brief Replace the real steady clock (used by tests). */
Option withClock(ClockPtr clock);

/**
 * @class Scheduler
 * @brief Runs a target periodically and on demand, never concurrently.
 *
 * Lifecycle is Created → Running → Stopped. start() and stop() return
 * immediately; signal() never blocks and may be called from any thread.
 * start(), stop() and wait() belong to the owning thread.
 *
 * The loop runs on its own task. Each wake-up it either runs the target
 * (a signal passed the gate), turns an elapsed interval into a signal, or
 * exits on stop. Both trigger origins share the single-slot buffer, so at
 * most one trigger is ever pending.
 *
 * A target that throws ends the loop for good; wait() rethrows it.
 */
class Scheduler {
public:
    /// Callback invoked on every firing.
    using Target = std::function<void()>;

    /// Lifecycle states.
    enum class State { Created, Running, Stopped };

    /**
     * @brief Configure a scheduler; nothing runs until start().
     * @param target   Callback to invoke.
     * @param options  Modifiers, applied in order.
     * @throws std::invalid_argument on an empty target or a non-positive
     *         interval or throttle window.
     */
    explicit Scheduler(Target target, std::vector<Option> options = {});

    /** @brief Requests stop and waits for the loop task to end. */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /** @brief Launch the loop task. Ignored unless Created. */
    void start();

    /**
     * @brief Ask the loop to exit. Does not wait for an in-flight target.
     *
     * Repeated calls are ignored; stopping a never-started scheduler only
     * prevents it from starting later.
     */
    void stop();

    /** @brief Request an immediate firing; coalesced if one is pending. */
    void signal();

    /**
     * @brief Block until the loop task has ended.
     *
     * Returns at once if the loop was never started.
     * @throws Whatever the target threw, if that is what ended the loop.
     */
    void wait();

    /** @return True once the loop task has ended (normally or not). */
    bool finished() const;

    /** @return Current lifecycle state. */
    State state() const noexcept { return m_state.load(); }

    /** @return Configured interval. */
    Duration interval() const noexcept { return m_settings.interval; }

    /** @return Configured throttle window, if any. */
    const std::optional<Duration>& throttle() const noexcept { return m_settings.throttle; }

private:
    void run();

    const Target                  m_target;     ///< Callback
    const Settings                m_settings;   ///< Interval, throttle and clock

    WakerPtr                      m_waker;      ///< Wakes the loop
    SignalBuffer                  m_signals;    ///< Single-slot mailbox
    std::atomic<State>            m_state{State::Created}; ///< Stopped doubles as the shutdown event
    std::shared_future<void>      m_loop;       ///< Loop task
};

} // namespace recurrent
