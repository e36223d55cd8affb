/**
 * @file   scheduler.cpp
 * @brief  Implements Scheduler: option handling, lifecycle, and the loop
 *         that merges interval, signal and shutdown events.
 *
 * @author recurrent contributors
 * @date   2026-10-19
 */

#include "scheduler.hpp"

#include <QDebug>
#include <stdexcept>

namespace recurrent {

namespace {

// Apply options over the defaults and reject unusable durations.
Settings configure(std::vector<Option> options) {
    Settings s;
    for (auto& opt : options)
        if (opt) opt(s);

    if (s.interval <= Duration::zero())
        throw std::invalid_argument("scheduler interval must be positive");
    if (s.throttle && *s.throttle <= Duration::zero())
        throw std::invalid_argument("scheduler throttle window must be positive");
    if (!s.clock)
        s.clock = std::make_shared<RealClock>();
    return s;
}

// Releases everything the loop owns, whichever way run() leaves.
struct LoopExit {
    SignalBuffer& signals;
    ReadySource&  gate;
    TimerPtr&     interval;

    ~LoopExit() {
        signals.close();
        gate.release();
        if (interval) interval->stop();
    }
};

} // namespace

Option withInterval(Duration interval) {
    return [interval](Settings& s) { s.interval = interval; };
}

Option withThrottle(Duration window) {
    return [window](Settings& s) { s.throttle = window; };
}

Option withClock(ClockPtr clock) {
    return [clock = std::move(clock)](Settings& s) { s.clock = clock; };
}

Scheduler::Scheduler(Target target, std::vector<Option> options)
: m_target(std::move(target))
, m_settings(configure(std::move(options)))
, m_waker(std::make_shared<Waker>())
, m_signals(m_waker)
{
    if (!m_target)
        throw std::invalid_argument("scheduler target is empty");
}

Scheduler::~Scheduler() {
    if (state() == State::Running) stop();
    if (m_loop.valid()) m_loop.wait();
}

void Scheduler::start() {
    auto expected = State::Created;
    if (!m_state.compare_exchange_strong(expected, State::Running)) {
        qWarning() << "[scheduler] start() ignored:"
                   << (expected == State::Running ? "already running" : "already stopped");
        return;
    }

    qDebug() << "[scheduler] start interval=" << m_settings.interval.count() << "ms"
             << "throttle=" << (m_settings.throttle ? m_settings.throttle->count() : 0) << "ms";
    m_loop = std::async(std::launch::async, [this]{ run(); }).share();
}

void Scheduler::stop() {
    auto expected = State::Running;
    if (m_state.compare_exchange_strong(expected, State::Stopped)) {
        m_waker->notify();
        qDebug() << "[scheduler] stop requested";
        return;
    }
    if (expected == State::Created &&
        m_state.compare_exchange_strong(expected, State::Stopped))
    {
        qDebug() << "[scheduler] stopped before start";
        return;
    }
    qWarning() << "[scheduler] stop() ignored: already stopped";
}

void Scheduler::signal() {
    m_signals.post();
}

void Scheduler::wait() {
    if (m_loop.valid()) m_loop.get();
}

bool Scheduler::finished() const {
    return m_loop.valid() &&
           m_loop.wait_for(Duration::zero()) == std::future_status::ready;
}

/**
 * Loop body, run on the task launched by start().
 *
 * Each pass samples the waker epoch, then checks, in order: shutdown, the
 * gate (fire the target inline), the interval timer (post an internal
 * signal). With nothing to do it sleeps until a notification or the
 * earliest timer deadline. The interval timer is re-armed after every
 * firing and every interval post.
 */
void Scheduler::run() {
    Clock& clock = *m_settings.clock;
    ReadySource gate = m_settings.throttle
        ? ReadySource::throttled(clock.newTicker(*m_settings.throttle, m_waker))
        : ReadySource::immediate();
    TimerPtr interval = clock.after(m_settings.interval, m_waker);
    LoopExit guard{m_signals, gate, interval};

    try {
        for (;;) {
            const auto seen = m_waker->epoch();
            if (m_state.load() == State::Stopped) break;

            if (gate.ready(m_signals)) {
                // stop() may have returned while the gate was polled.
                if (m_state.load() == State::Stopped) break;
                m_target();
                interval = clock.after(m_settings.interval, m_waker);
                continue;
            }

            if (interval->fired()) {
                m_signals.post();
                interval = clock.after(m_settings.interval, m_waker);
                continue;
            }

            m_waker->waitFor(seen, earliest(interval->deadline(), gate.deadline()));
        }
    }
    catch (const std::exception& e) {
        qCritical() << "[scheduler] loop terminated by exception:" << e.what();
        throw;
    }

    qDebug() << "[scheduler] loop exited";
}

} // namespace recurrent
