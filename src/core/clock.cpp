/**
 * @file   clock.cpp
 * @brief  Implements Waker and the steady-clock timers handed out by RealClock.
 *
 * @author recurrent contributors
 * @date   2026-10-19
 */

#include "clock.hpp"

#include <stdexcept>

namespace recurrent {

namespace {

// One-shot deadline: expires once, then goes quiet.
class OneShotTimer final : public Timer {
public:
    explicit OneShotTimer(TimePoint due) : m_due(due) {}

    bool fired() override {
        if (m_done || SteadyClock::now() < m_due) return false;
        m_done = true;
        return true;
    }

    std::optional<TimePoint> deadline() const override {
        if (m_done) return std::nullopt;
        return m_due;
    }

    void stop() override { m_done = true; }

private:
    TimePoint m_due;
    bool      m_done{false};
};

// Periodic deadline. Late polls see one tick no matter how many periods
// went by, and the next tick stays on the period grid set at creation.
class PeriodicTimer final : public Timer {
public:
    PeriodicTimer(TimePoint first, Duration period)
    : m_next(first)
    , m_period(period)
    {}

    bool fired() override {
        if (m_stopped) return false;
        auto now = SteadyClock::now();
        if (now < m_next) return false;
        auto missed = (now - m_next) / m_period;
        m_next += m_period * (missed + 1);
        return true;
    }

    std::optional<TimePoint> deadline() const override {
        if (m_stopped) return std::nullopt;
        return m_next;
    }

    void stop() override { m_stopped = true; }

private:
    TimePoint m_next;
    Duration  m_period;
    bool      m_stopped{false};
};

} // namespace

std::uint64_t Waker::epoch() const {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_epoch;
}

void Waker::notify() {
    {
        std::lock_guard<std::mutex> lk(m_mtx);
        ++m_epoch;
    }
    m_cv.notify_all();
}

void Waker::waitFor(std::uint64_t seen, std::optional<TimePoint> deadline) {
    std::unique_lock<std::mutex> lk(m_mtx);
    auto moved = [&]{ return m_epoch != seen; };
    if (deadline)
        m_cv.wait_until(lk, *deadline, moved);
    else
        m_cv.wait(lk, moved);
}

TimerPtr RealClock::after(Duration delay, WakerPtr) {
    return std::make_unique<OneShotTimer>(SteadyClock::now() + delay);
}

TimerPtr RealClock::newTicker(Duration period, WakerPtr) {
    if (period <= Duration::zero())
        throw std::invalid_argument("ticker period must be positive");
    return std::make_unique<PeriodicTimer>(SteadyClock::now() + period, period);
}

std::optional<TimePoint> earliest(std::optional<TimePoint> a,
                                  std::optional<TimePoint> b) noexcept
{
    if (!a) return b;
    if (!b) return a;
    return *a < *b ? a : b;
}

} // namespace recurrent
