/**
 * @file   manual_clock.hpp
 * @brief  Hand-driven Clock for deterministic scheduler tests.
 *
 * ManualClock never expires anything by itself: the test calls elapse() to
 * expire the current after() timer and tick() to fire the ticker. Both
 * events hold at most one pending occurrence, like a one-slot channel.
 * Every after()/newTicker() request is recorded for inspection.
 *
 * @author recurrent contributors
 * @date   2026-10-19
 */
#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include "../src/core/clock.hpp"

namespace recurrent::testing {

class ManualClock final : public Clock {
public:
    TimerPtr after(Duration delay, WakerPtr waker) override {
        std::lock_guard<std::mutex> lk(m_shared->mtx);
        m_shared->afterArgs.push_back(delay);
        m_shared->waker = std::move(waker);
        return std::make_unique<Handle>(m_shared, Kind::After);
    }

    TimerPtr newTicker(Duration period, WakerPtr waker) override {
        std::lock_guard<std::mutex> lk(m_shared->mtx);
        m_shared->tickerArgs.push_back(period);
        m_shared->waker = std::move(waker);
        return std::make_unique<Handle>(m_shared, Kind::Tick);
    }

    /// Expire the interval timer currently armed by the loop.
    void elapse() { raise(Kind::After); }

    /// Fire the throttle ticker once.
    void tick() { raise(Kind::Tick); }

    std::vector<Duration> afterArgs() const {
        std::lock_guard<std::mutex> lk(m_shared->mtx);
        return m_shared->afterArgs;
    }

    std::vector<Duration> tickerArgs() const {
        std::lock_guard<std::mutex> lk(m_shared->mtx);
        return m_shared->tickerArgs;
    }

    /// True while a tick() has not been consumed yet.
    bool tickPending() const {
        std::lock_guard<std::mutex> lk(m_shared->mtx);
        return m_shared->tickPending;
    }

    bool tickerStopped() const {
        std::lock_guard<std::mutex> lk(m_shared->mtx);
        return m_shared->tickerStopped;
    }

private:
    enum class Kind { After, Tick };

    struct Shared {
        mutable std::mutex    mtx;
        std::vector<Duration> afterArgs;
        std::vector<Duration> tickerArgs;
        WakerPtr              waker;
        bool                  afterPending{false};
        bool                  tickPending{false};
        bool                  tickerStopped{false};

        bool& pending(Kind k) { return k == Kind::After ? afterPending : tickPending; }
    };

    class Handle final : public Timer {
    public:
        Handle(std::shared_ptr<Shared> shared, Kind kind)
        : m_shared(std::move(shared)), m_kind(kind) {}

        bool fired() override {
            std::lock_guard<std::mutex> lk(m_shared->mtx);
            bool& flag = m_shared->pending(m_kind);
            if (m_stopped || !flag) return false;
            flag = false;
            return true;
        }

        // Expiries are pushed through the waker, never predicted.
        std::optional<TimePoint> deadline() const override { return std::nullopt; }

        void stop() override {
            std::lock_guard<std::mutex> lk(m_shared->mtx);
            m_stopped = true;
            if (m_kind == Kind::Tick) m_shared->tickerStopped = true;
        }

    private:
        std::shared_ptr<Shared> m_shared;
        Kind                    m_kind;
        bool                    m_stopped{false};
    };

    void raise(Kind k) {
        WakerPtr waker;
        {
            std::lock_guard<std::mutex> lk(m_shared->mtx);
            m_shared->pending(k) = true;
            waker = m_shared->waker;
        }
        if (waker) waker->notify();
    }

    std::shared_ptr<Shared> m_shared = std::make_shared<Shared>();
};

} // namespace recurrent::testing
