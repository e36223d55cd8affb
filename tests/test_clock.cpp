// test_clock.cpp
#include <QtTest>

#include <thread>

#include "../src/core/clock.hpp"

using namespace std::chrono_literals;
using recurrent::Duration;
using recurrent::RealClock;
using recurrent::SteadyClock;
using recurrent::Waker;

class ClockTest : public QObject {
    Q_OBJECT

private slots:
    void afterFiresOnce();
    void tickerCollapsesMissedTicks();
    void stoppedTickerStaysQuiet();
    void tickerRejectsNonPositivePeriod();
    void earliestPicksSoonerDeadline();
    void wakerWakesWaitingThread();
    void wakerHonoursDeadline();
};

void ClockTest::afterFiresOnce()
{
    RealClock clock;
    auto before = SteadyClock::now();
    auto timer = clock.after(30ms, std::make_shared<Waker>());

    QVERIFY(timer->deadline());
    QVERIFY(*timer->deadline() >= before + 30ms);
    QVERIFY(!timer->fired());

    std::this_thread::sleep_until(*timer->deadline());
    QVERIFY(timer->fired());
    QVERIFY(!timer->fired());
    QVERIFY(!timer->deadline());
}

void ClockTest::tickerCollapsesMissedTicks()
{
    RealClock clock;
    auto ticker = clock.newTicker(50ms, std::make_shared<Waker>());

    // Two periods go by unpolled; they surface as a single tick.
    std::this_thread::sleep_for(120ms);
    QVERIFY(ticker->fired());
    QVERIFY(!ticker->fired());
    QVERIFY(ticker->deadline());

    std::this_thread::sleep_until(*ticker->deadline());
    QVERIFY(ticker->fired());
}

void ClockTest::stoppedTickerStaysQuiet()
{
    RealClock clock;
    auto ticker = clock.newTicker(5ms, std::make_shared<Waker>());

    ticker->stop();
    std::this_thread::sleep_for(15ms);
    QVERIFY(!ticker->fired());
    QVERIFY(!ticker->deadline());
}

void ClockTest::tickerRejectsNonPositivePeriod()
{
    RealClock clock;
    bool thrown = false;
    try {
        clock.newTicker(Duration::zero(), std::make_shared<Waker>());
    }
    catch (const std::invalid_argument&) {
        thrown = true;
    }
    QVERIFY(thrown);
}

void ClockTest::earliestPicksSoonerDeadline()
{
    auto now = SteadyClock::now();
    std::optional<recurrent::TimePoint> none;

    QVERIFY(!recurrent::earliest(none, none));
    QVERIFY(recurrent::earliest(now, none) == now);
    QVERIFY(recurrent::earliest(none, now) == now);
    QVERIFY(recurrent::earliest(now + 5ms, now) == now);
    QVERIFY(recurrent::earliest(now, now + 5ms) == now);
}

void ClockTest::wakerWakesWaitingThread()
{
    Waker waker;
    auto seen = waker.epoch();

    std::thread notifier([&]{
        std::this_thread::sleep_for(20ms);
        waker.notify();
    });
    waker.waitFor(seen, std::nullopt);
    notifier.join();

    QCOMPARE(waker.epoch(), seen + 1);

    // A notification that already happened is not waited for again.
    waker.waitFor(seen, std::nullopt);
}

void ClockTest::wakerHonoursDeadline()
{
    Waker waker;
    auto start = SteadyClock::now();
    waker.waitFor(waker.epoch(), start + 30ms);
    QVERIFY(SteadyClock::now() >= start + 30ms);
}

QTEST_GUILESS_MAIN(ClockTest)
#include "test_clock.moc"
