/**
 * @file   runtime_main.cpp
 * @brief  Standalone runtime executing one schedule document: runs the
 *         configured command every interval, accepts signals over UDP and
 *         stdin, and publishes a telemetry packet after every firing.
 *
 * @author recurrent contributors
 * @date   2026-10-19
 */
#include <atomic>
#include <chrono>
#include <cstdint>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include <sys/select.h>

#include <QCoreApplication>
#include <QDebug>
#include <QProcess>
#include <QString>
#include <QStringList>

#include "../core/persistence.hpp"
#include "../core/scheduler.hpp"
#include "../core/io/protocol.hpp"
#include "../core/io/udp_channel.hpp"

using namespace std::chrono_literals;
using recurrent::Scheduler;
namespace io = recurrent::io;

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
namespace {

/**
 * Runs the schedule's command synchronously.
 *
 * @param command Program followed by its arguments; empty = nothing to run.
 * @return The exit code, -2 if the program could not be started, -1 if it
 *         crashed (QProcess::execute conventions), 0 with no command.
 */
int runCommand(const std::vector<std::string>& command) {
    if (command.empty()) return 0;

    QStringList args;
    for (std::size_t i = 1; i < command.size(); ++i)
        args << QString::fromStdString(command[i]);
    return QProcess::execute(QString::fromStdString(command.front()), args);
}

/// Milliseconds since the UNIX epoch, for telemetry timestamps.
std::int64_t wallClockMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/**
 * Checks if stdin has data available to read without blocking.
 */
bool stdinHasData() {
    fd_set rfds;
    FD_ZERO(&rfds);
    FD_SET(STDIN_FILENO, &rfds);
    timeval tv{0, 0};
    return select(STDIN_FILENO + 1, &rfds, nullptr, nullptr, &tv) > 0;
}

} // namespace ------------------------------------------------------------------

// -----------------------------------------------------------------------------
// Ctrl-C handling
// -----------------------------------------------------------------------------
static std::atomic_bool g_stop{false};

static void onSigInt(int) { g_stop = true; }

// -----------------------------------------------------------------------------
// MAIN
// -----------------------------------------------------------------------------

/**
 * Loads the schedule, starts the scheduler, then pumps UDP and stdin
 * commands until asked to quit.
 *
 * Exit codes: 0 clean shutdown, 1 bad schedule, 2 channel setup failure,
 * 3 target failure.
 */
int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);
    const std::string schedulePath = (argc > 1 ? argv[1] : "examples/heartbeat.schedule.json");
    const std::string bindAddr     = (argc > 2 ? argv[2] : "0.0.0.0:45464");
    const std::string peerAddr     = (argc > 3 ? argv[3] : "127.0.0.1:45465");

    // 1) Load ------------------------------------------------------------------
    recurrent::persistence::ScheduleDocument doc;
    std::string msg;
    if (!recurrent::persistence::loadFile(schedulePath, doc, &msg)) {
        std::cerr << "[runtime] ERROR: cannot load '" << schedulePath << "' – " << msg << "\n";
        return 1;
    }
    if (!msg.empty())
        qWarning() << "[runtime]" << QString::fromStdString(msg);

    // 2) Networking ------------------------------------------------------------
    auto chan = std::make_shared<io::UdpChannel>(bindAddr, peerAddr);
    if (!chan->isOpen()) {
        std::cerr << "[runtime] ERROR: " << chan->error() << "\n";
        return 2;
    }

    // 3) Scheduler -------------------------------------------------------------
    // The target only runs on the scheduler's loop task, so seq needs no guard.
    std::uint64_t seq = 0;
    auto target = [&doc, &seq, chan]{
        int code = runCommand(doc.command);
        if (code != 0)
            qWarning() << "[runtime]" << QString::fromStdString(doc.name)
                       << "command exited with" << code;

        io::FiredEvent ev{++seq, wallClockMs(), doc.name, code};
        if (!chan->send(io::firedPacket(ev)))
            qWarning() << "[runtime] telemetry send failed, seq" << ev.seq;
        qDebug() << "[runtime] fired" << QString::fromStdString(doc.name) << "seq" << ev.seq;
    };

    Scheduler scheduler(target, recurrent::persistence::optionsFrom(doc));
    scheduler.start();
    qInfo() << "[runtime] running" << QString::fromStdString(doc.name)
            << "on" << QString::fromStdString(bindAddr);

    // 4) Event loop: UDP + stdin → signal / shutdown ---------------------------
    std::signal(SIGINT, onSigInt);

    while (!g_stop && !scheduler.finished()) {
        io::Packet p;
        while (chan->poll(p)) {
            switch (io::parseCommand(p)) {
              case io::Command::Signal:   scheduler.signal(); break;
              case io::Command::Shutdown: g_stop = true;      break;
              case io::Command::Unknown:
              default:
                qDebug() << "[runtime] ignoring packet" << QString::fromStdString(p.json);
            }
        }

        if (stdinHasData()) {
            std::string line;
            if (!std::getline(std::cin, line)) {
                g_stop = true;              // Ctrl-D
            } else if (line == "signal") {
                scheduler.signal();
            } else if (line == "quit") {
                g_stop = true;
            }
        }

        std::this_thread::sleep_for(10ms);
    }

    // 5) Shutdown --------------------------------------------------------------
    scheduler.stop();
    try {
        scheduler.wait();
    }
    catch (const std::exception& e) {
        std::cerr << "[runtime] ERROR: schedule '" << doc.name << "' died: " << e.what() << "\n";
        return 3;
    }
    qInfo() << "[runtime] stopped after" << seq << "firings";
    return 0;
}
