/**
 * @file   main.cpp
 * @brief  recurrent_ctl: sends one control command ("signal" or "shutdown")
 *         to a running recurrent_runtime over UDP, or watches its telemetry.
 *
 * @author recurrent contributors
 * @date   2026-10-19
 */
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "../../core/io/protocol.hpp"
#include "../../core/io/udp_channel.hpp"

using namespace std::chrono_literals;
namespace io = recurrent::io;

static std::atomic_bool g_stop{false};

static void onSigInt(int) { g_stop = true; }

namespace {

void usage() {
    std::cerr << "usage: recurrent_ctl <signal|shutdown> [peerAddr] [bindAddr]\n"
                 "       recurrent_ctl watch [bindAddr]\n";
}

/// Print every "fired" packet arriving on `bindAddr` until Ctrl-C.
int watch(const std::string& bindAddr) {
    io::UdpChannel chan(bindAddr, "127.0.0.1:45464");
    if (!chan.isOpen()) {
        std::cerr << "[recurrent_ctl] " << chan.error() << "\n";
        return 2;
    }

    std::signal(SIGINT, onSigInt);
    std::cout << "Watching " << bindAddr << " (Ctrl-C to quit)\n";

    while (!g_stop) {
        io::Packet p;
        while (chan.poll(p)) {
            if (auto ev = io::parseFired(p)) {
                std::cout << ev->name << " #" << ev->seq
                          << " ts=" << ev->ts << " exit=" << ev->exit << std::endl;
            }
        }
        std::this_thread::sleep_for(10ms);
    }
    return 0;
}

} // namespace

//------------------------------------------------------------------------------
// CLI entry point.
//------------------------------------------------------------------------------
int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 1;
    }

    const std::string verb = argv[1];
    if (verb == "watch")
        return watch(argc > 2 ? argv[2] : "0.0.0.0:45465");

    const auto cmd = io::commandFromName(verb);
    if (cmd == io::Command::Unknown) {
        std::cerr << "[recurrent_ctl] unknown command '" << verb << "'\n";
        usage();
        return 1;
    }

    const std::string peerAddr = (argc > 2 ? argv[2] : "127.0.0.1:45464");
    const std::string bindAddr = (argc > 3 ? argv[3] : "0.0.0.0:0");

    io::UdpChannel chan(bindAddr, peerAddr);
    if (!chan.isOpen()) {
        std::cerr << "[recurrent_ctl] " << chan.error() << "\n";
        return 2;
    }
    if (!chan.send(io::commandPacket(cmd))) {
        std::cerr << "[recurrent_ctl] failed to send '" << verb << "' to " << peerAddr << "\n";
        return 2;
    }

    std::cout << "Sent '" << verb << "' to " << peerAddr << ".\n";
    return 0;
}
