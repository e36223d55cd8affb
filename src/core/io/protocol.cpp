/**
 * @file   protocol.cpp
 * @brief  Implements encoding and decoding of control and telemetry packets.
 *
 * @author recurrent contributors
 * @date   2026-10-19
 */

#include "protocol.hpp"

#include <nlohmann/json.hpp>

namespace recurrent::io {

Command commandFromName(const std::string& name) noexcept {
    if (name == "signal")   return Command::Signal;
    if (name == "shutdown") return Command::Shutdown;
    return Command::Unknown;
}

const char* commandName(Command cmd) noexcept {
    switch (cmd) {
      case Command::Signal:   return "signal";
      case Command::Shutdown: return "shutdown";
      case Command::Unknown:
      default:                return "";
    }
}

Packet commandPacket(Command cmd) {
    nlohmann::json j = { {"type", commandName(cmd)} };
    return { j.dump() };
}

Command parseCommand(const Packet& pkt) noexcept {
    auto j = nlohmann::json::parse(pkt.json, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return Command::Unknown;

    auto it = j.find("type");
    if (it == j.end() || !it->is_string()) return Command::Unknown;
    return commandFromName(it->get<std::string>());
}

Packet firedPacket(const FiredEvent& ev) {
    nlohmann::json j = {
        {"type", "fired"},
        {"seq",  ev.seq},
        {"ts",   ev.ts},
        {"name", ev.name},
        {"exit", ev.exit}
    };
    return { j.dump() };
}

std::optional<FiredEvent> parseFired(const Packet& pkt) noexcept {
    auto j = nlohmann::json::parse(pkt.json, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    try {
        if (j.at("type").get<std::string>() != "fired") return std::nullopt;
        FiredEvent ev;
        ev.seq  = j.at("seq").get<std::uint64_t>();
        ev.ts   = j.at("ts").get<std::int64_t>();
        ev.name = j.at("name").get<std::string>();
        ev.exit = j.at("exit").get<int>();
        return ev;
    }
    catch (const nlohmann::json::exception&) {
        return std::nullopt;   // wrong shape: not a telemetry packet
    }
}

} // namespace recurrent::io
