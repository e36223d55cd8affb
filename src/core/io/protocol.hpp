/**
 * @file   protocol.hpp
 * @brief  JSON messages exchanged between the scheduler runtime and its
 *         controllers: "signal"/"shutdown" commands in, "fired" telemetry out.
 *
 * @author recurrent contributors
 * @date   2026-10-19
 */

#ifndef RECURRENT_IO_PROTOCOL_HPP
#define RECURRENT_IO_PROTOCOL_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "channel.hpp"

namespace recurrent::io {

/// Control commands a runtime accepts.
enum class Command { Signal, Shutdown, Unknown };

/** @brief Map "signal"/"shutdown" to a Command (Unknown otherwise). */
Command commandFromName(const std::string& name) noexcept;

/** @brief Wire name of a command ("" for Unknown). */
const char* commandName(Command cmd) noexcept;

/** @brief Build the `{"type": ...}` packet for a command. */
Packet commandPacket(Command cmd);

/**
 * @brief Decode a control packet.
 * @return Unknown for malformed JSON, non-objects, or unknown types.
 */
Command parseCommand(const Packet& pkt) noexcept;

/**
 * @struct FiredEvent
 * @brief Telemetry published after every target invocation.
 */
struct FiredEvent {
    std::uint64_t seq{0};    ///< Monotonically increasing firing number
    std::int64_t  ts{0};     ///< Wall-clock time, ms since epoch
    std::string   name;      ///< Schedule name
    int           exit{0};   ///< Command exit code (0 when no command)
};

/** @brief Encode a FiredEvent as a `{"type":"fired", ...}` packet. */
Packet firedPacket(const FiredEvent& ev);

/** @brief Decode a "fired" packet; std::nullopt for anything else. */
std::optional<FiredEvent> parseFired(const Packet& pkt) noexcept;

} // namespace recurrent::io

#endif // RECURRENT_IO_PROTOCOL_HPP
