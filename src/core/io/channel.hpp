/**
 * @file   channel.hpp
 * @brief  Defines the abstract IChannel interface and Packet struct used to
 *         carry scheduler control and telemetry messages.
 *
 * @author recurrent contributors
 * @date   2026-10-19
 */

#ifndef RECURRENT_IO_CHANNEL_HPP
#define RECURRENT_IO_CHANNEL_HPP

#include <string>

namespace recurrent::io {

/**
 * @struct Packet
 * @brief One JSON message, exactly as it travels on the wire.
 */
struct Packet {
    std::string json;
};

/**
 * @class IChannel
 * @brief Datagram transport for Packets.
 *
 * Neither call blocks or throws; failures are reported through the return
 * value only.
 */
class IChannel {
public:
    virtual ~IChannel() = default;

    /**
     * @brief Send a packet to the channel's peer.
     * @return True if the whole packet was handed to the transport.
     */
    virtual bool send(const Packet& pkt) noexcept = 0;

    /**
     * @brief Fetch the next received packet, if one is waiting.
     * @param[out] pkt  Filled when a packet is returned.
     * @return True if `pkt` was populated.
     */
    virtual bool poll(Packet& pkt) noexcept = 0;
};

} // namespace recurrent::io

#endif // RECURRENT_IO_CHANNEL_HPP
