/**
 * @file   udp_channel.hpp
 * @brief  Declares UdpChannel: a non-blocking UDP IChannel transport.
 *
 * @author recurrent contributors
 * @date   2026-10-19
 */

#ifndef RECURRENT_IO_UDP_CHANNEL_HPP
#define RECURRENT_IO_UDP_CHANNEL_HPP

#include "channel.hpp"

#include <array>
#include <optional>
#include <string>
#include <netinet/in.h>

namespace recurrent::io {

/**
 * @brief Parse an IPv4 "IP:port" endpoint.
 * @return The socket address, or std::nullopt if `text` is malformed.
 */
std::optional<sockaddr_in> parseEndpoint(const std::string& text) noexcept;

/**
 * @class UdpChannel
 * @brief IChannel over a non-blocking UDP socket bound to a local endpoint
 *        and sending to one fixed peer.
 */
class UdpChannel final : public IChannel {
public:
    /**
     * @brief Open and bind the socket.
     * @param bindAddr  Local "IP:port" to bind ("0.0.0.0:0" for any port).
     * @param peerAddr  Remote "IP:port" that send() targets.
     * @note On failure the channel stays closed (isOpen() == false) and
     *       error() describes why.
     */
    UdpChannel(const std::string& bindAddr, const std::string& peerAddr) noexcept;

    /** @brief Closes the socket. */
    ~UdpChannel() noexcept override;

    UdpChannel(const UdpChannel&) = delete;
    UdpChannel& operator=(const UdpChannel&) = delete;

    bool send(const Packet& pkt) noexcept override;
    bool poll(Packet& pkt) noexcept override;

    /** @return True if the socket is bound and the peer address is valid. */
    bool isOpen() const noexcept { return m_sock >= 0; }

    /** @return Reason the channel failed to open (empty when open). */
    const std::string& error() const noexcept { return m_error; }

private:
    void fail(const std::string& why) noexcept;

    static constexpr std::size_t kMaxDatagram = 2048;

    int                               m_sock{-1};  ///< Socket FD, -1 when closed
    sockaddr_in                       m_peer{};    ///< Destination of send()
    std::string                       m_error;     ///< Open failure reason
    std::array<char, kMaxDatagram>    m_buf{};     ///< Receive buffer
};

} // namespace recurrent::io

#endif // RECURRENT_IO_UDP_CHANNEL_HPP
