/**
 * @file   udp_channel.cpp
 * @brief  Implements UdpChannel: endpoint parsing, socket setup, send(), poll().
 *
 * @author recurrent contributors
 * @date   2026-10-19
 */

#include "udp_channel.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace recurrent::io {

std::optional<sockaddr_in> parseEndpoint(const std::string& text) noexcept {
    auto colon = text.rfind(':');
    if (colon == std::string::npos || colon + 1 == text.size())
        return std::nullopt;

    const std::string host = text.substr(0, colon);
    const std::string port = text.substr(colon + 1);
    if (port.find_first_not_of("0123456789") != std::string::npos || port.size() > 5)
        return std::nullopt;
    unsigned long num = std::strtoul(port.c_str(), nullptr, 10);
    if (num > 65535)
        return std::nullopt;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(static_cast<uint16_t>(num));
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1)
        return std::nullopt;
    return addr;
}

UdpChannel::UdpChannel(const std::string& bindAddr,
                       const std::string& peerAddr) noexcept
{
    auto local = parseEndpoint(bindAddr);
    if (!local) { fail("invalid bind address `" + bindAddr + "`"); return; }
    auto peer = parseEndpoint(peerAddr);
    if (!peer)  { fail("invalid peer address `" + peerAddr + "`"); return; }
    m_peer = *peer;

    m_sock = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (m_sock < 0) { fail(std::string("socket: ") + std::strerror(errno)); return; }

    int on = 1;
    ::setsockopt(m_sock, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));

    int flags = ::fcntl(m_sock, F_GETFL, 0);
    if (flags < 0 || ::fcntl(m_sock, F_SETFL, flags | O_NONBLOCK) < 0) {
        fail(std::string("fcntl: ") + std::strerror(errno));
        return;
    }

    if (::bind(m_sock, reinterpret_cast<const sockaddr*>(&*local), sizeof(*local)) < 0) {
        fail("bind " + bindAddr + ": " + std::strerror(errno));
        return;
    }
}

UdpChannel::~UdpChannel() noexcept {
    if (m_sock >= 0) ::close(m_sock);
}

void UdpChannel::fail(const std::string& why) noexcept {
    m_error = why;
    if (m_sock >= 0) {
        ::close(m_sock);
        m_sock = -1;
    }
}

bool UdpChannel::send(const Packet& pkt) noexcept {
    if (m_sock < 0 || pkt.json.size() > kMaxDatagram) return false;
    auto sent = ::sendto(m_sock, pkt.json.data(), pkt.json.size(), 0,
                         reinterpret_cast<const sockaddr*>(&m_peer), sizeof(m_peer));
    return sent == static_cast<ssize_t>(pkt.json.size());
}

bool UdpChannel::poll(Packet& pkt) noexcept {
    if (m_sock < 0) return false;
    auto n = ::recv(m_sock, m_buf.data(), m_buf.size(), 0);
    if (n <= 0) return false;   // EAGAIN, or an error: nothing to hand out
    pkt.json.assign(m_buf.data(), static_cast<std::size_t>(n));
    return true;
}

} // namespace recurrent::io
