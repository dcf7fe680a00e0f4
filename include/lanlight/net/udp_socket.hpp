/**
 * @file udp_socket.hpp
 * @brief RAII UDP socket with broadcast and multicast options.
 *
 * The socket is driven by the event loop: it is switched to non-blocking
 * mode and read whenever select() reports it readable.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#pragma once

#include "lanlight/net/export.hpp"
#include "lanlight/net/platform.hpp"

#include <cstdint>
#include <string>

namespace lanlight {
namespace net {

/**
 * @struct SocketAddress
 * @brief IPv4 address and port pair.
 */
struct LANLIGHT_NET_API SocketAddress {
    std::string ip;
    uint16_t port;

    SocketAddress() : ip("0.0.0.0"), port(0) {}
    SocketAddress(const std::string& ip_, uint16_t port_) : ip(ip_), port(port_) {}

    std::string toString() const { return ip + ":" + std::to_string(port); }

    bool operator==(const SocketAddress& other) const {
        return ip == other.ip && port == other.port;
    }
};

/**
 * @class UdpSocket
 * @brief Owning wrapper around an IPv4 datagram socket.
 *
 * Usage:
 * @code
 * UdpSocket sock;
 * sock.setReuseAddress(true);
 * sock.bind(4002, "192.168.1.10");
 * sock.setBroadcast(true);
 * sock.joinMulticastGroup("239.255.255.250", "192.168.1.10");
 * sock.sendTo(SocketAddress("239.255.255.250", 4001), data.data(), data.size());
 * @endcode
 */
class LANLIGHT_NET_API UdpSocket {
public:
    /**
     * @brief Create an unbound socket. Check isValid() afterwards.
     */
    UdpSocket();
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }

    SocketHandle handle() const { return socket_; }

    /**
     * @brief Bind to a local address and port.
     * @param port Local port (0 picks an ephemeral port).
     * @param address Local IPv4 address, "0.0.0.0" or empty for any.
     */
    bool bind(uint16_t port, const std::string& address = "0.0.0.0");

    /**
     * @brief Port the socket is bound to, 0 if unbound.
     */
    uint16_t getLocalPort() const;

    /**
     * @brief SO_REUSEADDR, plus SO_REUSEPORT where the platform has it.
     * Call before bind().
     */
    bool setReuseAddress(bool enable);

    bool setBroadcast(bool enable);

    bool setNonBlocking(bool enable);

    /**
     * @brief Multicast hop limit (1 keeps traffic on the local subnet).
     */
    bool setMulticastTTL(int ttl);

    bool setMulticastLoopback(bool enable);

    /**
     * @brief Outgoing interface for multicast datagrams.
     */
    bool setMulticastInterface(const std::string& interfaceAddress);

    /**
     * @brief Join a multicast group on an interface (empty = any).
     */
    bool joinMulticastGroup(const std::string& groupAddress,
                            const std::string& interfaceAddress = "");

    bool leaveMulticastGroup(const std::string& groupAddress,
                             const std::string& interfaceAddress = "");

    /**
     * @brief Send one datagram.
     * @return Bytes sent, or -1 on error (see getLastError()).
     */
    int sendTo(const SocketAddress& dest, const void* data, size_t length);

    /**
     * @brief Receive one datagram.
     * @param timeoutMs 0 = poll once, -1 = block, otherwise wait up to this long.
     * @return Bytes received, 0 on timeout or when a non-blocking read
     *         finds nothing, -1 on error.
     */
    int receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                    SocketAddress& sender);

    void close();

    int getLastError() const { return lastError_; }

private:
    SocketHandle socket_;
    int lastError_;

    bool setOption(int level, int name, const void* value, SocketLength size);
    bool changeMembership(int option, const std::string& groupAddress,
                          const std::string& interfaceAddress);
    void setLastError();
};

/**
 * @brief True if @p address is a dotted IPv4 address in 224.0.0.0/4.
 */
LANLIGHT_NET_API bool isMulticastAddress(const std::string& address);

}  // namespace net
}  // namespace lanlight
