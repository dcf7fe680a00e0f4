/**
 * @file udp_socket.cpp
 * @brief UdpSocket implementation.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#include "lanlight/net/udp_socket.hpp"
#include "lanlight/utils/logger.hpp"

#include <cstring>

namespace lanlight {
namespace net {

namespace {

bool parseIpv4(const std::string& address, struct in_addr& out) {
    if (address.empty() || address == "0.0.0.0") {
        out.s_addr = htonl(INADDR_ANY);
        return true;
    }
    return inet_pton(AF_INET, address.c_str(), &out) == 1;
}

}  // namespace

bool isMulticastAddress(const std::string& address) {
    struct in_addr addr{};
    if (inet_pton(AF_INET, address.c_str(), &addr) != 1) {
        return false;
    }
    uint32_t host = ntohl(addr.s_addr);
    return (host & 0xF0000000u) == 0xE0000000u;
}

UdpSocket::UdpSocket()
    : socket_(INVALID_SOCKET_HANDLE)
    , lastError_(0)
{
    socket_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (socket_ == INVALID_SOCKET_HANDLE) {
        setLastError();
        LOG_ERROR("UdpSocket", "Failed to create socket: error {}", lastError_);
    }
}

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : socket_(other.socket_)
    , lastError_(other.lastError_)
{
    other.socket_ = INVALID_SOCKET_HANDLE;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        lastError_ = other.lastError_;
        other.socket_ = INVALID_SOCKET_HANDLE;
    }
    return *this;
}

bool UdpSocket::bind(uint16_t port, const std::string& address) {
    if (!isValid()) {
        return false;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (!parseIpv4(address, addr.sin_addr)) {
        LOG_ERROR("UdpSocket", "Invalid bind address: {}", address);
        return false;
    }

    if (::bind(socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        setLastError();
        LOG_ERROR("UdpSocket", "Failed to bind to {}:{} - error {}",
                  address, port, lastError_);
        return false;
    }

    LOG_DEBUG("UdpSocket", "Bound to {}:{}", address, getLocalPort());
    return true;
}

uint16_t UdpSocket::getLocalPort() const {
    if (!isValid()) {
        return 0;
    }

    struct sockaddr_in addr{};
    SocketLength addrLen = sizeof(addr);
    if (getsockname(socket_, reinterpret_cast<struct sockaddr*>(&addr), &addrLen) != 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

bool UdpSocket::setOption(int level, int name, const void* value, SocketLength size) {
    if (!isValid()) {
        return false;
    }
    if (setsockopt(socket_, level, name, static_cast<const char*>(value), size) != 0) {
        setLastError();
        return false;
    }
    return true;
}

bool UdpSocket::setReuseAddress(bool enable) {
    int optval = enable ? 1 : 0;
    if (!setOption(SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval))) {
        return false;
    }
#ifdef SO_REUSEPORT
    // Best effort: several controllers on one host may share the listen port.
    if (!setOption(SOL_SOCKET, SO_REUSEPORT, &optval, sizeof(optval))) {
        LOG_DEBUG("UdpSocket", "SO_REUSEPORT not applied: error {}", lastError_);
    }
#endif
    return true;
}

bool UdpSocket::setBroadcast(bool enable) {
    int optval = enable ? 1 : 0;
    return setOption(SOL_SOCKET, SO_BROADCAST, &optval, sizeof(optval));
}

bool UdpSocket::setNonBlocking(bool enable) {
    if (!isValid()) {
        return false;
    }
#ifdef _WIN32
    u_long mode = enable ? 1 : 0;
    if (ioctlsocket(socket_, FIONBIO, &mode) != 0) {
        setLastError();
        return false;
    }
#else
    int flags = fcntl(socket_, F_GETFL, 0);
    if (flags < 0) {
        setLastError();
        return false;
    }
    flags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (fcntl(socket_, F_SETFL, flags) != 0) {
        setLastError();
        return false;
    }
#endif
    return true;
}

bool UdpSocket::setMulticastTTL(int ttl) {
    unsigned char ttlVal = static_cast<unsigned char>(ttl);
    return setOption(IPPROTO_IP, IP_MULTICAST_TTL, &ttlVal, sizeof(ttlVal));
}

bool UdpSocket::setMulticastLoopback(bool enable) {
    unsigned char loop = enable ? 1 : 0;
    return setOption(IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop));
}

bool UdpSocket::setMulticastInterface(const std::string& interfaceAddress) {
    struct in_addr addr{};
    if (!parseIpv4(interfaceAddress, addr)) {
        LOG_ERROR("UdpSocket", "Invalid interface address: {}", interfaceAddress);
        return false;
    }
    return setOption(IPPROTO_IP, IP_MULTICAST_IF, &addr, sizeof(addr));
}

bool UdpSocket::changeMembership(int option, const std::string& groupAddress,
                                 const std::string& interfaceAddress) {
    struct ip_mreq mreq{};
    if (inet_pton(AF_INET, groupAddress.c_str(), &mreq.imr_multiaddr) != 1) {
        LOG_ERROR("UdpSocket", "Invalid multicast group address: {}", groupAddress);
        return false;
    }
    if (!parseIpv4(interfaceAddress, mreq.imr_interface)) {
        LOG_ERROR("UdpSocket", "Invalid interface address: {}", interfaceAddress);
        return false;
    }
    return setOption(IPPROTO_IP, option, &mreq, sizeof(mreq));
}

bool UdpSocket::joinMulticastGroup(const std::string& groupAddress,
                                   const std::string& interfaceAddress) {
    if (!changeMembership(IP_ADD_MEMBERSHIP, groupAddress, interfaceAddress)) {
        LOG_WARN("UdpSocket", "Failed to join multicast group {} on {}: error {}",
                 groupAddress, interfaceAddress.empty() ? "any" : interfaceAddress,
                 lastError_);
        return false;
    }
    LOG_INFO("UdpSocket", "Joined multicast group {}", groupAddress);
    return true;
}

bool UdpSocket::leaveMulticastGroup(const std::string& groupAddress,
                                    const std::string& interfaceAddress) {
    if (!changeMembership(IP_DROP_MEMBERSHIP, groupAddress, interfaceAddress)) {
        return false;
    }
    LOG_DEBUG("UdpSocket", "Left multicast group {}", groupAddress);
    return true;
}

int UdpSocket::sendTo(const SocketAddress& dest, const void* data, size_t length) {
    if (!isValid()) {
        return -1;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(dest.port);
    if (inet_pton(AF_INET, dest.ip.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR("UdpSocket", "Invalid destination address: {}", dest.ip);
        return -1;
    }

#ifdef _WIN32
    int result = ::sendto(socket_, static_cast<const char*>(data),
                          static_cast<int>(length), 0,
                          reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
#else
    ssize_t result = ::sendto(socket_, data, length, 0,
                              reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
#endif

    if (result < 0) {
        setLastError();
        return -1;
    }
    return static_cast<int>(result);
}

int UdpSocket::receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                           SocketAddress& sender) {
    if (!isValid()) {
        return -1;
    }

    if (timeoutMs > 0) {
        fd_set readSet;
        FD_ZERO(&readSet);
        FD_SET(socket_, &readSet);

        struct timeval tv;
        tv.tv_sec = timeoutMs / 1000;
        tv.tv_usec = (timeoutMs % 1000) * 1000;

        int ready = ::select(static_cast<int>(socket_) + 1, &readSet, nullptr, nullptr, &tv);
        if (ready < 0) {
            setLastError();
            return -1;
        }
        if (ready == 0) {
            return 0;
        }
    }

    struct sockaddr_in addr{};
    SocketLength addrLen = sizeof(addr);

#ifdef _WIN32
    int result = ::recvfrom(socket_, static_cast<char*>(buffer),
                            static_cast<int>(bufferSize), 0,
                            reinterpret_cast<struct sockaddr*>(&addr), &addrLen);
#else
    ssize_t result = ::recvfrom(socket_, buffer, bufferSize, 0,
                                reinterpret_cast<struct sockaddr*>(&addr), &addrLen);
#endif

    if (result < 0) {
        setLastError();
        return wouldBlock(lastError_) ? 0 : -1;
    }

    char ipStr[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &addr.sin_addr, ipStr, sizeof(ipStr));
    sender.ip = ipStr;
    sender.port = ntohs(addr.sin_port);

    return static_cast<int>(result);
}

void UdpSocket::close() {
    if (isValid()) {
        closeSocket(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
    }
}

void UdpSocket::setLastError() {
    lastError_ = getLastSocketError();
}

}  // namespace net
}  // namespace lanlight
