/**
 * @file transport_manager.hpp
 * @brief One UDP endpoint per listening address, and routing between them.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#pragma once

#include "lanlight/core/event_loop.hpp"
#include "lanlight/core/export.hpp"
#include "lanlight/net/udp_socket.hpp"

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace lanlight {
namespace core {

/**
 * @class ConfigError
 * @brief Invalid configuration detected at construction time.
 */
class LANLIGHT_CORE_API ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class DatagramLink
 * @brief Outbound side of the transport, as seen by the protocol components.
 */
class LANLIGHT_CORE_API DatagramLink {
public:
    virtual ~DatagramLink() = default;

    /**
     * @brief Send to the configured broadcast/multicast target on every endpoint.
     * @return True if at least one endpoint sent the datagram.
     */
    virtual bool broadcast(const std::string& payload) = 0;

    /**
     * @brief Send to one host through the endpoint best suited to reach it.
     */
    virtual bool sendTo(const std::string& payload, const std::string& ip, uint16_t port) = 0;
};

/**
 * @struct TransportConfig
 * @brief Addresses and ports for the UDP endpoints.
 */
struct LANLIGHT_CORE_API TransportConfig {
    std::vector<std::string> listen_addresses{"0.0.0.0"};
    std::vector<std::string> network_masks;      ///< Empty, or one per listen address
    uint16_t listen_port = 4002;
    std::string broadcast_address = "239.255.255.250";
    uint16_t broadcast_port = 4001;
    int multicast_ttl = 2;
};

/**
 * @class Transport
 * @brief A UDP socket bound to one local address.
 */
class LANLIGHT_CORE_API Transport {
public:
    Transport(std::string listenAddress, std::optional<std::string> networkMask);
    ~Transport();

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    /**
     * @brief Bind and configure the socket.
     *
     * Multicast options are best effort: failures are logged and the
     * endpoint stays usable for unicast.
     */
    bool open(uint16_t port, const std::string& broadcastAddress, int multicastTtl);

    /**
     * @brief Leave the multicast group and close the socket.
     */
    void close();

    bool isOpen() const { return open_; }

    /**
     * @brief Send one datagram.
     * @return Bytes sent, or -1 on error.
     */
    int sendTo(const std::string& payload, const net::SocketAddress& destination);

    /**
     * @brief Read every datagram waiting on the socket.
     */
    void drain(const std::function<void(const std::string&, const net::SocketAddress&)>& handler);

    const std::string& listenAddress() const { return listenAddress_; }
    const std::optional<std::string>& networkMask() const { return networkMask_; }
    bool isWildcard() const;
    net::SocketHandle handle() const { return socket_.handle(); }
    uint16_t localPort() const { return socket_.getLocalPort(); }

private:
    std::string listenAddress_;
    std::optional<std::string> networkMask_;
    std::string joinedGroup_;
    net::UdpSocket socket_;
    bool open_ = false;
};

/**
 * @class TransportManager
 * @brief Owns every endpoint and picks one per destination.
 *
 * Usage:
 * @code
 * TransportConfig config;
 * config.listen_addresses = {"192.168.1.100", "10.0.0.100"};
 * config.network_masks = {"/24", "/8"};
 * TransportManager transports(loop, config);
 * transports.open([](const std::string& payload, const std::string& ip) { ... });
 * transports.sendTo(message, "10.50.1.1", 4003);
 * @endcode
 */
class LANLIGHT_CORE_API TransportManager : public DatagramLink {
public:
    using DatagramHandler = std::function<void(const std::string& payload,
                                               const std::string& senderIp)>;

    /**
     * @throws ConfigError if masks are given but their count differs from
     *         the number of listen addresses, or no address is given.
     */
    TransportManager(EventLoop& loop, TransportConfig config);
    ~TransportManager() override;

    TransportManager(const TransportManager&) = delete;
    TransportManager& operator=(const TransportManager&) = delete;

    /**
     * @brief Open every endpoint and start delivering inbound datagrams.
     * @return False (with everything closed again) if any endpoint fails to bind.
     */
    bool open(DatagramHandler handler);

    /**
     * @brief Close every endpoint.
     * @return Future satisfied once every endpoint reported disconnection.
     */
    std::shared_future<void> close();

    /**
     * @brief Future satisfied once every endpoint reported disconnection.
     */
    std::shared_future<void> closed() const { return closedFuture_; }

    bool broadcast(const std::string& payload) override;
    bool sendTo(const std::string& payload, const std::string& ip, uint16_t port) override;

    /**
     * @brief Pick the endpoint to reach @p destinationIp.
     *
     * 1. A single endpoint is always used.
     * 2. With masks, the first non-wildcard endpoint whose subnet contains
     *    the destination. Endpoints with an unparseable mask are skipped.
     * 3. Without masks, the first non-wildcard endpoint that
     *    net::likelySameNetwork() matches.
     * 4. Otherwise the first non-wildcard endpoint, then the first endpoint.
     *
     * Destinations that are not dotted IPv4 go straight to the first endpoint.
     */
    Transport& selectTransport(const std::string& destinationIp);

    size_t size() const { return transports_.size(); }
    Transport& at(size_t index) { return *transports_.at(index); }
    const TransportConfig& config() const { return config_; }

private:
    void onEndpointClosed();

    EventLoop& loop_;
    TransportConfig config_;
    std::vector<std::unique_ptr<Transport>> transports_;

    size_t openCount_ = 0;
    std::promise<void> closedPromise_;
    std::shared_future<void> closedFuture_;
    bool closeReported_ = false;
};

}  // namespace core
}  // namespace lanlight
