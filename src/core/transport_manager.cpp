/**
 * @file transport_manager.cpp
 * @brief Transport and TransportManager implementation.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#include "lanlight/core/transport_manager.hpp"
#include "lanlight/net/ipv4.hpp"
#include "lanlight/utils/logger.hpp"

#include <vector>

namespace lanlight {
namespace core {

namespace {

constexpr size_t kMaxDatagramSize = 65535;

}  // namespace

// =============================================================================
// Transport
// =============================================================================

Transport::Transport(std::string listenAddress, std::optional<std::string> networkMask)
    : listenAddress_(std::move(listenAddress))
    , networkMask_(std::move(networkMask)) {}

Transport::~Transport() {
    close();
}

bool Transport::isWildcard() const {
    return net::isWildcardAddress(listenAddress_);
}

bool Transport::open(uint16_t port, const std::string& broadcastAddress, int multicastTtl) {
    if (open_) {
        return true;
    }
    if (!socket_.isValid()) {
        socket_ = net::UdpSocket();
    }
    if (!socket_.isValid()) {
        LOG_ERROR("Transport", "Failed to create socket for {}: {}", listenAddress_,
                  socket_.getLastError());
        return false;
    }

    if (!socket_.setReuseAddress(true)) {
        LOG_WARN("Transport", "Failed to set SO_REUSEADDR on {}", listenAddress_);
    }
    if (!socket_.setBroadcast(true)) {
        LOG_WARN("Transport", "Failed to set SO_BROADCAST on {}", listenAddress_);
    }

    const std::string bindAddress = isWildcard() ? "0.0.0.0" : listenAddress_;
    if (!socket_.bind(port, bindAddress)) {
        LOG_ERROR("Transport", "Failed to bind {}:{}: {}", bindAddress, port,
                  socket_.getLastError());
        socket_.close();
        return false;
    }
    socket_.setNonBlocking(true);

    if (net::isMulticastAddress(broadcastAddress)) {
        const std::string interfaceAddress = isWildcard() ? "" : listenAddress_;
        if (!socket_.setMulticastTTL(multicastTtl)) {
            LOG_WARN("Transport", "Failed to set multicast TTL on {}", listenAddress_);
        }
        if (!interfaceAddress.empty() && !socket_.setMulticastInterface(interfaceAddress)) {
            LOG_WARN("Transport", "Failed to select multicast interface {}", interfaceAddress);
        }
        if (socket_.joinMulticastGroup(broadcastAddress, interfaceAddress)) {
            joinedGroup_ = broadcastAddress;
        } else {
            LOG_WARN("Transport", "Failed to join {} on {}: {}", broadcastAddress,
                     listenAddress_, socket_.getLastError());
        }
    }

    open_ = true;
    LOG_INFO("Transport", "Listening on {}:{}", bindAddress, socket_.getLocalPort());
    return true;
}

void Transport::close() {
    if (!open_) {
        return;
    }
    if (!joinedGroup_.empty()) {
        const std::string interfaceAddress = isWildcard() ? "" : listenAddress_;
        if (!socket_.leaveMulticastGroup(joinedGroup_, interfaceAddress)) {
            LOG_DEBUG("Transport", "Failed to leave {} on {}", joinedGroup_, listenAddress_);
        }
        joinedGroup_.clear();
    }
    socket_.close();
    open_ = false;
    LOG_DEBUG("Transport", "Closed endpoint {}", listenAddress_);
}

int Transport::sendTo(const std::string& payload, const net::SocketAddress& destination) {
    int sent = socket_.sendTo(destination, payload.data(), payload.size());
    if (sent < 0) {
        LOG_WARN("Transport", "Send from {} to {} failed: {}", listenAddress_,
                 destination.toString(), socket_.getLastError());
    } else {
        LOG_TRACE("Transport", "{} -> {}: {}", listenAddress_, destination.toString(), payload);
    }
    return sent;
}

void Transport::drain(
    const std::function<void(const std::string&, const net::SocketAddress&)>& handler) {
    std::vector<char> buffer(kMaxDatagramSize);
    while (open_) {
        net::SocketAddress sender;
        int received = socket_.receiveFrom(buffer.data(), buffer.size(), 0, sender);
        if (received < 0) {
            LOG_WARN("Transport", "Receive on {} failed: {}", listenAddress_,
                     socket_.getLastError());
            return;
        }
        if (received == 0) {
            return;
        }
        handler(std::string(buffer.data(), static_cast<size_t>(received)), sender);
    }
}

// =============================================================================
// TransportManager
// =============================================================================

TransportManager::TransportManager(EventLoop& loop, TransportConfig config)
    : loop_(loop)
    , config_(std::move(config))
    , closedFuture_(closedPromise_.get_future().share())
{
    if (config_.listen_addresses.empty()) {
        throw ConfigError("at least one listening address is required");
    }
    const bool hasMasks = !config_.network_masks.empty();
    if (hasMasks && config_.network_masks.size() != config_.listen_addresses.size()) {
        throw ConfigError("got " + std::to_string(config_.network_masks.size()) +
                          " network masks for " +
                          std::to_string(config_.listen_addresses.size()) +
                          " listening addresses");
    }

    for (size_t i = 0; i < config_.listen_addresses.size(); ++i) {
        std::optional<std::string> mask;
        if (hasMasks) {
            mask = config_.network_masks[i];
        }
        transports_.push_back(std::make_unique<Transport>(config_.listen_addresses[i], mask));
    }
}

TransportManager::~TransportManager() {
    close();
}

bool TransportManager::open(DatagramHandler handler) {
    if (openCount_ > 0) {
        LOG_WARN("Transport", "Endpoints already open");
        return false;
    }

    for (auto& transport : transports_) {
        if (!transport->open(config_.listen_port, config_.broadcast_address,
                             config_.multicast_ttl)) {
            LOG_ERROR("Transport", "Could not open endpoint {}, closing the others",
                      transport->listenAddress());
            for (auto& opened : transports_) {
                if (opened->isOpen()) {
                    loop_.unwatch(opened->handle());
                    opened->close();
                }
            }
            openCount_ = 0;
            return false;
        }

        Transport* endpoint = transport.get();
        loop_.watchReadable(endpoint->handle(), [endpoint, handler]() {
            endpoint->drain([&handler](const std::string& payload,
                                       const net::SocketAddress& sender) {
                handler(payload, sender.ip);
            });
        });
        ++openCount_;
    }
    return true;
}

std::shared_future<void> TransportManager::close() {
    for (auto& transport : transports_) {
        if (!transport->isOpen()) {
            continue;
        }
        loop_.unwatch(transport->handle());
        transport->close();
        onEndpointClosed();
    }
    if (openCount_ == 0 && !closeReported_) {
        closeReported_ = true;
        closedPromise_.set_value();
    }
    return closedFuture_;
}

void TransportManager::onEndpointClosed() {
    if (openCount_ > 0) {
        --openCount_;
    }
}

bool TransportManager::broadcast(const std::string& payload) {
    const net::SocketAddress target(config_.broadcast_address, config_.broadcast_port);
    bool anySent = false;
    for (auto& transport : transports_) {
        if (!transport->isOpen()) {
            continue;
        }
        if (transport->sendTo(payload, target) >= 0) {
            anySent = true;
        }
    }
    return anySent;
}

bool TransportManager::sendTo(const std::string& payload, const std::string& ip, uint16_t port) {
    Transport& transport = selectTransport(ip);
    if (!transport.isOpen()) {
        LOG_WARN("Transport", "Endpoint {} is not open, dropping datagram for {}",
                 transport.listenAddress(), ip);
        return false;
    }
    return transport.sendTo(payload, net::SocketAddress(ip, port)) >= 0;
}

Transport& TransportManager::selectTransport(const std::string& destinationIp) {
    Transport& first = *transports_.front();
    if (transports_.size() == 1) {
        return first;
    }

    auto destination = net::parseIpv4(destinationIp);
    if (!destination) {
        LOG_DEBUG("Transport", "'{}' is not an IPv4 address, using {}", destinationIp,
                  first.listenAddress());
        return first;
    }

    if (!config_.network_masks.empty()) {
        for (auto& transport : transports_) {
            if (transport->isWildcard()) {
                continue;
            }
            auto network = net::Ipv4Network::fromAddressAndMask(
                transport->listenAddress(), transport->networkMask().value_or(""));
            if (!network) {
                LOG_WARN("Transport", "Skipping {}: invalid network mask '{}'",
                         transport->listenAddress(), transport->networkMask().value_or(""));
                continue;
            }
            if (network->contains(*destination)) {
                return *transport;
            }
        }
    } else {
        for (auto& transport : transports_) {
            if (transport->isWildcard()) {
                continue;
            }
            auto local = net::parseIpv4(transport->listenAddress());
            if (local && net::likelySameNetwork(*local, *destination)) {
                return *transport;
            }
        }
    }

    for (auto& transport : transports_) {
        if (!transport->isWildcard()) {
            return *transport;
        }
    }
    return first;
}

}  // namespace core
}  // namespace lanlight
