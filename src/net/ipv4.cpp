/**
 * @file ipv4.cpp
 * @brief IPv4 helpers.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#include "lanlight/net/ipv4.hpp"
#include "lanlight/net/platform.hpp"

#include <cctype>

namespace lanlight {
namespace net {

namespace {

std::optional<uint32_t> prefixToMask(const std::string& digits) {
    if (digits.empty() || digits.size() > 2) {
        return std::nullopt;
    }
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    int prefix = std::stoi(digits);
    if (prefix < 0 || prefix > 32) {
        return std::nullopt;
    }
    if (prefix == 0) {
        return 0u;
    }
    return static_cast<uint32_t>(0xFFFFFFFFull << (32 - prefix));
}

}  // namespace

std::optional<uint32_t> parseIpv4(const std::string& text) {
    struct in_addr addr{};
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    return ntohl(addr.s_addr);
}

std::optional<uint32_t> parseNetmask(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    if (text[0] == '/') {
        return prefixToMask(text.substr(1));
    }
    if (text.find('.') == std::string::npos) {
        return prefixToMask(text);
    }

    auto mask = parseIpv4(text);
    if (!mask) {
        return std::nullopt;
    }
    // Contiguous: inverted mask plus one is a power of two (or zero).
    uint32_t inverted = ~*mask;
    if ((inverted & (inverted + 1)) != 0) {
        return std::nullopt;
    }
    return mask;
}

bool isWildcardAddress(const std::string& text) {
    return text.empty() || text == "0.0.0.0";
}

std::optional<Ipv4Network> Ipv4Network::fromAddressAndMask(const std::string& address,
                                                           const std::string& mask) {
    auto addr = parseIpv4(address);
    auto bits = parseNetmask(mask);
    if (!addr || !bits) {
        return std::nullopt;
    }
    Ipv4Network network;
    network.address = *addr;
    network.mask = *bits;
    return network;
}

bool likelySameNetwork(uint32_t local, uint32_t destination) {
    if ((local >> 8) == (destination >> 8)) {
        return true;
    }
    if ((local >> 16) == 0xC0A8u && (destination >> 16) == 0xC0A8u) {
        return true;
    }
    return (local >> 24) == 10u && (destination >> 24) == 10u;
}

}  // namespace net
}  // namespace lanlight
