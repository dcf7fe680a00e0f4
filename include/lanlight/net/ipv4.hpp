/**
 * @file ipv4.hpp
 * @brief IPv4 address and subnet helpers for interface selection.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#pragma once

#include "lanlight/net/export.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace lanlight {
namespace net {

/**
 * @brief Parse a dotted-quad IPv4 address.
 * @return Host-order address, or std::nullopt for anything else (IPv6 included).
 */
LANLIGHT_NET_API std::optional<uint32_t> parseIpv4(const std::string& text);

/**
 * @brief Parse a network mask given as "/24", "24" or "255.255.255.0".
 *
 * Dotted masks must be contiguous.
 * @return Host-order mask, or std::nullopt if the text is not a valid mask.
 */
LANLIGHT_NET_API std::optional<uint32_t> parseNetmask(const std::string& text);

/**
 * @brief True for "0.0.0.0" and the empty string.
 */
LANLIGHT_NET_API bool isWildcardAddress(const std::string& text);

/**
 * @struct Ipv4Network
 * @brief A subnet described by one member address and a mask.
 */
struct LANLIGHT_NET_API Ipv4Network {
    uint32_t address = 0;
    uint32_t mask = 0;

    bool contains(uint32_t host) const {
        return (host & mask) == (address & mask);
    }

    /**
     * @brief Build a network from an interface address and a mask string.
     * @return std::nullopt if either part fails to parse.
     */
    static std::optional<Ipv4Network> fromAddressAndMask(const std::string& address,
                                                         const std::string& mask);
};

/**
 * @brief Private-network guess used when no masks are configured.
 *
 * Matches when both addresses share their top three octets, when both are
 * in 192.168.0.0/16, or when both are in 10.0.0.0/8. This is approximate
 * and intentionally does not cover other layouts (172.16/12 and friends).
 */
LANLIGHT_NET_API bool likelySameNetwork(uint32_t local, uint32_t destination);

}  // namespace net
}  // namespace lanlight
