/**
 * @file test_ipv4.cpp
 * @brief Unit tests for IPv4 parsing and subnet matching
 */

#include <gtest/gtest.h>
#include <lanlight/net/ipv4.hpp>

using namespace lanlight::net;

namespace {

uint32_t ip(const char* text) {
    return parseIpv4(text).value();
}

}  // namespace

TEST(Ipv4Test, ParsesDottedQuad) {
    EXPECT_EQ(parseIpv4("192.168.1.100"), 0xC0A80164u);
    EXPECT_EQ(parseIpv4("0.0.0.0"), 0u);
}

TEST(Ipv4Test, RejectsNonIpv4) {
    EXPECT_FALSE(parseIpv4("").has_value());
    EXPECT_FALSE(parseIpv4("256.1.1.1").has_value());
    EXPECT_FALSE(parseIpv4("fe80::1").has_value());
    EXPECT_FALSE(parseIpv4("light.local").has_value());
}

TEST(Ipv4Test, ParsesMaskForms) {
    EXPECT_EQ(parseNetmask("255.255.255.0"), 0xFFFFFF00u);
    EXPECT_EQ(parseNetmask("/24"), 0xFFFFFF00u);
    EXPECT_EQ(parseNetmask("8"), 0xFF000000u);
    EXPECT_EQ(parseNetmask("/0"), 0u);
    EXPECT_EQ(parseNetmask("/32"), 0xFFFFFFFFu);
}

TEST(Ipv4Test, RejectsInvalidMasks) {
    EXPECT_FALSE(parseNetmask("").has_value());
    EXPECT_FALSE(parseNetmask("255.0.255.0").has_value());
    EXPECT_FALSE(parseNetmask("/33").has_value());
    EXPECT_FALSE(parseNetmask("garbage").has_value());
}

TEST(Ipv4Test, WildcardAddress) {
    EXPECT_TRUE(isWildcardAddress("0.0.0.0"));
    EXPECT_TRUE(isWildcardAddress(""));
    EXPECT_FALSE(isWildcardAddress("127.0.0.1"));
}

TEST(Ipv4Test, NetworkContains) {
    auto net = Ipv4Network::fromAddressAndMask("192.168.1.100", "255.255.255.0");
    ASSERT_TRUE(net.has_value());
    EXPECT_TRUE(net->contains(ip("192.168.1.50")));
    EXPECT_FALSE(net->contains(ip("192.168.2.50")));

    EXPECT_FALSE(Ipv4Network::fromAddressAndMask("192.168.1.100", "bad").has_value());
    EXPECT_FALSE(Ipv4Network::fromAddressAndMask("bad", "/24").has_value());
}

TEST(Ipv4Test, LikelySameNetworkHeuristic) {
    EXPECT_TRUE(likelySameNetwork(ip("172.16.5.1"), ip("172.16.5.200")));
    EXPECT_TRUE(likelySameNetwork(ip("192.168.1.10"), ip("192.168.7.20")));
    EXPECT_TRUE(likelySameNetwork(ip("10.0.0.100"), ip("10.20.30.40")));
    EXPECT_FALSE(likelySameNetwork(ip("10.0.0.100"), ip("192.168.1.50")));
    EXPECT_FALSE(likelySameNetwork(ip("172.16.5.1"), ip("172.16.6.1")));
}
