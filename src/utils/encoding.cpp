/**
 * @file encoding.cpp
 * @brief Base64 encoder and hex decoder.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#include "lanlight/utils/encoding.hpp"

#include <cstdint>

namespace lanlight {
namespace utils {

namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

std::string base64Encode(const std::vector<uint8_t>& bytes) {
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        uint32_t chunk = (static_cast<uint32_t>(bytes[i]) << 16) |
                         (static_cast<uint32_t>(bytes[i + 1]) << 8) |
                         static_cast<uint32_t>(bytes[i + 2]);
        out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
        out.push_back(kAlphabet[chunk & 0x3F]);
    }

    size_t rest = bytes.size() - i;
    if (rest == 1) {
        uint32_t chunk = static_cast<uint32_t>(bytes[i]) << 16;
        out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        out.append("==");
    } else if (rest == 2) {
        uint32_t chunk = (static_cast<uint32_t>(bytes[i]) << 16) |
                         (static_cast<uint32_t>(bytes[i + 1]) << 8);
        out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
        out.push_back('=');
    }

    return out;
}

std::optional<std::vector<uint8_t>> hexDecode(const std::string& text) {
    if (text.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> out;
    out.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2) {
        int hi = hexValue(text[i]);
        int lo = hexValue(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

}  // namespace utils
}  // namespace lanlight
