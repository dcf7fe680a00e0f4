/**
 * @file encoding.hpp
 * @brief Base64 encoding and hex decoding for binary frames.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#pragma once

#include "lanlight/utils/export.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanlight {
namespace utils {

/**
 * @brief Encode bytes as standard (RFC 4648, padded) base64.
 */
LANLIGHT_UTILS_API std::string base64Encode(const std::vector<uint8_t>& bytes);

/**
 * @brief Decode a hex string ("3305040a", case-insensitive, even length).
 * @return The decoded bytes, or std::nullopt on malformed input.
 */
LANLIGHT_UTILS_API std::optional<std::vector<uint8_t>> hexDecode(const std::string& text);

}  // namespace utils
}  // namespace lanlight
