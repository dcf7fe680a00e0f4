/**
 * @file checksum.hpp
 * @brief XOR-8 checksum used to terminate binary light frames.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#pragma once

#include "lanlight/utils/export.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace lanlight {
namespace utils {

/**
 * @class Xor8
 * @brief XOR of every byte, the trailing check byte of a light frame.
 *
 * Usage:
 * @code
 * frame.push_back(Xor8::compute(frame));
 * @endcode
 */
class LANLIGHT_UTILS_API Xor8 {
public:
    static uint8_t compute(const void* data, size_t length) {
        const uint8_t* bytes = static_cast<const uint8_t*>(data);
        uint8_t value = 0;
        for (size_t i = 0; i < length; ++i) {
            value ^= bytes[i];
        }
        return value;
    }

    static uint8_t compute(const std::vector<uint8_t>& bytes) {
        return compute(bytes.data(), bytes.size());
    }
};

}  // namespace utils
}  // namespace lanlight
