/**
 * @file light_types.hpp
 * @brief Value types describing a light's state.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#pragma once

#include <ostream>

namespace lanlight {
namespace core {

/**
 * @struct Rgb
 * @brief 8-bit RGB triplet (stored as int so out-of-range input can be clamped).
 */
struct Rgb {
    int r = 0;
    int g = 0;
    int b = 0;

    Rgb() = default;
    Rgb(int r_, int g_, int b_) : r(r_), g(g_), b(b_) {}

    bool operator==(const Rgb& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Rgb& other) const { return !(*this == other); }
};

inline std::ostream& operator<<(std::ostream& os, const Rgb& rgb) {
    return os << "(" << rgb.r << "," << rgb.g << "," << rgb.b << ")";
}

/**
 * @struct DeviceState
 * @brief State as last reported by (or optimistically assumed for) a device.
 */
struct DeviceState {
    bool on = false;
    int brightness = 0;             ///< Percent, 0-100
    Rgb color;
    int colorTemperature = 0;       ///< Kelvin, 0 when in RGB mode

    bool operator==(const DeviceState& other) const {
        return on == other.on && brightness == other.brightness &&
               color == other.color && colorTemperature == other.colorTemperature;
    }
    bool operator!=(const DeviceState& other) const { return !(*this == other); }
};

inline std::ostream& operator<<(std::ostream& os, const DeviceState& state) {
    os << "{on=" << (state.on ? "true" : "false");
    if (state.on) {
        os << ", brightness=" << state.brightness
           << ", color=" << state.color
           << ", temperature=" << state.colorTemperature;
    }
    return os << "}";
}

}  // namespace core
}  // namespace lanlight
