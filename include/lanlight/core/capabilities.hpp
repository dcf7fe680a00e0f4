/**
 * @file capabilities.hpp
 * @brief Per-model feature sets, segment selectors and scene codes.
 *
 * The table is built once on first use and never mutated afterwards.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#pragma once

#include "lanlight/core/export.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lanlight {
namespace core {

/**
 * @enum LightFeature
 * @brief Bit flags; combine with `|`, test with hasFeature().
 */
enum class LightFeature : uint32_t {
    NONE              = 0,
    POWER             = 1u << 0,
    BRIGHTNESS        = 1u << 1,
    COLOR_RGB         = 1u << 2,
    COLOR_TEMPERATURE = 1u << 3,
    SEGMENT_CONTROL   = 1u << 4,
    SCENES            = 1u << 5
};

constexpr LightFeature operator|(LightFeature a, LightFeature b) {
    return static_cast<LightFeature>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

constexpr LightFeature operator&(LightFeature a, LightFeature b) {
    return static_cast<LightFeature>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

constexpr bool hasFeature(LightFeature set, LightFeature feature) {
    return (set & feature) == feature && feature != LightFeature::NONE;
}

/// Name of a single feature flag.
inline const char* lightFeatureToString(LightFeature feature) {
    switch (feature) {
        case LightFeature::NONE: return "none";
        case LightFeature::POWER: return "power";
        case LightFeature::BRIGHTNESS: return "brightness";
        case LightFeature::COLOR_RGB: return "color_rgb";
        case LightFeature::COLOR_TEMPERATURE: return "color_temperature";
        case LightFeature::SEGMENT_CONTROL: return "segment_control";
        case LightFeature::SCENES: return "scenes";
        default: return "unknown";
    }
}

/// Two-byte little-endian segment bitmask as it appears in a segment frame.
using SegmentCode = std::array<uint8_t, 2>;

/**
 * @struct LightCapabilities
 * @brief What a model can do.
 */
struct LANLIGHT_CORE_API LightCapabilities {
    LightFeature features = LightFeature::POWER;
    std::vector<SegmentCode> segments;          ///< Index 0 is segment 1
    std::map<std::string, uint16_t> scenes;     ///< Lower-case name -> scene code

    bool has(LightFeature feature) const { return hasFeature(features, feature); }

    /**
     * @brief Look up a scene by name, ignoring case.
     */
    std::optional<uint16_t> sceneCode(const std::string& name) const;

    /**
     * @brief Selector for a 1-based segment index, if the model has it.
     */
    std::optional<SegmentCode> segmentCode(int segment) const;
};

/**
 * @class CapabilityTable
 * @brief Immutable SKU -> capabilities lookup.
 */
class LANLIGHT_CORE_API CapabilityTable {
public:
    /**
     * @brief The built-in table of known models.
     */
    static const CapabilityTable& builtin();

    /**
     * @brief Power-only capabilities for unrecognised models.
     */
    static const LightCapabilities& onOffOnly();

    /**
     * @return The entry for @p sku, or nullptr if the model is unknown.
     */
    const LightCapabilities* find(const std::string& sku) const;

    size_t size() const { return entries_.size(); }

    explicit CapabilityTable(std::unordered_map<std::string, LightCapabilities> entries)
        : entries_(std::move(entries)) {}

private:
    std::unordered_map<std::string, LightCapabilities> entries_;
};

}  // namespace core
}  // namespace lanlight
