/**
 * @file capabilities.cpp
 * @brief Built-in capability table.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#include "lanlight/core/capabilities.hpp"

#include <algorithm>
#include <cctype>

namespace lanlight {
namespace core {

namespace {

constexpr LightFeature kBasicColor = LightFeature::POWER | LightFeature::BRIGHTNESS |
                                     LightFeature::COLOR_RGB |
                                     LightFeature::COLOR_TEMPERATURE;

constexpr LightFeature kSegmentedColor = kBasicColor | LightFeature::SEGMENT_CONTROL |
                                         LightFeature::SCENES;

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Segment N (1-based) is bit N-1 of a little-endian 16-bit mask.
std::vector<SegmentCode> segmentMasks(int count) {
    std::vector<SegmentCode> codes;
    codes.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        uint16_t bit = static_cast<uint16_t>(1u << i);
        codes.push_back({static_cast<uint8_t>(bit & 0xFF), static_cast<uint8_t>(bit >> 8)});
    }
    return codes;
}

std::map<std::string, uint16_t> standardScenes() {
    return {
        {"sunrise", 0x0000},
        {"sunset", 0x0001},
        {"movie", 0x0004},
        {"dating", 0x0005},
        {"romantic", 0x0007},
        {"blinking", 0x0008},
        {"candlelight", 0x0009},
        {"snowflake", 0x000F},
    };
}

LightCapabilities basic() {
    LightCapabilities caps;
    caps.features = kBasicColor;
    return caps;
}

LightCapabilities segmented(int segmentCount) {
    LightCapabilities caps;
    caps.features = kSegmentedColor;
    caps.segments = segmentMasks(segmentCount);
    caps.scenes = standardScenes();
    return caps;
}

std::unordered_map<std::string, LightCapabilities> buildEntries() {
    static const char* const kBasicModels[] = {
        "H6046", "H6047", "H6051", "H6052", "H6056", "H6059", "H6061", "H6062",
        "H6065", "H6066", "H6067", "H606A", "H6072", "H6073", "H6076", "H6078",
        "H6087", "H6088", "H608A", "H608B", "H610A", "H610B", "H6117", "H6159",
        "H615A", "H615E", "H6163", "H6168", "H6172", "H6173", "H618A", "H618C",
        "H618E", "H618F", "H61B2", "H61B5", "H61BE", "H61C3", "H61C5", "H61D3",
        "H61E1", "H7012", "H7013", "H7020", "H7021", "H7028", "H7041", "H7042",
        "H7050", "H7051", "H7055", "H705A", "H705B", "H705C", "H7060", "H7061",
        "H7062", "H7065", "H7066", "H70C1",
    };

    // Strip lights addressable per segment.
    static const struct {
        const char* sku;
        int segments;
    } kSegmentedModels[] = {
        {"H619A", 10}, {"H619B", 10}, {"H619C", 10}, {"H619D", 10}, {"H619E", 10},
        {"H619Z", 10}, {"H61A0", 15}, {"H61A1", 15}, {"H61A2", 15}, {"H61A3", 15},
        {"H61A5", 15}, {"H61A8", 15},
    };

    std::unordered_map<std::string, LightCapabilities> entries;
    for (const char* sku : kBasicModels) {
        entries.emplace(sku, basic());
    }
    for (const auto& model : kSegmentedModels) {
        entries.emplace(model.sku, segmented(model.segments));
    }
    return entries;
}

}  // namespace

std::optional<uint16_t> LightCapabilities::sceneCode(const std::string& name) const {
    auto it = scenes.find(toLower(name));
    if (it == scenes.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<SegmentCode> LightCapabilities::segmentCode(int segment) const {
    if (segment < 1 || static_cast<size_t>(segment) > segments.size()) {
        return std::nullopt;
    }
    return segments[static_cast<size_t>(segment - 1)];
}

const CapabilityTable& CapabilityTable::builtin() {
    static const CapabilityTable table(buildEntries());
    return table;
}

const LightCapabilities& CapabilityTable::onOffOnly() {
    static const LightCapabilities caps;
    return caps;
}

const LightCapabilities* CapabilityTable::find(const std::string& sku) const {
    auto it = entries_.find(sku);
    return it == entries_.end() ? nullptr : &it->second;
}

}  // namespace core
}  // namespace lanlight
