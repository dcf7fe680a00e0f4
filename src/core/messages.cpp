/**
 * @file messages.cpp
 * @brief Wire codec implementation.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#include "lanlight/core/messages.hpp"
#include "lanlight/utils/checksum.hpp"
#include "lanlight/utils/encoding.hpp"
#include "lanlight/utils/logger.hpp"

#include <algorithm>
#include <cstdint>

namespace lanlight {
namespace protocol {

namespace {

constexpr size_t kLogPreviewLength = 50;

int clamp(int value, int low, int high) {
    return std::max(low, std::min(value, high));
}

std::string preview(const std::string& payload) {
    if (payload.size() <= kLogPreviewLength) {
        return payload;
    }
    return payload.substr(0, kLogPreviewLength) + "...";
}

void reportMalformed(const std::string& payload, const std::string& reason) {
    LOG_WARN("Codec", "Dropping datagram ({}): {}", reason, preview(payload));
    LOG_DEBUG("Codec", "Full payload: {}", payload);
}

// onOff arrives as 0/1 from most firmware, occasionally as a boolean.
std::optional<bool> readFlag(const nlohmann::json& value) {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number_integer()) {
        const int64_t flag = value.get<int64_t>();
        if (flag == 0 || flag == 1) {
            return flag == 1;
        }
    }
    return std::nullopt;
}

// Absent fields read as 0; present ones must be integers within [low, high].
std::optional<int> readInt(const nlohmann::json& object, const char* key, int low, int high) {
    auto it = object.find(key);
    if (it == object.end()) {
        return 0;
    }
    if (!it->is_number_integer()) {
        return std::nullopt;
    }
    if (it->is_number_unsigned()) {
        const uint64_t value = it->get<uint64_t>();
        if (value > static_cast<uint64_t>(high)) {
            return std::nullopt;
        }
        return static_cast<int>(value);
    }
    const int64_t value = it->get<int64_t>();
    if (value < low || value > high) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

std::string readString(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

std::optional<Response> decodeScan(const std::string& payload, const nlohmann::json& data) {
    ScanResponse scan;
    scan.fingerprint = readString(data, "device");
    scan.sku = readString(data, "sku");
    scan.ip = readString(data, "ip");
    if (scan.fingerprint.empty() || scan.ip.empty()) {
        reportMalformed(payload, "scan response without device or ip");
        return std::nullopt;
    }
    return Response{scan};
}

std::optional<Response> decodeStatus(const std::string& payload, const nlohmann::json& data) {
    auto onOff = data.find("onOff");
    if (onOff == data.end() || !data.contains("brightness")) {
        reportMalformed(payload, "status response without onOff or brightness");
        return std::nullopt;
    }
    auto on = readFlag(*onOff);
    if (!on) {
        reportMalformed(payload, "status response with invalid onOff");
        return std::nullopt;
    }

    auto brightness = readInt(data, "brightness", kBrightnessMin, kBrightnessMax);
    auto kelvin = readInt(data, "colorTemInKelvin", 0, kTemperatureReportMaxKelvin);
    if (!brightness || !kelvin) {
        reportMalformed(payload, "status response with out-of-range brightness or temperature");
        return std::nullopt;
    }

    StatusResponse status;
    status.state.on = *on;
    status.state.brightness = *brightness;
    status.state.colorTemperature = *kelvin;

    auto color = data.find("color");
    if (color != data.end() && color->is_object()) {
        auto r = readInt(*color, "r", 0, kColorChannelMax);
        auto g = readInt(*color, "g", 0, kColorChannelMax);
        auto b = readInt(*color, "b", 0, kColorChannelMax);
        if (!r || !g || !b) {
            reportMalformed(payload, "status response with out-of-range color");
            return std::nullopt;
        }
        status.state.color = core::Rgb(*r, *g, *b);
    }
    return Response{status};
}

}  // namespace

// =============================================================================
// Message
// =============================================================================

Message::Message(std::string command, nlohmann::ordered_json data)
    : command_(std::move(command))
    , data_(std::move(data)) {}

std::string Message::toJson() const {
    nlohmann::ordered_json envelope;
    envelope["msg"]["cmd"] = command_;
    envelope["msg"]["data"] = data_;
    return envelope.dump();
}

Message Message::scanRequest() {
    return Message(command::SCAN, {{"account_topic", "reserve"}});
}

Message Message::statusRequest() {
    return Message(command::STATUS, nlohmann::ordered_json::object());
}

Message Message::turn(bool on) {
    return Message(command::TURN, {{"value", on ? 1 : 0}});
}

Message Message::brightness(int percent) {
    return Message(command::BRIGHTNESS,
                   {{"value", clamp(percent, kBrightnessMin, kBrightnessMax)}});
}

Message Message::color(const core::Rgb& rgb) {
    nlohmann::ordered_json data;
    data["color"]["r"] = clamp(rgb.r, 0, kColorChannelMax);
    data["color"]["g"] = clamp(rgb.g, 0, kColorChannelMax);
    data["color"]["b"] = clamp(rgb.b, 0, kColorChannelMax);
    data["colorTemInKelvin"] = 0;
    return Message(command::COLOR, std::move(data));
}

Message Message::colorTemperature(int kelvin) {
    nlohmann::ordered_json data;
    data["color"]["r"] = 0;
    data["color"]["g"] = 0;
    data["color"]["b"] = 0;
    data["colorTemInKelvin"] = clamp(kelvin, kTemperatureMinKelvin, kTemperatureMaxKelvin);
    return Message(command::COLOR, std::move(data));
}

Message Message::ptReal(const std::vector<std::vector<uint8_t>>& frames) {
    auto encoded = nlohmann::ordered_json::array();
    for (const auto& frame : frames) {
        encoded.push_back(utils::base64Encode(frame));
    }
    return Message(command::PT_REAL, {{"command", std::move(encoded)}});
}

// =============================================================================
// Frames
// =============================================================================

std::vector<uint8_t> buildFrame(std::vector<uint8_t> payload) {
    if (payload.size() < kFramePayloadSize) {
        payload.resize(kFramePayloadSize, 0x00);
    }
    payload.push_back(utils::Xor8::compute(payload));
    return payload;
}

std::vector<uint8_t> segmentColorFrame(const core::SegmentCode& segment, const core::Rgb& rgb) {
    std::vector<uint8_t> payload = {
        0x33, 0x05, 0x15, 0x01,
        static_cast<uint8_t>(clamp(rgb.r, 0, kColorChannelMax)),
        static_cast<uint8_t>(clamp(rgb.g, 0, kColorChannelMax)),
        static_cast<uint8_t>(clamp(rgb.b, 0, kColorChannelMax)),
        0x00, 0x00, 0x00, 0x00, 0x00,
        segment[0], segment[1],
    };
    return buildFrame(std::move(payload));
}

std::vector<uint8_t> sceneFrame(uint16_t code) {
    return buildFrame({0x33, 0x05, 0x04,
                       static_cast<uint8_t>(code & 0xFF),
                       static_cast<uint8_t>(code >> 8)});
}

std::optional<Message> rawHexCommand(const std::vector<std::string>& hexFrames) {
    std::vector<std::vector<uint8_t>> frames;
    frames.reserve(hexFrames.size());
    for (const auto& hex : hexFrames) {
        auto bytes = utils::hexDecode(hex);
        if (!bytes) {
            LOG_WARN("Codec", "Invalid hex frame: {}", preview(hex));
            return std::nullopt;
        }
        frames.push_back(std::move(*bytes));
    }
    return Message::ptReal(frames);
}

// =============================================================================
// Decoding
// =============================================================================

std::optional<Response> decodeMessage(const std::string& payload) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::exception& e) {
        reportMalformed(payload, e.what());
        return std::nullopt;
    }

    if (!root.is_object()) {
        reportMalformed(payload, "not a JSON object");
        return std::nullopt;
    }
    auto msg = root.find("msg");
    if (msg == root.end() || !msg->is_object()) {
        reportMalformed(payload, "missing msg envelope");
        return std::nullopt;
    }
    auto cmd = msg->find("cmd");
    auto data = msg->find("data");
    if (cmd == msg->end() || !cmd->is_string() || data == msg->end() || !data->is_object()) {
        reportMalformed(payload, "missing cmd or data");
        return std::nullopt;
    }

    const std::string name = cmd->get<std::string>();
    if (name == command::SCAN) {
        return decodeScan(payload, *data);
    }
    if (name == command::STATUS) {
        return decodeStatus(payload, *data);
    }
    reportMalformed(payload, "unknown command '" + name + "'");
    return std::nullopt;
}

}  // namespace protocol
}  // namespace lanlight
