/**
 * @file messages.hpp
 * @brief JSON wire codec and binary ptReal frame builders.
 *
 * Every datagram carries `{"msg":{"cmd":<name>,"data":<object>}}`.
 * Outbound payloads are serialized compactly with keys in insertion order.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#pragma once

#include "lanlight/core/capabilities.hpp"
#include "lanlight/core/export.hpp"
#include "lanlight/core/light_types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lanlight {
namespace protocol {

constexpr int kBrightnessMin = 0;
constexpr int kBrightnessMax = 100;
constexpr int kColorChannelMax = 255;
constexpr int kTemperatureMinKelvin = 2000;
constexpr int kTemperatureMaxKelvin = 9000;
/// Largest temperature accepted in a status response.
constexpr int kTemperatureReportMaxKelvin = 65535;

/// Frame size before the checksum byte.
constexpr size_t kFramePayloadSize = 19;

namespace command {
constexpr const char* SCAN = "scan";
constexpr const char* STATUS = "devStatus";
constexpr const char* TURN = "turn";
constexpr const char* BRIGHTNESS = "brightness";
constexpr const char* COLOR = "colorwc";
constexpr const char* PT_REAL = "ptReal";
}  // namespace command

/**
 * @class Message
 * @brief One outbound command: a name plus its data object.
 */
class LANLIGHT_CORE_API Message {
public:
    Message(std::string command, nlohmann::ordered_json data);

    const std::string& command() const { return command_; }
    const nlohmann::ordered_json& data() const { return data_; }

    /**
     * @brief Compact JSON envelope, ready to send.
     */
    std::string toJson() const;

    /// `scan` with the fixed account topic.
    static Message scanRequest();

    /// `devStatus` with an empty data object.
    static Message statusRequest();

    static Message turn(bool on);

    /// Brightness clamped to 0..100.
    static Message brightness(int percent);

    /// RGB clamped to 0..255, temperature field 0.
    static Message color(const core::Rgb& rgb);

    /// RGB zero, temperature clamped to 2000..9000 K.
    static Message colorTemperature(int kelvin);

    /// `ptReal` carrying each frame base64 encoded, in order.
    static Message ptReal(const std::vector<std::vector<uint8_t>>& frames);

private:
    std::string command_;
    nlohmann::ordered_json data_;
};

/**
 * @brief Pad @p payload with zeros to 19 bytes and append the XOR checksum.
 *
 * Payloads longer than 19 bytes are kept whole; the checksum still covers
 * every preceding byte.
 */
LANLIGHT_CORE_API std::vector<uint8_t> buildFrame(std::vector<uint8_t> payload);

/**
 * @brief Checksummed frame setting one segment to @p rgb.
 */
LANLIGHT_CORE_API std::vector<uint8_t> segmentColorFrame(const core::SegmentCode& segment,
                                                         const core::Rgb& rgb);

/**
 * @brief Checksummed frame selecting scene @p code.
 */
LANLIGHT_CORE_API std::vector<uint8_t> sceneFrame(uint16_t code);

/**
 * @brief `ptReal` message carrying raw frames given as hex text.
 *
 * Frames are sent verbatim: no padding, no checksum.
 * @return std::nullopt if any frame is not valid hex.
 */
LANLIGHT_CORE_API std::optional<Message> rawHexCommand(const std::vector<std::string>& hexFrames);

/**
 * @struct ScanResponse
 * @brief A device answering a scan.
 */
struct ScanResponse {
    std::string fingerprint;
    std::string sku;
    std::string ip;
};

/**
 * @struct StatusResponse
 * @brief A device reporting its state.
 */
struct StatusResponse {
    core::DeviceState state;
};

using Response = std::variant<ScanResponse, StatusResponse>;

/**
 * @brief Decode an inbound datagram.
 *
 * Malformed JSON, a missing envelope, an unknown command or missing
 * required fields are logged and yield std::nullopt.
 */
LANLIGHT_CORE_API std::optional<Response> decodeMessage(const std::string& payload);

}  // namespace protocol
}  // namespace lanlight
