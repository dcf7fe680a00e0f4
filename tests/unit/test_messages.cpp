/**
 * @file test_messages.cpp
 * @brief Unit tests for the LAN wire codec
 *
 * Tests cover:
 * - Outbound envelopes and value clamping
 * - Segment and scene frames with their checksum
 * - Raw hex commands
 * - Decoding of scan and status responses, and rejection of malformed input
 */

#include <gtest/gtest.h>
#include <lanlight/core/messages.hpp>
#include <lanlight/utils/logger.hpp>

#include <sstream>
#include <string>
#include <variant>

using namespace lanlight;
using namespace lanlight::protocol;

class MessagesTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::instance().setLevel(utils::LogLevel::WARN);
        utils::Logger::instance().setColorEnabled(false);
        utils::Logger::instance().setOutput(&log_);
    }

    void TearDown() override {
        utils::Logger::instance().setOutput(nullptr);
        utils::Logger::instance().setLevel(utils::LogLevel::INFO);
    }

    std::ostringstream log_;
};

// =============================================================================
// Outbound
// =============================================================================

TEST_F(MessagesTest, ScanRequest) {
    EXPECT_EQ(Message::scanRequest().toJson(),
              R"({"msg":{"cmd":"scan","data":{"account_topic":"reserve"}}})");
}

TEST_F(MessagesTest, StatusRequestHasEmptyData) {
    EXPECT_EQ(Message::statusRequest().toJson(), R"({"msg":{"cmd":"devStatus","data":{}}})");
}

TEST_F(MessagesTest, TurnEncodesAsInteger) {
    EXPECT_EQ(Message::turn(true).toJson(), R"({"msg":{"cmd":"turn","data":{"value":1}}})");
    EXPECT_EQ(Message::turn(false).toJson(), R"({"msg":{"cmd":"turn","data":{"value":0}}})");
}

TEST_F(MessagesTest, BrightnessIsClamped) {
    EXPECT_EQ(Message::brightness(42).data()["value"], 42);
    EXPECT_EQ(Message::brightness(150).data()["value"], 100);
    EXPECT_EQ(Message::brightness(-3).data()["value"], 0);
}

TEST_F(MessagesTest, ColorClampsChannelsAndZeroesTemperature) {
    Message msg = Message::color(core::Rgb(300, -5, 128));
    EXPECT_EQ(msg.command(), "colorwc");
    EXPECT_EQ(msg.toJson(),
              R"({"msg":{"cmd":"colorwc","data":{"color":{"r":255,"g":0,"b":128},"colorTemInKelvin":0}}})");
}

TEST_F(MessagesTest, TemperatureIsClampedAndZeroesColor) {
    EXPECT_EQ(Message::colorTemperature(1000).data()["colorTemInKelvin"], 2000);
    EXPECT_EQ(Message::colorTemperature(12000).data()["colorTemInKelvin"], 9000);

    Message msg = Message::colorTemperature(4000);
    EXPECT_EQ(msg.data()["colorTemInKelvin"], 4000);
    EXPECT_EQ(msg.data()["color"]["r"], 0);
    EXPECT_EQ(msg.data()["color"]["g"], 0);
    EXPECT_EQ(msg.data()["color"]["b"], 0);
}

// =============================================================================
// Frames
// =============================================================================

TEST_F(MessagesTest, BuildFramePadsAndAppendsChecksum) {
    auto frame = buildFrame({0x33, 0x05, 0x04});
    ASSERT_EQ(frame.size(), kFramePayloadSize + 1);
    for (size_t i = 3; i < kFramePayloadSize; ++i) {
        EXPECT_EQ(frame[i], 0x00) << "byte " << i;
    }
    EXPECT_EQ(frame.back(), 0x32);
}

TEST_F(MessagesTest, SceneFrame) {
    auto frame = sceneFrame(0x000F);
    ASSERT_EQ(frame.size(), 20u);
    EXPECT_EQ(frame[0], 0x33);
    EXPECT_EQ(frame[1], 0x05);
    EXPECT_EQ(frame[2], 0x04);
    EXPECT_EQ(frame[3], 0x0F);
    EXPECT_EQ(frame[4], 0x00);
    EXPECT_EQ(frame.back(), 0x33 ^ 0x05 ^ 0x04 ^ 0x0F);
}

TEST_F(MessagesTest, SegmentColorFrame) {
    auto frame = segmentColorFrame({0x01, 0x00}, core::Rgb(255, 0, 0));
    ASSERT_EQ(frame.size(), 20u);
    EXPECT_EQ(frame[0], 0x33);
    EXPECT_EQ(frame[1], 0x05);
    EXPECT_EQ(frame[2], 0x15);
    EXPECT_EQ(frame[3], 0x01);
    EXPECT_EQ(frame[4], 0xFF);
    EXPECT_EQ(frame[5], 0x00);
    EXPECT_EQ(frame[6], 0x00);
    EXPECT_EQ(frame[12], 0x01);
    EXPECT_EQ(frame[13], 0x00);
    EXPECT_EQ(frame.back(), 0xDC);
}

TEST_F(MessagesTest, PtRealCarriesBase64Frames) {
    Message msg = Message::ptReal({{0x33, 0x05, 0x04, 0x00, 0x00}, {0x4D}});
    EXPECT_EQ(msg.command(), "ptReal");
    ASSERT_EQ(msg.data()["command"].size(), 2u);
    EXPECT_EQ(msg.data()["command"][0], "MwUEAAA=");
    EXPECT_EQ(msg.data()["command"][1], "TQ==");
}

TEST_F(MessagesTest, RawHexCommandSendsBytesVerbatim) {
    auto msg = rawHexCommand({"3305040000"});
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->toJson(), R"({"msg":{"cmd":"ptReal","data":{"command":["MwUEAAA="]}}})");
}

TEST_F(MessagesTest, RawHexCommandRejectsInvalidHex) {
    EXPECT_FALSE(rawHexCommand({"3305", "zz"}).has_value());
    EXPECT_NE(log_.str().find("Invalid hex frame"), std::string::npos);
}

// =============================================================================
// Decoding
// =============================================================================

TEST_F(MessagesTest, DecodesScanResponse) {
    auto response = decodeMessage(
        R"({"msg":{"cmd":"scan","data":{"ip":"192.168.1.23","device":"1F:80:C5:32:32:36:72:4E",)"
        R"("sku":"H619A","bleVersionHard":"3.01.01","wifiVersionSoft":"1.02.03"}}})");
    ASSERT_TRUE(response.has_value());
    ASSERT_TRUE(std::holds_alternative<ScanResponse>(*response));

    const auto& scan = std::get<ScanResponse>(*response);
    EXPECT_EQ(scan.fingerprint, "1F:80:C5:32:32:36:72:4E");
    EXPECT_EQ(scan.sku, "H619A");
    EXPECT_EQ(scan.ip, "192.168.1.23");
}

TEST_F(MessagesTest, DecodesStatusResponse) {
    auto response = decodeMessage(
        R"({"msg":{"cmd":"devStatus","data":{"onOff":1,"brightness":100,)"
        R"("color":{"r":255,"g":0,"b":0},"colorTemInKelvin":7200}}})");
    ASSERT_TRUE(response.has_value());
    ASSERT_TRUE(std::holds_alternative<StatusResponse>(*response));

    const auto& state = std::get<StatusResponse>(*response).state;
    EXPECT_TRUE(state.on);
    EXPECT_EQ(state.brightness, 100);
    EXPECT_EQ(state.color, core::Rgb(255, 0, 0));
    EXPECT_EQ(state.colorTemperature, 7200);
}

TEST_F(MessagesTest, StatusAcceptsBooleanOnOff) {
    auto response = decodeMessage(
        R"({"msg":{"cmd":"devStatus","data":{"onOff":false,"brightness":10}}})");
    ASSERT_TRUE(response.has_value());
    const auto& state = std::get<StatusResponse>(*response).state;
    EXPECT_FALSE(state.on);
    EXPECT_EQ(state.brightness, 10);
    EXPECT_EQ(state.color, core::Rgb());
}

TEST_F(MessagesTest, StatusWithOutOfRangeValuesIsDropped) {
    const char* payloads[] = {
        R"({"msg":{"cmd":"devStatus","data":{"onOff":1,"brightness":1e300}}})",
        R"({"msg":{"cmd":"devStatus","data":{"onOff":1,"brightness":101}}})",
        R"({"msg":{"cmd":"devStatus","data":{"onOff":1,"brightness":-1}}})",
        R"({"msg":{"cmd":"devStatus","data":{"onOff":1,"brightness":50.5}}})",
        R"({"msg":{"cmd":"devStatus","data":{"onOff":2,"brightness":50}}})",
        R"({"msg":{"cmd":"devStatus","data":{"onOff":1,"brightness":50,"colorTemInKelvin":5000000000}}})",
        R"({"msg":{"cmd":"devStatus","data":{"onOff":1,"brightness":50,"colorTemInKelvin":-2147483648}}})",
        R"({"msg":{"cmd":"devStatus","data":{"onOff":1,"brightness":50,"color":{"r":-1e20,"g":0,"b":0}}}})",
        R"({"msg":{"cmd":"devStatus","data":{"onOff":1,"brightness":50,"color":{"r":0,"g":256,"b":0}}}})",
        R"({"msg":{"cmd":"devStatus","data":{"onOff":1,"brightness":50,"color":{"r":0,"g":0,"b":18446744073709551615}}}})",
    };
    for (const char* payload : payloads) {
        EXPECT_FALSE(decodeMessage(payload).has_value()) << payload;
    }
    EXPECT_NE(log_.str().find("Dropping datagram"), std::string::npos);
}

TEST_F(MessagesTest, StatusAtRangeLimitsAccepted) {
    auto response = decodeMessage(
        R"({"msg":{"cmd":"devStatus","data":{"onOff":0,"brightness":0,)"
        R"("color":{"r":0,"g":255,"b":0},"colorTemInKelvin":65535}}})");
    ASSERT_TRUE(response.has_value());
    const auto& state = std::get<StatusResponse>(*response).state;
    EXPECT_FALSE(state.on);
    EXPECT_EQ(state.brightness, 0);
    EXPECT_EQ(state.color, core::Rgb(0, 255, 0));
    EXPECT_EQ(state.colorTemperature, 65535);
}

TEST_F(MessagesTest, ScanWithoutFingerprintIsDropped) {
    EXPECT_FALSE(decodeMessage(R"({"msg":{"cmd":"scan","data":{"ip":"192.168.1.23","sku":"H6159"}}})")
                     .has_value());
    EXPECT_FALSE(decodeMessage(R"({"msg":{"cmd":"scan","data":{"device":"AA","sku":"H6159"}}})")
                     .has_value());
}

TEST_F(MessagesTest, MalformedInputIsDroppedAndLogged) {
    EXPECT_FALSE(decodeMessage("not json at all").has_value());
    EXPECT_FALSE(decodeMessage("[1,2,3]").has_value());
    EXPECT_FALSE(decodeMessage(R"({"cmd":"scan"})").has_value());
    EXPECT_FALSE(decodeMessage(R"({"msg":{"cmd":"turn","data":{"value":1}}})").has_value());
    EXPECT_FALSE(decodeMessage(R"({"msg":{"cmd":"devStatus","data":{"brightness":5}}})").has_value());
    EXPECT_NE(log_.str().find("Dropping datagram"), std::string::npos);
}

TEST_F(MessagesTest, LongPayloadTruncatedInWarning) {
    const std::string payload(200, 'x');
    EXPECT_FALSE(decodeMessage(payload).has_value());
    EXPECT_NE(log_.str().find(std::string(50, 'x') + "..."), std::string::npos);
    EXPECT_EQ(log_.str().find(std::string(51, 'x')), std::string::npos);
}
