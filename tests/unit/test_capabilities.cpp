/**
 * @file test_capabilities.cpp
 * @brief Unit tests for the SKU capability table
 */

#include <gtest/gtest.h>
#include <lanlight/core/capabilities.hpp>

using namespace lanlight::core;

TEST(LightFeatureTest, FlagOperators) {
    LightFeature set = LightFeature::POWER | LightFeature::SCENES;
    EXPECT_TRUE(hasFeature(set, LightFeature::POWER));
    EXPECT_TRUE(hasFeature(set, LightFeature::SCENES));
    EXPECT_FALSE(hasFeature(set, LightFeature::BRIGHTNESS));
    EXPECT_FALSE(hasFeature(set, LightFeature::NONE));
    EXPECT_TRUE(hasFeature(set, LightFeature::POWER | LightFeature::SCENES));
    EXPECT_FALSE(hasFeature(set, LightFeature::POWER | LightFeature::COLOR_RGB));
}

TEST(LightFeatureTest, Names) {
    EXPECT_STREQ(lightFeatureToString(LightFeature::SEGMENT_CONTROL), "segment_control");
    EXPECT_STREQ(lightFeatureToString(LightFeature::COLOR_TEMPERATURE), "color_temperature");
}

TEST(CapabilityTableTest, BasicColorModel) {
    const LightCapabilities* caps = CapabilityTable::builtin().find("H6159");
    ASSERT_NE(caps, nullptr);
    EXPECT_TRUE(caps->has(LightFeature::POWER));
    EXPECT_TRUE(caps->has(LightFeature::BRIGHTNESS));
    EXPECT_TRUE(caps->has(LightFeature::COLOR_RGB));
    EXPECT_TRUE(caps->has(LightFeature::COLOR_TEMPERATURE));
    EXPECT_FALSE(caps->has(LightFeature::SEGMENT_CONTROL));
    EXPECT_FALSE(caps->has(LightFeature::SCENES));
    EXPECT_TRUE(caps->segments.empty());
    EXPECT_FALSE(caps->sceneCode("sunrise").has_value());
}

TEST(CapabilityTableTest, SegmentedModel) {
    const LightCapabilities* caps = CapabilityTable::builtin().find("H619A");
    ASSERT_NE(caps, nullptr);
    EXPECT_TRUE(caps->has(LightFeature::SEGMENT_CONTROL));
    EXPECT_TRUE(caps->has(LightFeature::SCENES));
    EXPECT_EQ(caps->segments.size(), 10u);

    const LightCapabilities* wide = CapabilityTable::builtin().find("H61A2");
    ASSERT_NE(wide, nullptr);
    EXPECT_EQ(wide->segments.size(), 15u);
}

TEST(CapabilityTableTest, SegmentCodesAreLittleEndianBitmasks) {
    const LightCapabilities* caps = CapabilityTable::builtin().find("H61A0");
    ASSERT_NE(caps, nullptr);

    EXPECT_EQ(caps->segmentCode(1), (SegmentCode{0x01, 0x00}));
    EXPECT_EQ(caps->segmentCode(8), (SegmentCode{0x80, 0x00}));
    EXPECT_EQ(caps->segmentCode(9), (SegmentCode{0x00, 0x01}));
    EXPECT_EQ(caps->segmentCode(15), (SegmentCode{0x00, 0x40}));
    EXPECT_FALSE(caps->segmentCode(0).has_value());
    EXPECT_FALSE(caps->segmentCode(16).has_value());
}

TEST(CapabilityTableTest, SceneLookupIgnoresCase) {
    const LightCapabilities* caps = CapabilityTable::builtin().find("H619Z");
    ASSERT_NE(caps, nullptr);
    EXPECT_EQ(caps->sceneCode("sunrise"), 0x0000);
    EXPECT_EQ(caps->sceneCode("Sunset"), 0x0001);
    EXPECT_EQ(caps->sceneCode("MOVIE"), 0x0004);
    EXPECT_EQ(caps->sceneCode("snowflake"), 0x000F);
    EXPECT_FALSE(caps->sceneCode("disco").has_value());
}

TEST(CapabilityTableTest, UnknownModel) {
    EXPECT_EQ(CapabilityTable::builtin().find("H0000"), nullptr);

    const LightCapabilities& fallback = CapabilityTable::onOffOnly();
    EXPECT_TRUE(fallback.has(LightFeature::POWER));
    EXPECT_FALSE(fallback.has(LightFeature::BRIGHTNESS));
    EXPECT_FALSE(fallback.has(LightFeature::COLOR_RGB));
}

TEST(CapabilityTableTest, CustomTable) {
    LightCapabilities caps;
    caps.features = LightFeature::POWER | LightFeature::BRIGHTNESS;
    CapabilityTable table({{"TEST1", caps}});

    EXPECT_EQ(table.size(), 1u);
    ASSERT_NE(table.find("TEST1"), nullptr);
    EXPECT_TRUE(table.find("TEST1")->has(LightFeature::BRIGHTNESS));
    EXPECT_EQ(table.find("H6159"), nullptr);
}
