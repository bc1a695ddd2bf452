/**
 * @file    watermark_geometry_test.cpp
 * @brief   Unit tests for watermark size presets and placement
 * @license MIT
 */

#include <gtest/gtest.h>
#include "core/watermark_geometry.hpp"

namespace wmr {

// =============================================================================
// Size Detection
// =============================================================================

TEST(WatermarkGeometryTest, LargeWhenBothDimensionsExceed1024) {
    const cv::Size sizes[] = {{1025, 1025}, {2000, 2000}, {4096, 4096}, {2000, 1500}};

    for (const auto& s : sizes) {
        const WatermarkConfig config = detect_config(s.width, s.height);
        EXPECT_EQ(config.size, 96) << s.width << "x" << s.height;
        EXPECT_EQ(config.margin, 64) << s.width << "x" << s.height;
        EXPECT_EQ(get_watermark_size(s.width, s.height), WatermarkSize::Large);
    }
}

TEST(WatermarkGeometryTest, SmallOtherwise) {
    const cv::Size sizes[] = {
        {100, 100}, {512, 512}, {800, 600},
        {1024, 1024},               // Boundary is exclusive
        {1025, 800}, {800, 1025},   // Only one dimension exceeds 1024
        {1920, 1080}, {1080, 1920},
        {1024, 2000}, {2000, 1024},
        {0, 0},
    };

    for (const auto& s : sizes) {
        const WatermarkConfig config = detect_config(s.width, s.height);
        EXPECT_EQ(config, kSmallConfig) << s.width << "x" << s.height;
        EXPECT_EQ(get_watermark_size(s.width, s.height), WatermarkSize::Small);
    }
}

TEST(WatermarkGeometryTest, PresetsAreFixed) {
    EXPECT_EQ(config_for(WatermarkSize::Small), (WatermarkConfig{48, 32}));
    EXPECT_EQ(config_for(WatermarkSize::Large), (WatermarkConfig{96, 64}));
    EXPECT_STREQ(to_string(WatermarkSize::Small), "Small");
    EXPECT_STREQ(to_string(WatermarkSize::Large), "Large");
}

// =============================================================================
// Position
// =============================================================================

TEST(WatermarkGeometryTest, PositionSmallConfig) {
    const cv::Rect pos = calculate_position(800, 600, kSmallConfig);

    EXPECT_EQ(pos.x, 720);
    EXPECT_EQ(pos.y, 520);
    EXPECT_EQ(pos.width, 48);
    EXPECT_EQ(pos.height, 48);
}

TEST(WatermarkGeometryTest, PositionLargeConfig) {
    const cv::Rect pos = calculate_position(2000, 2000, kLargeConfig);
    EXPECT_EQ(pos.x, 1840);
    EXPECT_EQ(pos.y, 1840);

    const cv::Rect wide = calculate_position(1920, 1080, kLargeConfig);
    EXPECT_EQ(wide.x, 1920 - 64 - 96);
    EXPECT_EQ(wide.y, 1080 - 64 - 96);
}

TEST(WatermarkGeometryTest, PositionEndsAtMarginFromCorner) {
    const cv::Rect pos = calculate_position(640, 480, kSmallConfig);
    EXPECT_EQ(pos.br().x, 640 - 32);
    EXPECT_EQ(pos.br().y, 480 - 32);
}

TEST(WatermarkGeometryTest, PositionNotClampedForTinyImages) {
    const cv::Rect pos = calculate_position(50, 30, kSmallConfig);
    EXPECT_EQ(pos.x, 50 - 32 - 48);
    EXPECT_EQ(pos.y, 30 - 32 - 48);
    EXPECT_LT(pos.x, 0);
    EXPECT_LT(pos.y, 0);
}

// =============================================================================
// Info Query
// =============================================================================

TEST(WatermarkGeometryTest, InfoMatchesDetectAndPosition) {
    const cv::Size sizes[] = {{800, 600}, {1024, 768}, {2000, 2000}, {10, 10}};

    for (const auto& s : sizes) {
        const WatermarkInfo info = get_watermark_info(s.width, s.height);
        const WatermarkConfig expected = detect_config(s.width, s.height);

        EXPECT_EQ(info.config, expected);
        EXPECT_EQ(info.position, calculate_position(s.width, s.height, expected));
    }
}

}  // namespace wmr
