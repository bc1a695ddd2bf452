/**
 * @file    tool_config_test.cpp
 * @brief   Unit tests for configuration loading
 * @license MIT
 */

#include <gtest/gtest.h>
#include "config/tool_config.hpp"
#include "test_helpers.hpp"

namespace wmr {

TEST(ToolConfigTest, Defaults) {
    ToolConfig config;
    EXPECT_EQ(config.suffix, "_clean");
    EXPECT_EQ(config.jpeg_quality, 95);
    EXPECT_EQ(config.png_compression, 6);
    EXPECT_TRUE(config.assets_dir.empty());
    EXPECT_EQ(config.log_level, "info");
}

TEST(ToolConfigTest, ParseAllKeys) {
    auto config = parse_config(R"({
        "suffix": "_nowm",
        "jpeg_quality": 90,
        "png_compression": 9,
        "assets_dir": "/opt/assets",
        "log_level": "debug"
    })");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->suffix, "_nowm");
    EXPECT_EQ(config->jpeg_quality, 90);
    EXPECT_EQ(config->png_compression, 9);
    EXPECT_EQ(config->assets_dir, std::filesystem::path("/opt/assets"));
    EXPECT_EQ(config->log_level, "debug");
}

TEST(ToolConfigTest, MissingKeysKeepDefaults) {
    auto config = parse_config(R"({"suffix": "_x", "unrelated": [1, 2, 3]})");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->suffix, "_x");
    EXPECT_EQ(config->jpeg_quality, 95);
    EXPECT_EQ(config->png_compression, 6);
}

TEST(ToolConfigTest, OutOfRangeValuesAreClamped) {
    auto config = parse_config(R"({"jpeg_quality": 150, "png_compression": -3})");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->jpeg_quality, 100);
    EXPECT_EQ(config->png_compression, 0);
}

TEST(ToolConfigTest, InvalidDocumentsAreRejected) {
    EXPECT_FALSE(parse_config("{ not json").has_value());
    EXPECT_FALSE(parse_config("[1, 2]").has_value());
    EXPECT_FALSE(parse_config(R"({"jpeg_quality": "high"})").has_value());
}

TEST(ToolConfigTest, UnknownLogLevelIsRejected) {
    // Unrecognised names would otherwise map to spdlog's "off" and hide errors
    EXPECT_FALSE(parse_config(R"({"log_level": "INFO"})").has_value());
    EXPECT_FALSE(parse_config(R"({"log_level": "verbose"})").has_value());
    EXPECT_FALSE(parse_config(R"({"log_level": ""})").has_value());
}

TEST(ToolConfigTest, KnownLogLevelsAreAccepted) {
    for (const char* level : {"trace", "debug", "info", "warning", "error", "critical", "off"}) {
        auto config = parse_config(std::string(R"({"log_level": ")") + level + "\"}");
        ASSERT_TRUE(config.has_value()) << level;
        EXPECT_EQ(config->log_level, level);
    }
}

TEST(ToolConfigTest, NonIntegerNumbersAreRejected) {
    EXPECT_FALSE(parse_config(R"({"jpeg_quality": 90.5})").has_value());
    EXPECT_FALSE(parse_config(R"({"jpeg_quality": 1e10})").has_value());
    EXPECT_FALSE(parse_config(R"({"png_compression": true})").has_value());
}

TEST(ToolConfigTest, HugeIntegersClampWithoutWrapping) {
    auto config = parse_config(
        R"({"jpeg_quality": 3000000000, "png_compression": -5000000000})");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->jpeg_quality, 100);
    EXPECT_EQ(config->png_compression, 0);

    auto unsigned_max = parse_config(R"({"jpeg_quality": 18446744073709551615})");
    ASSERT_TRUE(unsigned_max.has_value());
    EXPECT_EQ(unsigned_max->jpeg_quality, 100);
}

TEST(ToolConfigTest, LoadFromFile) {
    test::TempDir dir;
    const auto path = dir.touch("config.json", R"({"suffix": "_done", "png_compression": 3})");

    auto config = load_config(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->suffix, "_done");
    EXPECT_EQ(config->png_compression, 3);
}

TEST(ToolConfigTest, LoadMissingFile) {
    EXPECT_FALSE(load_config("/nonexistent/config.json").has_value());
}

}  // namespace wmr
