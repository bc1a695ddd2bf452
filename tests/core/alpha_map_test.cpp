/**
 * @file    alpha_map_test.cpp
 * @brief   Unit tests for alpha map extraction
 * @license MIT
 */

#include <gtest/gtest.h>
#include "core/alpha_map.hpp"
#include "test_helpers.hpp"

#include <iterator>
#include <stdexcept>

namespace wmr {

namespace {

cv::Mat solid(int width, int height, const cv::Scalar& color, int type = CV_8UC3) {
    return cv::Mat(height, width, type, color);
}

}  // anonymous namespace

// =============================================================================
// Value Tests
// =============================================================================

TEST(AlphaMapTest, BlackCaptureIsFullyTransparent) {
    AlphaMap alpha = calculate_alpha_map(solid(4, 4, cv::Scalar::all(0)));

    ASSERT_EQ(alpha.total(), 16u);
    for (int y = 0; y < alpha.rows; ++y) {
        for (int x = 0; x < alpha.cols; ++x) {
            EXPECT_FLOAT_EQ(alpha.at<float>(y, x), 0.0f) << "at (" << x << ", " << y << ")";
        }
    }
}

TEST(AlphaMapTest, WhiteCaptureIsFullyOpaque) {
    AlphaMap alpha = calculate_alpha_map(solid(4, 4, cv::Scalar::all(255)));

    ASSERT_EQ(alpha.total(), 16u);
    for (int y = 0; y < alpha.rows; ++y) {
        for (int x = 0; x < alpha.cols; ++x) {
            EXPECT_FLOAT_EQ(alpha.at<float>(y, x), 1.0f);
        }
    }
}

TEST(AlphaMapTest, GrayCaptureGivesProportionalAlpha) {
    AlphaMap alpha = calculate_alpha_map(solid(4, 4, cv::Scalar::all(128)));

    const float expected = 128.0f / 255.0f;
    for (int y = 0; y < alpha.rows; ++y) {
        for (int x = 0; x < alpha.cols; ++x) {
            EXPECT_FLOAT_EQ(alpha.at<float>(y, x), expected);
        }
    }
}

TEST(AlphaMapTest, UsesMaxChannelNotAverage) {
    // BGR order: red is the brightest channel
    AlphaMap alpha = calculate_alpha_map(solid(2, 2, cv::Scalar(50, 100, 200)));

    const float expected = 200.0f / 255.0f;
    for (int y = 0; y < alpha.rows; ++y) {
        for (int x = 0; x < alpha.cols; ++x) {
            EXPECT_FLOAT_EQ(alpha.at<float>(y, x), expected);
        }
    }
}

TEST(AlphaMapTest, RowMajorOrder) {
    cv::Mat capture(2, 3, CV_8UC1);
    capture.at<uchar>(0, 0) = 0;
    capture.at<uchar>(0, 1) = 85;
    capture.at<uchar>(0, 2) = 170;
    capture.at<uchar>(1, 0) = 255;
    capture.at<uchar>(1, 1) = 128;
    capture.at<uchar>(1, 2) = 64;

    AlphaMap alpha = calculate_alpha_map(capture);
    ASSERT_TRUE(alpha.isContinuous());

    const float expected[] = {
        0.0f / 255.0f, 85.0f / 255.0f, 170.0f / 255.0f,
        255.0f / 255.0f, 128.0f / 255.0f, 64.0f / 255.0f,
    };

    const float* flat = alpha.ptr<float>();
    for (size_t i = 0; i < std::size(expected); ++i) {
        EXPECT_FLOAT_EQ(flat[i], expected[i]) << "index " << i;
    }
}

TEST(AlphaMapTest, MatchesCaptureDimensions) {
    const cv::Size sizes[] = {{1, 1}, {10, 10}, {48, 48}, {96, 96}, {100, 50}};

    for (const auto& size : sizes) {
        AlphaMap alpha = calculate_alpha_map(solid(size.width, size.height, cv::Scalar::all(128)));
        EXPECT_EQ(alpha.cols, size.width);
        EXPECT_EQ(alpha.rows, size.height);
        EXPECT_EQ(alpha.type(), CV_32FC1);
        EXPECT_EQ(alpha.total(), static_cast<size_t>(size.area()));
    }
}

TEST(AlphaMapTest, IgnoresOpacityChannel) {
    AlphaMap alpha = calculate_alpha_map(solid(3, 3, cv::Scalar(0, 0, 0, 255), CV_8UC4));

    for (int y = 0; y < alpha.rows; ++y) {
        for (int x = 0; x < alpha.cols; ++x) {
            EXPECT_FLOAT_EQ(alpha.at<float>(y, x), 0.0f);
        }
    }
}

TEST(AlphaMapTest, SixteenBitCaptureDropsLowByte) {
    AlphaMap alpha = calculate_alpha_map(solid(2, 2, cv::Scalar::all(0x80FF), CV_16UC3));
    EXPECT_FLOAT_EQ(alpha.at<float>(0, 0), 128.0f / 255.0f);
}

TEST(AlphaMapTest, ValuesStayInUnitRange) {
    for (int size : {48, 96}) {
        AlphaMap alpha = calculate_alpha_map(test::make_capture(size, 255));

        double min_val, max_val;
        cv::minMaxLoc(alpha, &min_val, &max_val);
        EXPECT_GE(min_val, 0.0);
        EXPECT_LE(max_val, 1.0);
        EXPECT_EQ(alpha.total(), static_cast<size_t>(size * size));
    }
}

TEST(AlphaMapTest, Deterministic) {
    const cv::Mat capture = test::make_capture(48);
    AlphaMap first = calculate_alpha_map(capture);
    AlphaMap second = calculate_alpha_map(capture);

    EXPECT_EQ(cv::countNonZero(first != second), 0);
}

// =============================================================================
// Error Tests
// =============================================================================

TEST(AlphaMapTest, EmptyCaptureThrows) {
    EXPECT_THROW(calculate_alpha_map(cv::Mat()), std::invalid_argument);
}

TEST(AlphaMapTest, FloatCaptureThrows) {
    EXPECT_THROW(calculate_alpha_map(solid(2, 2, cv::Scalar::all(0.5), CV_32FC3)),
                 std::invalid_argument);
}

TEST(AlphaMapTest, DecodeReferenceFromPng) {
    const auto png = test::encode_png(test::make_capture(48));
    cv::Mat capture = decode_reference(png.data(), png.size());

    EXPECT_EQ(capture.cols, 48);
    EXPECT_EQ(capture.rows, 48);
}

TEST(AlphaMapTest, DecodeReferenceRejectsGarbage) {
    const unsigned char garbage[] = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'};
    EXPECT_THROW(decode_reference(garbage, sizeof(garbage)), std::runtime_error);
    EXPECT_THROW(decode_reference(nullptr, 0), std::runtime_error);
}

TEST(AlphaMapTest, LoadReferenceMissingFileThrows) {
    EXPECT_THROW(load_reference("/nonexistent/bg_48.png"), std::runtime_error);
}

}  // namespace wmr
