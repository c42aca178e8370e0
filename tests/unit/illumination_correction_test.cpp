// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "services/preprocessing/illumination_correction.hpp"

#include "../test_utils/tensor_generator.hpp"

#include <gtest/gtest.h>

namespace bioimage_lab::services {
namespace {

using test_utils::createSlice;
using test_utils::sliceIndex;

/// Slice whose intensity grows linearly along x: base * (1 + x / width)
SliceImageType::Pointer createGradient(size_t width, size_t height, float base) {
    auto slice = createSlice(width, height);
    for (size_t y = 0; y < height; ++y) {
        for (size_t x = 0; x < width; ++x) {
            const float gain = 1.0f + static_cast<float>(x) / static_cast<float>(width);
            slice->SetPixel(sliceIndex(x, y), base * gain);
        }
    }
    return slice;
}

// =============================================================================
// DarkFrameSubtraction tests
// =============================================================================

TEST(DarkFrameSubtractionTest, SubtractsAndClipsAtZero) {
    auto image = createSlice(4, 4, 100.0f);
    image->SetPixel(sliceIndex(1, 1), 5.0f);
    auto dark = createSlice(4, 4, 20.0f);

    DarkFrameSubtraction correction(dark);
    auto result = correction.apply(image);
    ASSERT_TRUE(result.has_value()) << result.error().toString();

    EXPECT_FLOAT_EQ((*result)->GetPixel(sliceIndex(0, 0)), 80.0f);
    EXPECT_FLOAT_EQ((*result)->GetPixel(sliceIndex(1, 1)), 0.0f);
}

TEST(DarkFrameSubtractionTest, SizeMismatchIsRejected) {
    DarkFrameSubtraction correction(createSlice(3, 4));

    auto result = correction.apply(createSlice(4, 4));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, PreprocessingError::Code::InvalidInput);
}

TEST(DarkFrameSubtractionTest, MissingReferenceIsRejected) {
    DarkFrameSubtraction correction(nullptr);

    auto result = correction.apply(createSlice(4, 4));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, PreprocessingError::Code::InvalidParameters);
}

// =============================================================================
// RollingBallBackground tests
// =============================================================================

TEST(RollingBallBackgroundTest, SmallRadiusIsRaised) {
    EXPECT_EQ(RollingBallBackground::effectiveRadius(0), RollingBallBackground::kMinimumRadius);
    EXPECT_EQ(RollingBallBackground::effectiveRadius(2), 3u);
    EXPECT_EQ(RollingBallBackground::effectiveRadius(10), 10u);
}

TEST(RollingBallBackgroundTest, FlatBackgroundIsRemoved) {
    auto image = createSlice(30, 30, 200.0f);
    for (unsigned int y = 14; y <= 15; ++y) {
        for (unsigned int x = 14; x <= 15; ++x) {
            image->SetPixel(sliceIndex(x, y), 700.0f);
        }
    }

    RollingBallBackground correction({5});
    auto result = correction.apply(image);
    ASSERT_TRUE(result.has_value()) << result.error().toString();

    EXPECT_NEAR((*result)->GetPixel(sliceIndex(3, 3)), 0.0f, 1e-3);
    EXPECT_NEAR((*result)->GetPixel(sliceIndex(14, 14)), 500.0f, 1e-3);
}

TEST(RollingBallBackgroundTest, OutputIsNonNegative) {
    auto image = createGradient(20, 20, 50.0f);

    auto result = RollingBallBackground({4}).apply(image);
    ASSERT_TRUE(result.has_value());

    for (unsigned int x = 0; x < 20; ++x) {
        EXPECT_GE((*result)->GetPixel(sliceIndex(x, 10)), 0.0f);
    }
}

// =============================================================================
// FlatFieldReference tests
// =============================================================================

TEST(FlatFieldReferenceTest, DividesByFlatField) {
    auto flat = createGradient(8, 4, 1.0f);
    auto image = createGradient(8, 4, 300.0f);

    FlatFieldReference correction(flat);
    auto result = correction.apply(image);
    ASSERT_TRUE(result.has_value()) << result.error().toString();

    EXPECT_NEAR((*result)->GetPixel(sliceIndex(0, 0)), 300.0f, 1e-3);
    EXPECT_NEAR((*result)->GetPixel(sliceIndex(7, 3)), 300.0f, 1e-3);
}

TEST(FlatFieldReferenceTest, DarkFrameIsRemovedFromBothTerms) {
    auto image = createSlice(4, 4, 110.0f);
    auto flat = createSlice(4, 4, 60.0f);
    auto dark = createSlice(4, 4, 10.0f);

    FlatFieldReference correction(flat, dark);
    auto result = correction.apply(image);
    ASSERT_TRUE(result.has_value());

    EXPECT_FLOAT_EQ((*result)->GetPixel(sliceIndex(2, 2)), 2.0f);
    EXPECT_TRUE(correction.parameters().at("dark_frame").get<bool>());
}

TEST(FlatFieldReferenceTest, NonPositiveDenominatorPassesThrough) {
    auto image = createSlice(4, 4, 50.0f);
    auto flat = createSlice(4, 4, 10.0f);
    flat->SetPixel(sliceIndex(0, 0), 0.0f);
    auto dark = createSlice(4, 4, 0.0f);
    dark->SetPixel(sliceIndex(1, 0), 10.0f);

    auto result = FlatFieldReference(flat, dark).apply(image);
    ASSERT_TRUE(result.has_value());

    EXPECT_FLOAT_EQ((*result)->GetPixel(sliceIndex(0, 0)), 50.0f);
    EXPECT_FLOAT_EQ((*result)->GetPixel(sliceIndex(1, 0)), 50.0f);
    EXPECT_FLOAT_EQ((*result)->GetPixel(sliceIndex(2, 0)), 5.0f);
}

// =============================================================================
// FlatFieldEstimated tests
// =============================================================================

TEST(FlatFieldEstimatedTest, ConstantSliceBecomesOne) {
    auto image = createSlice(16, 16, 80.0f);

    auto result = FlatFieldEstimated({4.0}).apply(image);
    ASSERT_TRUE(result.has_value()) << result.error().toString();

    EXPECT_NEAR((*result)->GetPixel(sliceIndex(8, 8)), 1.0f, 1e-2);
}

TEST(FlatFieldEstimatedTest, NonPositiveSigmaIsRejected) {
    auto result = FlatFieldEstimated({0.0}).apply(createSlice(4, 4, 1.0f));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, PreprocessingError::Code::InvalidParameters);
}

// =============================================================================
// ShadingMapCorrection tests
// =============================================================================

TEST(ShadingMapCorrectionTest, MultipliesByMap) {
    auto image = createSlice(4, 4, 30.0f);
    auto map = createSlice(4, 4, 1.0f);
    map->SetPixel(sliceIndex(3, 0), 2.5f);

    auto result = ShadingMapCorrection(map).apply(image);
    ASSERT_TRUE(result.has_value());

    EXPECT_FLOAT_EQ((*result)->GetPixel(sliceIndex(0, 0)), 30.0f);
    EXPECT_FLOAT_EQ((*result)->GetPixel(sliceIndex(3, 0)), 75.0f);
}

// =============================================================================
// PolynomialShadingCorrection tests
// =============================================================================

TEST(PolynomialShadingCorrectionTest, LinearGradientIsFlattened) {
    auto image = createGradient(16, 8, 100.0f);

    auto result = PolynomialShadingCorrection({1}).apply(image);
    ASSERT_TRUE(result.has_value()) << result.error().toString();

    const float left = (*result)->GetPixel(sliceIndex(0, 4));
    const float right = (*result)->GetPixel(sliceIndex(15, 4));
    EXPECT_NEAR(left, right, 1e-2);

    // Mean level of the gradient is kept: 100 * (1 + 7.5 / 16)
    EXPECT_NEAR(left, 146.875f, 1e-2);
}

TEST(PolynomialShadingCorrectionTest, ZeroSliceIsLeftUnchanged) {
    auto image = createSlice(6, 6, 0.0f);

    auto result = PolynomialShadingCorrection().apply(image);
    ASSERT_TRUE(result.has_value());

    EXPECT_FLOAT_EQ((*result)->GetPixel(sliceIndex(3, 3)), 0.0f);
}

TEST(PolynomialShadingCorrectionTest, NullInputIsRejected) {
    auto result = PolynomialShadingCorrection().apply(nullptr);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, PreprocessingError::Code::InvalidInput);
}

}  // namespace
}  // namespace bioimage_lab::services
