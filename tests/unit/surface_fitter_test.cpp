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

#include "services/preprocessing/surface_fitter.hpp"

#include "../test_utils/tensor_generator.hpp"

#include <gtest/gtest.h>

namespace bioimage_lab::services {
namespace {

using test_utils::createSlice;
using test_utils::sliceIndex;

/// 5x5 slice with v = 10 + 2x + 3y in pixel coordinates
SliceImageType::Pointer createPlane() {
    auto slice = createSlice(5, 5);
    for (unsigned int y = 0; y < 5; ++y) {
        for (unsigned int x = 0; x < 5; ++x) {
            slice->SetPixel(sliceIndex(x, y), static_cast<float>(10 + 2 * x + 3 * y));
        }
    }
    return slice;
}

PolynomialSurfaceFitter::MaskType::Pointer createMask(size_t width, size_t height) {
    using MaskType = PolynomialSurfaceFitter::MaskType;
    MaskType::SizeType size;
    size[0] = width;
    size[1] = height;
    MaskType::RegionType region;
    region.SetSize(size);

    auto mask = MaskType::New();
    mask->SetRegions(region);
    mask->Allocate();
    mask->FillBuffer(0);
    return mask;
}

TEST(PolynomialSurfaceFitterTest, TermCount) {
    EXPECT_EQ(PolynomialSurfaceFitter::termCount(0), 1u);
    EXPECT_EQ(PolynomialSurfaceFitter::termCount(1), 3u);
    EXPECT_EQ(PolynomialSurfaceFitter::termCount(2), 6u);
    EXPECT_EQ(PolynomialSurfaceFitter::termCount(3), 10u);
    EXPECT_EQ(PolynomialSurfaceFitter::termCount(-1), 0u);
}

TEST(PolynomialSurfaceFitterTest, PlaneIsRecoveredExactly) {
    PolynomialSurfaceFitter fitter({1});

    auto fit = fitter.fit(createPlane());
    ASSERT_TRUE(fit.has_value()) << fit.error().toString();

    // Coordinates run over [-1, 1]: v = 20 + 4x' + 6y'
    ASSERT_EQ(fit->coefficients.size(), 3u);
    EXPECT_NEAR(fit->coefficients[0], 20.0, 1e-9);
    EXPECT_NEAR(fit->coefficients[1], 4.0, 1e-9);
    EXPECT_NEAR(fit->coefficients[2], 6.0, 1e-9);
    EXPECT_EQ(fit->sampleCount, 25u);

    EXPECT_NEAR(fit->surface->GetPixel(sliceIndex(0, 0)), 10.0f, 1e-4);
    EXPECT_NEAR(fit->surface->GetPixel(sliceIndex(4, 4)), 30.0f, 1e-4);
}

TEST(PolynomialSurfaceFitterTest, HigherDegreeStillFitsPlane) {
    PolynomialSurfaceFitter fitter({2});

    auto surface = fitter.apply(createPlane());
    ASSERT_TRUE(surface.has_value());

    EXPECT_NEAR((*surface)->GetPixel(sliceIndex(2, 3)), 23.0f, 1e-3);
    EXPECT_NEAR((*surface)->GetPixel(sliceIndex(4, 1)), 21.0f, 1e-3);
}

TEST(PolynomialSurfaceFitterTest, QuadraticBowlIsRecovered) {
    auto slice = createSlice(9, 7);
    for (unsigned int y = 0; y < 7; ++y) {
        for (unsigned int x = 0; x < 9; ++x) {
            const float dx = static_cast<float>(x) - 4.0f;
            const float dy = static_cast<float>(y) - 3.0f;
            slice->SetPixel(sliceIndex(x, y), 100.0f - dx * dx - 2.0f * dy * dy);
        }
    }

    auto surface = PolynomialSurfaceFitter({2}).apply(slice);
    ASSERT_TRUE(surface.has_value());

    EXPECT_NEAR((*surface)->GetPixel(sliceIndex(4, 3)), 100.0f, 1e-3);
    EXPECT_NEAR((*surface)->GetPixel(sliceIndex(0, 0)), 66.0f, 1e-3);
}

TEST(PolynomialSurfaceFitterTest, MaskExcludesOutliers) {
    auto slice = createPlane();
    slice->SetPixel(sliceIndex(2, 2), 10000.0f);

    auto mask = createMask(5, 5);
    mask->FillBuffer(1);
    mask->SetPixel(sliceIndex(2, 2), 0);

    auto fit = PolynomialSurfaceFitter({1}).fit(slice, mask);
    ASSERT_TRUE(fit.has_value());

    EXPECT_EQ(fit->sampleCount, 24u);
    EXPECT_NEAR(fit->surface->GetPixel(sliceIndex(2, 2)), 20.0f, 1e-3);
}

TEST(PolynomialSurfaceFitterTest, MismatchedMaskIsRejected) {
    auto fit = PolynomialSurfaceFitter({1}).fit(createPlane(), createMask(4, 5));

    ASSERT_FALSE(fit.has_value());
    EXPECT_EQ(fit.error().code, PreprocessingError::Code::InvalidInput);
}

TEST(PolynomialSurfaceFitterTest, TooFewSamplesFails) {
    auto mask = createMask(5, 5);
    mask->SetPixel(sliceIndex(0, 0), 1);
    mask->SetPixel(sliceIndex(4, 4), 1);

    auto fit = PolynomialSurfaceFitter({1}).fit(createPlane(), mask);

    ASSERT_FALSE(fit.has_value());
    EXPECT_EQ(fit.error().code, PreprocessingError::Code::ProcessingFailed);
}

TEST(PolynomialSurfaceFitterTest, NegativeDegreeIsRejected) {
    auto fit = PolynomialSurfaceFitter({-1}).fit(createPlane());

    ASSERT_FALSE(fit.has_value());
    EXPECT_EQ(fit.error().code, PreprocessingError::Code::InvalidParameters);
}

}  // namespace
}  // namespace bioimage_lab::services
