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

#include "services/segmentation/channel_binarizer.hpp"

#include "../test_utils/tensor_generator.hpp"

#include <gtest/gtest.h>

#include <limits>

namespace bioimage_lab::services {
namespace {

using core::FloatTensorType;
using core::MaskTensorType;
using test_utils::makeShape;
using test_utils::tensorIndex;

class ChannelBinarizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        normalized_ = core::allocateTensor<FloatTensorType>(makeShape(1, 2, 1, 2, 2), 0.0);
        normalized_->SetPixel(tensorIndex(0, 0, 0, 0, 0), 0.25);
        normalized_->SetPixel(tensorIndex(0, 0, 0, 0, 1), 0.5);
        normalized_->SetPixel(tensorIndex(0, 0, 0, 1, 0), 0.75);
        normalized_->SetPixel(tensorIndex(0, 1, 0, 1, 1), 1.0);
    }

    FloatTensorType::Pointer normalized_;
    ChannelBinarizer binarizer_;
};

TEST_F(ChannelBinarizerTest, StrictlyGreaterThanThresholdIsForeground) {
    auto mask = binarizer_.binarize(normalized_, 0, 2, 0.5);
    ASSERT_TRUE(mask.has_value()) << mask.error().toString();

    EXPECT_EQ((*mask)->GetPixel(tensorIndex(0, 0, 0, 0, 0)), 0);
    EXPECT_EQ((*mask)->GetPixel(tensorIndex(0, 0, 0, 0, 1)), 0);
    EXPECT_EQ((*mask)->GetPixel(tensorIndex(0, 0, 0, 1, 0)), 255);
    EXPECT_EQ((*mask)->GetPixel(tensorIndex(0, 1, 0, 1, 1)), 255);
    EXPECT_EQ(core::TensorShape::of(mask->GetPointer()), makeShape(1, 2, 1, 2, 2));
}

TEST_F(ChannelBinarizerTest, ZScoreValuesBelowZeroAreBackground) {
    normalized_->SetPixel(tensorIndex(0, 1, 0, 0, 0), -3.0);

    auto mask = binarizer_.binarize(normalized_, 1, 2, -1.0);
    ASSERT_TRUE(mask.has_value());

    EXPECT_EQ((*mask)->GetPixel(tensorIndex(0, 1, 0, 0, 0)), 0);
    EXPECT_EQ((*mask)->GetPixel(tensorIndex(0, 0, 0, 0, 0)), 255);
}

TEST_F(ChannelBinarizerTest, MissingNormalizationIsAPreconditionViolation) {
    auto mask = binarizer_.binarize(nullptr, 0, 2, 0.5);

    ASSERT_FALSE(mask.has_value());
    EXPECT_EQ(mask.error().code, core::BioImageError::Code::PreconditionViolation);
    EXPECT_FALSE(binarizer_.isAllocated());
}

TEST_F(ChannelBinarizerTest, ChannelOutOfRangeCitesBound) {
    auto mask = binarizer_.binarize(normalized_, 5, 2, 0.5);

    ASSERT_FALSE(mask.has_value());
    EXPECT_EQ(mask.error().code, core::BioImageError::Code::IndexOutOfRange);
    EXPECT_NE(mask.error().message.find("0-1"), std::string::npos);
    EXPECT_FALSE(binarizer_.isAllocated());
}

TEST_F(ChannelBinarizerTest, NaNThresholdIsRejected) {
    auto mask = binarizer_.binarize(normalized_, 0, 2, std::numeric_limits<double>::quiet_NaN());

    ASSERT_FALSE(mask.has_value());
    EXPECT_EQ(mask.error().code, core::BioImageError::Code::InvalidParameters);
}

TEST_F(ChannelBinarizerTest, LargestFiniteThresholdGivesEmptyMask) {
    auto mask = binarizer_.binarize(normalized_, 0, 2, std::numeric_limits<double>::max());
    ASSERT_TRUE(mask.has_value()) << mask.error().toString();

    EXPECT_EQ((*mask)->GetPixel(tensorIndex(0, 1, 0, 1, 1)), 0);
    EXPECT_EQ((*mask)->GetPixel(tensorIndex(0, 0, 0, 1, 0)), 0);
    EXPECT_TRUE(binarizer_.hasChannel(0));
}

TEST_F(ChannelBinarizerTest, PositiveInfinityThresholdGivesEmptyMask) {
    normalized_->SetPixel(tensorIndex(0, 0, 0, 0, 0), std::numeric_limits<double>::infinity());

    auto mask = binarizer_.binarize(normalized_, 0, 2, std::numeric_limits<double>::infinity());
    ASSERT_TRUE(mask.has_value()) << mask.error().toString();

    EXPECT_EQ((*mask)->GetPixel(tensorIndex(0, 0, 0, 0, 0)), 0);
    EXPECT_EQ((*mask)->GetPixel(tensorIndex(0, 1, 0, 1, 1)), 0);
}

TEST_F(ChannelBinarizerTest, NegativeInfinityThresholdGivesFullMask) {
    normalized_->SetPixel(tensorIndex(0, 1, 0, 0, 0), std::numeric_limits<double>::lowest());

    auto mask = binarizer_.binarize(normalized_, 0, 2, -std::numeric_limits<double>::infinity());
    ASSERT_TRUE(mask.has_value()) << mask.error().toString();

    EXPECT_EQ((*mask)->GetPixel(tensorIndex(0, 0, 0, 0, 0)), 255);
    EXPECT_EQ((*mask)->GetPixel(tensorIndex(0, 1, 0, 0, 0)), 255);
    EXPECT_EQ((*mask)->GetPixel(tensorIndex(0, 1, 0, 1, 1)), 255);
}

TEST_F(ChannelBinarizerTest, CacheIsAllocatedOnFirstSuccessAndHoldsACopy) {
    EXPECT_FALSE(binarizer_.isAllocated());

    auto mask = binarizer_.binarize(normalized_, 1, 2, 0.5);
    ASSERT_TRUE(mask.has_value());
    EXPECT_TRUE(binarizer_.isAllocated());
    EXPECT_TRUE(binarizer_.hasChannel(1));
    EXPECT_FALSE(binarizer_.hasChannel(0));

    (*mask)->FillBuffer(7);
    EXPECT_EQ(binarizer_.cached(1)->GetPixel(tensorIndex(0, 0, 0, 1, 0)), 255);

    binarizer_.reset();
    EXPECT_FALSE(binarizer_.isAllocated());
}

}  // namespace
}  // namespace bioimage_lab::services
