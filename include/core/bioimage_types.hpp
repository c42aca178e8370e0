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

/**
 * @file bioimage_types.hpp
 * @brief Tensor types, shape bookkeeping and error information for bioimages
 * @details A bioimage is held as a 5D ITK image. The logical axis order is
 *          (Time, Z, Channel, Y, X); ITK indexes the fastest axis first, so the
 *          ITK index order is [X, Y, C, Z, T] and the buffer layout matches a
 *          C-ordered (T, Z, C, Y, X) array.
 *
 * @since 1.0.0
 */

#pragma once

#include <cstddef>
#include <string>

#include <itkImage.h>
#include <itkImageDuplicator.h>

namespace bioimage_lab::core {

/// Number of tensor axes
constexpr unsigned int TensorDimension = 5;

/// ITK index positions of the logical tensor axes
namespace axis {
constexpr unsigned int X = 0;
constexpr unsigned int Y = 1;
constexpr unsigned int Channel = 2;
constexpr unsigned int Z = 3;
constexpr unsigned int Time = 4;
}  // namespace axis

/// Raw samples (8-bit sources are upconverted to this depth)
using RawPixelType = unsigned short;

/// Raw tensor [T, Z, C, Y, X]
using RawTensorType = itk::Image<RawPixelType, TensorDimension>;

/// Normalized tensor, channel extent is always 1
using FloatTensorType = itk::Image<double, TensorDimension>;

/// Binary mask tensor (0 or 255), channel extent is always 1
using MaskTensorType = itk::Image<unsigned char, TensorDimension>;

/// 2D (Y, X) views
using RawSliceType = itk::Image<RawPixelType, 2>;
using FloatSliceType = itk::Image<double, 2>;
using MaskSliceType = itk::Image<unsigned char, 2>;

/// Value of a foreground pixel in a binary mask
constexpr unsigned char MaskForegroundValue = 255;

/**
 * @brief Extent of each logical tensor axis
 */
struct TensorShape {
    size_t t = 0;
    size_t z = 0;
    size_t c = 0;
    size_t y = 0;
    size_t x = 0;

    /// Number of samples in the tensor
    [[nodiscard]] size_t elementCount() const noexcept {
        return t * z * c * y * x;
    }

    /// Every axis has at least one sample
    [[nodiscard]] bool isValid() const noexcept {
        return t > 0 && z > 0 && c > 0 && y > 0 && x > 0;
    }

    /// Same shape with the channel axis collapsed to 1
    [[nodiscard]] TensorShape singleChannel() const noexcept {
        TensorShape shape = *this;
        shape.c = 1;
        return shape;
    }

    [[nodiscard]] itk::Size<TensorDimension> toItkSize() const {
        itk::Size<TensorDimension> size;
        size[axis::X] = x;
        size[axis::Y] = y;
        size[axis::Channel] = c;
        size[axis::Z] = z;
        size[axis::Time] = t;
        return size;
    }

    [[nodiscard]] static TensorShape fromItkSize(const itk::Size<TensorDimension>& size) {
        TensorShape shape;
        shape.x = size[axis::X];
        shape.y = size[axis::Y];
        shape.c = size[axis::Channel];
        shape.z = size[axis::Z];
        shape.t = size[axis::Time];
        return shape;
    }

    template <typename TImage>
    [[nodiscard]] static TensorShape of(const TImage* image) {
        if (!image) {
            return TensorShape{};
        }
        return fromItkSize(image->GetLargestPossibleRegion().GetSize());
    }

    [[nodiscard]] std::string toString() const {
        return "(" + std::to_string(t) + ", " + std::to_string(z) + ", " +
               std::to_string(c) + ", " + std::to_string(y) + ", " +
               std::to_string(x) + ")";
    }

    bool operator==(const TensorShape&) const = default;
};

/**
 * @brief Error information for bioimage operations
 */
struct BioImageError {
    enum class Code {
        Success,
        LoadFailure,
        NotFound,
        IndexOutOfRange,
        PreconditionViolation,
        InvalidParameters,
        ProcessingFailed,
        InternalError
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::LoadFailure: return "Load failure: " + message;
            case Code::NotFound: return "Not found: " + message;
            case Code::IndexOutOfRange: return "Index out of range: " + message;
            case Code::PreconditionViolation: return "Precondition violation: " + message;
            case Code::InvalidParameters: return "Invalid parameters: " + message;
            case Code::ProcessingFailed: return "Processing failed: " + message;
            case Code::InternalError: return "Internal error: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief Allocate a tensor of the given shape filled with a constant
 */
template <typename TImage>
[[nodiscard]] typename TImage::Pointer allocateTensor(
    const TensorShape& shape,
    typename TImage::PixelType fillValue = typename TImage::PixelType{})
{
    typename TImage::IndexType start;
    start.Fill(0);

    typename TImage::RegionType region;
    region.SetSize(shape.toItkSize());
    region.SetIndex(start);

    auto image = TImage::New();
    image->SetRegions(region);
    image->Allocate();
    image->FillBuffer(fillValue);
    return image;
}

/**
 * @brief Region of a tensor restricted on the C, Z and T axes
 *
 * Passing a negative value keeps the whole axis.
 */
template <typename TImage>
[[nodiscard]] typename TImage::RegionType subRegion(
    const TImage* image, long channel, long z, long t)
{
    auto region = image->GetLargestPossibleRegion();
    if (channel >= 0) {
        region.SetIndex(axis::Channel, channel);
        region.SetSize(axis::Channel, 1);
    }
    if (z >= 0) {
        region.SetIndex(axis::Z, z);
        region.SetSize(axis::Z, 1);
    }
    if (t >= 0) {
        region.SetIndex(axis::Time, t);
        region.SetSize(axis::Time, 1);
    }
    return region;
}

/**
 * @brief Deep copy of an image, nullptr for a null input
 */
template <typename TImage>
[[nodiscard]] typename TImage::Pointer duplicateImage(const TImage* image) {
    if (!image) {
        return nullptr;
    }
    auto duplicator = itk::ImageDuplicator<TImage>::New();
    duplicator->SetInputImage(image);
    duplicator->Update();
    return duplicator->GetOutput();
}

/// Render an index range bound as "0-<extent-1>"
[[nodiscard]] inline std::string boundString(size_t extent) {
    if (extent == 0) {
        return "none";
    }
    return "0-" + std::to_string(extent - 1);
}

/// IndexOutOfRange error for a channel index
[[nodiscard]] inline BioImageError channelOutOfRange(size_t channel, size_t channelCount) {
    return BioImageError{
        BioImageError::Code::IndexOutOfRange,
        "Channel " + std::to_string(channel) + " out of range. Valid channels: " +
        boundString(channelCount)
    };
}

}  // namespace bioimage_lab::core
