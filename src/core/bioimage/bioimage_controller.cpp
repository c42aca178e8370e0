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

#include "core/bioimage_controller.hpp"
#include "core/logging.hpp"
#include "services/normalization/channel_normalizer.hpp"
#include "services/segmentation/channel_binarizer.hpp"

#include <type_traits>

#include <itkCastImageFilter.h>
#include <itkImageRegionConstIterator.h>
#include <itkImageRegionIterator.h>

namespace bioimage_lab::core {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("BioImageController");
    return logger;
}

/// 8-bit to 16-bit scale of standard images
constexpr RawPixelType kGrayscaleUpscale = 256;

/**
 * @brief Lay a grayscale plane out as a (1, 1, 1, Y, X) 16-bit tensor
 */
RawTensorType::Pointer grayscaleToTensor(const GrayscaleImageType* plane) {
    const auto size = plane->GetLargestPossibleRegion().GetSize();

    TensorShape shape;
    shape.t = 1;
    shape.z = 1;
    shape.c = 1;
    shape.y = size[1];
    shape.x = size[0];

    auto tensor = allocateTensor<RawTensorType>(shape);

    itk::ImageRegionConstIterator<GrayscaleImageType> source(
        plane, plane->GetLargestPossibleRegion());
    itk::ImageRegionIterator<RawTensorType> target(
        tensor, tensor->GetLargestPossibleRegion());
    for (source.GoToBegin(), target.GoToBegin(); !source.IsAtEnd(); ++source, ++target) {
        target.Set(static_cast<RawPixelType>(source.Get() * kGrayscaleUpscale));
    }
    return tensor;
}

/**
 * @brief Reject decoder output that breaks the tensor contract
 */
std::expected<void, BioImageError> validateDecoded(const DecodedBioImage& decoded) {
    if (!decoded.tensor) {
        return std::unexpected(BioImageError{
            BioImageError::Code::LoadFailure,
            "Reader returned no tensor"
        });
    }

    const auto shape = TensorShape::of(decoded.tensor.GetPointer());
    if (!shape.isValid()) {
        return std::unexpected(BioImageError{
            BioImageError::Code::LoadFailure,
            "Reader returned a tensor with an empty axis " + shape.toString()
        });
    }

    if (decoded.channelNames.size() != shape.c) {
        return std::unexpected(BioImageError{
            BioImageError::Code::LoadFailure,
            "Reader returned " + std::to_string(decoded.channelNames.size()) +
            " channel names for " + std::to_string(shape.c) + " channels"
        });
    }
    return {};
}

template <typename TSlice>
FloatSliceType::Pointer toFloatSlice(typename TSlice::Pointer slice) {
    if constexpr (std::is_same_v<TSlice, FloatSliceType>) {
        return slice;
    } else {
        using CastFilterType = itk::CastImageFilter<TSlice, FloatSliceType>;
        auto caster = CastFilterType::New();
        caster->SetInput(slice);
        caster->Update();

        FloatSliceType::Pointer output = caster->GetOutput();
        output->DisconnectPipeline();
        return output;
    }
}

template <typename TSlice>
std::expected<FloatSliceType::Pointer, BioImageError>
castSliceResult(std::expected<typename TSlice::Pointer, BioImageError> slice) {
    if (!slice) {
        return std::unexpected(slice.error());
    }
    try {
        return toFloatSlice<TSlice>(*slice);
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(BioImageError{
            BioImageError::Code::ProcessingFailed,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
}

}  // anonymous namespace

/**
 * @brief PIMPL implementation for BioImageController
 */
class BioImageController::Impl {
public:
    std::filesystem::path path;
    std::shared_ptr<const IBioImageReader> bioImageReader;
    std::shared_ptr<const IGrayscaleReader> grayscaleReader;

    RawTensorType::Pointer raw;
    RawTensorType::Pointer processed;
    std::vector<std::string> channelNames;

    services::ChannelNormalizer normalizer;
    services::ChannelBinarizer binarizer;

    std::expected<void, BioImageError> requireLoaded() const {
        if (!raw) {
            return std::unexpected(BioImageError{
                BioImageError::Code::PreconditionViolation,
                "No image loaded; call load() first"
            });
        }
        return {};
    }

    std::expected<void, BioImageError> requireChannel(size_t channel) const {
        if (auto loaded = requireLoaded(); !loaded) {
            return loaded;
        }
        const size_t channelCount = channelNames.size();
        if (channel >= channelCount) {
            return std::unexpected(channelOutOfRange(channel, channelCount));
        }
        return {};
    }

    std::expected<DecodedBioImage, BioImageError> decode(const ImageOrigin& origin) const {
        if (std::holds_alternative<BioImage>(origin)) {
            auto decoded = bioImageReader->read(path);
            if (!decoded) {
                return std::unexpected(decoded.error());
            }
            if (auto valid = validateDecoded(*decoded); !valid) {
                return std::unexpected(valid.error());
            }
            return decoded;
        }

        auto plane = grayscaleReader->read(path);
        if (!plane) {
            return std::unexpected(plane.error());
        }
        if (!*plane) {
            return std::unexpected(BioImageError{
                BioImageError::Code::NotFound,
                "Could not decode " + path.string()
            });
        }

        DecodedBioImage decoded;
        decoded.tensor = grayscaleToTensor(plane->GetPointer());
        decoded.channelNames = {"Gray"};
        return decoded;
    }
};

BioImageController::BioImageController(std::filesystem::path path)
    : BioImageController(std::move(path),
                         std::make_shared<ItkBioImageReader>(),
                         std::make_shared<ItkGrayscaleReader>()) {}

BioImageController::BioImageController(
    std::filesystem::path path,
    std::shared_ptr<const IBioImageReader> bioImageReader,
    std::shared_ptr<const IGrayscaleReader> grayscaleReader)
    : impl_(std::make_unique<Impl>())
{
    impl_->path = std::move(path);
    impl_->bioImageReader = std::move(bioImageReader);
    impl_->grayscaleReader = std::move(grayscaleReader);
}

BioImageController::~BioImageController() = default;

BioImageController::BioImageController(BioImageController&&) noexcept = default;

BioImageController& BioImageController::operator=(BioImageController&&) noexcept = default;

const std::filesystem::path& BioImageController::path() const noexcept {
    return impl_->path;
}

ImageOrigin BioImageController::origin() const {
    return classifyOrigin(impl_->path);
}

std::expected<RawTensorType::Pointer, BioImageError> BioImageController::load() {
    const auto imageOrigin = origin();
    getLogger()->info("Loading {} as {}", impl_->path.string(), originName(imageOrigin));

    std::expected<DecodedBioImage, BioImageError> decoded;
    try {
        decoded = impl_->decode(imageOrigin);
    }
    catch (const itk::ExceptionObject& e) {
        decoded = std::unexpected(BioImageError{
            BioImageError::Code::LoadFailure,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }

    if (!decoded) {
        getLogger()->error("Failed to load {}: {}",
                           impl_->path.string(), decoded.error().toString());
        return std::unexpected(decoded.error());
    }

    const auto shape = TensorShape::of(decoded->tensor.GetPointer());
    impl_->raw = decoded->tensor;
    impl_->channelNames = std::move(decoded->channelNames);
    impl_->processed = allocateTensor<RawTensorType>(shape);
    impl_->normalizer.reset();
    impl_->binarizer.reset();

    getLogger()->info("Loaded {}: shape (t, z, c, y, x) = {}, {} channel(s)",
                      impl_->path.filename().string(), shape.toString(), shape.c);
    return duplicateImage(impl_->raw.GetPointer());
}

bool BioImageController::isLoaded() const noexcept {
    return impl_->raw.IsNotNull();
}

TensorShape BioImageController::shape() const {
    return TensorShape::of(impl_->raw.GetPointer());
}

const std::vector<std::string>& BioImageController::channelNames() const noexcept {
    return impl_->channelNames;
}

std::expected<std::string, BioImageError>
BioImageController::channelName(size_t channel) const {
    if (auto valid = impl_->requireChannel(channel); !valid) {
        return std::unexpected(valid.error());
    }
    return impl_->channelNames[channel];
}

RawTensorType::Pointer BioImageController::original() const {
    return duplicateImage(impl_->raw.GetPointer());
}

RawTensorType::Pointer BioImageController::processed() const {
    return duplicateImage(impl_->processed.GetPointer());
}

void BioImageController::setWarningCallback(services::NormalizationWarningCallback callback) {
    impl_->normalizer.setWarningCallback(std::move(callback));
}

std::expected<FloatTensorType::Pointer, BioImageError> BioImageController::normalize(
    size_t channel,
    const services::NormalizationStrategy& strategy,
    services::NormalizationMethod method,
    size_t zRef,
    size_t tRef)
{
    services::NormalizationParameters params;
    params.method = method;
    return normalize(channel, strategy, params, zRef, tRef);
}

std::expected<FloatTensorType::Pointer, BioImageError> BioImageController::normalize(
    size_t channel,
    const services::NormalizationStrategy& strategy,
    const services::NormalizationParameters& params,
    size_t zRef,
    size_t tRef)
{
    if (auto loaded = impl_->requireLoaded(); !loaded) {
        return std::unexpected(loaded.error());
    }
    return impl_->normalizer.normalize(
        impl_->raw.GetPointer(), impl_->channelNames, channel, strategy, params, zRef, tRef);
}

bool BioImageController::hasNormalized(size_t channel) const noexcept {
    return impl_->normalizer.hasChannel(channel);
}

std::expected<MaskTensorType::Pointer, BioImageError>
BioImageController::binarize(size_t channel, double threshold) {
    if (auto loaded = impl_->requireLoaded(); !loaded) {
        return std::unexpected(loaded.error());
    }
    return impl_->binarizer.binarize(
        impl_->normalizer.cached(channel), channel, impl_->channelNames.size(), threshold);
}

bool BioImageController::hasBinary(size_t channel) const noexcept {
    return impl_->binarizer.hasChannel(channel);
}

bool BioImageController::isBinaryCacheAllocated() const noexcept {
    return impl_->binarizer.isAllocated();
}

std::expected<RawSliceType::Pointer, BioImageError>
BioImageController::getOriginalSlice(size_t channel, size_t t, size_t z) const {
    if (auto loaded = impl_->requireLoaded(); !loaded) {
        return std::unexpected(loaded.error());
    }
    return extractSlice(impl_->raw.GetPointer(), channel, t, z);
}

std::expected<RawSliceType::Pointer, BioImageError>
BioImageController::getProcessedSlice(size_t channel, size_t t, size_t z) const {
    if (auto loaded = impl_->requireLoaded(); !loaded) {
        return std::unexpected(loaded.error());
    }
    return extractSlice(impl_->processed.GetPointer(), channel, t, z);
}

std::expected<FloatSliceType::Pointer, BioImageError>
BioImageController::getNormalizedSlice(size_t channel, size_t t, size_t z) const {
    if (auto valid = impl_->requireChannel(channel); !valid) {
        return std::unexpected(valid.error());
    }
    const auto* normalized = impl_->normalizer.cached(channel);
    if (!normalized) {
        return std::unexpected(BioImageError{
            BioImageError::Code::PreconditionViolation,
            "Channel " + std::to_string(channel) + " has not yet been normalized"
        });
    }
    return extractSlice(normalized, 0, t, z);
}

std::expected<MaskSliceType::Pointer, BioImageError>
BioImageController::getBinarySlice(size_t channel, size_t t, size_t z) const {
    if (auto valid = impl_->requireChannel(channel); !valid) {
        return std::unexpected(valid.error());
    }
    const auto* mask = impl_->binarizer.cached(channel);
    if (!mask) {
        return std::unexpected(BioImageError{
            BioImageError::Code::PreconditionViolation,
            "Channel " + std::to_string(channel) + " has not yet been binarized"
        });
    }
    return extractSlice(mask, 0, t, z);
}

std::expected<FloatSliceType::Pointer, BioImageError>
BioImageController::getSlice(TensorSource source, size_t channel, size_t t, size_t z) const {
    switch (source) {
        case TensorSource::Original:
            return castSliceResult<RawSliceType>(getOriginalSlice(channel, t, z));
        case TensorSource::Processed:
            return castSliceResult<RawSliceType>(getProcessedSlice(channel, t, z));
        case TensorSource::Normalized:
            return getNormalizedSlice(channel, t, z);
        case TensorSource::Binary:
            return castSliceResult<MaskSliceType>(getBinarySlice(channel, t, z));
    }
    return std::unexpected(BioImageError{
        BioImageError::Code::InvalidParameters,
        "Unknown tensor source"
    });
}

std::expected<SliceRange<RawTensorType>, BioImageError>
BioImageController::iterateSlices(size_t channel) const {
    if (auto valid = impl_->requireChannel(channel); !valid) {
        return std::unexpected(valid.error());
    }
    return SliceRange<RawTensorType>(
        RawTensorType::ConstPointer(impl_->raw.GetPointer()), channel);
}

std::expected<SliceRange<RawTensorType>, BioImageError>
BioImageController::iterateAllSlices() const {
    if (auto loaded = impl_->requireLoaded(); !loaded) {
        return std::unexpected(loaded.error());
    }
    return SliceRange<RawTensorType>(
        RawTensorType::ConstPointer(impl_->raw.GetPointer()), std::nullopt);
}

std::expected<void, BioImageError> BioImageController::setProcessedSlice(
    size_t channel, size_t t, size_t z, const RawSliceType* slice)
{
    if (auto loaded = impl_->requireLoaded(); !loaded) {
        return loaded;
    }

    const auto tensorShape = shape();
    if (auto valid = checkSliceIndex(tensorShape, channel, t, z); !valid) {
        return valid;
    }

    auto& processed = impl_->processed;
    const auto region = subRegion(processed.GetPointer(), static_cast<long>(channel),
                                  static_cast<long>(z), static_cast<long>(t));
    itk::ImageRegionIterator<RawTensorType> target(processed, region);

    if (!slice) {
        for (target.GoToBegin(); !target.IsAtEnd(); ++target) {
            target.Set(0);
        }
        return {};
    }

    const auto size = slice->GetLargestPossibleRegion().GetSize();
    if (size[0] != tensorShape.x || size[1] != tensorShape.y) {
        return std::unexpected(BioImageError{
            BioImageError::Code::InvalidParameters,
            "Slice of size (" + std::to_string(size[1]) + ", " + std::to_string(size[0]) +
            ") does not match (y, x) = (" + std::to_string(tensorShape.y) + ", " +
            std::to_string(tensorShape.x) + ")"
        });
    }

    itk::ImageRegionConstIterator<RawSliceType> source(slice, slice->GetLargestPossibleRegion());
    for (source.GoToBegin(), target.GoToBegin(); !source.IsAtEnd(); ++source, ++target) {
        target.Set(source.Get());
    }

    getLogger()->debug("Processed slice written: channel={}, t={}, z={}", channel, t, z);
    return {};
}

}  // namespace bioimage_lab::core
