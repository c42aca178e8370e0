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
#include "core/logging.hpp"

#include <cmath>
#include <limits>
#include <vector>

#include <itkBinaryThresholdImageFilter.h>

namespace bioimage_lab::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("ChannelBinarizer");
    return logger;
}

}  // anonymous namespace

/**
 * @brief PIMPL implementation for ChannelBinarizer
 */
class ChannelBinarizer::Impl {
public:
    /// Empty until the first successful binarization
    std::vector<core::MaskTensorType::Pointer> masks;
};

ChannelBinarizer::ChannelBinarizer() : impl_(std::make_unique<Impl>()) {}

ChannelBinarizer::~ChannelBinarizer() = default;

ChannelBinarizer::ChannelBinarizer(ChannelBinarizer&&) noexcept = default;

ChannelBinarizer& ChannelBinarizer::operator=(ChannelBinarizer&&) noexcept = default;

std::expected<core::MaskTensorType::Pointer, core::BioImageError>
ChannelBinarizer::binarize(
    const core::FloatTensorType* normalized,
    size_t channel,
    size_t channelCount,
    double threshold)
{
    if (channel >= channelCount) {
        return std::unexpected(core::channelOutOfRange(channel, channelCount));
    }

    if (!normalized) {
        return std::unexpected(core::BioImageError{
            core::BioImageError::Code::PreconditionViolation,
            "Channel " + std::to_string(channel) +
            " has not yet been normalized; call normalize() first"
        });
    }

    if (std::isnan(threshold)) {
        return std::unexpected(core::BioImageError{
            core::BioImageError::Code::InvalidParameters,
            "Threshold must not be NaN"
        });
    }

    try {
        using FilterType = itk::BinaryThresholdImageFilter<
            core::FloatTensorType, core::MaskTensorType>;
        auto filter = FilterType::New();

        // Inclusive lower bound one ulp above the threshold gives value > threshold.
        // Nothing exceeds +inf, so that threshold yields an empty mask.
        constexpr double infinity = std::numeric_limits<double>::infinity();
        const bool nothingAbove = threshold == infinity;
        filter->SetInput(normalized);
        filter->SetLowerThreshold(nothingAbove ? infinity : std::nextafter(threshold, infinity));
        filter->SetUpperThreshold(infinity);
        filter->SetInsideValue(
            nothingAbove ? core::MaskTensorType::PixelType{0} : core::MaskForegroundValue);
        filter->SetOutsideValue(0);
        filter->Update();

        core::MaskTensorType::Pointer mask = filter->GetOutput();
        mask->DisconnectPipeline();

        if (impl_->masks.size() != channelCount) {
            impl_->masks.assign(channelCount, nullptr);
        }
        impl_->masks[channel] = mask;

        getLogger()->info("Channel {} binarized at threshold {}", channel, threshold);
        return core::duplicateImage(mask.GetPointer());
    }
    catch (const itk::ExceptionObject& e) {
        getLogger()->error("ITK exception: {}", e.GetDescription());
        return std::unexpected(core::BioImageError{
            core::BioImageError::Code::ProcessingFailed,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
    catch (const std::exception& e) {
        getLogger()->error("Standard exception: {}", e.what());
        return std::unexpected(core::BioImageError{
            core::BioImageError::Code::InternalError,
            std::string("Standard exception: ") + e.what()
        });
    }
}

bool ChannelBinarizer::isAllocated() const noexcept {
    return !impl_->masks.empty();
}

bool ChannelBinarizer::hasChannel(size_t channel) const noexcept {
    return cached(channel) != nullptr;
}

const core::MaskTensorType* ChannelBinarizer::cached(size_t channel) const noexcept {
    if (channel >= impl_->masks.size()) {
        return nullptr;
    }
    return impl_->masks[channel].GetPointer();
}

core::MaskTensorType::Pointer ChannelBinarizer::channel(size_t channel) const {
    return core::duplicateImage(cached(channel));
}

void ChannelBinarizer::reset() {
    impl_->masks.clear();
}

}  // namespace bioimage_lab::services
