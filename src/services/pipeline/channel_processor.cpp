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

#include "services/pipeline/channel_processor.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <itkCastImageFilter.h>
#include <itkImageRegionConstIterator.h>
#include <itkImageRegionIterator.h>

namespace bioimage_lab::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("ChannelProcessor");
    return logger;
}

}  // anonymous namespace

SliceImageType::Pointer ChannelProcessor::toFloat(const core::RawSliceType* slice) {
    using CastFilterType = itk::CastImageFilter<core::RawSliceType, SliceImageType>;
    auto caster = CastFilterType::New();
    caster->SetInput(slice);
    caster->Update();

    SliceImageType::Pointer output = caster->GetOutput();
    output->DisconnectPipeline();
    return output;
}

core::RawSliceType::Pointer ChannelProcessor::toRaw(const SliceImageType* slice) {
    constexpr double kMaximum = std::numeric_limits<core::RawPixelType>::max();

    auto output = core::RawSliceType::New();
    output->CopyInformation(slice);
    output->SetRegions(slice->GetLargestPossibleRegion());
    output->Allocate();

    itk::ImageRegionConstIterator<SliceImageType> source(slice, slice->GetLargestPossibleRegion());
    itk::ImageRegionIterator<core::RawSliceType> target(output, output->GetLargestPossibleRegion());
    for (source.GoToBegin(), target.GoToBegin(); !source.IsAtEnd(); ++source, ++target) {
        const double value = source.Get();
        // NaN maps to 0
        const double clamped = std::isnan(value) ? 0.0 : std::clamp(std::round(value), 0.0, kMaximum);
        target.Set(static_cast<core::RawPixelType>(clamped));
    }
    return output;
}

std::expected<size_t, core::BioImageError> ChannelProcessor::apply(
    core::BioImageController& controller,
    size_t channel,
    const ISliceOperation& operation) const
{
    auto slices = controller.iterateSlices(channel);
    if (!slices) {
        return std::unexpected(slices.error());
    }

    getLogger()->info("Applying {} to channel {} ({} slices)",
                      operation.name(), channel, slices->size());

    size_t written = 0;
    try {
        for (const auto& entry : *slices) {
            if (entry.slice.IsNull()) {
                return std::unexpected(core::BioImageError{
                    core::BioImageError::Code::ProcessingFailed,
                    "Slice t=" + std::to_string(entry.t) + ", z=" + std::to_string(entry.z) +
                    " could not be extracted"
                });
            }

            auto result = operation.apply(toFloat(entry.slice));
            if (!result) {
                getLogger()->error("{} failed at t={}, z={}: {}",
                                   operation.name(), entry.t, entry.z, result.error().toString());
                return std::unexpected(core::BioImageError{
                    core::BioImageError::Code::ProcessingFailed,
                    operation.name() + " failed at t=" + std::to_string(entry.t) +
                    ", z=" + std::to_string(entry.z) + ": " + result.error().toString()
                });
            }

            auto raw = toRaw(*result);
            if (auto stored = controller.setProcessedSlice(channel, entry.t, entry.z, raw);
                !stored) {
                return std::unexpected(stored.error());
            }
            ++written;
        }
    }
    catch (const itk::ExceptionObject& e) {
        getLogger()->error("ITK exception: {}", e.GetDescription());
        return std::unexpected(core::BioImageError{
            core::BioImageError::Code::ProcessingFailed,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }

    getLogger()->info("{} written to {} processed slice(s) of channel {}",
                      operation.name(), written, channel);
    return written;
}

}  // namespace bioimage_lab::services
