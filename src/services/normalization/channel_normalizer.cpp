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

#include "services/normalization/channel_normalizer.hpp"
#include "core/logging.hpp"

#include <functional>
#include <optional>

#include <itkImageRegionConstIterator.h>
#include <itkImageRegionIterator.h>

namespace bioimage_lab::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("ChannelNormalizer");
    return logger;
}

using core::FloatTensorType;
using core::RawTensorType;
using RegionType = FloatTensorType::RegionType;

/// Called with the affected z / t and the reason of a degenerate statistic
using DegenerateReporter = std::function<void(
    std::optional<size_t> z, std::optional<size_t> t, const std::string& reason)>;

/**
 * @brief Copy one channel of the raw tensor into a (T, Z, 1, Y, X) double tensor
 */
FloatTensorType::Pointer castChannel(const RawTensorType* raw, size_t channel) {
    const auto shape = core::TensorShape::of(raw).singleChannel();
    auto data = core::allocateTensor<FloatTensorType>(shape);

    // Both regions have the same size, so both iterators visit X fastest and T slowest
    itk::ImageRegionConstIterator<RawTensorType> source(
        raw, core::subRegion(raw, static_cast<long>(channel), -1, -1));
    itk::ImageRegionIterator<FloatTensorType> target(data, data->GetLargestPossibleRegion());
    for (source.GoToBegin(), target.GoToBegin(); !source.IsAtEnd(); ++source, ++target) {
        target.Set(static_cast<double>(source.Get()));
    }
    return data;
}

std::vector<double> gatherSamples(const FloatTensorType* data, const RegionType& region) {
    std::vector<double> samples;
    samples.reserve(region.GetNumberOfPixels());

    itk::ImageRegionConstIterator<FloatTensorType> it(data, region);
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        samples.push_back(it.Get());
    }
    return samples;
}

void applyTransform(
    const FloatTensorType* data,
    FloatTensorType* output,
    const RegionType& region,
    const NormalizationTransform& transform)
{
    itk::ImageRegionConstIterator<FloatTensorType> source(data, region);
    itk::ImageRegionIterator<FloatTensorType> target(output, region);
    for (source.GoToBegin(), target.GoToBegin(); !source.IsAtEnd(); ++source, ++target) {
        target.Set(transform(source.Get()));
    }
}

/**
 * @brief std::visit target running one strategy over a cast channel
 */
class StrategyRunner {
public:
    StrategyRunner(
        const FloatTensorType* data,
        FloatTensorType* output,
        const NormalizationParameters& params,
        size_t zRef,
        size_t tRef,
        DegenerateReporter report)
        : data_(data)
        , output_(output)
        , params_(params)
        , zRef_(zRef)
        , tRef_(tRef)
        , report_(std::move(report))
        , shape_(core::TensorShape::of(data)) {}

    void operator()(const GlobalNormalization&) const {
        const auto whole = data_->GetLargestPossibleRegion();
        normalizeRegion(whole, whole, std::nullopt, std::nullopt);
    }

    void operator()(const ZReferenceNormalization&) const {
        normalizeRegion(zRegion(zRef_), data_->GetLargestPossibleRegion(), zRef_, std::nullopt);
    }

    void operator()(const ZPerSliceNormalization&) const {
        for (size_t z = 0; z < shape_.z; ++z) {
            const auto region = zRegion(z);
            normalizeRegion(region, region, z, std::nullopt);
        }
    }

    void operator()(const TReferenceNormalization&) const {
        normalizeRegion(tRegion(tRef_), data_->GetLargestPossibleRegion(), std::nullopt, tRef_);
    }

    void operator()(const TPerSliceNormalization&) const {
        for (size_t t = 0; t < shape_.t; ++t) {
            const auto region = tRegion(t);
            normalizeRegion(region, region, std::nullopt, t);
        }
    }

private:
    /// (T, Y, X) block at one z
    RegionType zRegion(size_t z) const {
        return core::subRegion(data_, -1, static_cast<long>(z), -1);
    }

    /// (Z, Y, X) block at one t
    RegionType tRegion(size_t t) const {
        return core::subRegion(data_, -1, -1, static_cast<long>(t));
    }

    void normalizeRegion(
        const RegionType& statisticRegion,
        const RegionType& targetRegion,
        std::optional<size_t> z,
        std::optional<size_t> t) const
    {
        const auto samples = gatherSamples(data_, statisticRegion);
        const auto transform = computeTransform(samples, params_);
        if (transform.isDegenerate()) {
            report_(z, t, transform.degenerateReason());
        }
        applyTransform(data_, output_, targetRegion, transform);
    }

    const FloatTensorType* data_;
    FloatTensorType* output_;
    const NormalizationParameters& params_;
    size_t zRef_;
    size_t tRef_;
    DegenerateReporter report_;
    core::TensorShape shape_;
};

size_t effectiveZReference(const NormalizationStrategy& strategy, size_t zRef) {
    if (const auto* reference = std::get_if<ZReferenceNormalization>(&strategy)) {
        return reference->zStack.value_or(zRef);
    }
    return zRef;
}

size_t effectiveTReference(const NormalizationStrategy& strategy, size_t tRef) {
    if (const auto* reference = std::get_if<TReferenceNormalization>(&strategy)) {
        return reference->timepoint.value_or(tRef);
    }
    return tRef;
}

}  // anonymous namespace

/**
 * @brief PIMPL implementation for ChannelNormalizer
 */
class ChannelNormalizer::Impl {
public:
    NormalizationWarningCallback warningCallback;
    std::vector<FloatTensorType::Pointer> normalized;

    void store(size_t channel, FloatTensorType::Pointer result, size_t channelCount) {
        if (normalized.size() != channelCount) {
            // Entries of a tensor with another channel count are stale
            normalized.assign(channelCount, nullptr);
        }
        normalized[channel] = std::move(result);
    }
};

ChannelNormalizer::ChannelNormalizer() : impl_(std::make_unique<Impl>()) {}

ChannelNormalizer::~ChannelNormalizer() = default;

ChannelNormalizer::ChannelNormalizer(ChannelNormalizer&&) noexcept = default;

ChannelNormalizer& ChannelNormalizer::operator=(ChannelNormalizer&&) noexcept = default;

void ChannelNormalizer::setWarningCallback(NormalizationWarningCallback callback) {
    impl_->warningCallback = std::move(callback);
}

std::expected<FloatTensorType::Pointer, core::BioImageError>
ChannelNormalizer::normalize(
    const RawTensorType* raw,
    const std::vector<std::string>& channelNames,
    size_t channel,
    const NormalizationStrategy& strategy,
    const NormalizationParameters& params,
    size_t zRef,
    size_t tRef)
{
    if (!raw) {
        return std::unexpected(core::BioImageError{
            core::BioImageError::Code::PreconditionViolation,
            "No image loaded"
        });
    }

    const auto shape = core::TensorShape::of(raw);
    if (channel >= shape.c) {
        return std::unexpected(core::channelOutOfRange(channel, shape.c));
    }

    const size_t zReference = effectiveZReference(strategy, zRef);
    if (zReference >= shape.z) {
        return std::unexpected(core::BioImageError{
            core::BioImageError::Code::IndexOutOfRange,
            "zRef=" + std::to_string(zReference) + " out of range. Valid z-slices: " +
            core::boundString(shape.z)
        });
    }

    const size_t tReference = effectiveTReference(strategy, tRef);
    if (tReference >= shape.t) {
        return std::unexpected(core::BioImageError{
            core::BioImageError::Code::IndexOutOfRange,
            "tRef=" + std::to_string(tReference) + " out of range. Valid timepoints: " +
            core::boundString(shape.t)
        });
    }

    if (!params.isValid()) {
        return std::unexpected(core::BioImageError{
            core::BioImageError::Code::InvalidParameters,
            "Percentiles must satisfy 0 <= low < high <= 100"
        });
    }

    const std::string channelName = channel < channelNames.size() ? channelNames[channel] : "";
    const std::string strategyLabel = strategyName(strategy);
    getLogger()->info("Normalizing channel {} ({}): strategy={}, method={}",
                      channel, channelName, strategyLabel, toString(params.method));

    try {
        const auto data = castChannel(raw, channel);
        auto output = core::allocateTensor<FloatTensorType>(shape.singleChannel());

        size_t degenerateCount = 0;
        auto report = [&](std::optional<size_t> z, std::optional<size_t> t,
                          const std::string& reason) {
            ++degenerateCount;
            NormalizationWarning warning;
            warning.channel = channel;
            warning.channelName = channelName;
            warning.z = z;
            warning.t = t;
            warning.method = params.method;
            warning.reason = reason;

            getLogger()->warn("{}", warning.toString());
            if (impl_->warningCallback) {
                impl_->warningCallback(warning);
            }
        };

        std::visit(StrategyRunner(data, output, params, zReference, tReference, report),
                   strategy);

        getLogger()->info("Channel {} normalized, {} region(s) passed through",
                          channel, degenerateCount);

        impl_->store(channel, output, shape.c);
        return core::duplicateImage(output.GetPointer());
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

bool ChannelNormalizer::hasChannel(size_t channel) const noexcept {
    return cached(channel) != nullptr;
}

const FloatTensorType* ChannelNormalizer::cached(size_t channel) const noexcept {
    if (channel >= impl_->normalized.size()) {
        return nullptr;
    }
    return impl_->normalized[channel].GetPointer();
}

FloatTensorType::Pointer ChannelNormalizer::channel(size_t channel) const {
    return core::duplicateImage(cached(channel));
}

void ChannelNormalizer::reset() {
    impl_->normalized.clear();
}

}  // namespace bioimage_lab::services
