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

#include "services/normalization/normalization_methods.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <numeric>

namespace bioimage_lab::services {

namespace {

std::vector<double> sortedCopy(std::span<const double> samples) {
    std::vector<double> sorted(samples.begin(), samples.end());
    std::sort(sorted.begin(), sorted.end());
    return sorted;
}

/// numpy-style "linear" percentile on an ascending, non-empty sample set
double percentileOfSorted(const std::vector<double>& sorted, double p) {
    const double rank = std::clamp(p, 0.0, 100.0) / 100.0 *
                        static_cast<double>(sorted.size() - 1);
    const auto lower = static_cast<size_t>(std::floor(rank));
    const auto upper = static_cast<size_t>(std::ceil(rank));
    return sorted[lower] + (sorted[upper] - sorted[lower]) *
                           (rank - static_cast<double>(lower));
}

NormalizationTransform maxDivideTransform(std::span<const double> samples) {
    const double maximum = *std::max_element(samples.begin(), samples.end());
    if (!(maximum > 0.0)) {
        return NormalizationTransform::identity("maximum is 0");
    }
    return NormalizationTransform::affine(0.0, maximum, false);
}

NormalizationTransform minMaxTransform(std::span<const double> samples) {
    const auto [minIt, maxIt] = std::minmax_element(samples.begin(), samples.end());
    if (*maxIt == *minIt) {
        return NormalizationTransform::identity("minimum equals maximum");
    }
    return NormalizationTransform::affine(*minIt, *maxIt - *minIt, false);
}

NormalizationTransform percentileTransform(
    std::span<const double> samples, double lowPercentile, double highPercentile)
{
    const auto sorted = sortedCopy(samples);
    const double low = percentileOfSorted(sorted, lowPercentile);
    const double high = percentileOfSorted(sorted, highPercentile);
    if (!(high > low)) {
        return NormalizationTransform::identity("percentile bounds are equal");
    }
    return NormalizationTransform::affine(low, high - low, true);
}

NormalizationTransform zScoreTransform(std::span<const double> samples) {
    const double count = static_cast<double>(samples.size());
    const double mean = std::accumulate(samples.begin(), samples.end(), 0.0) / count;

    double squaredDeviation = 0.0;
    for (double value : samples) {
        const double deviation = value - mean;
        squaredDeviation += deviation * deviation;
    }
    const double stddev = std::sqrt(squaredDeviation / count);

    if (!(stddev > 0.0)) {
        return NormalizationTransform::identity("standard deviation is 0");
    }
    return NormalizationTransform::affine(mean, stddev, false);
}

}  // anonymous namespace

NormalizationTransform NormalizationTransform::identity(std::string degenerateReason) {
    NormalizationTransform transform;
    transform.degenerateReason_ = std::move(degenerateReason);
    return transform;
}

NormalizationTransform NormalizationTransform::affine(
    double offset, double divisor, bool clampToUnit)
{
    NormalizationTransform transform;
    transform.offset_ = offset;
    transform.divisor_ = divisor;
    transform.clampToUnit_ = clampToUnit;
    transform.identity_ = false;
    return transform;
}

double NormalizationTransform::operator()(double value) const noexcept {
    if (identity_) {
        return value;
    }
    const double scaled = (value - offset_) / divisor_;
    if (clampToUnit_) {
        return std::clamp(scaled, 0.0, 1.0);
    }
    return scaled;
}

NormalizationTransform computeTransform(
    std::span<const double> samples,
    const NormalizationParameters& params)
{
    if (samples.empty()) {
        return NormalizationTransform::identity("no samples");
    }

    switch (params.method) {
        case NormalizationMethod::MaxDivide:
            return maxDivideTransform(samples);
        case NormalizationMethod::MinMax:
            return minMaxTransform(samples);
        case NormalizationMethod::PercentileClip:
            return percentileTransform(samples, params.lowPercentile, params.highPercentile);
        case NormalizationMethod::ZScore:
            return zScoreTransform(samples);
    }
    return NormalizationTransform::identity("unknown method");
}

std::vector<double> applyMethod(
    std::span<const double> samples,
    const NormalizationParameters& params)
{
    const auto transform = computeTransform(samples, params);

    std::vector<double> result;
    result.reserve(samples.size());
    for (double value : samples) {
        result.push_back(transform(value));
    }
    return result;
}

double percentile(std::span<const double> samples, double p) {
    if (samples.empty()) {
        return 0.0;
    }
    return percentileOfSorted(sortedCopy(samples), p);
}

std::string toString(NormalizationMethod method) {
    switch (method) {
        case NormalizationMethod::MaxDivide:      return "max_divide";
        case NormalizationMethod::MinMax:         return "min_max";
        case NormalizationMethod::PercentileClip: return "percentile_clip";
        case NormalizationMethod::ZScore:         return "z_score";
    }
    return "unknown";
}

std::optional<NormalizationMethod> normalizationMethodFromString(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (lowered == "max_divide") return NormalizationMethod::MaxDivide;
    if (lowered == "min_max") return NormalizationMethod::MinMax;
    if (lowered == "percentile_clip") return NormalizationMethod::PercentileClip;
    if (lowered == "z_score") return NormalizationMethod::ZScore;
    return std::nullopt;
}

std::string strategyName(const NormalizationStrategy& strategy) {
    struct Namer {
        std::string operator()(const GlobalNormalization&) const { return "global"; }
        std::string operator()(const ZReferenceNormalization&) const { return "z_reference"; }
        std::string operator()(const ZPerSliceNormalization&) const { return "z_per_slice"; }
        std::string operator()(const TReferenceNormalization&) const { return "t_reference"; }
        std::string operator()(const TPerSliceNormalization&) const { return "t_per_slice"; }
    };
    return std::visit(Namer{}, strategy);
}

std::string NormalizationWarning::toString() const {
    std::string text = "Channel " + std::to_string(channel);
    if (!channelName.empty()) {
        text += " (" + channelName + ")";
    }
    if (t) {
        text += " t=" + std::to_string(*t);
    }
    if (z) {
        text += " z=" + std::to_string(*z);
    }
    text += ": " + reason + ", " + services::toString(method) + " skipped";
    return text;
}

}  // namespace bioimage_lab::services
