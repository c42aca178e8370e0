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
 * @file normalization_types.hpp
 * @brief Strategies, methods and diagnostics of channel normalization
 * @details A strategy selects which sub-tensor of a channel the statistic is
 *          computed on and where the resulting transform is applied; a method
 *          defines the statistic and the transform. The two are orthogonal.
 *
 * @since 1.0.0
 */

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace bioimage_lab::services {

/// Reference = whole channel
struct GlobalNormalization {};

/// Reference = one z-slice (all timepoints), transform applied to every z
struct ZReferenceNormalization {
    /// Overrides the zRef argument of normalize() when set
    std::optional<size_t> zStack;
};

/// Each z-slice (all timepoints) normalized by its own statistic
struct ZPerSliceNormalization {};

/// Reference = one timepoint (all z), transform applied to every timepoint
struct TReferenceNormalization {
    /// Overrides the tRef argument of normalize() when set
    std::optional<size_t> timepoint;
};

/// Each timepoint (all z) normalized by its own statistic
struct TPerSliceNormalization {};

using NormalizationStrategy = std::variant<
    GlobalNormalization,
    ZReferenceNormalization,
    ZPerSliceNormalization,
    TReferenceNormalization,
    TPerSliceNormalization
>;

/**
 * @brief Transform applied once a statistic is known
 */
enum class NormalizationMethod {
    MaxDivide,       ///< x / max
    MinMax,          ///< (x - min) / (max - min)
    PercentileClip,  ///< clamp((x - lo) / (hi - lo), 0, 1)
    ZScore           ///< (x - mean) / std, unbounded
};

/**
 * @brief Method parameters
 */
struct NormalizationParameters {
    NormalizationMethod method = NormalizationMethod::MaxDivide;

    /// Lower percentile for PercentileClip, range [0, 100)
    double lowPercentile = 2.0;

    /// Upper percentile for PercentileClip, range (0, 100]
    double highPercentile = 98.0;

    [[nodiscard]] bool isValid() const noexcept {
        return lowPercentile >= 0.0 && highPercentile <= 100.0 &&
               lowPercentile < highPercentile;
    }
};

/**
 * @brief Emitted when a statistic is degenerate and the data is passed through
 *
 * z and t identify the affected slice for per-slice and reference strategies;
 * both are empty when the whole channel was affected.
 */
struct NormalizationWarning {
    size_t channel = 0;
    std::string channelName;
    std::optional<size_t> z;
    std::optional<size_t> t;
    NormalizationMethod method = NormalizationMethod::MaxDivide;
    std::string reason;

    [[nodiscard]] std::string toString() const;
};

/// Caller-supplied diagnostic sink
using NormalizationWarningCallback = std::function<void(const NormalizationWarning&)>;

[[nodiscard]] std::string toString(NormalizationMethod method);

[[nodiscard]] std::optional<NormalizationMethod> normalizationMethodFromString(
    const std::string& text);

[[nodiscard]] std::string strategyName(const NormalizationStrategy& strategy);

}  // namespace bioimage_lab::services
