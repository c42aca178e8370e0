/**
 * @file channel_normalizer.hpp
 * @brief Per-channel normalization engine with result cache
 * @details Combines a NormalizationStrategy (which region the statistic is
 *          computed on and where it is applied) with a NormalizationMethod
 *          (the statistic and the transform). Results are cached per channel
 *          as (T, Z, 1, Y, X) double tensors.
 *
 * @since 1.0.0
 */

#pragma once

#include "core/bioimage_types.hpp"
#include "services/normalization/normalization_methods.hpp"
#include "services/normalization/normalization_types.hpp"

#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace bioimage_lab::services {

/**
 * @brief Normalizes single channels of a raw tensor
 *
 * A call validates everything before touching the cache, computes into a
 * freshly allocated tensor and only then replaces the cached entry, so a
 * failing call never alters previously cached results. Degenerate statistics
 * pass the affected region through unchanged and are reported to the
 * warning callback.
 *
 * @example
 * @code
 * ChannelNormalizer normalizer;
 * normalizer.setWarningCallback([](const NormalizationWarning& w) {
 *     std::cerr << w.toString() << '\n';
 * });
 *
 * NormalizationParameters params;
 * params.method = NormalizationMethod::PercentileClip;
 * auto result = normalizer.normalize(raw, names, 0, ZPerSliceNormalization{}, params);
 * @endcode
 */
class ChannelNormalizer {
public:
    ChannelNormalizer();
    ~ChannelNormalizer();

    // Non-copyable, movable
    ChannelNormalizer(const ChannelNormalizer&) = delete;
    ChannelNormalizer& operator=(const ChannelNormalizer&) = delete;
    ChannelNormalizer(ChannelNormalizer&&) noexcept;
    ChannelNormalizer& operator=(ChannelNormalizer&&) noexcept;

    void setWarningCallback(NormalizationWarningCallback callback);

    /**
     * @brief Normalize one channel of a raw tensor
     *
     * @param raw Raw (T, Z, C, Y, X) tensor
     * @param channelNames Channel name table, used in warnings only
     * @param channel Channel to normalize, in [0, C)
     * @param strategy Region selection
     * @param params Method and its parameters
     * @param zRef Reference z-slice, overridden by ZReferenceNormalization::zStack
     * @param tRef Reference timepoint, overridden by TReferenceNormalization::timepoint
     * @return Copy of the full (T, Z, 1, Y, X) normalized tensor
     */
    [[nodiscard]] std::expected<core::FloatTensorType::Pointer, core::BioImageError>
    normalize(
        const core::RawTensorType* raw,
        const std::vector<std::string>& channelNames,
        size_t channel,
        const NormalizationStrategy& strategy,
        const NormalizationParameters& params,
        size_t zRef = 0,
        size_t tRef = 0);

    /// Whether a normalized tensor is cached for the channel
    [[nodiscard]] bool hasChannel(size_t channel) const noexcept;

    /// Cached tensor (not a copy), nullptr if not computed
    [[nodiscard]] const core::FloatTensorType* cached(size_t channel) const noexcept;

    /// Copy of the cached tensor, nullptr if not computed
    [[nodiscard]] core::FloatTensorType::Pointer channel(size_t channel) const;

    /// Drop every cached channel
    void reset();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace bioimage_lab::services
