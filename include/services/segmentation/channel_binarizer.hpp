/**
 * @file channel_binarizer.hpp
 * @brief Thresholding of normalized channels into 0/255 masks
 *
 * @since 1.0.0
 */

#pragma once

#include "core/bioimage_types.hpp"

#include <cstddef>
#include <expected>
#include <memory>

namespace bioimage_lab::services {

/**
 * @brief Binarizes normalized channels and caches one mask per channel
 *
 * A voxel is foreground (255) when its normalized value is strictly greater
 * than the threshold, background (0) otherwise. The mask cache is allocated
 * on the first successful call.
 *
 * @example
 * @code
 * ChannelBinarizer binarizer;
 * auto mask = binarizer.binarize(normalizer.cached(0), 0, channelCount, 0.5);
 * @endcode
 */
class ChannelBinarizer {
public:
    ChannelBinarizer();
    ~ChannelBinarizer();

    // Non-copyable, movable
    ChannelBinarizer(const ChannelBinarizer&) = delete;
    ChannelBinarizer& operator=(const ChannelBinarizer&) = delete;
    ChannelBinarizer(ChannelBinarizer&&) noexcept;
    ChannelBinarizer& operator=(ChannelBinarizer&&) noexcept;

    /**
     * @brief Threshold a normalized channel
     *
     * @param normalized Normalized (T, Z, 1, Y, X) tensor of the channel, or
     *                   nullptr if the channel was never normalized
     * @param channel Channel index, in [0, channelCount)
     * @param channelCount Number of channels of the raw tensor
     * @param threshold Strict lower bound of the foreground, any value but NaN
     * @return Copy of the (T, Z, 1, Y, X) mask
     */
    [[nodiscard]] std::expected<core::MaskTensorType::Pointer, core::BioImageError>
    binarize(
        const core::FloatTensorType* normalized,
        size_t channel,
        size_t channelCount,
        double threshold = 0.5);

    /// Whether any channel has been binarized since the last reset
    [[nodiscard]] bool isAllocated() const noexcept;

    [[nodiscard]] bool hasChannel(size_t channel) const noexcept;

    /// Cached mask (not a copy), nullptr if not computed
    [[nodiscard]] const core::MaskTensorType* cached(size_t channel) const noexcept;

    /// Copy of the cached mask, nullptr if not computed
    [[nodiscard]] core::MaskTensorType::Pointer channel(size_t channel) const;

    void reset();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace bioimage_lab::services
