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
 * @file bioimage_controller.hpp
 * @brief Tensor store and state machine of a single bioimage
 * @details Owns the raw (T, Z, C, Y, X) tensor loaded from one file, the
 *          processed tensor receiving preprocessed slices, and the per-channel
 *          normalization and binarization caches. All getters return copies.
 *
 *          States: Empty -> Loaded (load succeeded) -> per channel
 *          Normalized -> Binarized. A new successful load drops every cache;
 *          a failed load leaves the previous state in place.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "core/bioimage_reader.hpp"
#include "core/bioimage_types.hpp"
#include "core/origin_classifier.hpp"
#include "core/slice_accessor.hpp"
#include "services/normalization/normalization_types.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace bioimage_lab::core {

/**
 * @brief Tensor a slice is read from
 */
enum class TensorSource {
    Original,    ///< Raw tensor as loaded
    Processed,   ///< Write-back tensor of preprocessed slices
    Normalized,  ///< Normalized channel cache
    Binary       ///< Binary mask cache
};

/**
 * @brief Loads a bioimage and manages its normalization and binarization
 *
 * @example
 * @code
 * BioImageController controller("cells.tif");
 * if (auto loaded = controller.load(); !loaded) {
 *     spdlog::error("{}", loaded.error().toString());
 *     return;
 * }
 *
 * controller.normalize(0, services::ZPerSliceNormalization{},
 *                      services::NormalizationMethod::PercentileClip);
 * auto mask = controller.binarize(0, 0.5);
 *
 * auto slices = controller.iterateSlices(0);
 * if (slices) {
 *     for (const auto& entry : *slices) {
 *         display(entry.t, entry.z, entry.slice);
 *     }
 * }
 * @endcode
 */
class BioImageController {
public:
    /// Controller reading through the ITK readers
    explicit BioImageController(std::filesystem::path path);

    /// Controller reading through caller-supplied readers
    BioImageController(
        std::filesystem::path path,
        std::shared_ptr<const IBioImageReader> bioImageReader,
        std::shared_ptr<const IGrayscaleReader> grayscaleReader);

    ~BioImageController();

    // Non-copyable, movable
    BioImageController(const BioImageController&) = delete;
    BioImageController& operator=(const BioImageController&) = delete;
    BioImageController(BioImageController&&) noexcept;
    BioImageController& operator=(BioImageController&&) noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept;

    /// Loading strategy selected by the file extension
    [[nodiscard]] ImageOrigin origin() const;

    // ==================== Loading ====================

    /**
     * @brief Decode the file into the raw tensor
     *
     * Bioimages keep the reader's channel names. Standard images are scaled
     * by 256 into 16 bits, shaped (1, 1, 1, Y, X) and named "Gray".
     *
     * @return Copy of the raw tensor; LoadFailure or NotFound on failure, in
     *         which case the previous state is kept
     */
    [[nodiscard]] std::expected<RawTensorType::Pointer, BioImageError> load();

    [[nodiscard]] bool isLoaded() const noexcept;

    /// Shape of the raw tensor, all zero before load
    [[nodiscard]] TensorShape shape() const;

    [[nodiscard]] const std::vector<std::string>& channelNames() const noexcept;

    [[nodiscard]] std::expected<std::string, BioImageError> channelName(size_t channel) const;

    /// Copy of the raw tensor, nullptr before load
    [[nodiscard]] RawTensorType::Pointer original() const;

    /// Copy of the processed tensor, nullptr before load
    [[nodiscard]] RawTensorType::Pointer processed() const;

    // ==================== Normalization ====================

    /// Sink for degenerate-statistic warnings
    void setWarningCallback(services::NormalizationWarningCallback callback);

    /**
     * @brief Normalize a channel
     *
     * @param channel Channel index
     * @param strategy Region the statistic is computed on
     * @param method Statistic and transform
     * @param zRef Reference z-slice for ZReferenceNormalization without zStack
     * @param tRef Reference timepoint for TReferenceNormalization without timepoint
     * @return Copy of the (T, Z, 1, Y, X) normalized tensor
     */
    [[nodiscard]] std::expected<FloatTensorType::Pointer, BioImageError> normalize(
        size_t channel,
        const services::NormalizationStrategy& strategy,
        services::NormalizationMethod method = services::NormalizationMethod::MaxDivide,
        size_t zRef = 0,
        size_t tRef = 0);

    /// Normalize with explicit method parameters (percentile bounds)
    [[nodiscard]] std::expected<FloatTensorType::Pointer, BioImageError> normalize(
        size_t channel,
        const services::NormalizationStrategy& strategy,
        const services::NormalizationParameters& params,
        size_t zRef = 0,
        size_t tRef = 0);

    [[nodiscard]] bool hasNormalized(size_t channel) const noexcept;

    // ==================== Binarization ====================

    /**
     * @brief Threshold a normalized channel into a 0/255 mask
     * @return Copy of the (T, Z, 1, Y, X) mask; PreconditionViolation if the
     *         channel has not been normalized
     */
    [[nodiscard]] std::expected<MaskTensorType::Pointer, BioImageError> binarize(
        size_t channel, double threshold = 0.5);

    [[nodiscard]] bool hasBinary(size_t channel) const noexcept;

    /// Whether any mask has been computed since the last load
    [[nodiscard]] bool isBinaryCacheAllocated() const noexcept;

    // ==================== Slice access ====================

    [[nodiscard]] std::expected<RawSliceType::Pointer, BioImageError>
    getOriginalSlice(size_t channel, size_t t, size_t z) const;

    [[nodiscard]] std::expected<RawSliceType::Pointer, BioImageError>
    getProcessedSlice(size_t channel, size_t t, size_t z) const;

    [[nodiscard]] std::expected<FloatSliceType::Pointer, BioImageError>
    getNormalizedSlice(size_t channel, size_t t, size_t z) const;

    [[nodiscard]] std::expected<MaskSliceType::Pointer, BioImageError>
    getBinarySlice(size_t channel, size_t t, size_t z) const;

    /**
     * @brief Slice of any source as double samples
     *
     * Normalized and binary sources are validated against the channel count
     * first and then against the cached tensor's own shape.
     */
    [[nodiscard]] std::expected<FloatSliceType::Pointer, BioImageError>
    getSlice(TensorSource source, size_t channel, size_t t, size_t z) const;

    /// Raw slices of one channel, t outer and z inner
    [[nodiscard]] std::expected<SliceRange<RawTensorType>, BioImageError>
    iterateSlices(size_t channel) const;

    /// Raw slices of every channel, channel outer, t middle, z inner
    [[nodiscard]] std::expected<SliceRange<RawTensorType>, BioImageError>
    iterateAllSlices() const;

    /**
     * @brief Write a slice into the processed tensor
     * @param slice (Y, X) slice, nullptr writes zeros
     * @return InvalidParameters on shape mismatch, IndexOutOfRange on bad index
     */
    [[nodiscard]] std::expected<void, BioImageError> setProcessedSlice(
        size_t channel, size_t t, size_t z, const RawSliceType* slice);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace bioimage_lab::core
