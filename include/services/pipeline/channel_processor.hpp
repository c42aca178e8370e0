#pragma once

#include "core/bioimage_controller.hpp"
#include "services/preprocessing/slice_operation.hpp"

#include <cstddef>
#include <expected>

namespace bioimage_lab::services {

/**
 * @brief Applies a slice operation to every (t, z) slice of a channel
 *
 * Original slices are processed as float, clamped to the 16-bit range and
 * written into the controller's processed tensor. Processing stops at the
 * first failing slice; slices written before it are kept.
 */
class ChannelProcessor {
public:
    /**
     * @brief Process one channel
     * @return Number of slices written
     */
    [[nodiscard]] std::expected<size_t, core::BioImageError> apply(
        core::BioImageController& controller,
        size_t channel,
        const ISliceOperation& operation) const;

    /// Original slice as float
    [[nodiscard]] static SliceImageType::Pointer toFloat(const core::RawSliceType* slice);

    /// Float slice rounded and clamped to [0, 65535]
    [[nodiscard]] static core::RawSliceType::Pointer toRaw(const SliceImageType* slice);
};

}  // namespace bioimage_lab::services
