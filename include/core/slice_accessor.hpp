/**
 * @file slice_accessor.hpp
 * @brief Read-only 2D (Y, X) access into 5D tensors
 * @details Slices are always deep copies: the extraction filter writes into a
 *          freshly allocated buffer that is disconnected from the pipeline, so
 *          mutating a slice never reaches the source tensor.
 *
 *          SliceRange walks the (channel, t, z) grid lazily. It holds a
 *          reference-counted pointer to the tensor and no cursor of its own;
 *          every begin() starts again from the first slice.
 *
 * @since 1.0.0
 */

#pragma once

#include "core/bioimage_types.hpp"

#include <cstddef>
#include <expected>
#include <iterator>
#include <optional>
#include <string>

#include <itkExtractImageFilter.h>
#include <itkImage.h>

namespace bioimage_lab::core {

/// 2D slice type of a 5D tensor type
template <typename TImage>
using SliceImageOf = itk::Image<typename TImage::PixelType, 2>;

/**
 * @brief Validate a (channel, t, z) triple against a tensor shape
 * @return IndexOutOfRange naming the offending index and its bound
 */
[[nodiscard]] inline std::expected<void, BioImageError>
checkSliceIndex(const TensorShape& shape, size_t channel, size_t t, size_t z)
{
    if (channel >= shape.c) {
        return std::unexpected(channelOutOfRange(channel, shape.c));
    }
    if (t >= shape.t) {
        return std::unexpected(BioImageError{
            BioImageError::Code::IndexOutOfRange,
            "t=" + std::to_string(t) + " out of range. Valid timepoints: " + boundString(shape.t)
        });
    }
    if (z >= shape.z) {
        return std::unexpected(BioImageError{
            BioImageError::Code::IndexOutOfRange,
            "z=" + std::to_string(z) + " out of range. Valid z-slices: " + boundString(shape.z)
        });
    }
    return {};
}

/**
 * @brief Extract a deep-copied (Y, X) slice
 *
 * Indices are validated against the tensor's own shape.
 *
 * @param tensor Source tensor
 * @param channel Channel index within the tensor
 * @param t Timepoint index
 * @param z Z-slice index
 * @return 2D slice, IndexOutOfRange naming the offending index and its bound
 */
template <typename TImage>
[[nodiscard]] std::expected<typename SliceImageOf<TImage>::Pointer, BioImageError>
extractSlice(const TImage* tensor, size_t channel, size_t t, size_t z)
{
    if (!tensor) {
        return std::unexpected(BioImageError{
            BioImageError::Code::PreconditionViolation,
            "Source tensor is not available"
        });
    }

    if (auto valid = checkSliceIndex(TensorShape::of(tensor), channel, t, z); !valid) {
        return std::unexpected(valid.error());
    }

    try {
        using SliceType = SliceImageOf<TImage>;
        using ExtractFilterType = itk::ExtractImageFilter<TImage, SliceType>;
        auto extractFilter = ExtractFilterType::New();
        extractFilter->SetDirectionCollapseToSubmatrix();

        auto extractRegion = subRegion(tensor, static_cast<long>(channel),
                                       static_cast<long>(z), static_cast<long>(t));
        // Collapse C, Z and T
        extractRegion.SetSize(axis::Channel, 0);
        extractRegion.SetSize(axis::Z, 0);
        extractRegion.SetSize(axis::Time, 0);

        extractFilter->SetExtractionRegion(extractRegion);
        extractFilter->SetInput(tensor);
        extractFilter->Update();

        typename SliceType::Pointer slice = extractFilter->GetOutput();
        slice->DisconnectPipeline();
        return slice;
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(BioImageError{
            BioImageError::Code::ProcessingFailed,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
}

/**
 * @brief One element of a slice walk
 */
template <typename TImage>
struct SliceEntry {
    size_t channel = 0;
    size_t t = 0;
    size_t z = 0;

    /// Deep copy of the slice, null if extraction failed
    typename SliceImageOf<TImage>::Pointer slice;
};

/**
 * @brief Lazy, finite, restartable walk over the slices of a tensor
 *
 * Fixed-channel form: t outer, z inner.
 * Every-channel form: channel outer, t middle, z inner.
 *
 * @example
 * @code
 * SliceRange<RawTensorType> range(tensor, 0);
 * for (const auto& entry : range) {
 *     process(entry.t, entry.z, entry.slice);
 * }
 * @endcode
 */
template <typename TImage>
class SliceRange {
public:
    using Entry = SliceEntry<TImage>;

    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Entry;
        using difference_type = std::ptrdiff_t;
        using pointer = const Entry*;
        using reference = const Entry&;

        Iterator() = default;

        Iterator(const SliceRange* range, size_t position)
            : range_(range), position_(position) {}

        reference operator*() const {
            materialize();
            return *current_;
        }

        pointer operator->() const {
            materialize();
            return &*current_;
        }

        Iterator& operator++() {
            ++position_;
            current_.reset();
            return *this;
        }

        Iterator operator++(int) {
            Iterator previous = *this;
            ++(*this);
            return previous;
        }

        bool operator==(const Iterator& other) const {
            return range_ == other.range_ && position_ == other.position_;
        }

    private:
        void materialize() const {
            if (!current_) {
                current_ = range_->entryAt(position_);
            }
        }

        const SliceRange* range_ = nullptr;
        size_t position_ = 0;
        mutable std::optional<Entry> current_;
    };

    /**
     * @brief Build a range over a tensor
     * @param tensor Source tensor (shared, not copied)
     * @param channel Fixed channel, or nullopt to walk every channel
     */
    SliceRange(typename TImage::ConstPointer tensor, std::optional<size_t> channel)
        : tensor_(std::move(tensor)), channel_(channel), shape_(TensorShape::of(tensor_.GetPointer())) {}

    [[nodiscard]] Iterator begin() const { return Iterator(this, 0); }
    [[nodiscard]] Iterator end() const { return Iterator(this, size()); }

    /// Number of slices the walk yields
    [[nodiscard]] size_t size() const noexcept {
        const size_t channels = channel_ ? 1 : shape_.c;
        return channels * shape_.t * shape_.z;
    }

    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

private:
    Entry entryAt(size_t position) const {
        Entry entry;
        const size_t perChannel = shape_.t * shape_.z;
        entry.channel = channel_ ? *channel_ : position / perChannel;
        const size_t withinChannel = position % perChannel;
        entry.t = withinChannel / shape_.z;
        entry.z = withinChannel % shape_.z;

        // Indices come from the tensor's own shape, extraction cannot fail on range
        auto slice = extractSlice(tensor_.GetPointer(), entry.channel, entry.t, entry.z);
        if (slice) {
            entry.slice = *slice;
        }
        return entry;
    }

    typename TImage::ConstPointer tensor_;
    std::optional<size_t> channel_;
    TensorShape shape_;
};

}  // namespace bioimage_lab::core
