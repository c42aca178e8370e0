#pragma once

#include "services/preprocessing/slice_operation.hpp"

namespace bioimage_lab::services {

/**
 * @brief Median filter for salt-and-pepper noise
 *
 * Wraps itk::MedianImageFilter with a square neighborhood. An even kernel
 * size is raised to the next odd value.
 */
class MedianFilter : public ISliceOperation {
public:
    struct Parameters {
        /// Side length of the neighborhood in pixels
        unsigned int kernelSize = 3;

        [[nodiscard]] bool isValid() const noexcept { return kernelSize >= 1; }
    };

    MedianFilter() = default;
    explicit MedianFilter(const Parameters& params) : params_(params) {}

    [[nodiscard]] std::string name() const override { return "median"; }
    [[nodiscard]] nlohmann::json parameters() const override;

    [[nodiscard]] std::expected<SliceImageType::Pointer, PreprocessingError>
    apply(SliceImageType::Pointer input) const override;

private:
    Parameters params_;
};

/**
 * @brief Mean over a rectangular neighborhood
 *
 * Wraps itk::BoxMeanImageFilter. Even sides are raised to the next odd value.
 */
class BoxBlurFilter : public ISliceOperation {
public:
    struct Parameters {
        unsigned int width = 3;
        unsigned int height = 3;

        [[nodiscard]] bool isValid() const noexcept { return width >= 1 && height >= 1; }
    };

    BoxBlurFilter() = default;
    explicit BoxBlurFilter(const Parameters& params) : params_(params) {}

    [[nodiscard]] std::string name() const override { return "box_blur"; }
    [[nodiscard]] nlohmann::json parameters() const override;

    [[nodiscard]] std::expected<SliceImageType::Pointer, PreprocessingError>
    apply(SliceImageType::Pointer input) const override;

private:
    Parameters params_;
};

/**
 * @brief Edge-preserving bilateral filter
 *
 * Wraps itk::BilateralImageFilter. sigmaSpace is the domain sigma in pixels,
 * sigmaColor the range sigma in intensity units, and diameter bounds the
 * neighborhood.
 */
class BilateralFilter : public ISliceOperation {
public:
    struct Parameters {
        unsigned int diameter = 3;
        double sigmaColor = 75.0;
        double sigmaSpace = 75.0;

        [[nodiscard]] bool isValid() const noexcept {
            return diameter >= 1 && sigmaColor > 0.0 && sigmaSpace > 0.0;
        }
    };

    BilateralFilter() = default;
    explicit BilateralFilter(const Parameters& params) : params_(params) {}

    [[nodiscard]] std::string name() const override { return "bilateral"; }
    [[nodiscard]] nlohmann::json parameters() const override;

    [[nodiscard]] std::expected<SliceImageType::Pointer, PreprocessingError>
    apply(SliceImageType::Pointer input) const override;

private:
    Parameters params_;
};

/// Odd size used for a requested neighborhood side
[[nodiscard]] unsigned int oddKernelSize(unsigned int requested) noexcept;

}  // namespace bioimage_lab::services
