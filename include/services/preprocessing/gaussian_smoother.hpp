#pragma once

#include "services/preprocessing/slice_operation.hpp"

namespace bioimage_lab::services {

/**
 * @brief Gaussian smoothing of a slice for noise reduction
 *
 * The filter uses ITK's DiscreteGaussianImageFilter which provides
 * a high-quality approximation of continuous Gaussian filtering.
 * The kernel is defined in pixel units.
 *
 * @example
 * @code
 * GaussianSmoother::Parameters params;
 * params.sigma = 2.0;
 * params.kernelWidth = 7;
 * GaussianSmoother smoother(params);
 *
 * auto result = smoother.apply(slice);
 * if (result) {
 *     auto smoothed = result.value();
 * }
 * @endcode
 */
class GaussianSmoother : public ISliceOperation {
public:
    /**
     * @brief Parameters for Gaussian smoothing
     */
    struct Parameters {
        /// Standard deviation of the kernel in pixels, must be positive
        double sigma = 1.0;

        /// Kernel width in pixels
        /// 0 = automatic (default); an even width is raised to the next odd value
        unsigned int kernelWidth = 0;

        [[nodiscard]] bool isValid() const noexcept {
            return sigma > 0.0;
        }
    };

    GaussianSmoother() = default;
    explicit GaussianSmoother(const Parameters& params);

    [[nodiscard]] std::string name() const override { return "gaussian"; }

    [[nodiscard]] nlohmann::json parameters() const override;

    [[nodiscard]] std::expected<SliceImageType::Pointer, PreprocessingError>
    apply(SliceImageType::Pointer input) const override;

    [[nodiscard]] const Parameters& params() const noexcept { return params_; }

    /**
     * @brief Kernel width actually used for a requested width
     *
     * @param requested Requested width, 0 for automatic
     * @return requested if odd or 0, requested + 1 otherwise
     */
    [[nodiscard]] static unsigned int effectiveKernelWidth(unsigned int requested) noexcept;

private:
    Parameters params_;
};

}  // namespace bioimage_lab::services
