#pragma once

#include "services/preprocessing/slice_operation.hpp"

#include <vector>

namespace bioimage_lab::services {

/**
 * @brief Least-squares polynomial surface of a slice
 *
 * Fits every term x^i * y^j with i + j <= degree. Coordinates are mapped to
 * [-1, 1] on each axis before fitting, which keeps the normal equations well
 * conditioned for large slices.
 *
 * As an operation it returns the fitted surface, which serves as an estimate
 * of a smooth background or illumination field.
 *
 * @example
 * @code
 * PolynomialSurfaceFitter fitter({2});
 * auto fit = fitter.fit(slice, backgroundMask);
 * if (fit) {
 *     auto background = fit->surface;
 * }
 * @endcode
 */
class PolynomialSurfaceFitter : public ISliceOperation {
public:
    /// Mask selecting fit pixels (non-zero = used)
    using MaskType = itk::Image<unsigned char, 2>;

    struct Parameters {
        /// Polynomial degree, must be non-negative
        int degree = 2;

        [[nodiscard]] bool isValid() const noexcept { return degree >= 0; }
    };

    /**
     * @brief Fitted polynomial and its evaluation over the slice
     */
    struct SurfaceFit {
        /// Coefficients in term order: degree p ascending, x power descending
        std::vector<double> coefficients;

        /// Surface evaluated at every pixel
        SliceImageType::Pointer surface;

        /// Number of pixels the fit used
        size_t sampleCount = 0;
    };

    PolynomialSurfaceFitter() = default;
    explicit PolynomialSurfaceFitter(const Parameters& params) : params_(params) {}

    [[nodiscard]] std::string name() const override { return "surface_fit"; }
    [[nodiscard]] nlohmann::json parameters() const override;

    [[nodiscard]] std::expected<SliceImageType::Pointer, PreprocessingError>
    apply(SliceImageType::Pointer input) const override;

    /**
     * @brief Fit the surface
     *
     * @param input Slice to fit
     * @param mask Optional mask of the same size selecting fit pixels
     * @return Fit on success; InvalidParameters for a negative degree,
     *         InvalidInput for a null input or mismatched mask,
     *         ProcessingFailed when fewer pixels than terms are available
     */
    [[nodiscard]] std::expected<SurfaceFit, PreprocessingError>
    fit(SliceImageType::Pointer input, MaskType::Pointer mask = nullptr) const;

    /// Number of terms of a 2D polynomial of the given degree
    [[nodiscard]] static size_t termCount(int degree) noexcept;

private:
    Parameters params_;
};

}  // namespace bioimage_lab::services
