/**
 * @file illumination_correction.hpp
 * @brief Background subtraction, flat-field and shading correction
 * @details Additive models (I = S + B) are corrected by subtracting a
 *          background B, either a measured dark frame or a rolling-ball
 *          estimate. Multiplicative models (I = S * L) are corrected by
 *          dividing by an illumination field L, either a measured flat field
 *          or a smooth estimate. Pixels where the divisor is not positive are
 *          passed through unchanged.
 *
 * @since 1.0.0
 */

#pragma once

#include "services/preprocessing/slice_operation.hpp"

namespace bioimage_lab::services {

/**
 * @brief max(I - D, 0) with a measured dark frame D
 */
class DarkFrameSubtraction : public ISliceOperation {
public:
    explicit DarkFrameSubtraction(SliceImageType::Pointer masterDark);

    [[nodiscard]] std::string name() const override { return "dark_frame"; }
    [[nodiscard]] nlohmann::json parameters() const override;

    [[nodiscard]] std::expected<SliceImageType::Pointer, PreprocessingError>
    apply(SliceImageType::Pointer input) const override;

private:
    SliceImageType::Pointer masterDark_;
};

/**
 * @brief Rolling-ball background removal
 *
 * Computed as a grayscale white top-hat with a flat ball of the given radius,
 * clipped at 0. The radius must exceed the size of the structures to keep.
 * Radii below 3 are raised to 3.
 */
class RollingBallBackground : public ISliceOperation {
public:
    static constexpr unsigned int kMinimumRadius = 3;

    struct Parameters {
        unsigned int radius = 50;
    };

    RollingBallBackground() = default;
    explicit RollingBallBackground(const Parameters& params) : params_(params) {}

    [[nodiscard]] std::string name() const override { return "rolling_ball"; }
    [[nodiscard]] nlohmann::json parameters() const override;

    [[nodiscard]] std::expected<SliceImageType::Pointer, PreprocessingError>
    apply(SliceImageType::Pointer input) const override;

    /// Radius actually used for a requested radius
    [[nodiscard]] static unsigned int effectiveRadius(unsigned int requested) noexcept;

private:
    Parameters params_;
};

/**
 * @brief (I - D) / (F - D) with a measured flat field F and optional dark D
 */
class FlatFieldReference : public ISliceOperation {
public:
    FlatFieldReference(SliceImageType::Pointer masterFlat,
                       SliceImageType::Pointer masterDark = nullptr);

    [[nodiscard]] std::string name() const override { return "flat_field_reference"; }
    [[nodiscard]] nlohmann::json parameters() const override;

    [[nodiscard]] std::expected<SliceImageType::Pointer, PreprocessingError>
    apply(SliceImageType::Pointer input) const override;

private:
    SliceImageType::Pointer masterFlat_;
    SliceImageType::Pointer masterDark_;
};

/**
 * @brief I / F with F estimated by a wide Gaussian of the slice itself
 *
 * A large sigma keeps only the illumination curvature and not the objects.
 */
class FlatFieldEstimated : public ISliceOperation {
public:
    struct Parameters {
        double sigma = 100.0;
    };

    FlatFieldEstimated() = default;
    explicit FlatFieldEstimated(const Parameters& params) : params_(params) {}

    [[nodiscard]] std::string name() const override { return "flat_field_estimated"; }
    [[nodiscard]] nlohmann::json parameters() const override;

    [[nodiscard]] std::expected<SliceImageType::Pointer, PreprocessingError>
    apply(SliceImageType::Pointer input) const override;

private:
    Parameters params_;
};

/**
 * @brief I * M with a measured shading map M
 */
class ShadingMapCorrection : public ISliceOperation {
public:
    explicit ShadingMapCorrection(SliceImageType::Pointer shadingMap);

    [[nodiscard]] std::string name() const override { return "shading_map"; }
    [[nodiscard]] nlohmann::json parameters() const override;

    [[nodiscard]] std::expected<SliceImageType::Pointer, PreprocessingError>
    apply(SliceImageType::Pointer input) const override;

private:
    SliceImageType::Pointer shadingMap_;
};

/**
 * @brief I / (L / mean(L)) with L a polynomial surface fitted to the slice
 *
 * Dividing by the relative illumination flattens smooth gradients while
 * keeping the overall intensity level.
 */
class PolynomialShadingCorrection : public ISliceOperation {
public:
    struct Parameters {
        int degree = 2;
    };

    PolynomialShadingCorrection() = default;
    explicit PolynomialShadingCorrection(const Parameters& params) : params_(params) {}

    [[nodiscard]] std::string name() const override { return "shading_polynomial"; }
    [[nodiscard]] nlohmann::json parameters() const override;

    [[nodiscard]] std::expected<SliceImageType::Pointer, PreprocessingError>
    apply(SliceImageType::Pointer input) const override;

private:
    Parameters params_;
};

}  // namespace bioimage_lab::services
