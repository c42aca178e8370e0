/**
 * @file normalization_methods.hpp
 * @brief Statistic and transform of the four normalization methods
 * @details Each method is split in two so that a statistic computed on a
 *          reference region can be applied to a different region:
 *          computeTransform() derives a NormalizationTransform from a sample
 *          set, and the transform maps individual values. applyMethod()
 *          composes both for the common "normalize these samples" case.
 *
 *          Degenerate statistics (zero maximum, equal min/max, equal
 *          percentile bounds, zero standard deviation, no samples) yield the
 *          identity transform with isDegenerate() set.
 *
 * @since 1.0.0
 */

#pragma once

#include "services/normalization/normalization_types.hpp"

#include <span>
#include <string>
#include <vector>

namespace bioimage_lab::services {

/**
 * @brief Affine transform with optional clamp to [0, 1]
 */
class NormalizationTransform {
public:
    /// Identity transform; a reason marks it as a degenerate fallback
    static NormalizationTransform identity(std::string degenerateReason = {});

    /// (value - offset) / divisor, optionally clamped
    static NormalizationTransform affine(double offset, double divisor, bool clampToUnit);

    [[nodiscard]] double operator()(double value) const noexcept;

    [[nodiscard]] bool isIdentity() const noexcept { return identity_; }
    [[nodiscard]] bool isDegenerate() const noexcept { return !degenerateReason_.empty(); }
    [[nodiscard]] const std::string& degenerateReason() const noexcept { return degenerateReason_; }

    [[nodiscard]] double offset() const noexcept { return offset_; }
    [[nodiscard]] double divisor() const noexcept { return divisor_; }

private:
    double offset_ = 0.0;
    double divisor_ = 1.0;
    bool clampToUnit_ = false;
    bool identity_ = true;
    std::string degenerateReason_;
};

/**
 * @brief Derive the transform of a method from a sample set
 */
[[nodiscard]] NormalizationTransform computeTransform(
    std::span<const double> samples,
    const NormalizationParameters& params);

/**
 * @brief Normalize a sample set by its own statistic
 */
[[nodiscard]] std::vector<double> applyMethod(
    std::span<const double> samples,
    const NormalizationParameters& params);

/**
 * @brief Percentile with linear interpolation between closest ranks
 * @param samples Sample set (copied internally)
 * @param percentile Percentile in [0, 100]
 * @return Percentile value, 0 for an empty set
 */
[[nodiscard]] double percentile(std::span<const double> samples, double percentile);

}  // namespace bioimage_lab::services
