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

#include "services/preprocessing/surface_fitter.hpp"
#include "core/logging.hpp"

#include <cmath>

#include <itkImageRegionConstIteratorWithIndex.h>
#include <itkImageRegionIteratorWithIndex.h>

namespace bioimage_lab::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("SurfaceFitter");
    return logger;
}

/// Pixel index to [-1, 1] scale of one axis
double axisScale(size_t extent) {
    return extent > 1 ? 2.0 / static_cast<double>(extent - 1) : 1.0;
}

/// Basis row: for p in [0, degree], x^i * y^(p-i) with i from p down to 0
std::vector<double> basisRow(double x, double y, int degree) {
    std::vector<double> row;
    row.reserve(PolynomialSurfaceFitter::termCount(degree));
    for (int p = 0; p <= degree; ++p) {
        for (int i = p; i >= 0; --i) {
            row.push_back(std::pow(x, i) * std::pow(y, p - i));
        }
    }
    return row;
}

/**
 * @brief Solve the normal equations (A^T A) c = A^T b
 *
 * Gaussian elimination with partial pivoting; near-singular pivots leave
 * their coefficient at 0.
 */
std::vector<double> solveNormalEquations(
    std::vector<std::vector<double>> ata,
    std::vector<double> atb)
{
    const size_t n = atb.size();
    std::vector<double> coeffs(n, 0.0);

    for (size_t col = 0; col < n; ++col) {
        // Find pivot
        size_t maxRow = col;
        double maxVal = std::abs(ata[col][col]);
        for (size_t row = col + 1; row < n; ++row) {
            if (std::abs(ata[row][col]) > maxVal) {
                maxVal = std::abs(ata[row][col]);
                maxRow = row;
            }
        }

        if (maxVal < 1e-12) continue;  // Singular or near-singular

        if (maxRow != col) {
            std::swap(ata[col], ata[maxRow]);
            std::swap(atb[col], atb[maxRow]);
        }

        // Eliminate below
        for (size_t row = col + 1; row < n; ++row) {
            const double factor = ata[row][col] / ata[col][col];
            for (size_t j = col; j < n; ++j) {
                ata[row][j] -= factor * ata[col][j];
            }
            atb[row] -= factor * atb[col];
        }
    }

    // Back substitution
    for (size_t k = n; k-- > 0;) {
        double sum = atb[k];
        for (size_t j = k + 1; j < n; ++j) {
            sum -= ata[k][j] * coeffs[j];
        }
        if (std::abs(ata[k][k]) > 1e-12) {
            coeffs[k] = sum / ata[k][k];
        }
    }
    return coeffs;
}

}  // anonymous namespace

size_t PolynomialSurfaceFitter::termCount(int degree) noexcept {
    if (degree < 0) {
        return 0;
    }
    const auto d = static_cast<size_t>(degree);
    return (d + 1) * (d + 2) / 2;
}

nlohmann::json PolynomialSurfaceFitter::parameters() const {
    return {{"degree", params_.degree}};
}

std::expected<SliceImageType::Pointer, PreprocessingError>
PolynomialSurfaceFitter::apply(SliceImageType::Pointer input) const {
    auto result = fit(input);
    if (!result) {
        return std::unexpected(result.error());
    }
    return result->surface;
}

std::expected<PolynomialSurfaceFitter::SurfaceFit, PreprocessingError>
PolynomialSurfaceFitter::fit(SliceImageType::Pointer input, MaskType::Pointer mask) const {
    if (!input) {
        return std::unexpected(nullInputError());
    }
    if (!params_.isValid()) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidParameters,
            "Polynomial degree must be >= 0, got " + std::to_string(params_.degree)
        });
    }

    const auto region = input->GetLargestPossibleRegion();
    const auto size = region.GetSize();
    if (mask && mask->GetLargestPossibleRegion().GetSize() != size) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidInput,
            "Mask size does not match the input slice"
        });
    }

    const int degree = params_.degree;
    const size_t numTerms = termCount(degree);
    const double scaleX = axisScale(size[0]);
    const double scaleY = axisScale(size[1]);
    const auto origin = region.GetIndex();

    // Accumulate the normal equations directly, the design matrix is never stored
    std::vector<std::vector<double>> ata(numTerms, std::vector<double>(numTerms, 0.0));
    std::vector<double> atb(numTerms, 0.0);
    size_t sampleCount = 0;

    itk::ImageRegionConstIteratorWithIndex<SliceImageType> it(input, region);
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        const auto idx = it.GetIndex();
        if (mask && mask->GetPixel(idx) == 0) continue;

        const double x = static_cast<double>(idx[0] - origin[0]) * scaleX - 1.0;
        const double y = static_cast<double>(idx[1] - origin[1]) * scaleY - 1.0;
        const auto row = basisRow(x, y, degree);
        const double value = it.Get();

        for (size_t i = 0; i < numTerms; ++i) {
            atb[i] += row[i] * value;
            for (size_t j = i; j < numTerms; ++j) {
                ata[i][j] += row[i] * row[j];
            }
        }
        ++sampleCount;
    }

    if (sampleCount < numTerms) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::ProcessingFailed,
            "Not enough samples for a degree " + std::to_string(degree) + " fit: " +
            std::to_string(sampleCount) + " < " + std::to_string(numTerms)
        });
    }

    // Symmetrize
    for (size_t i = 0; i < numTerms; ++i) {
        for (size_t j = 0; j < i; ++j) {
            ata[i][j] = ata[j][i];
        }
    }

    SurfaceFit result;
    result.coefficients = solveNormalEquations(std::move(ata), std::move(atb));
    result.sampleCount = sampleCount;

    auto surface = SliceImageType::New();
    surface->SetRegions(region);
    surface->CopyInformation(input);
    surface->Allocate();

    itk::ImageRegionIteratorWithIndex<SliceImageType> out(surface, region);
    for (out.GoToBegin(); !out.IsAtEnd(); ++out) {
        const auto idx = out.GetIndex();
        const double x = static_cast<double>(idx[0] - origin[0]) * scaleX - 1.0;
        const double y = static_cast<double>(idx[1] - origin[1]) * scaleY - 1.0;
        const auto row = basisRow(x, y, degree);

        double value = 0.0;
        for (size_t i = 0; i < numTerms; ++i) {
            value += result.coefficients[i] * row[i];
        }
        out.Set(static_cast<float>(value));
    }
    result.surface = surface;

    getLogger()->debug("Surface fit: degree={}, terms={}, samples={}",
                       degree, numTerms, sampleCount);
    return result;
}

}  // namespace bioimage_lab::services
