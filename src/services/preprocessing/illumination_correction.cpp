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

#include "services/preprocessing/illumination_correction.hpp"
#include "services/preprocessing/surface_fitter.hpp"
#include "core/logging.hpp"

#include <algorithm>

#include <itkFlatStructuringElement.h>
#include <itkImageRegionConstIterator.h>
#include <itkImageRegionIterator.h>
#include <itkSmoothingRecursiveGaussianImageFilter.h>
#include <itkWhiteTopHatImageFilter.h>

namespace bioimage_lab::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("IlluminationCorrection");
    return logger;
}

using ConstIterator = itk::ImageRegionConstIterator<SliceImageType>;
using Iterator = itk::ImageRegionIterator<SliceImageType>;

SliceImageType::Pointer allocateLike(const SliceImageType* input) {
    auto output = SliceImageType::New();
    output->CopyInformation(input);
    output->SetRegions(input->GetLargestPossibleRegion());
    output->Allocate();
    return output;
}

/// output = fn(input, other) pixel by pixel; sizes must match
template <typename TFunction>
SliceImageType::Pointer combine(
    const SliceImageType* input, const SliceImageType* other, TFunction fn)
{
    auto output = allocateLike(input);
    ConstIterator a(input, input->GetLargestPossibleRegion());
    ConstIterator b(other, other->GetLargestPossibleRegion());
    Iterator out(output, output->GetLargestPossibleRegion());
    for (a.GoToBegin(), b.GoToBegin(), out.GoToBegin(); !a.IsAtEnd(); ++a, ++b, ++out) {
        out.Set(fn(a.Get(), b.Get()));
    }
    return output;
}

/// I where the divisor is not positive, I / divisor elsewhere
float divideWherePositive(float value, float divisor) {
    return divisor > 0.0f ? value / divisor : value;
}

std::expected<void, PreprocessingError> checkReference(
    const SliceImageType* input, const SliceImageType* reference, const char* what)
{
    if (!sameSize(input, reference)) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidInput,
            std::string(what) + " size does not match the input slice"
        });
    }
    return {};
}

PreprocessingError missingReference(const char* what) {
    return PreprocessingError{
        PreprocessingError::Code::InvalidParameters,
        std::string(what) + " is null"
    };
}

PreprocessingError itkError(const itk::ExceptionObject& e) {
    return PreprocessingError{
        PreprocessingError::Code::ProcessingFailed,
        std::string("ITK exception: ") + e.GetDescription()
    };
}

}  // anonymous namespace

// ==================== DarkFrameSubtraction ====================

DarkFrameSubtraction::DarkFrameSubtraction(SliceImageType::Pointer masterDark)
    : masterDark_(std::move(masterDark)) {}

nlohmann::json DarkFrameSubtraction::parameters() const {
    return {{"reference", "master_dark"}};
}

std::expected<SliceImageType::Pointer, PreprocessingError>
DarkFrameSubtraction::apply(SliceImageType::Pointer input) const {
    if (!input) {
        return std::unexpected(nullInputError());
    }
    if (!masterDark_) {
        return std::unexpected(missingReference("Master dark"));
    }
    if (auto valid = checkReference(input, masterDark_, "Master dark"); !valid) {
        return std::unexpected(valid.error());
    }

    return combine(input, masterDark_, [](float value, float dark) {
        return std::max(value - dark, 0.0f);
    });
}

// ==================== RollingBallBackground ====================

unsigned int RollingBallBackground::effectiveRadius(unsigned int requested) noexcept {
    return std::max(requested, kMinimumRadius);
}

nlohmann::json RollingBallBackground::parameters() const {
    return {{"radius", params_.radius}};
}

std::expected<SliceImageType::Pointer, PreprocessingError>
RollingBallBackground::apply(SliceImageType::Pointer input) const {
    if (!input) {
        return std::unexpected(nullInputError());
    }

    const unsigned int radius = effectiveRadius(params_.radius);
    if (radius != params_.radius) {
        getLogger()->warn("Rolling ball radius {} is too small, using {}",
                          params_.radius, radius);
    }

    try {
        using KernelType = itk::FlatStructuringElement<2>;
        KernelType::RadiusType kernelRadius;
        kernelRadius.Fill(radius);

        using FilterType = itk::WhiteTopHatImageFilter<SliceImageType, SliceImageType, KernelType>;
        auto filter = FilterType::New();
        filter->SetInput(input);
        filter->SetKernel(KernelType::Ball(kernelRadius));
        filter->SetSafeBorder(true);
        filter->Update();

        SliceImageType::Pointer output = filter->GetOutput();
        output->DisconnectPipeline();

        Iterator it(output, output->GetLargestPossibleRegion());
        for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
            it.Set(std::max(it.Get(), 0.0f));
        }
        return output;
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(itkError(e));
    }
}

// ==================== FlatFieldReference ====================

FlatFieldReference::FlatFieldReference(
    SliceImageType::Pointer masterFlat, SliceImageType::Pointer masterDark)
    : masterFlat_(std::move(masterFlat)), masterDark_(std::move(masterDark)) {}

nlohmann::json FlatFieldReference::parameters() const {
    return {
        {"reference", "master_flat"},
        {"dark_frame", masterDark_.IsNotNull()}
    };
}

std::expected<SliceImageType::Pointer, PreprocessingError>
FlatFieldReference::apply(SliceImageType::Pointer input) const {
    if (!input) {
        return std::unexpected(nullInputError());
    }
    if (!masterFlat_) {
        return std::unexpected(missingReference("Master flat"));
    }
    if (auto valid = checkReference(input, masterFlat_, "Master flat"); !valid) {
        return std::unexpected(valid.error());
    }

    if (!masterDark_) {
        return combine(input, masterFlat_, divideWherePositive);
    }
    if (auto valid = checkReference(input, masterDark_, "Master dark"); !valid) {
        return std::unexpected(valid.error());
    }

    auto output = allocateLike(input);
    ConstIterator image(input, input->GetLargestPossibleRegion());
    ConstIterator flat(masterFlat_, masterFlat_->GetLargestPossibleRegion());
    ConstIterator dark(masterDark_, masterDark_->GetLargestPossibleRegion());
    Iterator out(output, output->GetLargestPossibleRegion());
    for (image.GoToBegin(), flat.GoToBegin(), dark.GoToBegin(), out.GoToBegin();
         !image.IsAtEnd(); ++image, ++flat, ++dark, ++out) {
        const float denominator = flat.Get() - dark.Get();
        out.Set(denominator > 0.0f ? (image.Get() - dark.Get()) / denominator : image.Get());
    }
    return output;
}

// ==================== FlatFieldEstimated ====================

nlohmann::json FlatFieldEstimated::parameters() const {
    return {{"sigma", params_.sigma}};
}

std::expected<SliceImageType::Pointer, PreprocessingError>
FlatFieldEstimated::apply(SliceImageType::Pointer input) const {
    if (!input) {
        return std::unexpected(nullInputError());
    }
    if (!(params_.sigma > 0.0)) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidParameters,
            "Sigma must be positive"
        });
    }

    try {
        using FilterType = itk::SmoothingRecursiveGaussianImageFilter<SliceImageType, SliceImageType>;
        auto filter = FilterType::New();
        filter->SetInput(input);
        filter->SetSigma(params_.sigma);
        filter->Update();

        return combine(input, filter->GetOutput(), divideWherePositive);
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(itkError(e));
    }
}

// ==================== ShadingMapCorrection ====================

ShadingMapCorrection::ShadingMapCorrection(SliceImageType::Pointer shadingMap)
    : shadingMap_(std::move(shadingMap)) {}

nlohmann::json ShadingMapCorrection::parameters() const {
    return {{"reference", "shading_map"}};
}

std::expected<SliceImageType::Pointer, PreprocessingError>
ShadingMapCorrection::apply(SliceImageType::Pointer input) const {
    if (!input) {
        return std::unexpected(nullInputError());
    }
    if (!shadingMap_) {
        return std::unexpected(missingReference("Shading map"));
    }
    if (auto valid = checkReference(input, shadingMap_, "Shading map"); !valid) {
        return std::unexpected(valid.error());
    }

    return combine(input, shadingMap_, [](float value, float gain) {
        return value * gain;
    });
}

// ==================== PolynomialShadingCorrection ====================

nlohmann::json PolynomialShadingCorrection::parameters() const {
    return {{"degree", params_.degree}};
}

std::expected<SliceImageType::Pointer, PreprocessingError>
PolynomialShadingCorrection::apply(SliceImageType::Pointer input) const {
    PolynomialSurfaceFitter fitter({params_.degree});
    auto fit = fitter.fit(input);
    if (!fit) {
        return std::unexpected(fit.error());
    }

    const auto* surface = fit->surface.GetPointer();
    double sum = 0.0;
    ConstIterator it(surface, surface->GetLargestPossibleRegion());
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        sum += it.Get();
    }
    const double mean = sum / static_cast<double>(
        surface->GetLargestPossibleRegion().GetNumberOfPixels());

    if (!(mean > 0.0)) {
        getLogger()->warn("Illumination surface has mean {}, slice left uncorrected", mean);
        return combine(input, surface, [](float value, float) { return value; });
    }

    return combine(input, surface, [mean](float value, float illumination) {
        return divideWherePositive(value, static_cast<float>(illumination / mean));
    });
}

}  // namespace bioimage_lab::services
