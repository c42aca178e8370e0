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

#include "services/preprocessing/denoising_filters.hpp"
#include "core/logging.hpp"

#include <itkBilateralImageFilter.h>
#include <itkBoxMeanImageFilter.h>
#include <itkMedianImageFilter.h>

namespace bioimage_lab::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("DenoisingFilters");
    return logger;
}

/**
 * @brief Run a configured slice filter and detach its output
 */
template <typename TFilter>
std::expected<SliceImageType::Pointer, PreprocessingError> runFilter(TFilter* filter) {
    try {
        filter->Update();

        SliceImageType::Pointer output = filter->GetOutput();
        output->DisconnectPipeline();
        return output;
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::ProcessingFailed,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
    catch (const std::exception& e) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InternalError,
            std::string("Standard exception: ") + e.what()
        });
    }
}

unsigned int correctedSize(const char* what, unsigned int requested) {
    const unsigned int size = oddKernelSize(requested);
    if (size != requested) {
        getLogger()->info("{} {} is even, using {}", what, requested, size);
    }
    return size;
}

}  // anonymous namespace

unsigned int oddKernelSize(unsigned int requested) noexcept {
    return requested % 2 == 1 ? requested : requested + 1;
}

// ==================== MedianFilter ====================

nlohmann::json MedianFilter::parameters() const {
    return {{"kernel_size", params_.kernelSize}};
}

std::expected<SliceImageType::Pointer, PreprocessingError>
MedianFilter::apply(SliceImageType::Pointer input) const {
    if (!input) {
        return std::unexpected(nullInputError());
    }
    if (!params_.isValid()) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidParameters,
            "Kernel size must be at least 1"
        });
    }

    const unsigned int size = correctedSize("Median kernel size", params_.kernelSize);

    using FilterType = itk::MedianImageFilter<SliceImageType, SliceImageType>;
    auto filter = FilterType::New();

    FilterType::InputSizeType radius;
    radius.Fill(size / 2);
    filter->SetRadius(radius);
    filter->SetInput(input);

    return runFilter(filter.GetPointer());
}

// ==================== BoxBlurFilter ====================

nlohmann::json BoxBlurFilter::parameters() const {
    return {{"width", params_.width}, {"height", params_.height}};
}

std::expected<SliceImageType::Pointer, PreprocessingError>
BoxBlurFilter::apply(SliceImageType::Pointer input) const {
    if (!input) {
        return std::unexpected(nullInputError());
    }
    if (!params_.isValid()) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidParameters,
            "Box width and height must be at least 1"
        });
    }

    const unsigned int width = correctedSize("Box width", params_.width);
    const unsigned int height = correctedSize("Box height", params_.height);

    using FilterType = itk::BoxMeanImageFilter<SliceImageType, SliceImageType>;
    auto filter = FilterType::New();

    FilterType::RadiusType radius;
    radius[0] = width / 2;
    radius[1] = height / 2;
    filter->SetRadius(radius);
    filter->SetInput(input);

    return runFilter(filter.GetPointer());
}

// ==================== BilateralFilter ====================

nlohmann::json BilateralFilter::parameters() const {
    return {
        {"diameter", params_.diameter},
        {"sigma_color", params_.sigmaColor},
        {"sigma_space", params_.sigmaSpace}
    };
}

std::expected<SliceImageType::Pointer, PreprocessingError>
BilateralFilter::apply(SliceImageType::Pointer input) const {
    if (!input) {
        return std::unexpected(nullInputError());
    }
    if (!params_.isValid()) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidParameters,
            "Diameter must be at least 1 and both sigmas positive"
        });
    }

    const unsigned int diameter = correctedSize("Bilateral diameter", params_.diameter);

    using FilterType = itk::BilateralImageFilter<SliceImageType, SliceImageType>;
    auto filter = FilterType::New();

    FilterType::SizeType radius;
    radius.Fill(diameter / 2);
    filter->SetAutomaticKernelSize(false);
    filter->SetRadius(radius);
    filter->SetDomainSigma(params_.sigmaSpace);
    filter->SetRangeSigma(params_.sigmaColor);
    filter->SetInput(input);

    return runFilter(filter.GetPointer());
}

}  // namespace bioimage_lab::services
