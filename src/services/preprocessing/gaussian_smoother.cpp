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

#include "services/preprocessing/gaussian_smoother.hpp"
#include "core/logging.hpp"

#include <itkDiscreteGaussianImageFilter.h>

namespace bioimage_lab::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("GaussianSmoother");
    return logger;
}

}  // anonymous namespace

GaussianSmoother::GaussianSmoother(const Parameters& params) : params_(params) {}

nlohmann::json GaussianSmoother::parameters() const {
    return {
        {"sigma", params_.sigma},
        {"kernel_width", params_.kernelWidth}
    };
}

unsigned int GaussianSmoother::effectiveKernelWidth(unsigned int requested) noexcept {
    if (requested == 0 || requested % 2 == 1) {
        return requested;
    }
    return requested + 1;
}

std::expected<SliceImageType::Pointer, PreprocessingError>
GaussianSmoother::apply(SliceImageType::Pointer input) const {
    // Validate input
    if (!input) {
        return std::unexpected(nullInputError());
    }

    // Validate parameters
    if (!params_.isValid()) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidParameters,
            "Sigma must be positive"
        });
    }

    const unsigned int kernelWidth = effectiveKernelWidth(params_.kernelWidth);
    if (kernelWidth != params_.kernelWidth) {
        getLogger()->info("Kernel width {} is even, using {}", params_.kernelWidth, kernelWidth);
    }

    try {
        using FilterType = itk::DiscreteGaussianImageFilter<SliceImageType, SliceImageType>;
        auto filter = FilterType::New();

        filter->SetInput(input);
        filter->SetVariance(params_.sigma * params_.sigma);
        filter->SetUseImageSpacing(false);

        if (kernelWidth > 0) {
            filter->SetMaximumKernelWidth(kernelWidth);
        }

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

}  // namespace bioimage_lab::services
