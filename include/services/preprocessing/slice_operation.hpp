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

#pragma once

#include <expected>
#include <memory>
#include <string>

#include <itkImage.h>
#include <nlohmann/json.hpp>

namespace bioimage_lab::services {

/**
 * @brief Error information for preprocessing operations
 */
struct PreprocessingError {
    enum class Code {
        Success,
        InvalidInput,
        InvalidParameters,
        ProcessingFailed,
        InternalError
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::InvalidInput: return "Invalid input: " + message;
            case Code::InvalidParameters: return "Invalid parameters: " + message;
            case Code::ProcessingFailed: return "Processing failed: " + message;
            case Code::InternalError: return "Internal error: " + message;
        }
        return "Unknown error";
    }
};

/// 2D (Y, X) slice processed by preprocessing operations
using SliceImageType = itk::Image<float, 2>;

/**
 * @brief A preprocessing step mapping one slice to another
 *
 * Implementations never modify their input and return a newly allocated
 * slice of the same size.
 */
class ISliceOperation {
public:
    virtual ~ISliceOperation() = default;

    /// Identifier used in operation history and configuration files
    [[nodiscard]] virtual std::string name() const = 0;

    /// Parameters as recorded in operation history
    [[nodiscard]] virtual nlohmann::json parameters() const = 0;

    [[nodiscard]] virtual std::expected<SliceImageType::Pointer, PreprocessingError>
    apply(SliceImageType::Pointer input) const = 0;
};

using SliceOperationPtr = std::shared_ptr<const ISliceOperation>;

/// InvalidInput error for a null slice
[[nodiscard]] inline PreprocessingError nullInputError() {
    return PreprocessingError{
        PreprocessingError::Code::InvalidInput,
        "Input image is null"
    };
}

/// Whether two slices have the same (Y, X) size
[[nodiscard]] inline bool sameSize(const SliceImageType* a, const SliceImageType* b) {
    return a->GetLargestPossibleRegion().GetSize() == b->GetLargestPossibleRegion().GetSize();
}

}  // namespace bioimage_lab::services
