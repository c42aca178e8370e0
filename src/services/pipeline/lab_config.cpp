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

#include "services/pipeline/lab_config.hpp"
#include "services/preprocessing/denoising_filters.hpp"
#include "services/preprocessing/gaussian_smoother.hpp"
#include "services/preprocessing/illumination_correction.hpp"
#include "services/preprocessing/surface_fitter.hpp"

#include <fstream>
#include <sstream>

namespace bioimage_lab::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("LabConfig");
    return logger;
}

std::expected<logging::LogConfig, PreprocessingError> parseLogging(const nlohmann::json& j) {
    logging::LogConfig config;
    if (!j.is_object()) {
        return config;
    }

    const std::string levelText = j.value("level", std::string("info"));
    const auto level = logging::logLevelFromString(levelText);
    if (!level) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidParameters,
            "Unknown log level: " + levelText
        });
    }

    config.level = *level;
    config.enableFileLogging = j.value("file_logging", false);
    config.logDirectory = j.value("directory", std::string());
    config.logFileName = j.value("file_name", config.logFileName);
    return config;
}

std::expected<OperationConfig, PreprocessingError> parseOperation(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("name") || !j.contains("operation")) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidParameters,
            "Each operation needs a \"name\" and an \"operation\""
        });
    }

    OperationConfig op;
    op.name = j["name"].get<std::string>();
    op.operation = j["operation"].get<std::string>();
    if (j.contains("input")) {
        op.input = j["input"].get<std::string>();
    }
    if (j.contains("parameters")) {
        op.parameters = j["parameters"];
    }
    return op;
}

}  // anonymous namespace

std::expected<LabConfig, PreprocessingError> parseLabConfig(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidInput,
            std::string("Malformed configuration: ") + e.what()
        });
    }

    if (!j.is_object()) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidInput,
            "Configuration must be a JSON object"
        });
    }

    try {
        LabConfig config;

        if (j.contains("logging")) {
            auto loggingConfig = parseLogging(j["logging"]);
            if (!loggingConfig) {
                return std::unexpected(loggingConfig.error());
            }
            config.logging = *loggingConfig;
        }

        if (j.contains("operations")) {
            for (const auto& entry : j["operations"]) {
                auto op = parseOperation(entry);
                if (!op) {
                    return std::unexpected(op.error());
                }
                config.operations.push_back(std::move(*op));
            }
        }
        return config;
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidParameters,
            std::string("Invalid configuration value: ") + e.what()
        });
    }
}

std::expected<LabConfig, PreprocessingError> loadLabConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidInput,
            "File not found: " + path.string()
        });
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidInput,
            "Failed to open file: " + path.string()
        });
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseLabConfig(buffer.str());
}

std::expected<SliceOperationPtr, PreprocessingError> createOperation(const OperationConfig& op) {
    const auto& p = op.parameters;

    try {
        if (op.operation == "gaussian") {
            GaussianSmoother::Parameters params;
            params.sigma = p.value("sigma", params.sigma);
            params.kernelWidth = p.value("kernel_width", params.kernelWidth);
            return std::make_shared<GaussianSmoother>(params);
        }
        if (op.operation == "median") {
            MedianFilter::Parameters params;
            params.kernelSize = p.value("kernel_size", params.kernelSize);
            return std::make_shared<MedianFilter>(params);
        }
        if (op.operation == "box_blur") {
            BoxBlurFilter::Parameters params;
            params.width = p.value("width", params.width);
            params.height = p.value("height", params.height);
            return std::make_shared<BoxBlurFilter>(params);
        }
        if (op.operation == "bilateral") {
            BilateralFilter::Parameters params;
            params.diameter = p.value("diameter", params.diameter);
            params.sigmaColor = p.value("sigma_color", params.sigmaColor);
            params.sigmaSpace = p.value("sigma_space", params.sigmaSpace);
            return std::make_shared<BilateralFilter>(params);
        }
        if (op.operation == "rolling_ball") {
            RollingBallBackground::Parameters params;
            params.radius = p.value("radius", params.radius);
            return std::make_shared<RollingBallBackground>(params);
        }
        if (op.operation == "flat_field_estimated") {
            FlatFieldEstimated::Parameters params;
            params.sigma = p.value("sigma", params.sigma);
            return std::make_shared<FlatFieldEstimated>(params);
        }
        if (op.operation == "shading_polynomial") {
            PolynomialShadingCorrection::Parameters params;
            params.degree = p.value("degree", params.degree);
            return std::make_shared<PolynomialShadingCorrection>(params);
        }
        if (op.operation == "surface_fit") {
            PolynomialSurfaceFitter::Parameters params;
            params.degree = p.value("degree", params.degree);
            return std::make_shared<PolynomialSurfaceFitter>(params);
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidParameters,
            "Invalid parameters for " + op.operation + ": " + e.what()
        });
    }

    return std::unexpected(PreprocessingError{
        PreprocessingError::Code::InvalidParameters,
        "Unknown operation: " + op.operation
    });
}

std::expected<void, PreprocessingError>
runOperations(ProcessingFlow& flow, const std::vector<OperationConfig>& operations) {
    for (const auto& op : operations) {
        auto operation = createOperation(op);
        if (!operation) {
            getLogger()->error("{}: {}", op.name, operation.error().toString());
            return std::unexpected(operation.error());
        }

        auto result = flow.execute(op.name, **operation, op.input);
        if (!result) {
            return std::unexpected(result.error());
        }
    }

    getLogger()->info("{} configured operation(s) executed", operations.size());
    return {};
}

}  // namespace bioimage_lab::services
