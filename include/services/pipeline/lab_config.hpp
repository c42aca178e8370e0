/**
 * @file lab_config.hpp
 * @brief JSON configuration of logging and of an operation chain
 * @details Example:
 * @code
 * {
 *   "logging": { "level": "info", "file_logging": false, "directory": "",
 *                "file_name": "bioimage_lab.log" },
 *   "operations": [
 *     { "name": "smooth", "operation": "gaussian", "parameters": { "sigma": 1.5 } },
 *     { "name": "flat", "operation": "flat_field_estimated", "input": "smooth" }
 *   ]
 * }
 * @endcode
 *
 * @since 1.0.0
 */

#pragma once

#include "core/logging.hpp"
#include "services/pipeline/processing_flow.hpp"
#include "services/preprocessing/slice_operation.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace bioimage_lab::services {

/**
 * @brief One configured operation
 */
struct OperationConfig {
    /// Result name
    std::string name;

    /// Operation identifier, see createOperation()
    std::string operation;

    /// Result used as input, the original slice if empty
    std::optional<std::string> input;

    nlohmann::json parameters = nlohmann::json::object();
};

struct LabConfig {
    logging::LogConfig logging;
    std::vector<OperationConfig> operations;
};

/**
 * @brief Parse a configuration document
 * @return InvalidInput for malformed JSON, InvalidParameters for missing
 *         fields or an unknown log level
 */
[[nodiscard]] std::expected<LabConfig, PreprocessingError> parseLabConfig(const std::string& text);

/// Read and parse a configuration file, InvalidInput if it cannot be read
[[nodiscard]] std::expected<LabConfig, PreprocessingError>
loadLabConfig(const std::filesystem::path& path);

/**
 * @brief Instantiate an operation that needs no reference image
 *
 * Known identifiers: gaussian, median, box_blur, bilateral, rolling_ball,
 * flat_field_estimated, shading_polynomial, surface_fit.
 *
 * @return InvalidParameters for an unknown identifier or ill-typed parameters
 */
[[nodiscard]] std::expected<SliceOperationPtr, PreprocessingError>
createOperation(const OperationConfig& op);

/**
 * @brief Create and execute configured operations in order
 *
 * Stops at the first failure; results of earlier operations stay in the flow.
 */
[[nodiscard]] std::expected<void, PreprocessingError>
runOperations(ProcessingFlow& flow, const std::vector<OperationConfig>& operations);

}  // namespace bioimage_lab::services
