/**
 * @file processing_flow.hpp
 * @brief Named results and history of operations applied to one slice
 *
 * @since 1.0.0
 */

#pragma once

#include "services/preprocessing/slice_operation.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace bioimage_lab::services {

/**
 * @brief One executed operation
 */
struct OperationRecord {
    /// Name the result was stored under
    std::string resultName;

    /// ISliceOperation::name() of the operation
    std::string operation;

    /// Result the operation was applied to, empty for the original slice
    std::string input;

    nlohmann::json parameters;
};

/**
 * @brief Applies operations to an original slice and keeps every result
 *
 * Each execute() reads the original slice or a stored result, stores the
 * output under a new name and appends an OperationRecord. A failing
 * operation stores and records nothing.
 *
 * @example
 * @code
 * ProcessingFlow flow(slice);
 * flow.execute("denoised", MedianFilter{});
 * flow.execute("flat", FlatFieldEstimated{}, "denoised");
 * std::cout << flow.historyToJson().dump(2);
 * @endcode
 */
class ProcessingFlow {
public:
    explicit ProcessingFlow(SliceImageType::Pointer original);

    /**
     * @brief Run an operation and store its result
     *
     * @param resultName Name to store the result under (replaces an older result)
     * @param operation Operation to run
     * @param inputName Stored result to use as input, the original slice if empty
     * @return The stored result; InvalidInput for an unknown input name
     */
    [[nodiscard]] std::expected<SliceImageType::Pointer, PreprocessingError> execute(
        const std::string& resultName,
        const ISliceOperation& operation,
        const std::optional<std::string>& inputName = std::nullopt);

    [[nodiscard]] SliceImageType::Pointer original() const { return original_; }

    /// Stored result, nullptr for an unknown name
    [[nodiscard]] SliceImageType::Pointer result(const std::string& name) const;

    [[nodiscard]] bool hasResult(const std::string& name) const;

    /// Result names in lexicographic order
    [[nodiscard]] std::vector<std::string> resultNames() const;

    [[nodiscard]] const std::vector<OperationRecord>& history() const noexcept { return history_; }

    /// [{"result": ..., "operation": ..., "input": ..., "parameters": {...}}, ...]
    [[nodiscard]] nlohmann::json historyToJson() const;

private:
    SliceImageType::Pointer original_;
    std::map<std::string, SliceImageType::Pointer> results_;
    std::vector<OperationRecord> history_;
};

}  // namespace bioimage_lab::services
