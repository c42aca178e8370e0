#pragma once

#include "services/pipeline/processing_flow.hpp"

#include <map>
#include <string>
#include <vector>

namespace bioimage_lab::services {

/**
 * @brief Independent processing flows over the same original slice
 *
 * Each branch is a ProcessingFlow of its own, so alternative chains of
 * operations can be compared side by side.
 */
class BranchManager {
public:
    explicit BranchManager(SliceImageType::Pointer original);

    /// InvalidParameters for an empty or existing name
    [[nodiscard]] std::expected<void, PreprocessingError> createBranch(const std::string& name);

    /// Run an operation on a branch, InvalidInput for an unknown branch
    [[nodiscard]] std::expected<SliceImageType::Pointer, PreprocessingError> execute(
        const std::string& branchName,
        const std::string& resultName,
        const ISliceOperation& operation,
        const std::optional<std::string>& inputName = std::nullopt);

    /// Branch by name, nullptr if unknown
    [[nodiscard]] const ProcessingFlow* branch(const std::string& name) const;

    /// Branch names in lexicographic order
    [[nodiscard]] std::vector<std::string> branchNames() const;

private:
    SliceImageType::Pointer original_;
    std::map<std::string, ProcessingFlow> branches_;
};

}  // namespace bioimage_lab::services
