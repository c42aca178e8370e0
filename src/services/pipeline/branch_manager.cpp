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

#include "services/pipeline/branch_manager.hpp"
#include "core/logging.hpp"

namespace bioimage_lab::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("BranchManager");
    return logger;
}

}  // anonymous namespace

BranchManager::BranchManager(SliceImageType::Pointer original)
    : original_(std::move(original)) {}

std::expected<void, PreprocessingError> BranchManager::createBranch(const std::string& name) {
    if (name.empty()) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidParameters,
            "Branch name must not be empty"
        });
    }
    if (branches_.contains(name)) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidParameters,
            "Branch already exists: " + name
        });
    }

    branches_.emplace(name, ProcessingFlow(original_));
    getLogger()->debug("Branch created: {}", name);
    return {};
}

std::expected<SliceImageType::Pointer, PreprocessingError> BranchManager::execute(
    const std::string& branchName,
    const std::string& resultName,
    const ISliceOperation& operation,
    const std::optional<std::string>& inputName)
{
    auto it = branches_.find(branchName);
    if (it == branches_.end()) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidInput,
            "Unknown branch: " + branchName
        });
    }
    return it->second.execute(resultName, operation, inputName);
}

const ProcessingFlow* BranchManager::branch(const std::string& name) const {
    auto it = branches_.find(name);
    if (it == branches_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> BranchManager::branchNames() const {
    std::vector<std::string> names;
    names.reserve(branches_.size());
    for (const auto& [name, flow] : branches_) {
        names.push_back(name);
    }
    return names;
}

}  // namespace bioimage_lab::services
