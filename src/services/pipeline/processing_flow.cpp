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

#include "services/pipeline/processing_flow.hpp"
#include "core/logging.hpp"

namespace bioimage_lab::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("ProcessingFlow");
    return logger;
}

}  // anonymous namespace

ProcessingFlow::ProcessingFlow(SliceImageType::Pointer original)
    : original_(std::move(original)) {}

std::expected<SliceImageType::Pointer, PreprocessingError> ProcessingFlow::execute(
    const std::string& resultName,
    const ISliceOperation& operation,
    const std::optional<std::string>& inputName)
{
    if (resultName.empty()) {
        return std::unexpected(PreprocessingError{
            PreprocessingError::Code::InvalidParameters,
            "Result name must not be empty"
        });
    }

    SliceImageType::Pointer input = original_;
    if (inputName && !inputName->empty()) {
        auto it = results_.find(*inputName);
        if (it == results_.end()) {
            return std::unexpected(PreprocessingError{
                PreprocessingError::Code::InvalidInput,
                "Unknown result: " + *inputName
            });
        }
        input = it->second;
    }

    auto output = operation.apply(input);
    if (!output) {
        getLogger()->error("{} -> {} failed: {}",
                           operation.name(), resultName, output.error().toString());
        return std::unexpected(output.error());
    }

    results_[resultName] = *output;

    OperationRecord record;
    record.resultName = resultName;
    record.operation = operation.name();
    record.input = inputName.value_or("");
    record.parameters = operation.parameters();
    history_.push_back(std::move(record));

    getLogger()->debug("{} -> {}", operation.name(), resultName);
    return *output;
}

SliceImageType::Pointer ProcessingFlow::result(const std::string& name) const {
    auto it = results_.find(name);
    if (it == results_.end()) {
        return nullptr;
    }
    return it->second;
}

bool ProcessingFlow::hasResult(const std::string& name) const {
    return results_.contains(name);
}

std::vector<std::string> ProcessingFlow::resultNames() const {
    std::vector<std::string> names;
    names.reserve(results_.size());
    for (const auto& [name, image] : results_) {
        names.push_back(name);
    }
    return names;
}

nlohmann::json ProcessingFlow::historyToJson() const {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& record : history_) {
        j.push_back({
            {"result", record.resultName},
            {"operation", record.operation},
            {"input", record.input},
            {"parameters", record.parameters}
        });
    }
    return j;
}

}  // namespace bioimage_lab::services
