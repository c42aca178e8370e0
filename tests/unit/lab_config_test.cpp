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

#include "../test_utils/tensor_generator.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace bioimage_lab::services {
namespace {

using test_utils::createSlice;
using test_utils::sliceIndex;

constexpr const char* kConfig = R"({
    "logging": {"level": "debug", "file_logging": true, "directory": "/tmp/lab-logs",
                "file_name": "session.log"},
    "operations": [
        {"name": "denoised", "operation": "median", "parameters": {"kernel_size": 5}},
        {"name": "background", "operation": "rolling_ball",
         "input": "denoised", "parameters": {"radius": 20}}
    ]
})";

// =============================================================================
// Parsing tests
// =============================================================================

TEST(LabConfigTest, ParsesLoggingAndOperations) {
    auto config = parseLabConfig(kConfig);
    ASSERT_TRUE(config.has_value()) << config.error().toString();

    EXPECT_EQ(config->logging.level, logging::LogLevel::Debug);
    EXPECT_TRUE(config->logging.enableFileLogging);
    EXPECT_EQ(config->logging.logDirectory, std::filesystem::path("/tmp/lab-logs"));
    EXPECT_EQ(config->logging.logFileName, "session.log");

    ASSERT_EQ(config->operations.size(), 2u);
    EXPECT_EQ(config->operations[0].name, "denoised");
    EXPECT_EQ(config->operations[0].operation, "median");
    EXPECT_FALSE(config->operations[0].input.has_value());
    EXPECT_EQ(config->operations[1].input, "denoised");
    EXPECT_EQ(config->operations[1].parameters["radius"].get<unsigned int>(), 20u);
}

TEST(LabConfigTest, EmptyObjectUsesDefaults) {
    auto config = parseLabConfig("{}");
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->logging.level, logging::LogLevel::Info);
    EXPECT_FALSE(config->logging.enableFileLogging);
    EXPECT_EQ(config->logging.logFileName, "bioimage_lab.log");
    EXPECT_TRUE(config->operations.empty());
}

TEST(LabConfigTest, MalformedJsonIsInvalidInput) {
    auto config = parseLabConfig("{\"operations\": [");

    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, PreprocessingError::Code::InvalidInput);
}

TEST(LabConfigTest, NonObjectIsInvalidInput) {
    auto config = parseLabConfig("[1, 2, 3]");

    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, PreprocessingError::Code::InvalidInput);
}

TEST(LabConfigTest, UnknownLogLevelIsRejected) {
    auto config = parseLabConfig(R"({"logging": {"level": "loud"}})");

    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, PreprocessingError::Code::InvalidParameters);
    EXPECT_NE(config.error().message.find("loud"), std::string::npos);
}

TEST(LabConfigTest, OperationWithoutNameIsRejected) {
    auto config = parseLabConfig(R"({"operations": [{"operation": "median"}]})");

    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, PreprocessingError::Code::InvalidParameters);
}

TEST(LabConfigTest, WrongValueTypeIsRejected) {
    auto config = parseLabConfig(R"({"operations": [{"name": 3, "operation": "median"}]})");

    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, PreprocessingError::Code::InvalidParameters);
}

TEST(LabConfigTest, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "bioimage_lab_config_test.json";
    {
        std::ofstream file(path);
        file << kConfig;
    }

    auto config = loadLabConfig(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(config.has_value()) << config.error().toString();
    EXPECT_EQ(config->operations.size(), 2u);
}

TEST(LabConfigTest, MissingFileIsInvalidInput) {
    auto config = loadLabConfig("/nonexistent/bioimage_lab/config.json");

    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, PreprocessingError::Code::InvalidInput);
}

// =============================================================================
// Operation factory tests
// =============================================================================

TEST(LabConfigTest, CreatesEveryKnownOperation) {
    for (const std::string name : {"gaussian", "median", "box_blur", "bilateral", "rolling_ball",
                                   "flat_field_estimated", "shading_polynomial", "surface_fit"}) {
        OperationConfig op;
        op.name = "out";
        op.operation = name;

        auto operation = createOperation(op);
        ASSERT_TRUE(operation.has_value()) << name << ": " << operation.error().toString();
        EXPECT_EQ((*operation)->name(), name);
    }
}

TEST(LabConfigTest, ParametersAreForwarded) {
    OperationConfig op;
    op.name = "smooth";
    op.operation = "gaussian";
    op.parameters = {{"sigma", 2.5}, {"kernel_width", 9}};

    auto operation = createOperation(op);
    ASSERT_TRUE(operation.has_value());

    const auto params = (*operation)->parameters();
    EXPECT_DOUBLE_EQ(params["sigma"].get<double>(), 2.5);
    EXPECT_EQ(params["kernel_width"].get<unsigned int>(), 9u);
}

TEST(LabConfigTest, UnknownOperationIsRejected) {
    OperationConfig op;
    op.name = "x";
    op.operation = "sharpen";

    auto operation = createOperation(op);

    ASSERT_FALSE(operation.has_value());
    EXPECT_EQ(operation.error().code, PreprocessingError::Code::InvalidParameters);
    EXPECT_EQ(operation.error().message, "Unknown operation: sharpen");
}

TEST(LabConfigTest, MistypedParameterIsRejected) {
    OperationConfig op;
    op.name = "x";
    op.operation = "median";
    op.parameters = {{"kernel_size", "five"}};

    auto operation = createOperation(op);

    ASSERT_FALSE(operation.has_value());
    EXPECT_EQ(operation.error().code, PreprocessingError::Code::InvalidParameters);
}

// =============================================================================
// Execution tests
// =============================================================================

TEST(LabConfigTest, RunsOperationsInOrder) {
    auto config = parseLabConfig(kConfig);
    ASSERT_TRUE(config.has_value());

    auto slice = createSlice(48, 48, 100.0f);
    slice->SetPixel(sliceIndex(24, 24), 900.0f);

    ProcessingFlow flow(slice);
    auto run = runOperations(flow, config->operations);
    ASSERT_TRUE(run.has_value()) << run.error().toString();

    EXPECT_EQ(flow.resultNames(), (std::vector<std::string>{"background", "denoised"}));
    ASSERT_EQ(flow.history().size(), 2u);
    EXPECT_EQ(flow.history()[1].input, "denoised");

    // Median removes the spike, then the flat background is subtracted
    EXPECT_NEAR(flow.result("background")->GetPixel(sliceIndex(24, 24)), 0.0f, 1e-3);
}

TEST(LabConfigTest, RunStopsAtFirstFailure) {
    OperationConfig first;
    first.name = "a";
    first.operation = "median";

    OperationConfig second;
    second.name = "b";
    second.operation = "unknown";

    OperationConfig third;
    third.name = "c";
    third.operation = "median";

    ProcessingFlow flow(createSlice(8, 8, 1.0f));
    auto run = runOperations(flow, {first, second, third});

    ASSERT_FALSE(run.has_value());
    EXPECT_TRUE(flow.hasResult("a"));
    EXPECT_FALSE(flow.hasResult("c"));
}

}  // namespace
}  // namespace bioimage_lab::services
