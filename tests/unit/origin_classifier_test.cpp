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

#include "core/origin_classifier.hpp"

#include <gtest/gtest.h>

namespace bioimage_lab::core {
namespace {

TEST(OriginClassifierTest, BioImageExtensionsSelectBioImage) {
    for (const char* name : {"cells.ids", "cells.ics", "stack.tif", "stack.tiff"}) {
        const auto origin = classifyOrigin(name);
        EXPECT_TRUE(std::holds_alternative<BioImage>(origin)) << name;
    }
}

TEST(OriginClassifierTest, ExtensionsAreCaseInsensitive) {
    EXPECT_TRUE(std::holds_alternative<BioImage>(classifyOrigin("STACK.TIF")));
    EXPECT_TRUE(std::holds_alternative<BioImage>(classifyOrigin("cells.Ics")));
    EXPECT_TRUE(isBioImageExtension("/data/run1/IMG.TiFf"));
}

TEST(OriginClassifierTest, OtherFilesSelectStandardImage) {
    for (const char* name : {"photo.png", "photo.jpg", "photo.jpeg", "notes.txt",
                             "no_extension", "archive.tif.gz", ".tif"}) {
        const auto origin = classifyOrigin(name);
        EXPECT_TRUE(std::holds_alternative<StandardImage>(origin)) << name;
    }
}

TEST(OriginClassifierTest, OriginKeepsPath) {
    const std::filesystem::path path = "/data/sample/cells.ics";
    const auto origin = classifyOrigin(path);

    EXPECT_EQ(originPath(origin), path);
    EXPECT_EQ(originName(origin), "BioImage");
    EXPECT_EQ(originName(classifyOrigin("a.png")), "StandardImage");
}

}  // namespace
}  // namespace bioimage_lab::core
