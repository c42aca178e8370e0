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

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace bioimage_lab::core {

namespace {

constexpr std::array<std::string_view, 4> kBioImageExtensions = {
    ".ids", ".ics", ".tiff", ".tif"
};

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return text;
}

}  // anonymous namespace

bool isBioImageExtension(const std::filesystem::path& path) {
    const std::string extension = lowercase(path.extension().string());
    return std::find(kBioImageExtensions.begin(), kBioImageExtensions.end(), extension)
        != kBioImageExtensions.end();
}

ImageOrigin classifyOrigin(const std::filesystem::path& path) {
    if (isBioImageExtension(path)) {
        return BioImage{path};
    }
    return StandardImage{path};
}

const std::filesystem::path& originPath(const ImageOrigin& origin) {
    return std::visit([](const auto& o) -> const std::filesystem::path& { return o.path; },
                      origin);
}

std::string originName(const ImageOrigin& origin) {
    return std::holds_alternative<BioImage>(origin) ? "BioImage" : "StandardImage";
}

}  // namespace bioimage_lab::core
