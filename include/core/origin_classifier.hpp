/**
 * @file origin_classifier.hpp
 * @brief Selection of the loading strategy from a file extension
 *
 * @since 1.0.0
 */

#pragma once

#include <filesystem>
#include <string>
#include <variant>

namespace bioimage_lab::core {

/// Standard photograph (PNG, JPEG, ...) decoded as a single grayscale plane
struct StandardImage {
    std::filesystem::path path;
};

/// Confocal / bioformats file decoded into a full (T, Z, C, Y, X) tensor
struct BioImage {
    std::filesystem::path path;
};

using ImageOrigin = std::variant<StandardImage, BioImage>;

/**
 * @brief Classify a file by its extension
 *
 * {.ids, .ics, .tiff, .tif} (case-insensitive) select the bioimage reader,
 * every other path selects the grayscale reader. Never fails.
 */
[[nodiscard]] ImageOrigin classifyOrigin(const std::filesystem::path& path);

/// Whether the extension belongs to the bioimage formats
[[nodiscard]] bool isBioImageExtension(const std::filesystem::path& path);

/// Path carried by either origin
[[nodiscard]] const std::filesystem::path& originPath(const ImageOrigin& origin);

/// "BioImage" or "StandardImage"
[[nodiscard]] std::string originName(const ImageOrigin& origin);

}  // namespace bioimage_lab::core
