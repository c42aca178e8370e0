/**
 * @file bioimage_reader.hpp
 * @brief Decoders feeding the tensor store
 * @details The controller depends on two opaque capabilities: a bioimage
 *          reader producing a (T, Z, C, Y, X) tensor with channel names, and a
 *          grayscale reader producing a single 8-bit plane. Both have ITK
 *          implementations; tests substitute their own.
 *
 * @since 1.0.0
 */

#pragma once

#include "core/bioimage_types.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

#include <itkImage.h>

namespace bioimage_lab::core {

/// 8-bit grayscale plane as decoded from a standard photograph
using GrayscaleImageType = itk::Image<unsigned char, 2>;

/**
 * @brief Output of a bioimage decoder
 */
struct DecodedBioImage {
    RawTensorType::Pointer tensor;
    std::vector<std::string> channelNames;
};

/**
 * @brief Decoder for confocal / bioformats files
 */
class IBioImageReader {
public:
    virtual ~IBioImageReader() = default;

    /**
     * @brief Decode a file into a (T, Z, C, Y, X) tensor
     * @param path File to decode
     * @return Tensor and channel names, LoadFailure on missing, corrupt or
     *         unsupported files
     */
    [[nodiscard]] virtual std::expected<DecodedBioImage, BioImageError>
    read(const std::filesystem::path& path) const = 0;
};

/**
 * @brief Decoder for standard photographs
 */
class IGrayscaleReader {
public:
    virtual ~IGrayscaleReader() = default;

    /**
     * @brief Decode a file into a single 8-bit grayscale plane
     * @return Plane on success, NotFound if the file cannot be decoded
     */
    [[nodiscard]] virtual std::expected<GrayscaleImageType::Pointer, BioImageError>
    read(const std::filesystem::path& path) const = 0;
};

/**
 * @brief Bioimage reader backed by the ITK ImageIO factory
 *
 * TIFF is handled natively; ICS/IDS require an ITK build that registers a
 * bioformats-capable ImageIO. 2D images map to (1, 1, C, Y, X), 3D images to
 * (1, Z, C, Y, X) and 4D images to (T, Z, C, Y, X), where C is the number of
 * pixel components. Channels are named "Channel <i>". Only 8-bit and 16-bit
 * unsigned samples are accepted; other component types are a LoadFailure.
 *
 * ITK's TIFF reader yields at most three dimensions, so T is always 1 for
 * TIFF, and ImageJ/OME hyperstacks that store channels or timepoints as
 * separate pages load as Z planes of one channel. A warning is logged when a
 * multi-page single-component file is read.
 */
class ItkBioImageReader : public IBioImageReader {
public:
    [[nodiscard]] std::expected<DecodedBioImage, BioImageError>
    read(const std::filesystem::path& path) const override;
};

/**
 * @brief Grayscale reader backed by itk::ImageFileReader
 *
 * Color images are converted to luminance by ITK on read. 16-bit samples
 * are reduced to their high byte; other component types are rejected.
 */
class ItkGrayscaleReader : public IGrayscaleReader {
public:
    [[nodiscard]] std::expected<GrayscaleImageType::Pointer, BioImageError>
    read(const std::filesystem::path& path) const override;
};

}  // namespace bioimage_lab::core
