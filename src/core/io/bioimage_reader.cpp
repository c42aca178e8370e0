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

#include "core/bioimage_reader.hpp"
#include "core/logging.hpp"

#include <itkImageFileReader.h>
#include <itkImageIOFactory.h>
#include <itkImageRegionConstIterator.h>
#include <itkImageRegionConstIteratorWithIndex.h>
#include <itkImageRegionIterator.h>
#include <itkVectorImage.h>

namespace bioimage_lab::core {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("BioImageReader");
    return logger;
}

std::string componentTypeName(const itk::ImageIOBase* imageIO) {
    return itk::ImageIOBase::GetComponentTypeAsString(imageIO->GetComponentType());
}

/**
 * @brief Read a D-dimensional multi-component image and lay it out as a tensor
 *
 * Pixel components become channels, the third image axis becomes Z and the
 * fourth becomes T.
 */
template <unsigned int D>
std::expected<DecodedBioImage, BioImageError>
readAsTensor(const std::filesystem::path& path, itk::ImageIOBase* imageIO)
{
    using VectorImageType = itk::VectorImage<RawPixelType, D>;
    using ReaderType = itk::ImageFileReader<VectorImageType>;

    auto reader = ReaderType::New();
    reader->SetFileName(path.string());
    reader->SetImageIO(imageIO);
    reader->Update();

    auto image = reader->GetOutput();
    const auto region = image->GetLargestPossibleRegion();
    const auto size = region.GetSize();
    const auto origin = region.GetIndex();

    TensorShape shape;
    shape.x = size[0];
    shape.y = size[1];
    shape.z = 1;
    shape.t = 1;
    if constexpr (D >= 3) {
        shape.z = size[2];
    }
    if constexpr (D >= 4) {
        shape.t = size[3];
    }
    shape.c = image->GetNumberOfComponentsPerPixel();

    if (!shape.isValid()) {
        return std::unexpected(BioImageError{
            BioImageError::Code::LoadFailure,
            "Decoded image has an empty axis " + shape.toString() + ": " + path.string()
        });
    }

    auto tensor = allocateTensor<RawTensorType>(shape);

    itk::ImageRegionConstIteratorWithIndex<VectorImageType> it(image, region);
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        const auto index = it.GetIndex();
        const auto pixel = it.Get();

        RawTensorType::IndexType tensorIndex;
        tensorIndex[axis::X] = index[0] - origin[0];
        tensorIndex[axis::Y] = index[1] - origin[1];
        tensorIndex[axis::Z] = 0;
        tensorIndex[axis::Time] = 0;
        if constexpr (D >= 3) {
            tensorIndex[axis::Z] = index[2] - origin[2];
        }
        if constexpr (D >= 4) {
            tensorIndex[axis::Time] = index[3] - origin[3];
        }

        for (size_t c = 0; c < shape.c; ++c) {
            tensorIndex[axis::Channel] = static_cast<long>(c);
            tensor->SetPixel(tensorIndex, pixel[static_cast<unsigned int>(c)]);
        }
    }

    DecodedBioImage decoded;
    decoded.tensor = tensor;
    decoded.channelNames.reserve(shape.c);
    for (size_t c = 0; c < shape.c; ++c) {
        decoded.channelNames.push_back("Channel " + std::to_string(c));
    }
    return decoded;
}

/// 16-bit plane read before reduction to 8 bits
using WidePlaneType = itk::Image<unsigned short, 2>;

template <typename TPlane>
typename TPlane::Pointer readPlane(const std::filesystem::path& path, itk::ImageIOBase* imageIO) {
    using ReaderType = itk::ImageFileReader<TPlane>;
    auto reader = ReaderType::New();
    reader->SetFileName(path.string());
    reader->SetImageIO(imageIO);
    reader->Update();

    typename TPlane::Pointer plane = reader->GetOutput();
    plane->DisconnectPipeline();
    return plane;
}

}  // anonymous namespace

std::expected<DecodedBioImage, BioImageError>
ItkBioImageReader::read(const std::filesystem::path& path) const
{
    if (!std::filesystem::exists(path)) {
        return std::unexpected(BioImageError{
            BioImageError::Code::LoadFailure,
            "File not found: " + path.string()
        });
    }

    try {
        auto imageIO = itk::ImageIOFactory::CreateImageIO(
            path.string().c_str(), itk::IOFileModeEnum::ReadMode);
        if (!imageIO) {
            return std::unexpected(BioImageError{
                BioImageError::Code::LoadFailure,
                "No image reader available for: " + path.string()
            });
        }

        imageIO->SetFileName(path.string());
        imageIO->ReadImageInformation();

        const unsigned int dimensions = imageIO->GetNumberOfDimensions();
        getLogger()->debug("Reading {} ({}D, {} components of {})",
                           path.string(), dimensions, imageIO->GetNumberOfComponents(),
                           componentTypeName(imageIO));

        const auto componentType = imageIO->GetComponentType();
        if (componentType != itk::IOComponentEnum::UCHAR &&
            componentType != itk::IOComponentEnum::USHORT) {
            return std::unexpected(BioImageError{
                BioImageError::Code::LoadFailure,
                "Unsupported pixel component type " + componentTypeName(imageIO) +
                ", expected 8-bit or 16-bit unsigned: " + path.string()
            });
        }

        if (dimensions >= 3 && imageIO->GetNumberOfComponents() == 1 &&
            imageIO->GetDimensions(2) > 1) {
            getLogger()->warn("{}: {} pages read as Z planes of a single channel; "
                              "channels or timepoints stored as pages are not separated",
                              path.filename().string(), imageIO->GetDimensions(2));
        }

        switch (dimensions) {
            case 2: return readAsTensor<2>(path, imageIO);
            case 3: return readAsTensor<3>(path, imageIO);
            case 4: return readAsTensor<4>(path, imageIO);
            default:
                return std::unexpected(BioImageError{
                    BioImageError::Code::LoadFailure,
                    "Unsupported dimensionality " + std::to_string(dimensions) +
                    ": " + path.string()
                });
        }
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(BioImageError{
            BioImageError::Code::LoadFailure,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
    catch (const std::exception& e) {
        return std::unexpected(BioImageError{
            BioImageError::Code::LoadFailure,
            std::string("Standard exception: ") + e.what()
        });
    }
}

std::expected<GrayscaleImageType::Pointer, BioImageError>
ItkGrayscaleReader::read(const std::filesystem::path& path) const
{
    if (!std::filesystem::exists(path)) {
        return std::unexpected(BioImageError{
            BioImageError::Code::NotFound,
            "File not found: " + path.string()
        });
    }

    try {
        auto imageIO = itk::ImageIOFactory::CreateImageIO(
            path.string().c_str(), itk::IOFileModeEnum::ReadMode);
        if (!imageIO) {
            return std::unexpected(BioImageError{
                BioImageError::Code::NotFound,
                "Could not decode " + path.string() + ": no image reader available"
            });
        }

        imageIO->SetFileName(path.string());
        imageIO->ReadImageInformation();

        const auto componentType = imageIO->GetComponentType();
        if (componentType == itk::IOComponentEnum::UCHAR) {
            return readPlane<GrayscaleImageType>(path, imageIO);
        }

        if (componentType == itk::IOComponentEnum::USHORT) {
            // 16-bit planes keep their high byte
            auto wide = readPlane<WidePlaneType>(path, imageIO);

            auto plane = GrayscaleImageType::New();
            plane->SetRegions(wide->GetLargestPossibleRegion());
            plane->CopyInformation(wide);
            plane->Allocate();

            itk::ImageRegionConstIterator<WidePlaneType> source(
                wide, wide->GetLargestPossibleRegion());
            itk::ImageRegionIterator<GrayscaleImageType> target(
                plane, plane->GetLargestPossibleRegion());
            for (source.GoToBegin(), target.GoToBegin(); !source.IsAtEnd(); ++source, ++target) {
                target.Set(static_cast<unsigned char>(source.Get() >> 8));
            }
            return plane;
        }

        return std::unexpected(BioImageError{
            BioImageError::Code::NotFound,
            "Could not decode " + path.string() + ": unsupported pixel component type " +
            componentTypeName(imageIO)
        });
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(BioImageError{
            BioImageError::Code::NotFound,
            "Could not decode " + path.string() + ": " + e.GetDescription()
        });
    }
}

}  // namespace bioimage_lab::core
