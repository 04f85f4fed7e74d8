#pragma once

#include "info.hpp"
#include "types.hpp"

#include <itkImage.h>

namespace sy {
namespace ITK {
using ImageType = itk::Image<float, 3>;

// The image refers to data, which must outlive it
auto Import(Re3CMap const data, Info const &info) -> ImageType::Pointer;
void Export(ImageType::Pointer img, Re3Map data);
} // namespace ITK
} // namespace sy
