#pragma once

#include "../volume.hpp"

#include <filesystem>

namespace sy {

/*
 * 3D or 4D single-component images only. The affine is returned in RAS.
 */
auto ReadNifti(std::filesystem::path const &fname) -> Volume;

// Data is converted to the volume's storage type on the way out
void WriteNifti(Volume const &vol, std::filesystem::path const &fname);

} // namespace sy
