#pragma once

#include "types.hpp"

namespace sy {

/*
 * The split form of an affine used by ITK. Direction columns are unit vectors.
 */
struct Info
{
  Eigen::Array3d  voxel_size = Eigen::Array3d::Ones();
  Eigen::Vector3d origin = Eigen::Vector3d::Zero();
  Eigen::Matrix3d direction = Eigen::Matrix3d::Identity();
};

auto ToInfo(Affine const &affine) -> Info;
auto ToAffine(Info const &info) -> Affine;

// NIfTI affines are RAS, ITK works in LPS. The conversion is its own inverse.
auto FlipLPS(Info const &info) -> Info;

} // namespace sy
