#pragma once

#include "../types.hpp"

namespace sy {

// Rotations applied about x, then y, then z. Angles in degrees.
auto Rotation(Eigen::Array3d const &degrees) -> Eigen::Matrix3d;

/*
 * Affine for a grid of the given matrix and voxel size, rotated about its centre voxel which
 * sits at the origin
 */
auto ObliqueAffine(Sz3 const &matrix, Eigen::Array3d const &voxel_size, Eigen::Array3d const &degrees) -> Affine;

/*
 * Sphere in grid space, centred on the centre voxel. Anything outside is zero.
 */
auto SpherePhantom(Sz3 const &matrix, Eigen::Array3d const &voxel_size, float const radius, float const intensity) -> Re3;

} // namespace sy
