#pragma once

#include "types.hpp"

#include <optional>

namespace sy {

/*
 * Column norms of the affine's 3x3 block, i.e. the physical length of one voxel step
 */
auto VoxelSizes(Affine const &affine) -> Eigen::Array3d;

/*
 * Axis-aligned affine with the same voxel size and axis polarity as the source, with the
 * grid centred on the origin. Throws GeometryError if the result would be singular.
 */
auto CanonicalAxial(Eigen::Array3d const &voxel_size, Sz3 const &shape, Affine const &source) -> Affine;

/*
 * Per-axis deviation from the closest scanner axis, in degrees. Translation is ignored.
 */
auto Obliquity(Affine const &affine) -> Eigen::Array3d;

struct Gate
{
  Eigen::Array3d obliquity;
  double         norm;
  bool           resample;
};

/*
 * Resampling is skipped only when a threshold is given and the obliquity norm is below it
 */
auto CheckObliquity(Affine const &affine, std::optional<double> const threshold) -> Gate;

} // namespace sy
