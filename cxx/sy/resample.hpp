#pragma once

#include "volume.hpp"

#include <optional>

namespace sy {

enum struct Interp
{
  Continuous, // Trilinear, for smoothly varying data
  Nearest     // For labels, never blends values
};

struct ResampleOpts
{
  Interp interp = Interp::Continuous;
  bool   quiet = false; // Report degenerate sampling at debug level only
};

/*
 * Shape of the grid on the target affine that reaches every source voxel centre. The target
 * affine is not moved, so voxels that would need negative indices are dropped.
 */
auto CoveringShape(Sz3 const &shape, Affine const &source, Affine const &target) -> Sz3;

/*
 * Fraction of target voxel centres that fall outside the source support
 */
auto OutsideFraction(Sz3 const &shape, Affine const &source, Sz3 const &tshape, Affine const &target) -> float;

/*
 * Continuous interpolation of signed integer data is stored as float32. Everything else keeps
 * its storage type.
 */
auto ResampledType(DataType const t, Interp const interp) -> DataType;

/*
 * Sample every volume of src onto the target grid. Points outside the source are 0. If no
 * shape is given, CoveringShape is used. The output storage type is ResampledType.
 */
auto Resample(Volume const &src, Affine const &target, std::optional<Sz3> const &shape, ResampleOpts const &opts)
  -> Volume;

} // namespace sy
