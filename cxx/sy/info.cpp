#include "info.hpp"

#include "geometry.hpp"

namespace sy {

auto ToInfo(Affine const &affine) -> Info
{
  Info info;
  info.voxel_size = VoxelSizes(affine);
  info.origin = affine.topRightCorner<3, 1>();
  info.direction = affine.topLeftCorner<3, 3>() * info.voxel_size.inverse().matrix().asDiagonal();
  return info;
}

auto ToAffine(Info const &info) -> Affine
{
  Affine affine = Affine::Identity();
  affine.topLeftCorner<3, 3>() = info.direction * info.voxel_size.matrix().asDiagonal();
  affine.topRightCorner<3, 1>() = info.origin;
  return affine;
}

auto FlipLPS(Info const &info) -> Info
{
  Eigen::Matrix3d const flip = Eigen::Vector3d(-1., -1., 1.).asDiagonal();
  return Info{.voxel_size = info.voxel_size, .origin = flip * info.origin, .direction = flip * info.direction};
}

} // namespace sy
