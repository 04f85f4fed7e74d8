#include "geometry.hpp"

#include "errors.hpp"

#include <cmath>
#include <limits>

namespace sy {

auto VoxelSizes(Affine const &affine) -> Eigen::Array3d
{
  return affine.topLeftCorner<3, 3>().colwise().norm().transpose().array();
}

namespace {
inline auto Sign(double const x) -> double { return (x > 0.) - (x < 0.); }
} // namespace

auto CanonicalAxial(Eigen::Array3d const &vs, Sz3 const &shape, Affine const &source) -> Affine
{
  if (!(vs > 0.).all()) {
    throw GeometryError("Axial", "Voxel size {} contains a non-positive value", fmt::join(vs, ","));
  }
  Affine target = Affine::Identity();
  for (Index ii = 0; ii < 3; ii++) {
    double const s = Sign(source(ii, ii));
    target(ii, ii) = vs[ii] * s;
    target(ii, 3) = -s * vs[ii] * shape[ii] / 2.;
  }
  // A zero on the source diagonal gives no polarity to copy
  if (std::abs(target.topLeftCorner<3, 3>().determinant()) < std::numeric_limits<double>::epsilon()) {
    throw GeometryError("Axial", "Canonical affine is singular, source diagonal {},{},{}", source(0, 0), source(1, 1),
                        source(2, 2));
  }
  return target;
}

auto Obliquity(Affine const &affine) -> Eigen::Array3d
{
  Eigen::Array33d const cosines = affine.topLeftCorner<3, 3>().array().rowwise() / VoxelSizes(affine).transpose();
  Eigen::Array3d const  best = cosines.abs().rowwise().maxCoeff().min(1.);
  return best.acos() * 180. / M_PI;
}

auto CheckObliquity(Affine const &affine, std::optional<double> const threshold) -> Gate
{
  Gate g;
  g.obliquity = Obliquity(affine);
  g.norm = g.obliquity.matrix().norm();
  g.resample = !(threshold && g.norm < threshold.value());
  return g;
}

} // namespace sy
