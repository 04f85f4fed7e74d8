#include "oblique.hpp"

#include "../log/log.hpp"

#include <Eigen/Geometry>

namespace sy {

auto Rotation(Eigen::Array3d const &degrees) -> Eigen::Matrix3d
{
  Eigen::Array3d const r = degrees * M_PI / 180.;
  return (Eigen::AngleAxisd(r[2], Eigen::Vector3d::UnitZ()) * Eigen::AngleAxisd(r[1], Eigen::Vector3d::UnitY()) *
          Eigen::AngleAxisd(r[0], Eigen::Vector3d::UnitX()))
    .toRotationMatrix();
}

auto ObliqueAffine(Sz3 const &matrix, Eigen::Array3d const &vs, Eigen::Array3d const &degrees) -> Affine
{
  Affine               a = Affine::Identity();
  Eigen::Vector3d const c(matrix[0] / 2, matrix[1] / 2, matrix[2] / 2);
  a.topLeftCorner<3, 3>() = Rotation(degrees) * vs.matrix().asDiagonal();
  a.topRightCorner<3, 1>() = -a.topLeftCorner<3, 3>() * c;
  return a;
}

auto SpherePhantom(Sz3 const &matrix, Eigen::Array3d const &vs, float const r, float const i) -> Re3
{
  Log::Print("Phan", "Drawing sphere radius {} mm intensity {}", r, i);
  Re3 phan(matrix);
  phan.setZero();
  Index const cx = matrix[0] / 2;
  Index const cy = matrix[1] / 2;
  Index const cz = matrix[2] / 2;
  for (Index iz = 0; iz < matrix[2]; iz++) {
    auto const pz = (iz - cz) * vs[2];
    for (Index iy = 0; iy < matrix[1]; iy++) {
      auto const py = (iy - cy) * vs[1];
      for (Index ix = 0; ix < matrix[0]; ix++) {
        auto const            px = (ix - cx) * vs[0];
        Eigen::Vector3d const p{px, py, pz};
        if (p.norm() < r) { phan(ix, iy, iz) = i; }
      }
    }
  }
  return phan;
}

} // namespace sy
