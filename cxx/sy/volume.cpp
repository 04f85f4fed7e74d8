#include "volume.hpp"

#include "errors.hpp"
#include "geometry.hpp"
#include "sys/threads.hpp"

#include <cmath>
#include <flux.hpp>
#include <limits>

namespace sy {

auto ToString(DataType const t) -> std::string
{
  switch (t) {
  case DataType::UInt8: return "uint8";
  case DataType::Int8: return "int8";
  case DataType::UInt16: return "uint16";
  case DataType::Int16: return "int16";
  case DataType::UInt32: return "uint32";
  case DataType::Int32: return "int32";
  case DataType::Float32: return "float32";
  case DataType::Float64: return "float64";
  }
  return "unknown";
}

auto IsInteger(DataType const t) -> bool { return !(t == DataType::Float32 || t == DataType::Float64); }

namespace {
template <typename T> auto Saturate(Re4 const &x) -> Re4
{
  float const lo = static_cast<float>(std::numeric_limits<T>::lowest());
  float       hi = static_cast<float>(std::numeric_limits<T>::max());
  // 32-bit maxima round up to the next power of two as float, which no longer fits in T
  if (static_cast<double>(hi) > static_cast<double>(std::numeric_limits<T>::max())) { hi = std::nextafter(hi, 0.f); }
  Re4         y(x.dimensions());
  y.device(Threads::TensorDevice()) = x.round().cwiseMax(lo).cwiseMin(hi);
  return y;
}
} // namespace

auto Cast(Re4 const &x, DataType const t) -> Re4
{
  switch (t) {
  case DataType::UInt8: return Saturate<uint8_t>(x);
  case DataType::Int8: return Saturate<int8_t>(x);
  case DataType::UInt16: return Saturate<uint16_t>(x);
  case DataType::Int16: return Saturate<int16_t>(x);
  case DataType::UInt32: return Saturate<uint32_t>(x);
  case DataType::Int32: return Saturate<int32_t>(x);
  case DataType::Float32:
  case DataType::Float64: return x;
  }
  return x;
}

Volume::Volume(Re4 d, Affine const &a, DataType const t)
  : Volume(std::move(d), VoxelSizes(a), a, t)
{
}

Volume::Volume(Re4 d, Eigen::Array3d const &vs, Affine const &a, DataType const t)
  : data{std::move(d)}
  , voxel_size{vs}
  , affine{a}
  , type{t}
{
  if (!flux::all(data.dimensions(), [](Index i) { return i > 0; })) {
    throw LoadError("Volume", "Data dimensions {} must all be positive", fmt::join(data.dimensions(), ","));
  }
  if (!(voxel_size > 0.).all()) {
    throw LoadError("Volume", "Voxel size {} contains a non-positive value", fmt::join(voxel_size, ","));
  }
  if (!affine.row(3).isApprox(Eigen::RowVector4d(0., 0., 0., 1.))) {
    throw LoadError("Volume", "Affine bottom row {},{},{},{} is not 0,0,0,1", affine(3, 0), affine(3, 1), affine(3, 2),
                    affine(3, 3));
  }
  if (std::abs(affine.topLeftCorner<3, 3>().determinant()) < std::numeric_limits<double>::epsilon()) {
    throw LoadError("Volume", "Affine rotation/scaling block is singular");
  }
  Eigen::Array3d const norms = VoxelSizes(affine);
  if (!((norms - voxel_size).abs() <= 1.e-3 * voxel_size).all()) {
    throw LoadError("Volume", "Voxel size {} does not match affine column norms {}", fmt::join(voxel_size, ","),
                    fmt::join(norms, ","));
  }
}

auto Volume::shape() const -> Sz3 { return FirstN<3>(data.dimensions()); }

auto Volume::nVolumes() const -> Index { return data.dimension(3); }

} // namespace sy
