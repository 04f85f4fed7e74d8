#pragma once

#include "types.hpp"

#include <string>

namespace sy {

/*
 * The numeric type a volume is stored as on disk. Data is always held as float in memory,
 * this records what it must be converted back to.
 */
enum struct DataType
{
  UInt8,
  Int8,
  UInt16,
  Int16,
  UInt32,
  Int32,
  Float32,
  Float64
};

auto ToString(DataType const t) -> std::string;
auto IsInteger(DataType const t) -> bool;

/*
 * Round to nearest and saturate for integer types. Floating point types pass through.
 */
auto Cast(Re4 const &x, DataType const t) -> Re4;

struct Volume
{
  Re4            data; // x, y, z, volumes
  Eigen::Array3d voxel_size;
  Affine         affine;
  DataType       type;

  // Throws LoadError unless the geometry is consistent and non-degenerate
  Volume(Re4 data, Affine const &affine, DataType const type);
  Volume(Re4 data, Eigen::Array3d const &voxel_size, Affine const &affine, DataType const type);

  auto shape() const -> Sz3;
  auto nVolumes() const -> Index;
};

} // namespace sy
