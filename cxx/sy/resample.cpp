#include "resample.hpp"

#include "errors.hpp"
#include "geometry.hpp"
#include "info.hpp"
#include "itk.hpp"
#include "sys/threads.hpp"

#include <itkLinearInterpolateImageFunction.h>
#include <itkNearestNeighborInterpolateImageFunction.h>
#include <itkResampleImageFilter.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <limits>

namespace sy {

auto CoveringShape(Sz3 const &shape, Affine const &source, Affine const &target) -> Sz3
{
  Eigen::Matrix4d const toTarget = target.inverse() * source;
  Eigen::Array3d        hi = Eigen::Array3d::Constant(-std::numeric_limits<double>::infinity());
  for (Index ic = 0; ic < 8; ic++) {
    Eigen::Vector4d const corner((ic & 1) ? shape[0] - 1 : 0, (ic & 2) ? shape[1] - 1 : 0, (ic & 4) ? shape[2] - 1 : 0, 1.);
    hi = hi.max((toTarget * corner).head<3>().array());
  }
  Sz3 tshape;
  for (Index ii = 0; ii < 3; ii++) {
    // Round-off from the inverse must not add a whole slab of voxels
    double const r = std::round(hi[ii]);
    double const h = std::abs(hi[ii] - r) < 1.e-6 ? r : hi[ii];
    tshape[ii] = static_cast<Index>(std::ceil(h)) + 1;
  }
  if (!std::all_of(tshape.begin(), tshape.end(), [](Index const i) { return i > 0; })) {
    throw InterpolationError("Resamp", "Source lies entirely outside the target grid, extent {}", fmt::join(tshape, ","));
  }
  return tshape;
}

auto OutsideFraction(Sz3 const &shape, Affine const &source, Sz3 const &tshape, Affine const &target) -> float
{
  Eigen::Matrix4d const toSource = source.inverse() * target;
  Eigen::Array3d const  lo = Eigen::Array3d::Constant(-0.5);
  Eigen::Array3d const  hi = Eigen::Array3d(shape[0], shape[1], shape[2]) - 0.5;
  std::atomic<Index>    outside = 0;
  auto                  task = [&](Index const zlo, Index const zhi) {
    Index n = 0;
    for (Index iz = zlo; iz < zhi; iz++) {
      for (Index iy = 0; iy < tshape[1]; iy++) {
        for (Index ix = 0; ix < tshape[0]; ix++) {
          Eigen::Array3d const p = (toSource * Eigen::Vector4d(ix, iy, iz, 1.)).head<3>().array();
          if ((p < lo).any() || (p > hi).any()) { n++; }
        }
      }
    }
    outside += n;
  };
  Threads::ChunkFor(task, tshape[2]);
  return static_cast<float>(outside.load()) / static_cast<float>(Product(tshape));
}

auto ResampledType(DataType const t, Interp const interp) -> DataType
{
  if (interp == Interp::Continuous) {
    switch (t) {
    case DataType::Int8:
    case DataType::Int16:
    case DataType::Int32: return DataType::Float32;
    default: return t;
    }
  }
  return t;
}

namespace {
using ImageType = ITK::ImageType;

auto MakeInterpolator(Interp const interp) -> itk::InterpolateImageFunction<ImageType, double>::Pointer
{
  switch (interp) {
  case Interp::Nearest: return itk::NearestNeighborInterpolateImageFunction<ImageType, double>::New();
  case Interp::Continuous: return itk::LinearInterpolateImageFunction<ImageType, double>::New();
  }
  throw InterpolationError("Resamp", "Unknown interpolation mode");
}
} // namespace

auto Resample(Volume const &src, Affine const &target, std::optional<Sz3> const &shape, ResampleOpts const &opts)
  -> Volume
{
  Info const tinfo = ToInfo(target);
  if (!(tinfo.voxel_size > 0.).all() ||
      std::abs(target.topLeftCorner<3, 3>().determinant()) < std::numeric_limits<double>::epsilon()) {
    throw GeometryError("Resamp", "Target affine is singular");
  }
  Sz3 const tshape = shape ? shape.value() : CoveringShape(src.shape(), src.affine, target);
  Log::Debug("Resamp", "{} interpolation from {} to {}", opts.interp == Interp::Nearest ? "Nearest" : "Linear",
             fmt::join(src.shape(), ","), fmt::join(tshape, ","));

  float const outside = OutsideFraction(src.shape(), src.affine, tshape, target);
  if (outside > 0.f) {
    if (opts.quiet) {
      Log::Debug("Resamp", "{:.1f}% of output lies outside the source and will be zero", 100.f * outside);
    } else {
      Log::Warn("Resamp", "{:.1f}% of output lies outside the source and will be zero", 100.f * outside);
    }
  }

  ImageType::SizeType sz;
  std::copy_n(tshape.begin(), 3, sz.begin());
  ImageType::SpacingType s;
  std::copy_n(tinfo.voxel_size.cbegin(), 3, s.begin());
  ImageType::PointType o;
  std::copy_n(tinfo.origin.cbegin(), 3, o.begin());
  ImageType::DirectionType d;
  for (Index ii = 0; ii < 3; ii++) {
    for (Index ij = 0; ij < 3; ij++) {
      d(ii, ij) = tinfo.direction(ii, ij);
    }
  }

  Info const sinfo = ToInfo(src.affine);
  Re4        out(AddBack(tshape, src.nVolumes()));
  for (Index iv = 0; iv < src.nVolumes(); iv++) {
    auto resampler = itk::ResampleImageFilter<ImageType, ImageType>::New();
    resampler->SetInput(ITK::Import(CChipMap(src.data, iv), sinfo));
    resampler->SetInterpolator(MakeInterpolator(opts.interp));
    resampler->SetSize(sz);
    resampler->SetOutputSpacing(s);
    resampler->SetOutputOrigin(o);
    resampler->SetOutputDirection(d);
    resampler->SetDefaultPixelValue(0.f);
    try {
      resampler->Update();
    } catch (itk::ExceptionObject const &e) {
      throw InterpolationError("Resamp", "Volume {}: {}", iv, e.what());
    }
    ITK::Export(resampler->GetOutput(), ChipMap(out, iv));
  }
  DataType const otype = ResampledType(src.type, opts.interp);
  if (otype != src.type) {
    Log::Debug("Resamp", "Casting {} to {} for continuous interpolation", ToString(src.type), ToString(otype));
  }
  return Volume(std::move(out), tinfo.voxel_size, target, otype);
}

} // namespace sy
