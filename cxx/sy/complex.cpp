#include "complex.hpp"

#include "errors.hpp"
#include "sys/threads.hpp"

namespace sy {

auto Decompose(Volume const &mag, Volume const &pha) -> ComplexPair
{
  if (mag.data.dimensions() != pha.data.dimensions()) {
    throw ShapeMismatchError("Cplx", "Magnitude dimensions {} do not match phase {}", fmt::join(mag.data.dimensions(), ","),
                             fmt::join(pha.data.dimensions(), ","));
  }
  if (!mag.affine.isApprox(pha.affine, 1.e-6)) {
    Log::Warn("Cplx", "Magnitude and phase affines differ, using the phase affine");
  }
  Cx4 z(pha.data.dimensions());
  z.device(Threads::TensorDevice()) =
    mag.data.cast<Cx>() * pha.data.unaryExpr([](float const p) { return std::polar(1.f, p); });
  Re4 re(z.dimensions()), im(z.dimensions());
  re.device(Threads::TensorDevice()) = z.real();
  im.device(Threads::TensorDevice()) = z.imag();
  Log::Debug("Cplx", "Decomposed {} voxels into real/imaginary", z.size());
  return ComplexPair{.real = Volume(std::move(re), pha.voxel_size, pha.affine, DataType::Float32),
                     .imag = Volume(std::move(im), pha.voxel_size, pha.affine, DataType::Float32)};
}

auto Recompose(Volume const &real, Volume const &imag, DataType const magType) -> MagPhase
{
  if (real.data.dimensions() != imag.data.dimensions()) {
    throw ShapeMismatchError("Cplx", "Real dimensions {} do not match imaginary {}", fmt::join(real.data.dimensions(), ","),
                             fmt::join(imag.data.dimensions(), ","));
  }
  Cx4 z(real.data.dimensions());
  z.device(Threads::TensorDevice()) = real.data.cast<Cx>() + imag.data.cast<Cx>() * Cx(0.f, 1.f);

  // Rounding first avoids a truncation bias for integer types
  Re4 m(z.dimensions());
  m.device(Threads::TensorDevice()) = z.abs().round();
  Re4 p(z.dimensions());
  p.device(Threads::TensorDevice()) =
    z.unaryExpr([](Cx const c) { return std::arg(c); }).cast<Eigen::half>().cast<float>();
  return MagPhase{.mag = Volume(Cast(m, magType), real.voxel_size, real.affine, magType),
                  .pha = Volume(std::move(p), real.voxel_size, real.affine, DataType::Float32)};
}

} // namespace sy
