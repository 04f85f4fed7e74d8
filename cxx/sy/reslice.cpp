#include "reslice.hpp"

#include "complex.hpp"
#include "errors.hpp"
#include "geometry.hpp"
#include "io/nifti.hpp"

namespace sy {

auto ResampleToAxial(AxialInputs const &in, bool const quiet) -> AxialOutputs
{
  auto const start = Log::Now();
  if (in.mask && in.mask->shape() != in.pha.shape()) {
    throw ShapeMismatchError("Axial", "Mask dimensions {} do not match phase {}", fmt::join(in.mask->shape(), ","),
                             fmt::join(in.pha.shape(), ","));
  }
  Affine const target = CanonicalAxial(in.mag.voxel_size, in.mag.shape(), in.mag.affine);
  Log::Debug("Axial", "Target affine diagonal {},{},{} translation {},{},{}", target(0, 0), target(1, 1), target(2, 2),
             target(0, 3), target(1, 3), target(2, 3));

  auto const            cplx = Decompose(in.mag, in.pha);
  ResampleOpts const    continuous{.interp = Interp::Continuous, .quiet = quiet};
  Volume const          real = Resample(cplx.real, target, std::nullopt, continuous);
  Volume const          imag = Resample(cplx.imag, target, std::nullopt, continuous);
  std::optional<Volume> mask;
  if (in.mask) {
    mask = Resample(in.mask.value(), target, std::nullopt, ResampleOpts{.interp = Interp::Nearest, .quiet = quiet});
  }
  auto mp = Recompose(real, imag, in.mag.type);
  Log::Print("Axial", "Resampled to {} in {}", fmt::join(mp.mag.shape(), "x"), Log::ToNow(start));
  return AxialOutputs{.mag = std::move(mp.mag), .pha = std::move(mp.pha), .mask = std::move(mask)};
}

auto ResliceLike(Volume const &src, Volume const &ref, Interp const interp) -> std::optional<Volume>
{
  if (src.affine == ref.affine) {
    Log::Print("Like", "Affines already match, nothing to do");
    return std::nullopt;
  }
  return Resample(src, ref.affine, ref.shape(), ResampleOpts{.interp = interp, .quiet = false});
}

auto ResampledName(std::filesystem::path const &in, std::filesystem::path const &outDir) -> std::filesystem::path
{
  std::string const name = in.filename().string();
  auto const        dot = name.find('.');
  std::string const stem = name.substr(0, dot);
  std::string const ext = dot == std::string::npos ? "" : name.substr(dot);
  return std::filesystem::absolute(outDir / (stem + "_resampled" + ext));
}

auto ResampleFiles(AxialFiles const           &in,
                   std::optional<double> const threshold,
                   std::filesystem::path const &outDir,
                   bool const                   quiet) -> AxialFiles
{
  Log::Print("Axial", "Loading mag={}", in.mag.filename().string());
  Volume mag = ReadNifti(in.mag);

  auto const gate = CheckObliquity(mag.affine, threshold);
  if (!gate.resample) {
    Log::Print("Axial", "Obliquity {}; norm {:.3f} < {}; no resampling needed", fmt::join(gate.obliquity, ","), gate.norm,
               threshold.value());
    return in;
  }
  if (threshold) {
    Log::Print("Axial", "Obliquity {}; norm {:.3f} >= {}; resampling", fmt::join(gate.obliquity, ","), gate.norm,
               threshold.value());
  } else {
    Log::Print("Axial", "Obliquity {}; norm {:.3f}; no threshold, resampling", fmt::join(gate.obliquity, ","), gate.norm);
  }

  Log::Print("Axial", "Loading pha={}", in.pha.filename().string());
  AxialInputs inputs{.mag = std::move(mag), .pha = ReadNifti(in.pha), .mask = std::nullopt};
  if (in.mask) {
    Log::Print("Axial", "Loading mask={}", in.mask->filename().string());
    inputs.mask = ReadNifti(in.mask.value());
  }
  auto const out = ResampleToAxial(inputs, quiet);

  AxialFiles files{.mag = ResampledName(in.mag, outDir), .pha = ResampledName(in.pha, outDir), .mask = std::nullopt};
  if (in.mask) { files.mask = ResampledName(in.mask.value(), outDir); }

  std::filesystem::create_directories(outDir);
  std::vector<std::filesystem::path> written;
  try {
    WriteNifti(out.mag, files.mag);
    written.push_back(files.mag);
    WriteNifti(out.pha, files.pha);
    written.push_back(files.pha);
    if (out.mask) {
      WriteNifti(out.mask.value(), files.mask.value());
      written.push_back(files.mask.value());
    }
  } catch (Log::Failure const &) {
    for (auto const &w : written) {
      std::error_code ec;
      std::filesystem::remove(w, ec);
    }
    throw;
  }
  return files;
}

auto ResliceLikeFile(std::filesystem::path const &in,
                     std::filesystem::path const &like,
                     Interp const                 interp,
                     std::filesystem::path const &outDir) -> std::filesystem::path
{
  Volume const src = ReadNifti(in);
  Volume const ref = ReadNifti(like);
  auto const   out = ResliceLike(src, ref, interp);
  if (!out) { return in; }
  auto const oname = ResampledName(in, outDir);
  std::filesystem::create_directories(outDir);
  WriteNifti(out.value(), oname);
  return oname;
}

} // namespace sy
