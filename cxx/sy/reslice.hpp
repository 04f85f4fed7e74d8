#pragma once

#include "resample.hpp"
#include "volume.hpp"

#include <filesystem>
#include <optional>

namespace sy {

struct AxialInputs
{
  Volume                mag;
  Volume                pha;
  std::optional<Volume> mask;
};

struct AxialOutputs
{
  Volume                mag;
  Volume                pha;
  std::optional<Volume> mask;
};

/*
 * Re-grid a magnitude/phase pair (and mask, if present) onto the canonical axial grid of the
 * magnitude. Magnitude keeps its storage type, phase becomes half-precision float, the mask is
 * resampled with nearest-neighbour and keeps its type.
 */
auto ResampleToAxial(AxialInputs const &in, bool const quiet = true) -> AxialOutputs;

/*
 * Sample src onto the grid of ref. Returns nothing if the affines are already identical, in
 * which case src can be used as is.
 */
auto ResliceLike(Volume const &src, Volume const &ref, Interp const interp = Interp::Continuous) -> std::optional<Volume>;

struct AxialFiles
{
  std::filesystem::path                mag;
  std::filesystem::path                pha;
  std::optional<std::filesystem::path> mask;
};

/*
 * "dir/name.nii.gz" -> "outDir/name_resampled.nii.gz"
 */
auto ResampledName(std::filesystem::path const &in, std::filesystem::path const &outDir) -> std::filesystem::path;

/*
 * Load, gate on obliquity, resample and write. If the gate decides no resampling is needed, the
 * input paths are returned and nothing is written. Either every output is written or none is.
 */
auto ResampleFiles(AxialFiles const           &in,
                   std::optional<double> const threshold,
                   std::filesystem::path const &outDir,
                   bool const                   quiet = true) -> AxialFiles;

/*
 * Returns the input path unchanged if the two files already share an affine
 */
auto ResliceLikeFile(std::filesystem::path const &in,
                     std::filesystem::path const &like,
                     Interp const                 interp,
                     std::filesystem::path const &outDir) -> std::filesystem::path;

} // namespace sy
