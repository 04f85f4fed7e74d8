#include "args.hpp"

#include "sy/geometry.hpp"
#include "sy/io/nifti.hpp"
#include "sy/log/log.hpp"

using namespace sy;

void main_obliquity(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "Input nii");
  args::ValueFlag<double>       threshold(parser, "DEG", "Obliquity threshold (degrees)", {'t', "threshold"});

  ParseCommand(parser, iname);
  auto const   cmd = parser.GetCommand().Name();
  Volume const vol = ReadNifti(iname.Get());
  auto const   gate = CheckObliquity(vol.affine, threshold ? std::optional<double>(threshold.Get()) : std::nullopt);
  fmt::print("obliquity: {:.4f}\nnorm: {:.4f}\n", fmt::join(gate.obliquity, " "), gate.norm);
  if (threshold) { fmt::print("resample: {}\n", gate.resample ? "yes" : "no"); }
  Log::Print(cmd, "Finished");
}
