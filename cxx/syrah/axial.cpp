#include "args.hpp"

#include "sy/log/log.hpp"
#include "sy/reslice.hpp"

#include <optional>

using namespace sy;

void main_axial(args::Subparser &parser)
{
  args::Positional<std::string> mname(parser, "MAG", "Input magnitude nii");
  args::Positional<std::string> pname(parser, "PHASE", "Input phase nii (radians)");
  args::ValueFlag<std::string>  mask(parser, "MASK", "Input mask nii", {'m', "mask"});
  args::ValueFlag<double>       threshold(parser, "DEG", "Skip resampling below this obliquity (degrees)",
                                          {'t', "obliquity-threshold"});
  args::ValueFlag<std::string>  odir(parser, "DIR", "Output directory (.)", {'o', "out"}, ".");
  args::Flag                    loud(parser, "L", "Warn about output voxels outside the source", {"loud"});

  ParseCommand(parser, mname);
  if (!pname) { throw args::Error("No phase file specified"); }
  auto const cmd = parser.GetCommand().Name();

  AxialFiles in{.mag = mname.Get(), .pha = pname.Get(), .mask = std::nullopt};
  if (mask) { in.mask = mask.Get(); }
  std::optional<double> thresh;
  if (threshold) { thresh = threshold.Get(); }

  auto const out = ResampleFiles(in, thresh, odir.Get(), !loud);
  fmt::print("{}\n{}\n", out.mag.string(), out.pha.string());
  if (out.mask) { fmt::print("{}\n", out.mask->string()); }
  Log::Print(cmd, "Finished");
}
