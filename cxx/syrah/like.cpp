#include "args.hpp"

#include "sy/log/log.hpp"
#include "sy/reslice.hpp"

using namespace sy;

void main_like(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "Input nii");
  args::Positional<std::string> lname(parser, "LIKE", "Reference nii, output will be on this grid");
  args::Flag                    nearest(parser, "N", "Nearest-neighbour interpolation (for labels)", {'n', "nearest"});
  args::ValueFlag<std::string>  odir(parser, "DIR", "Output directory (.)", {'o', "out"}, ".");

  ParseCommand(parser, iname);
  if (!lname) { throw args::Error("No reference file specified"); }
  auto const cmd = parser.GetCommand().Name();
  auto const out = ResliceLikeFile(iname.Get(), lname.Get(), nearest ? Interp::Nearest : Interp::Continuous, odir.Get());
  fmt::print("{}\n", out.string());
  Log::Print(cmd, "Finished");
}
