#include "args.hpp"

#include "sy/io/nifti.hpp"
#include "sy/log/log.hpp"

using namespace sy;

void main_hdr(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "Input nii");

  ParseCommand(parser, iname);
  auto const   cmd = parser.GetCommand().Name();
  Volume const vol = ReadNifti(iname.Get());
  fmt::print("shape: {}\nvolumes: {}\nvoxel size: {}\ntype: {}\naffine:\n", fmt::join(vol.shape(), " "), vol.nVolumes(),
             fmt::join(vol.voxel_size, " "), ToString(vol.type));
  for (Index ii = 0; ii < 4; ii++) {
    fmt::print("  {: .6f} {: .6f} {: .6f} {: .6f}\n", vol.affine(ii, 0), vol.affine(ii, 1), vol.affine(ii, 2),
               vol.affine(ii, 3));
  }
  Log::Print(cmd, "Finished");
}
