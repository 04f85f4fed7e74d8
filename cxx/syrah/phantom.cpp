#include "args.hpp"

#include "sy/io/nifti.hpp"
#include "sy/log/log.hpp"
#include "sy/phantom/oblique.hpp"

using namespace sy;

void main_phantom(args::Subparser &parser)
{
  args::Positional<std::string> mname(parser, "MAG", "Magnitude nii to write");
  args::Positional<std::string> pname(parser, "PHASE", "Phase nii to write");
  args::ValueFlag<std::string>  mask(parser, "MASK", "Also write a sphere mask", {'m', "mask"});

  SzFlag<3>              matrix(parser, "M", "Matrix size (64,64,64)", {"matrix"}, sy::Sz3{64, 64, 64});
  ArrayFlag<double, 3>   voxSize(parser, "V", "Voxel size in mm (2,2,2)", {"vox-size"}, Eigen::Array3d::Constant(2.));
  ArrayFlag<double, 3>   rotate(parser, "R", "Rotation about x,y,z in degrees (0,0,15)", {"rotate"},
                                Eigen::Array3d(0., 0., 15.));
  args::ValueFlag<float> magnitude(parser, "I", "Magnitude (100)", {"magnitude"}, 100.f);
  args::ValueFlag<float> phase(parser, "P", "Phase in radians (0.5)", {"phase"}, 0.5f);
  args::ValueFlag<float> radius(parser, "R", "Sphere radius in mm, 0 for a constant block (0)", {"radius"}, 0.f);

  ParseCommand(parser, mname);
  if (!pname) { throw args::Error("No phase file specified"); }
  auto const   cmd = parser.GetCommand().Name();
  Sz3 const    mat = matrix.Get();
  Affine const affine = ObliqueAffine(mat, voxSize.Get(), rotate.Get());

  Re4 m(AddBack(mat, 1));
  if (radius.Get() > 0.f) {
    m = SpherePhantom(mat, voxSize.Get(), radius.Get(), magnitude.Get()).reshape(AddBack(mat, 1));
  } else {
    m.setConstant(magnitude.Get());
  }
  Re4 p(AddBack(mat, 1));
  p.setConstant(phase.Get());

  WriteNifti(Volume(std::move(m), affine, DataType::Int16), mname.Get());
  WriteNifti(Volume(std::move(p), affine, DataType::Float32), pname.Get());
  if (mask) {
    // Without a sphere, mask the central half of the smallest FOV dimension
    Eigen::Array3d const fov = voxSize.Get() * Eigen::Array3d(mat[0], mat[1], mat[2]);
    float const          r = radius.Get() > 0.f ? radius.Get() : 0.25f * fov.minCoeff();
    Re4 const            k = SpherePhantom(mat, voxSize.Get(), r, 1.f).reshape(AddBack(mat, 1));
    WriteNifti(Volume(k, affine, DataType::UInt8), mask.Get());
  }
  Log::Print(cmd, "Finished");
}
