#include "sy/errors.hpp"
#include "sy/geometry.hpp"
#include "sy/io/nifti.hpp"
#include "sy/phantom/oblique.hpp"
#include "sy/reslice.hpp"

#include <filesystem>

#include <itkImage.h>
#include <itkImageFileWriter.h>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace sy;
using namespace Catch;

namespace {
auto Phantom(Sz3 const &mat, Affine const &a) -> Volume
{
  Re4 d(AddBack(mat, 1));
  d = SpherePhantom(mat, VoxelSizes(a), 12.f, 100.f).reshape(AddBack(mat, 1));
  return Volume(std::move(d), a, DataType::Int16);
}
} // namespace

TEST_CASE("NIfTI", "[io]")
{
  std::filesystem::path const dir("sy-io-test");
  std::filesystem::create_directories(dir);
  Sz3 const    mat{24, 20, 16};
  Affine const oblique = ObliqueAffine(mat, Eigen::Array3d(1., 1.5, 2.), Eigen::Array3d(5., 0., 20.));

  SECTION("Round trip")
  {
    Volume const                vol = Phantom(mat, oblique);
    std::filesystem::path const fname = dir / "vol.nii.gz";
    REQUIRE_NOTHROW(WriteNifti(vol, fname));
    CHECK(std::filesystem::exists(fname));
    Volume const check = ReadNifti(fname);
    CHECK(check.type == DataType::Int16);
    CHECK(check.shape() == vol.shape());
    CHECK(check.nVolumes() == 1);
    CHECK(check.affine.isApprox(vol.affine, 1.e-4));
    CHECK(check.voxel_size.isApprox(vol.voxel_size, 1.e-4));
    Re4 const diff = check.data - vol.data;
    CHECK(Eigen::Tensor<float, 0>(diff.abs().maximum())() == 0.f);
  }

  SECTION("Multiple volumes")
  {
    Re4 d(4, 5, 6, 2);
    d.setConstant(1.25f);
    d.chip<3>(1).setConstant(-3.5f);
    Volume const                vol(d, oblique, DataType::Float32);
    std::filesystem::path const fname = dir / "multi.nii";
    WriteNifti(vol, fname);
    Volume const check = ReadNifti(fname);
    CHECK(check.type == DataType::Float32);
    CHECK(check.nVolumes() == 2);
    CHECK(check.data(1, 2, 3, 0) == 1.25f);
    CHECK(check.data(1, 2, 3, 1) == -3.5f);
  }

  SECTION("Missing file") { CHECK_THROWS_AS(ReadNifti(dir / "nope.nii"), LoadError); }

  SECTION("Missing geometry")
  {
    // A 2D slice has no third axis to build an affine from
    using SliceType = itk::Image<float, 2>;
    auto slice = SliceType::New();
    slice->SetRegions(SliceType::SizeType{{8, 8}});
    slice->Allocate();
    slice->FillBuffer(1.f);
    std::filesystem::path const fname = dir / "slice.nii";
    auto                        writer = itk::ImageFileWriter<SliceType>::New();
    writer->SetFileName(fname.string());
    writer->SetInput(slice);
    writer->Update();
    CHECK_THROWS_AS(ReadNifti(fname), LoadError);
  }

  std::filesystem::remove_all(dir);
}

TEST_CASE("Resample files", "[io]")
{
  std::filesystem::path const dir("sy-files-test");
  std::filesystem::create_directories(dir);
  Sz3 const            mat{32, 32, 32};
  Eigen::Array3d const vs = Eigen::Array3d::Constant(2.);

  auto const writePair = [&](Affine const &a, std::string const &prefix) {
    AxialFiles files{.mag = dir / (prefix + "_mag.nii.gz"), .pha = dir / (prefix + "_pha.nii.gz"), .mask = std::nullopt};
    WriteNifti(Phantom(mat, a), files.mag);
    Re4 p(AddBack(mat, 1));
    p.setConstant(0.5f);
    WriteNifti(Volume(std::move(p), a, DataType::Float32), files.pha);
    return files;
  };

  SECTION("Axial inputs are returned as is")
  {
    Affine axial = Affine::Identity();
    axial.topLeftCorner<3, 3>() = vs.matrix().asDiagonal();
    auto const in = writePair(axial, "axial");
    auto const out = ResampleFiles(in, 10., dir / "out");
    CHECK(out.mag == in.mag);
    CHECK(out.pha == in.pha);
    CHECK(!out.mask);
    CHECK(!std::filesystem::exists(dir / "out"));
  }

  SECTION("Oblique inputs are resampled")
  {
    auto const oblique = ObliqueAffine(mat, vs, Eigen::Array3d(0., 0., 15.));
    auto       in = writePair(oblique, "oblique");
    Re4        k(AddBack(mat, 1));
    k = SpherePhantom(mat, vs, 20.f, 1.f).reshape(AddBack(mat, 1));
    in.mask = dir / "oblique_mask.nii.gz";
    WriteNifti(Volume(std::move(k), oblique, DataType::UInt8), in.mask.value());

    auto const out = ResampleFiles(in, 10., dir);
    CHECK(out.mag.filename() == "oblique_mag_resampled.nii.gz");
    CHECK(out.pha.filename() == "oblique_pha_resampled.nii.gz");
    REQUIRE(out.mask);
    CHECK(out.mask->filename() == "oblique_mask_resampled.nii.gz");

    Volume const mag = ReadNifti(out.mag);
    Volume const pha = ReadNifti(out.pha);
    Volume const mask = ReadNifti(out.mask.value());
    CHECK(mag.type == DataType::Int16);
    CHECK(pha.type == DataType::Float32);
    CHECK(mask.type == DataType::UInt8);
    CHECK(mag.shape() == pha.shape());
    CHECK(mag.shape() == mask.shape());
    CHECK(Obliquity(mag.affine).matrix().norm() == Approx(0.).margin(1.e-3));
  }

  SECTION("Reslicing onto another grid")
  {
    auto const oblique = ObliqueAffine(mat, vs, Eigen::Array3d(0., 10., 0.));
    auto const in = writePair(oblique, "src");
    Affine     axial = Affine::Identity();
    axial.topLeftCorner<3, 3>() = Eigen::Vector3d(2.5, 2.5, 2.5).asDiagonal();
    axial.topRightCorner<3, 1>() = Eigen::Vector3d::Constant(-25.);
    Re4 r(20, 20, 20, 1);
    r.setZero();
    std::filesystem::path const ref = dir / "ref.nii.gz";
    WriteNifti(Volume(std::move(r), axial, DataType::Float32), ref);

    auto const out = ResliceLikeFile(in.mag, ref, Interp::Continuous, dir / "like");
    CHECK(out == std::filesystem::absolute(dir / "like" / "src_mag_resampled.nii.gz"));
    REQUIRE(std::filesystem::exists(out));
    Volume const check = ReadNifti(out);
    Volume const refCheck = ReadNifti(ref);
    CHECK(check.shape() == refCheck.shape());
    CHECK(check.affine.isApprox(refCheck.affine, 1.e-4));
    CHECK(check.type == DataType::Float32);
    // Both grids are centred on the origin, as is the sphere
    CHECK(check.data(10, 10, 10, 0) == Approx(100.f).margin(1.e-2f));
  }

  SECTION("Reslicing onto the same grid is a no-op")
  {
    Affine axial = Affine::Identity();
    axial.topLeftCorner<3, 3>() = vs.matrix().asDiagonal();
    auto const in = writePair(axial, "like");
    CHECK(ResliceLikeFile(in.mag, in.pha, Interp::Continuous, dir) == in.mag);
  }

  std::filesystem::remove_all(dir);
}
