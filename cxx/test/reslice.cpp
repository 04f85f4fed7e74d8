#include "sy/errors.hpp"
#include "sy/geometry.hpp"
#include "sy/phantom/oblique.hpp"
#include "sy/reslice.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace sy;
using namespace Catch;

namespace {
auto Constant(Sz3 const &mat, float const v, Affine const &a, DataType const t) -> Volume
{
  Re4 d(AddBack(mat, 1));
  d.setConstant(v);
  return Volume(std::move(d), a, t);
}
} // namespace

TEST_CASE("Axial resampling", "[reslice]")
{
  Sz3 const            mat{64, 64, 64};
  Eigen::Array3d const vs = Eigen::Array3d::Constant(2.);
  Affine               axial = Affine::Identity();
  axial.topLeftCorner<3, 3>() = vs.matrix().asDiagonal();
  Affine const oblique = ObliqueAffine(mat, vs, Eigen::Array3d(0., 0., 15.));

  SECTION("Axial input is skipped")
  {
    auto const gate = CheckObliquity(axial, 10.);
    CHECK(gate.norm == Approx(0.).margin(1.e-9));
    CHECK(!gate.resample);
  }

  SECTION("Oblique input")
  {
    CHECK(CheckObliquity(oblique, 10.).resample);
    AxialInputs const in{.mag = Constant(mat, 100.f, oblique, DataType::Int16),
                         .pha = Constant(mat, 0.5f, oblique, DataType::Float32),
                         .mask = std::nullopt};
    auto const        out = ResampleToAxial(in);
    CHECK(!out.mask);
    CHECK(out.mag.type == DataType::Int16);
    CHECK(out.pha.type == DataType::Float32);
    CHECK(out.mag.affine == out.pha.affine);
    CHECK(out.mag.affine.topLeftCorner<3, 3>().isDiagonal());
    CHECK(Obliquity(out.mag.affine).matrix().norm() == Approx(0.).margin(1.e-9));
    CHECK(out.mag.voxel_size.isApprox(vs));

    Eigen::Matrix4d const toSource = oblique.inverse() * out.mag.affine;
    auto const            osz = out.mag.shape();
    Index                 inside = 0;
    for (Index iz = 0; iz < osz[2]; iz++) {
      for (Index iy = 0; iy < osz[1]; iy++) {
        for (Index ix = 0; ix < osz[0]; ix++) {
          Eigen::Array3d const p = (toSource * Eigen::Vector4d(ix, iy, iz, 1.)).head<3>().array();
          if ((p >= 1.).all() && (p <= 62.).all()) {
            inside++;
            CHECK(out.mag.data(ix, iy, iz, 0) == Approx(100.f).margin(1.f));
            CHECK(out.pha.data(ix, iy, iz, 0) == Approx(0.5f).margin(2.e-3f));
          } else if ((p < -1.).any() || (p > 64.).any()) {
            CHECK(out.mag.data(ix, iy, iz, 0) == 0.f);
          }
        }
      }
    }
    CHECK(inside > 100000);
  }

  SECTION("Mask")
  {
    Re4 k(AddBack(mat, 1));
    k = SpherePhantom(mat, vs, 40.f, 1.f).reshape(AddBack(mat, 1));
    AxialInputs const in{.mag = Constant(mat, 100.f, oblique, DataType::Int16),
                         .pha = Constant(mat, 0.5f, oblique, DataType::Float32),
                         .mask = Volume(k, oblique, DataType::UInt8)};
    auto const        out = ResampleToAxial(in);
    REQUIRE(out.mask);
    CHECK(out.mask->type == DataType::UInt8);
    CHECK(out.mask->shape() == out.mag.shape());
    CHECK(out.mask->affine == out.mag.affine);
    Index ones = 0;
    for (Index ii = 0; ii < out.mask->data.size(); ii++) {
      float const v = out.mask->data.data()[ii];
      CHECK((v == 0.f || v == 1.f));
      ones += v == 1.f;
    }
    CHECK(ones > 0);
  }

  SECTION("Mask must match phase")
  {
    AxialInputs const in{.mag = Constant(mat, 100.f, oblique, DataType::Int16),
                         .pha = Constant(mat, 0.5f, oblique, DataType::Float32),
                         .mask = Constant(Sz3{32, 64, 64}, 1.f, oblique, DataType::UInt8)};
    CHECK_THROWS_AS(ResampleToAxial(in), ShapeMismatchError);
  }

  SECTION("Magnitude must match phase")
  {
    AxialInputs const in{.mag = Constant(Sz3{64, 64, 32}, 100.f, oblique, DataType::Int16),
                         .pha = Constant(mat, 0.5f, oblique, DataType::Float32),
                         .mask = std::nullopt};
    CHECK_THROWS_AS(ResampleToAxial(in), ShapeMismatchError);
  }
}

TEST_CASE("Reslice like", "[reslice]")
{
  Sz3 const    mat{20, 20, 20};
  Affine const oblique = ObliqueAffine(mat, Eigen::Array3d::Constant(1.5), Eigen::Array3d(10., 0., 20.));
  Volume const src = Constant(mat, 4.f, oblique, DataType::Int16);

  SECTION("Same affine")
  {
    Volume const ref = Constant(Sz3{8, 8, 8}, 0.f, oblique, DataType::Float32);
    CHECK(!ResliceLike(src, ref));
  }

  SECTION("Onto the reference grid")
  {
    Affine ref_affine = Affine::Identity();
    ref_affine.topLeftCorner<3, 3>() = Eigen::Vector3d(1., 1., 2.).asDiagonal();
    ref_affine.topRightCorner<3, 1>() = Eigen::Vector3d(-5., -5., -5.);
    Volume const ref = Constant(Sz3{10, 11, 5}, 0.f, ref_affine, DataType::Float32);
    auto const   out = ResliceLike(src, ref, Interp::Nearest);
    REQUIRE(out);
    CHECK(out->shape() == ref.shape());
    CHECK(out->affine == ref.affine);
    CHECK(out->type == DataType::Int16);
    // The centre of the reference grid is well inside the source
    CHECK(out->data(5, 5, 2, 0) == 4.f);
  }

  SECTION("Continuous onto the reference grid")
  {
    Affine ref_affine = Affine::Identity();
    ref_affine.topLeftCorner<3, 3>() = Eigen::Vector3d(1., 1., 2.).asDiagonal();
    ref_affine.topRightCorner<3, 1>() = Eigen::Vector3d(-5., -5., -5.);
    Volume const ref = Constant(Sz3{10, 11, 5}, 0.f, ref_affine, DataType::Float32);
    auto const   out = ResliceLike(src, ref);
    REQUIRE(out);
    CHECK(out->shape() == ref.shape());
    CHECK(out->affine == ref.affine);
    CHECK(out->type == DataType::Float32);
    CHECK(out->data(5, 5, 2, 0) == Approx(4.f).margin(1.e-4f));
    CHECK(out->data(4, 6, 2, 0) == Approx(4.f).margin(1.e-4f));
  }
}

TEST_CASE("Resampled names", "[reslice]")
{
  CHECK(ResampledName("/data/sub-1/mag.nii.gz", "/out") == std::filesystem::path("/out/mag_resampled.nii.gz"));
  CHECK(ResampledName("pha.nii", "/out") == std::filesystem::path("/out/pha_resampled.nii"));
  CHECK(ResampledName("mask", "/out") == std::filesystem::path("/out/mask_resampled"));
}
