#include "nifti.hpp"

#include "../errors.hpp"
#include "../info.hpp"

#include <itkImageFileReader.h>
#include <itkImageFileWriter.h>
#include <itkImageIOFactory.h>
#include <itkImportImageFilter.h>

namespace sy {

namespace {
auto ToDataType(itk::IOComponentEnum const c, std::string const &fname) -> DataType
{
  switch (c) {
  case itk::IOComponentEnum::UCHAR: return DataType::UInt8;
  case itk::IOComponentEnum::CHAR: return DataType::Int8;
  case itk::IOComponentEnum::USHORT: return DataType::UInt16;
  case itk::IOComponentEnum::SHORT: return DataType::Int16;
  case itk::IOComponentEnum::UINT: return DataType::UInt32;
  case itk::IOComponentEnum::INT: return DataType::Int32;
  case itk::IOComponentEnum::FLOAT: return DataType::Float32;
  case itk::IOComponentEnum::DOUBLE: return DataType::Float64;
  default:
    throw LoadError("NIfTI", "{} has unsupported component type {}", fname, itk::ImageIOBase::GetComponentTypeAsString(c));
  }
}
} // namespace

auto ReadNifti(std::filesystem::path const &fname) -> Volume
{
  if (!std::filesystem::exists(fname)) { throw LoadError("NIfTI", "File {} does not exist", fname.string()); }
  auto io = itk::ImageIOFactory::CreateImageIO(fname.c_str(), itk::ImageIOFactory::IOFileModeEnum::ReadMode);
  if (!io) { throw LoadError("NIfTI", "No ITK reader could open {}", fname.string()); }
  try {
    io->SetFileName(fname.string());
    io->ReadImageInformation();
  } catch (itk::ExceptionObject const &e) {
    throw LoadError("NIfTI", "Could not read header of {}: {}", fname.string(), e.what());
  }
  auto const nd = io->GetNumberOfDimensions();
  if (nd < 3 || nd > 4) { throw LoadError("NIfTI", "{} has {} dimensions, need 3 or 4", fname.string(), nd); }
  if (io->GetNumberOfComponents() != 1) {
    throw LoadError("NIfTI", "{} has {} components per voxel, need 1", fname.string(), io->GetNumberOfComponents());
  }
  DataType const type = ToDataType(io->GetComponentType(), fname.string());
  for (unsigned ii = 0; ii < 3; ii++) {
    if (!(io->GetSpacing(ii) > 0.)) {
      throw LoadError("NIfTI", "{} has spacing {} on axis {}", fname.string(), io->GetSpacing(ii), ii);
    }
  }

  using ImageType = itk::Image<float, 4>;
  auto reader = itk::ImageFileReader<ImageType>::New();
  reader->SetImageIO(io);
  reader->SetFileName(fname.string());
  try {
    reader->Update();
  } catch (itk::ExceptionObject const &e) {
    throw LoadError("NIfTI", "Could not read {}: {}", fname.string(), e.what());
  }

  ImageType::Pointer img = reader->GetOutput();
  auto const         sz = img->GetLargestPossibleRegion().GetSize();
  auto const         spacing = img->GetSpacing();
  auto const         origin = img->GetOrigin();
  auto const         direction = img->GetDirection();
  Info               lps;
  for (Index ii = 0; ii < 3; ii++) {
    lps.voxel_size[ii] = spacing[ii];
    lps.origin[ii] = origin[ii];
    for (Index ij = 0; ij < 3; ij++) {
      lps.direction(ii, ij) = direction(ii, ij);
    }
  }
  Sz4 shape;
  for (Index ii = 0; ii < 4; ii++) {
    shape[ii] = static_cast<Index>(sz[ii]);
  }
  Re4 data(shape);
  std::copy_n(img->GetBufferPointer(), data.size(), data.data());
  Log::Print("NIfTI", "Read {} {} {}", fname.string(), fmt::join(data.dimensions(), "x"), ToString(type));
  Info const ras = FlipLPS(lps);
  return Volume(std::move(data), ras.voxel_size, ToAffine(ras), type);
}

namespace {
template <typename T, int ND> void WriteImage(Volume const &vol, std::filesystem::path const &fname)
{
  using Image = itk::Image<T, ND>;
  using Importer = itk::ImportImageFilter<T, ND>;
  using Writer = itk::ImageFileWriter<Image>;

  Eigen::Tensor<T, 4> const typed = Cast(vol.data, vol.type).template cast<T>();

  typename Importer::Pointer  import = Importer::New();
  typename Importer::SizeType sz;
  typename Importer::IndexType st;
  std::copy_n(typed.dimensions().begin(), ND, &sz[0]);
  st.Fill(0);
  typename Importer::RegionType const region{st, sz};
  import->SetRegion(region);

  Info const lps = FlipLPS(ToInfo(vol.affine));
  double     spacing[ND];
  std::copy_n(lps.voxel_size.begin(), 3, spacing);
  double origin[ND];
  std::copy_n(lps.origin.begin(), 3, origin);
  itk::Matrix<double, ND, ND> direction;
  direction.SetIdentity();
  for (auto ir = 0; ir < 3; ir++) {
    for (auto ic = 0; ic < 3; ic++) {
      direction(ir, ic) = lps.direction(ir, ic);
    }
  }
  if constexpr (ND == 4) {
    spacing[3] = 1.;
    origin[3] = 0.;
  }
  import->SetSpacing(spacing);
  import->SetOrigin(origin);
  import->SetDirection(direction);
  import->SetImportPointer(const_cast<T *>(typed.data()), typed.size(), false);

  typename Writer::Pointer write = Writer::New();
  write->SetFileName(fname.string());
  write->SetInput(import->GetOutput());
  try {
    write->Update();
  } catch (itk::ExceptionObject const &e) {
    throw Log::Failure("NIfTI", "Could not write {}: {}", fname.string(), e.what());
  }
  Log::Print("NIfTI", "Wrote {} {} {}", fname.string(), fmt::join(typed.dimensions(), "x"), ToString(vol.type));
}

template <typename T> void Write(Volume const &vol, std::filesystem::path const &fname)
{
  if (vol.nVolumes() == 1) {
    WriteImage<T, 3>(vol, fname);
  } else {
    WriteImage<T, 4>(vol, fname);
  }
}
} // namespace

void WriteNifti(Volume const &vol, std::filesystem::path const &fname)
{
  switch (vol.type) {
  case DataType::UInt8: return Write<uint8_t>(vol, fname);
  case DataType::Int8: return Write<int8_t>(vol, fname);
  case DataType::UInt16: return Write<uint16_t>(vol, fname);
  case DataType::Int16: return Write<int16_t>(vol, fname);
  case DataType::UInt32: return Write<uint32_t>(vol, fname);
  case DataType::Int32: return Write<int32_t>(vol, fname);
  case DataType::Float32: return Write<float>(vol, fname);
  case DataType::Float64: return Write<double>(vol, fname);
  }
}

} // namespace sy
