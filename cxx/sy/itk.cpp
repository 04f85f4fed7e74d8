#include "itk.hpp"

#include "errors.hpp"

#include <itkImportImageFilter.h>

namespace sy {
namespace ITK {

auto Import(Re3CMap const data, Info const &info) -> ImageType::Pointer
{
  using TImport = itk::ImportImageFilter<float, 3>;

  TImport::IndexType st;
  st.Fill(0);
  TImport::SizeType sz;
  std::copy_n(data.dimensions().begin(), 3, sz.begin());
  TImport::RegionType region;
  region.SetIndex(st);
  region.SetSize(sz);

  TImport::SpacingType s;
  std::copy_n(info.voxel_size.cbegin(), 3, s.begin());
  TImport::OriginType o;
  std::copy_n(info.origin.cbegin(), 3, o.begin());
  TImport::DirectionType d;
  for (Index ii = 0; ii < 3; ii++) {
    for (Index ij = 0; ij < 3; ij++) {
      d(ii, ij) = info.direction(ii, ij);
    }
  }

  auto import = TImport::New();
  import->SetRegion(region);
  import->SetSpacing(s);
  import->SetOrigin(o);
  import->SetDirection(d);
  // ITK wants a non-const pointer but never writes through it here
  import->SetImportPointer(const_cast<float *>(data.data()), data.size(), false);
  import->Update();
  return import->GetOutput();
}

void Export(ImageType::Pointer img, Re3Map data)
{
  auto const sz = img->GetLargestPossibleRegion().GetSize();
  for (Index ii = 0; ii < 3; ii++) {
    if (static_cast<Index>(sz[ii]) != data.dimension(ii)) {
      throw InterpolationError("ITK", "Image size {} does not match destination {}", fmt::join(sz, ","),
                               fmt::join(data.dimensions(), ","));
    }
  }
  std::copy_n(img->GetBufferPointer(), data.size(), data.data());
}

} // namespace ITK
} // namespace sy
