#pragma once

// Need to define EIGEN_USE_THREADS before including these. This is done in CMakeLists.txt
#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>

#include <cassert>
#include <complex>
#include <numeric>

using Index = Eigen::Index;

namespace sy {

template <int N> using ReN = Eigen::Tensor<float, N>;
using Re3 = ReN<3>;
using Re4 = ReN<4>;
template <int N> using ReNMap = Eigen::TensorMap<ReN<N>>;
template <int N> using ReNCMap = Eigen::TensorMap<ReN<N> const>;
using Re3Map = ReNMap<3>;
using Re3CMap = ReNCMap<3>;

using Cx = std::complex<float>;
using Cx4 = Eigen::Tensor<Cx, 4>;

// Voxel index to physical (RAS, mm) coordinates
using Affine = Eigen::Matrix4d;

// Useful shorthands
template <int Rank> using Sz = typename Eigen::DSizes<Index, Rank>;
using Sz3 = Sz<3>;
using Sz4 = Sz<4>;

template <size_t N, typename T> auto FirstN(T const &sz) -> Eigen::DSizes<typename T::value_type, N>
{
  assert(N <= sz.size());
  Eigen::DSizes<typename T::value_type, N> first;
  std::copy_n(sz.begin(), N, first.begin());
  return first;
}

template <typename T, int N, typename... Args> decltype(auto) AddBack(Eigen::DSizes<T, N> const &front, Args... toAdd)
{
  static_assert(sizeof...(Args) > 0);
  Eigen::DSizes<T, sizeof...(Args)>     back{{toAdd...}};
  Eigen::DSizes<T, sizeof...(Args) + N> out;

  std::copy_n(front.begin(), N, out.begin());
  std::copy_n(back.begin(), sizeof...(Args), out.begin() + N);
  return out;
}

template <size_t N> Index Product(std::array<Index, N> const &indices)
{
  return std::accumulate(indices.begin(), indices.end(), 1L, std::multiplies<Index>());
}

/*
 * Map one 3D volume out of a 4D stack without copying
 */
template <typename T> inline auto ChipMap(T &a, Index const index)
{
  constexpr auto LastDim = T::NumDimensions - 1;
  using Scalar = typename T::Scalar;
  using Tensor = Eigen::Tensor<Scalar, LastDim>;
  assert(index < a.dimension(LastDim));
  auto const chipDims = FirstN<LastDim>(a.dimensions());
  return Eigen::TensorMap<Tensor>(a.data() + Product(chipDims) * index, chipDims);
}

template <typename T> inline auto CChipMap(T const &a, Index const index)
{
  constexpr auto LastDim = T::NumDimensions - 1;
  using Scalar = typename T::Scalar;
  using Tensor = Eigen::Tensor<Scalar, LastDim>;
  assert(index < a.dimension(LastDim));
  auto const chipDims = FirstN<LastDim>(a.dimensions());
  return Eigen::TensorMap<Tensor const>(a.data() + Product(chipDims) * index, chipDims);
}

} // namespace sy
