#pragma once

#include "../types.hpp"

#include <unsupported/Eigen/CXX11/ThreadPool>

namespace sy {

namespace Threads {

auto GlobalPool() -> Eigen::ThreadPool *;
auto TensorDevice() -> Eigen::ThreadPoolDevice &;

auto GlobalThreadCount() -> Index;
void SetGlobalThreadCount(Index n_threads);

/*
 * Split [0, sz) into one contiguous chunk per thread and call f(lo, hi) on each
 */
template <typename F> void ChunkFor(F const &f, Index const sz)
{
  Index const nT = GlobalThreadCount();
  if (sz == 0) {
    return;
  } else {
    Index const    nC = std::min<Index>(sz, nT);
    Index const    den = sz / nC;
    Index const    rem = sz % nC;
    Eigen::Barrier barrier(nC);
    for (Index it = 0; it < nC; it++) {
      Index const lo = it * den + std::min(it, rem);
      Index const hi = (it + 1) * den + std::min(it + 1, rem);
      GlobalPool()->Schedule([&barrier, f, lo, hi] {
        f(lo, hi);
        barrier.Notify();
      });
    }
    barrier.Wait();
  }
}

} // namespace Threads
} // namespace sy
