#include "threads.hpp"

#include "../log/log.hpp"

#include <memory>
#include <thread>

namespace {
std::unique_ptr<Eigen::ThreadPool>       gp = nullptr;
std::unique_ptr<Eigen::ThreadPoolDevice> tensorDev = nullptr;
} // namespace

namespace sy {
namespace Threads {

auto GlobalPool() -> Eigen::ThreadPool *
{
  if (gp == nullptr) {
    auto const nt = std::thread::hardware_concurrency();
    Log::Debug("Thread", "Creating default thread pool with {} threads", nt);
    gp = std::make_unique<Eigen::ThreadPool>(nt);
  }
  return gp.get();
}

auto GlobalThreadCount() -> Index { return GlobalPool()->NumThreads(); }

void SetGlobalThreadCount(Index nt)
{
  if (nt < 1) { nt = std::thread::hardware_concurrency(); }
  Log::Debug("Thread", "Creating thread pool with {} threads", nt);
  // The device refers to the pool, so it must go first
  tensorDev.reset();
  gp = std::make_unique<Eigen::ThreadPool>(nt);
  tensorDev = std::make_unique<Eigen::ThreadPoolDevice>(gp.get(), nt);
}

auto TensorDevice() -> Eigen::ThreadPoolDevice &
{
  if (tensorDev == nullptr) {
    auto gp = GlobalPool();
    tensorDev = std::make_unique<Eigen::ThreadPoolDevice>(gp, gp->NumThreads());
  }
  return *tensorDev;
}

} // namespace Threads
} // namespace sy
