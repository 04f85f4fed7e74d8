#pragma once

#include "log/log.hpp"

namespace sy {

// Input could not be read, or carries inconsistent geometry
struct LoadError : Log::Failure
{
  using Log::Failure::Failure;
};

// A derived target affine is singular or has non-positive spacing
struct GeometryError : Log::Failure
{
  using Log::Failure::Failure;
};

// Volumes that must share a grid do not
struct ShapeMismatchError : Log::Failure
{
  using Log::Failure::Failure;
};

// The interpolation machinery failed or was handed something it cannot sample
struct InterpolationError : Log::Failure
{
  using Log::Failure::Failure;
};

} // namespace sy
