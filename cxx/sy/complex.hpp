#pragma once

#include "volume.hpp"

namespace sy {

/*
 * Phase wraps at +/- pi, so magnitude/phase are interpolated as real/imaginary instead
 */
struct ComplexPair
{
  Volume real;
  Volume imag;
};

struct MagPhase
{
  Volume mag;
  Volume pha;
};

// Both outputs are float32 on the phase volume's grid. Shapes must match.
auto Decompose(Volume const &mag, Volume const &pha) -> ComplexPair;

/*
 * Magnitude is rounded to the nearest integer and cast to magType, whatever magType is.
 * Phase is quantised to half precision and stored as float32.
 */
auto Recompose(Volume const &real, Volume const &imag, DataType const magType) -> MagPhase;

} // namespace sy
