#pragma once

#include <algorithm>
#include <cmath>

namespace orrery::math {

constexpr double kPi = 3.1415926535897932384626433832795;
constexpr double kTwoPi = 2.0 * kPi;

inline double degToRad(double deg) { return deg * (kPi / 180.0); }

// Floor division that rounds towards negative infinity for negative numerators.
template <class Int>
inline Int floorDiv(Int a, Int b) {
  Int q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

} // namespace orrery::math
