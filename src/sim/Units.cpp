#include "orrery/sim/Units.h"

#include <cmath>
#include <cstdio>

namespace orrery::sim {

std::string formatDistance(double km) {
  char buf[64];
  const double a = std::abs(km);
  if (a < 1.0) {
    std::snprintf(buf, sizeof(buf), "%.0f m", km * 1000.0);
  } else if (a < 1.0e7) {
    std::snprintf(buf, sizeof(buf), "%.0f km", km);
  } else if (a < 0.1 * kLightYearKm) {
    std::snprintf(buf, sizeof(buf), "%.2f AU", km / kAU_KM);
  } else {
    std::snprintf(buf, sizeof(buf), "%.2f ly", km / kLightYearKm);
  }
  return buf;
}

} // namespace orrery::sim
