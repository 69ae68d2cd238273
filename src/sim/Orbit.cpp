#include "orrery/sim/Orbit.h"

#include "orrery/math/Math.h"
#include "orrery/sim/Units.h"

#include <cmath>

namespace orrery::sim {

static double normalizeAngle(double a) {
  a = std::fmod(a, math::kTwoPi);
  if (a < 0) a += math::kTwoPi;
  return a;
}

double solveKepler(double meanAnomalyRad, double e, int iterations) {
  const double M = normalizeAngle(meanAnomalyRad);
  double E = (e < 0.8) ? M : math::kPi;

  for (int i = 0; i < iterations; ++i) {
    const double f = E - e * std::sin(E) - M;
    const double fp = 1.0 - e * std::cos(E);
    E = E - f / fp;
  }
  return E;
}

math::Vec3d orbitPositionKm(const OrbitElements& el, double timeSeconds) {
  // A non-positive period freezes the object at its epoch position.
  const double n = (el.periodSeconds > 0.0) ? math::kTwoPi / el.periodSeconds : 0.0;
  const double M = el.meanAnomalyAtEpochRad + n * timeSeconds;
  const double E = solveKepler(M, el.eccentricity);

  const double cosE = std::cos(E);
  const double sinE = std::sin(E);

  const double a = el.semiMajorAxisKm;
  const double r = a * (1.0 - el.eccentricity * cosE);

  // True anomaly
  const double v = std::atan2(std::sqrt(1.0 - el.eccentricity*el.eccentricity) * sinE,
                              cosE - el.eccentricity);

  return { r * std::cos(v), r * std::sin(v), 0.0 };
}

math::Vec3d orbitPosition3DKm(const OrbitElements& el, double timeSeconds) {
  const math::Vec3d p = orbitPositionKm(el, timeSeconds);

  const double cosO = std::cos(el.ascendingNodeRad);
  const double sinO = std::sin(el.ascendingNodeRad);
  const double cosi = std::cos(el.inclinationRad);
  const double sini = std::sin(el.inclinationRad);
  const double cosw = std::cos(el.argPeriapsisRad);
  const double sinw = std::sin(el.argPeriapsisRad);

  // Rotation Rz(O) * Rx(i) * Rz(w)
  const double x1 = cosw*p.x - sinw*p.y;
  const double y1 = sinw*p.x + cosw*p.y;

  const double y2 = cosi*y1;
  const double z2 = sini*y1;

  return {cosO*x1 - sinO*y2, sinO*x1 + cosO*y2, z2};
}

double orbitalPeriodSeconds(double semiMajorAxisKm, double parentMassKg) {
  if (semiMajorAxisKm <= 0.0 || parentMassKg <= 0.0) return 0.0;
  const double mu = kGravitationalConstantKm * parentMassKg;
  return math::kTwoPi * std::sqrt((semiMajorAxisKm * semiMajorAxisKm * semiMajorAxisKm) / mu);
}

} // namespace orrery::sim
