#pragma once

#include "orrery/math/Vec3.h"
#include "orrery/sim/StarSystemModel.h"

namespace orrery::sim {

// Solve Kepler's equation for eccentric anomaly E given mean anomaly M and eccentricity e.
double solveKepler(double meanAnomalyRad, double eccentricity, int iterations = 8);

// Position in the orbital plane (km) at `timeSeconds`.
math::Vec3d orbitPositionKm(const OrbitElements& el, double timeSeconds);

// Full 3D offset from the parent (km) with inclination, node, argument of periapsis applied.
math::Vec3d orbitPosition3DKm(const OrbitElements& el, double timeSeconds);

// Kepler's third law. Returns 0 for a degenerate orbit.
double orbitalPeriodSeconds(double semiMajorAxisKm, double parentMassKg);

} // namespace orrery::sim
