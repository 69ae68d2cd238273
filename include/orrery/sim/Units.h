#pragma once

#include <string>

namespace orrery::sim {

// Local (in-system) space is expressed in kilometers and seconds; galaxy space in
// light-years. These constants keep generator, sim, tools and tests consistent.

constexpr double kAU_KM = 149597870.7;
constexpr double kLightYearKm = 9.4607304725808e12;
constexpr double kSecondsPerDay = 86400.0;
constexpr double kSecondsPerHour = 3600.0;

constexpr double kSolarMassKg = 1.98847e30;
constexpr double kSolarRadiusKm = 695700.0;
constexpr double kEarthMassKg = 5.9722e24;
constexpr double kEarthRadiusKm = 6371.0;

// Gravitational constant in km^3 / (kg s^2).
constexpr double kGravitationalConstantKm = 6.6743e-20;

inline double lyToKm(double ly) { return ly * kLightYearKm; }
inline double kmToLy(double km) { return km / kLightYearKm; }

// Human-readable distance: m, km, AU or ly depending on magnitude.
std::string formatDistance(double km);

} // namespace orrery::sim
