#pragma once

#include "orrery/core/Types.h"

#include <string_view>

namespace orrery::sim {

// Kind of body placed in a star system. Values are persisted (save games,
// mission records), so never reorder them.
enum class OrbitalObjectType : core::u8 {
  Star = 0,
  NeutronStar,
  BlackHole,
  TelluricPlanet,
  TelluricSatellite,
  GasPlanet,
  Mandelbulb,
  JuliaSet,
  SpaceStation,
  SpaceElevator,
  Count
};

constexpr int kOrbitalObjectTypeCount = static_cast<int>(OrbitalObjectType::Count);

// Lower-case English label ("neutron star", "space station", ...).
std::string_view toString(OrbitalObjectType type);

// Validates an integer coming from external data.
bool orbitalObjectTypeFromInt(int value, OrbitalObjectType& out);

inline bool isStellarObject(OrbitalObjectType t) {
  return t == OrbitalObjectType::Star || t == OrbitalObjectType::NeutronStar || t == OrbitalObjectType::BlackHole;
}

inline bool isAnomaly(OrbitalObjectType t) {
  return t == OrbitalObjectType::Mandelbulb || t == OrbitalObjectType::JuliaSet;
}

inline bool isOrbitalFacility(OrbitalObjectType t) {
  return t == OrbitalObjectType::SpaceStation || t == OrbitalObjectType::SpaceElevator;
}

} // namespace orrery::sim
