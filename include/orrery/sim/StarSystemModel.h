#pragma once

#include "orrery/core/Types.h"
#include "orrery/math/Vec3.h"
#include "orrery/sim/Coordinates.h"

#include <optional>
#include <string>
#include <vector>

namespace orrery::sim {

struct OrbitElements {
  // Units:
  //  - semiMajorAxisKm: km, relative to the parent object
  //  - angles: radians
  //  - periodSeconds: seconds (<= 0 means "does not move")
  double semiMajorAxisKm{0.0};
  double eccentricity{0.0};
  double inclinationRad{0.0};
  double ascendingNodeRad{0.0};
  double argPeriapsisRad{0.0};
  double meanAnomalyAtEpochRad{0.0};
  double periodSeconds{0.0};
};

// Immutable description of one generated object.
struct OrbitalObjectModel {
  SystemObjectId id{};
  std::string name;
  core::u64 seed{0};

  double radiusKm{0.0};
  double massKg{0.0};
  double siderealDaySeconds{0.0};
  double axialTiltRad{0.0};
  double temperatureK{0.0}; // stellar objects only

  // Flat index of the parent in StarSystemModel::objects, -1 for the barycenter.
  int parentIndex{-1};
  OrbitElements orbit{};

  core::u32 factionId{0}; // facilities only, 0 otherwise

  OrbitalObjectType type() const { return id.type; }
};

// Everything the generator knows about a system. Regenerated from its
// coordinates on demand and never persisted in full.
struct StarSystemModel {
  StarSystemCoordinates coordinates{};
  core::u64 seed{0};
  std::string name;
  math::Vec3d galacticPositionLy{};
  core::u32 factionId{0};

  // Parents always precede their children.
  std::vector<OrbitalObjectModel> objects;
};

// Index into StarSystemModel::objects, or -1.
int findObjectIndex(const StarSystemModel& system, const SystemObjectId& id);

const OrbitalObjectModel* findObject(const StarSystemModel& system, const SystemObjectId& id);

std::vector<const OrbitalObjectModel*> objectsOfType(const StarSystemModel& system, OrbitalObjectType type);

// Space stations and space elevators, in generation order.
std::vector<const OrbitalObjectModel*> orbitalFacilities(const StarSystemModel& system);

std::size_t countObjects(const StarSystemModel& system, OrbitalObjectType type);

} // namespace orrery::sim
