#pragma once

#include "orrery/core/StableHash.h"
#include "orrery/sim/StarSystemModel.h"

namespace orrery::sim {

// Build stable, portable 64-bit signatures for procedural content.
//
// These signatures are intended for:
//  - tooling output (easy regression checking)
//  - unit tests (detect accidental procedural drift)

inline void signatureCoordinates(core::StableHash64& h, const StarSystemCoordinates& c) {
  h.addI64(c.sector.x);
  h.addI64(c.sector.y);
  h.addI64(c.sector.z);
  h.addU32(c.localIndex);
}

inline void signatureOrbit(core::StableHash64& h, const OrbitElements& o) {
  h.addDoubleQ(o.semiMajorAxisKm, 1.0);
  h.addDoubleQ(o.eccentricity);
  h.addDoubleQ(o.inclinationRad);
  h.addDoubleQ(o.ascendingNodeRad);
  h.addDoubleQ(o.argPeriapsisRad);
  h.addDoubleQ(o.meanAnomalyAtEpochRad);
  h.addDoubleQ(o.periodSeconds, 1.0);
}

inline void signatureObject(core::StableHash64& h, const OrbitalObjectModel& o) {
  h.addU8(static_cast<core::u8>(o.id.type));
  h.addU32(o.id.index);
  h.addString(o.name);
  h.addU64(o.seed);
  h.addDoubleQ(o.radiusKm, 1e3);
  h.addDoubleQ(o.massKg / 1e20); // keeps the quantized value well inside i64
  h.addDoubleQ(o.siderealDaySeconds, 1e3);
  h.addDoubleQ(o.axialTiltRad);
  h.addDoubleQ(o.temperatureK, 1e3);
  h.addInt(o.parentIndex);
  signatureOrbit(h, o.orbit);
  h.addU32(o.factionId);
}

inline core::u64 signatureSystemModel(const StarSystemModel& s) {
  core::StableHash64 h;
  signatureCoordinates(h, s.coordinates);
  h.addU64(s.seed);
  h.addString(s.name);
  h.addDoubleQ(s.galacticPositionLy.x);
  h.addDoubleQ(s.galacticPositionLy.y);
  h.addDoubleQ(s.galacticPositionLy.z);
  h.addU32(s.factionId);
  h.addU64(static_cast<core::u64>(s.objects.size()));
  for (const auto& o : s.objects) signatureObject(h, o);
  return h.value();
}

} // namespace orrery::sim
