#include "orrery/sim/Discovery.h"

#include "orrery/core/Random.h"
#include "orrery/sim/Universe.h"

#include <cmath>

namespace orrery::sim {

core::i64 discoveryBaseValue(OrbitalObjectType type) {
  switch (type) {
    case OrbitalObjectType::BlackHole: return 150000;
    case OrbitalObjectType::NeutronStar: return 80000;
    case OrbitalObjectType::Mandelbulb:
    case OrbitalObjectType::JuliaSet: return 100000;
    case OrbitalObjectType::Star: return 20000;
    case OrbitalObjectType::GasPlanet: return 12000;
    case OrbitalObjectType::TelluricPlanet: return 10000;
    case OrbitalObjectType::TelluricSatellite: return 4000;
    case OrbitalObjectType::SpaceStation:
    case OrbitalObjectType::SpaceElevator: return 0;
    default: return 0;
  }
}

bool EncyclopaediaGalactica::contributeDiscoveryIfNew(const SpaceDiscovery& discovery) {
  return entries_.emplace(discovery.objectId, discovery).second;
}

bool EncyclopaediaGalactica::hasObjectBeenDiscovered(const UniverseObjectId& id) const {
  return entries_.find(id) != entries_.end();
}

const SpaceDiscovery* EncyclopaediaGalactica::find(const UniverseObjectId& id) const {
  const auto it = entries_.find(id);
  return (it != entries_.end()) ? &it->second : nullptr;
}

core::i64 EncyclopaediaGalactica::estimateDiscovery(const UniverseObjectId& id, Universe& universe) const {
  const OrbitalObjectModel model = universe.objectModel(id);

  // +-10% depending on the object, stable across runs.
  core::SplitMix64 rng(core::deriveSeed(model.seed, "discovery_value"));
  double value = static_cast<double>(discoveryBaseValue(model.type())) * rng.range(0.9, 1.1);
  if (hasObjectBeenDiscovered(id)) value *= 0.5;

  return static_cast<core::i64>(std::llround(value));
}

} // namespace orrery::sim
